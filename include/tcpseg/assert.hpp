#pragma once

#include <cstdio>
#include <cstdlib>

// TCPSEG_ASSERT(condition, message) with an optional printf-style message.
#define TCPSEG_ASSERT(condition, ...)                                            \
    do {                                                                         \
        if (!(condition)) {                                                      \
            fprintf(stderr, "Assertion failed: %s\n", #condition);               \
            __VA_OPT__(fprintf(stderr, "Message: "); fprintf(stderr, __VA_ARGS__); \
                       fprintf(stderr, "\n");)                                   \
            fprintf(stderr, "File: %s, Line: %d\n", __FILE__, __LINE__);         \
            abort();                                                             \
        }                                                                        \
    } while (0)

#define TCPSEG_STATIC_ASSERT(condition, ...) static_assert(condition)
