#pragma once

#include <cstdio>

// NOTE: Compiled out unless built with TCPSEG_DEBUG (the TCPSEG_DEBUG_LOG CMake option). Each
// line is a single fprintf() to stderr.
#ifdef TCPSEG_DEBUG
#define TCPSEG_LOG(fmt, ...) \
    fprintf(stderr, "[tcpseg] %s:%d: " fmt "\n", __FILE__, __LINE__ __VA_OPT__(, ) __VA_ARGS__)
#else
#define TCPSEG_LOG(fmt, ...) \
    do {                     \
    } while (0)
#endif
