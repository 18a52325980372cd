#pragma once

namespace tcpseg {

enum class error {
    none,
    malformed_header,   // fewer than constants::HEADER_LENGTH bytes on decode
    checksum_mismatch,  // stored checksum differs from a freshly computed one
    length_overflow,    // header + payload does not fit the pseudo-header's 16-bit length
};

// NOTE: On error::checksum_mismatch, and on error::length_overflow from open_segment(), the value
// is still populated so that callers can inspect or log what was received. On every other error it
// is default constructed.
template <typename T>
struct result {
    error err;
    T value;

    [[nodiscard]] bool ok() const noexcept {
        return err == error::none;
    }
};

[[nodiscard]] const char *describe(error err) noexcept;

}  // namespace tcpseg
