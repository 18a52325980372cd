#pragma once

#include <vector>

#include "tcpseg/address.hpp"
#include "tcpseg/common.hpp"
#include "tcpseg/error.hpp"
#include "tcpseg/header.hpp"

namespace tcpseg {

// Adds data as consecutive big-endian 16-bit words to a running sum. A trailing odd byte is treated
// as the high byte of a word whose low byte is zero.
[[nodiscard]] u32 accumulate(const u8 *data, std::size_t length, u32 sum = 0) noexcept;

// Folds carries back into the low 16 bits and returns the ones' complement.
[[nodiscard]] u16 finalise(u32 sum) noexcept;

// RFC 793 checksum over the IPv4 pseudo-header, the header (with its checksum field taken as zero)
// and the payload. Fails with error::length_overflow before summing anything if the transport
// length does not fit in 16 bits.
[[nodiscard]] result<u16> compute_checksum(const ipv4_address &src, const ipv4_address &dst,
                                           const header &h, const std::vector<u8> &payload) noexcept;

[[nodiscard]] error verify_checksum(const ipv4_address &src, const ipv4_address &dst,
                                    const header &h, const std::vector<u8> &payload) noexcept;

}  // namespace tcpseg
