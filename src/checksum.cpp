#include "tcpseg/checksum.hpp"

#include <vector>

#include "tcpseg/assert.hpp"
#include "tcpseg/common.hpp"
#include "tcpseg/log.hpp"

namespace tcpseg {

// NOTE: With the transport length capped at 16 bits, at most 2^15 + 16 words of at most 0xFFFF are
// summed, which stays well inside a u32; no intermediate folding is needed.
TCPSEG_STATIC_ASSERT(constants::MAX_TRANSPORT_LENGTH <= 0xFFFF);

u32 accumulate(const u8 *data, std::size_t length, u32 sum) noexcept {
    std::size_t i = 0;
    for (; i + 1 < length; i += 2) {
        sum += static_cast<u32>((data[i] << 8) | data[i + 1]);
    }

    // Odd trailing byte: pad on the right with a zero.
    if (i < length) {
        sum += static_cast<u32>(data[i] << 8);
    }

    return sum;
}

u16 finalise(u32 sum) noexcept {
    while ((sum >> 16) != 0) {
        sum = (sum & 0xFFFF) + (sum >> 16);
    }

    return static_cast<u16>(~sum);
}

//   +--------+--------+--------+--------+
//   |           Source Address          |
//   +--------+--------+--------+--------+
//   |         Destination Address       |
//   +--------+--------+--------+--------+
//   |  zero  |PTCL (6)|    TCP Length   |
//   +--------+--------+--------+--------+
result<u16> compute_checksum(const ipv4_address &src, const ipv4_address &dst, const header &h,
                             const std::vector<u8> &payload) noexcept {
    if (payload.size() > constants::MAX_TRANSPORT_LENGTH - constants::HEADER_LENGTH) {
        TCPSEG_LOG("transport length %zu does not fit in 16 bits",
                   constants::HEADER_LENGTH + payload.size());
        return {error::length_overflow, 0};
    }

    u32 sum = 0;

    // Pseudo-header.
    sum += src.high_word();
    sum += src.low_word();
    sum += dst.high_word();
    sum += dst.low_word();
    sum += constants::PROTOCOL_TCP;
    sum += static_cast<u32>(constants::HEADER_LENGTH + payload.size());

    // Header, with the checksum field as a placeholder.
    header provisional = h;
    provisional.checksum = 0;
    header_bytes bytes = serialise(provisional);
    sum = accumulate(bytes.data(), bytes.size(), sum);

    // Payload.
    sum = accumulate(payload.data(), payload.size(), sum);

    return {error::none, finalise(sum)};
}

error verify_checksum(const ipv4_address &src, const ipv4_address &dst, const header &h,
                      const std::vector<u8> &payload) noexcept {
    auto [err, expected] = compute_checksum(src, dst, h, payload);
    if (err != error::none) {
        return err;
    }

    if (expected != h.checksum) {
        TCPSEG_LOG("checksum mismatch from %u.%u.%u.%u: stored 0x%04x, computed 0x%04x",
                   src.octets[0], src.octets[1], src.octets[2], src.octets[3], h.checksum,
                   expected);
        return error::checksum_mismatch;
    }

    return error::none;
}

}  // namespace tcpseg
