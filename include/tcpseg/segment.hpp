#pragma once

#include <vector>

#include "tcpseg/address.hpp"
#include "tcpseg/common.hpp"
#include "tcpseg/error.hpp"
#include "tcpseg/flags.hpp"
#include "tcpseg/header.hpp"

namespace tcpseg {

struct segment {
    struct header header;
    std::vector<u8> payload;

    bool operator==(const segment &) const = default;
};

// Every field has a default, so a partially configured builder always builds.
class segment_builder {
public:
    segment_builder &source_port(u16 port) noexcept;
    segment_builder &dest_port(u16 port) noexcept;
    segment_builder &seq_num(u32 seq) noexcept;
    segment_builder &ack_num(u32 ack) noexcept;
    segment_builder &flags(flag_set flags) noexcept;
    segment_builder &window_size(u16 size) noexcept;

    // Returns a header whose checksum covers the pseudo-header for src/dst and the payload.
    [[nodiscard]] result<header> build(const ipv4_address &src, const ipv4_address &dst,
                                       const std::vector<u8> &payload) const noexcept;

private:
    u16 m_source_port{};
    u16 m_dest_port{};
    u32 m_seq_num{};
    u32 m_ack_num{};
    flag_set m_flags{};
    u16 m_window_size{constants::DEFAULT_WINDOW_SIZE};
};

// NOTE: The checksum is not recomputed; build the header with segment_builder first.
[[nodiscard]] std::vector<u8> assemble_segment(const header &h, const std::vector<u8> &payload);

[[nodiscard]] result<segment> parse_segment(const std::vector<u8> &bytes);

// Parses and then verifies the checksum. On error::checksum_mismatch the parsed segment is still
// returned so the caller can decide whether to discard it.
[[nodiscard]] result<segment> open_segment(const std::vector<u8> &bytes, const ipv4_address &src,
                                           const ipv4_address &dst);

}  // namespace tcpseg
