#include "tcpseg/segment.hpp"

#include <utility>
#include <vector>

#include "tcpseg/checksum.hpp"
#include "tcpseg/common.hpp"
#include "tcpseg/header.hpp"
#include "tcpseg/log.hpp"

namespace tcpseg {

segment_builder &segment_builder::source_port(u16 port) noexcept {
    m_source_port = port;
    return *this;
}

segment_builder &segment_builder::dest_port(u16 port) noexcept {
    m_dest_port = port;
    return *this;
}

segment_builder &segment_builder::seq_num(u32 seq) noexcept {
    m_seq_num = seq;
    return *this;
}

segment_builder &segment_builder::ack_num(u32 ack) noexcept {
    m_ack_num = ack;
    return *this;
}

segment_builder &segment_builder::flags(flag_set flags) noexcept {
    m_flags = flags;
    return *this;
}

segment_builder &segment_builder::window_size(u16 size) noexcept {
    m_window_size = size;
    return *this;
}

result<header> segment_builder::build(const ipv4_address &src, const ipv4_address &dst,
                                      const std::vector<u8> &payload) const noexcept {
    header h;
    h.source_port = m_source_port;
    h.dest_port = m_dest_port;
    h.seq_num = m_seq_num;
    h.ack_num = m_ack_num;
    h.flags = m_flags;
    h.window_size = m_window_size;
    h.checksum = 0;

    auto [err, checksum] = compute_checksum(src, dst, h, payload);
    if (err != error::none) {
        return {err, header{}};
    }

    h.checksum = checksum;
    return {error::none, h};
}

std::vector<u8> assemble_segment(const header &h, const std::vector<u8> &payload) {
    std::vector<u8> result;
    result.reserve(constants::HEADER_LENGTH + payload.size());

    header_bytes bytes = serialise(h);
    result.insert(result.end(), bytes.begin(), bytes.end());
    result.insert(result.end(), payload.begin(), payload.end());

    return result;
}

result<segment> parse_segment(const std::vector<u8> &bytes) {
    auto [err, h] = deserialise(bytes);
    if (err != error::none) {
        return {err, segment{}};
    }

    segment parsed{h, {}};
    parsed.payload.assign(
        bytes.begin() + static_cast<std::vector<u8>::difference_type>(constants::HEADER_LENGTH),
        bytes.end());

    return {error::none, std::move(parsed)};
}

result<segment> open_segment(const std::vector<u8> &bytes, const ipv4_address &src,
                             const ipv4_address &dst) {
    auto parsed = parse_segment(bytes);
    if (!parsed.ok()) {
        return parsed;
    }

    parsed.err = verify_checksum(src, dst, parsed.value.header, parsed.value.payload);
    if (parsed.err != error::none) {
        TCPSEG_LOG("segment from %s failed verification: %s", src.to_string().c_str(),
                   describe(parsed.err));
    }

    return parsed;
}

}  // namespace tcpseg
