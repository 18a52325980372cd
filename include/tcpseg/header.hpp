#pragma once

#include <array>
#include <string>
#include <vector>

#include "tcpseg/common.hpp"
#include "tcpseg/error.hpp"
#include "tcpseg/flags.hpp"

namespace tcpseg {

//  0                   1                   2                   3
//  0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1
// +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
// |          Source Port          |       Destination Port        |
// +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
// |                        Sequence Number                        |
// +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
// |                    Acknowledgment Number                      |
// +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
// |  Data |       |C|E|U|A|P|R|S|F|                               |
// | Offset| Rsrvd |W|C|R|C|S|S|Y|I|            Window             |
// |  (5)  |  (0)  |R|E|G|K|H|T|N|N|                               |
// +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
// |           Checksum            |      Urgent Pointer (0)       |
// +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
//
// NOTE: Options and the urgent pointer are unsupported; the data offset, reserved bits and urgent
// pointer are written as constants and ignored on decode.
struct header {
    u16 source_port{};
    u16 dest_port{};
    u32 seq_num{};
    u32 ack_num{};
    flag_set flags{};
    u16 window_size{};
    u16 checksum{};  // NOTE: Not re-derived on decode; see verify_checksum().

    [[nodiscard]] std::string to_string() const;

    bool operator==(const header &) const = default;
};

using header_bytes = std::array<u8, constants::HEADER_LENGTH>;

[[nodiscard]] header_bytes serialise(const header &h) noexcept;
[[nodiscard]] result<header> deserialise(const u8 *data, std::size_t length) noexcept;
[[nodiscard]] result<header> deserialise(const std::vector<u8> &data) noexcept;

}  // namespace tcpseg
