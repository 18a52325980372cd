#pragma once

#include <cstddef>
#include <cstdint>

namespace tcpseg {

using u8 = std::uint8_t;
using u16 = std::uint16_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;

using s8 = std::int8_t;
using s16 = std::int16_t;
using s32 = std::int32_t;
using s64 = std::int64_t;

using b8 = bool;

namespace constants {
    // NOTE: Options are not supported, so the header is always five 32-bit words.
    inline constexpr u8 DATA_OFFSET_WORDS = 5;
    inline constexpr std::size_t HEADER_LENGTH = DATA_OFFSET_WORDS * 4;

    inline constexpr u8 PROTOCOL_TCP = 6;
    inline constexpr u16 DEFAULT_WINDOW_SIZE = 1024;

    // The pseudo-header carries the transport length in 16 bits.
    inline constexpr u32 MAX_TRANSPORT_LENGTH = 0xFFFF;
}  // namespace constants

}  // namespace tcpseg
