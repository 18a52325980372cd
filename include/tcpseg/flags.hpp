#pragma once

#include <string>

#include "tcpseg/common.hpp"

namespace tcpseg {

enum class flag : u8 {
    FIN = 1 << 0,
    SYN = 1 << 1,
    RST = 1 << 2,
    PSH = 1 << 3,
    ACK = 1 << 4,
    URG = 1 << 5,
    ECE = 1 << 6,
    CWR = 1 << 7,
};

// The control bits of a segment. Every byte is a valid combination; nothing is normalised.
class flag_set {
public:
    constexpr flag_set() noexcept = default;
    constexpr flag_set(flag f) noexcept : m_bits(static_cast<u8>(f)) {}

    [[nodiscard]] static constexpr flag_set from_byte(u8 byte) noexcept {
        flag_set set;
        set.m_bits = byte;
        return set;
    }

    [[nodiscard]] constexpr bool contains(flag f) const noexcept {
        return (m_bits & static_cast<u8>(f)) != 0;
    }

    [[nodiscard]] constexpr bool empty() const noexcept {
        return m_bits == 0;
    }

    [[nodiscard]] constexpr flag_set union_with(flag_set other) const noexcept {
        return from_byte(static_cast<u8>(m_bits | other.m_bits));
    }

    [[nodiscard]] constexpr flag_set remove(flag_set other) const noexcept {
        return from_byte(static_cast<u8>(m_bits & ~other.m_bits));
    }

    constexpr void insert(flag_set other) noexcept {
        m_bits = static_cast<u8>(m_bits | other.m_bits);
    }

    [[nodiscard]] constexpr u8 to_byte() const noexcept {
        return m_bits;
    }

    // e.g. "SYN | ACK 18", or "UNINT 0" when no bit is set.
    [[nodiscard]] std::string render() const;

    constexpr flag_set &operator|=(flag_set other) noexcept {
        insert(other);
        return *this;
    }

    constexpr bool operator==(const flag_set &) const = default;

private:
    u8 m_bits{};
};

[[nodiscard]] constexpr flag_set operator|(flag_set lhs, flag_set rhs) noexcept {
    return lhs.union_with(rhs);
}

[[nodiscard]] constexpr flag_set operator|(flag lhs, flag rhs) noexcept {
    return flag_set(lhs).union_with(rhs);
}

}  // namespace tcpseg
