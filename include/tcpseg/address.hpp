#pragma once

#include <netinet/in.h>

#include <array>
#include <optional>
#include <string>

#include "tcpseg/common.hpp"

namespace tcpseg {

// IPv4 address as it appears in the checksum pseudo-header, stored in network order.
struct ipv4_address {
    std::array<u8, 4> octets{};

    constexpr ipv4_address() noexcept = default;
    constexpr ipv4_address(u8 a, u8 b, u8 c, u8 d) noexcept : octets{a, b, c, d} {}

    [[nodiscard]] static std::optional<ipv4_address> from_string(const std::string &text);
    [[nodiscard]] static ipv4_address from_in_addr(in_addr addr) noexcept;

    [[nodiscard]] constexpr u16 high_word() const noexcept {
        return static_cast<u16>((octets[0] << 8) | octets[1]);
    }

    [[nodiscard]] constexpr u16 low_word() const noexcept {
        return static_cast<u16>((octets[2] << 8) | octets[3]);
    }

    [[nodiscard]] in_addr to_in_addr() const noexcept;
    [[nodiscard]] std::string to_string() const;

    bool operator==(const ipv4_address &) const = default;
};

}  // namespace tcpseg
