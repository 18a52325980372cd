#include "tcpseg/address.hpp"

#include <arpa/inet.h>

#include <cstring>
#include <optional>
#include <string>

#include "tcpseg/assert.hpp"

namespace tcpseg {

std::optional<ipv4_address> ipv4_address::from_string(const std::string &text) {
    in_addr addr{};
    if (inet_pton(AF_INET, text.c_str(), &addr) != 1) {
        return std::nullopt;
    }

    return from_in_addr(addr);
}

ipv4_address ipv4_address::from_in_addr(in_addr addr) noexcept {
    // NOTE: s_addr is already in network order, so its bytes are the octets in order.
    ipv4_address result;
    std::memcpy(result.octets.data(), &addr.s_addr, result.octets.size());
    return result;
}

in_addr ipv4_address::to_in_addr() const noexcept {
    in_addr addr{};
    std::memcpy(&addr.s_addr, octets.data(), octets.size());
    return addr;
}

std::string ipv4_address::to_string() const {
    char buffer[INET_ADDRSTRLEN]{};
    in_addr addr = to_in_addr();
    const char *text = inet_ntop(AF_INET, &addr, buffer, sizeof(buffer));
    TCPSEG_ASSERT(text != nullptr, "inet_ntop() cannot fail for AF_INET with INET_ADDRSTRLEN bytes.");

    return text;
}

}  // namespace tcpseg
