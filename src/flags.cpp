#include "tcpseg/flags.hpp"

#include <string>
#include <utility>

namespace tcpseg {
namespace {
    // clang-format off
    constexpr std::pair<flag, const char *> canonical_order[] = {
        {flag::FIN, "FIN"},
        {flag::SYN, "SYN"},
        {flag::RST, "RST"},
        {flag::PSH, "PSH"},
        {flag::ACK, "ACK"},
        {flag::URG, "URG"},
        {flag::ECE, "ECE"},
        {flag::CWR, "CWR"},
    };
    // clang-format on
}  // namespace

std::string flag_set::render() const {
    if (empty()) {
        return "UNINT " + std::to_string(m_bits);
    }

    std::string names;
    for (const auto &[f, name] : canonical_order) {
        if (!contains(f)) {
            continue;
        }

        if (!names.empty()) {
            names += " | ";
        }
        names += name;
    }

    return names + " " + std::to_string(m_bits);
}

}  // namespace tcpseg
