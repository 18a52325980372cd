#include "tcpseg/error.hpp"

namespace tcpseg {

const char *describe(error err) noexcept {
    switch (err) {
        case error::none:
            return "none";
        case error::malformed_header:
            return "malformed header";
        case error::checksum_mismatch:
            return "checksum mismatch";
        case error::length_overflow:
            return "length overflow";
    }

    return "unknown error";
}

}  // namespace tcpseg
