#include "tcpseg/header.hpp"

#include <arpa/inet.h>

#include <cstring>
#include <sstream>
#include <string>
#include <vector>

#include "tcpseg/assert.hpp"
#include "tcpseg/common.hpp"
#include "tcpseg/log.hpp"

namespace tcpseg {
namespace {
    // Byte offsets into the serialised header.
    constexpr std::size_t SOURCE_PORT = 0;
    constexpr std::size_t DEST_PORT = 2;
    constexpr std::size_t SEQ_NUM = 4;
    constexpr std::size_t ACK_NUM = 8;
    constexpr std::size_t DATA_OFFSET = 12;
    constexpr std::size_t FLAGS = 13;
    constexpr std::size_t WINDOW_SIZE = 14;
    constexpr std::size_t CHECKSUM = 16;
    constexpr std::size_t URGENT_POINTER = 18;

    constexpr u8 DATA_OFFSET_BYTE = static_cast<u8>(constants::DATA_OFFSET_WORDS << 4);

    void write_u16(header_bytes &out, std::size_t offset, u16 value) noexcept {
        u16 net = htons(value);
        std::memcpy(&out[offset], &net, sizeof(net));
    }

    void write_u32(header_bytes &out, std::size_t offset, u32 value) noexcept {
        u32 net = htonl(value);
        std::memcpy(&out[offset], &net, sizeof(net));
    }

    u16 read_u16(const u8 *data, std::size_t offset) noexcept {
        u16 net{};
        std::memcpy(&net, data + offset, sizeof(net));
        return ntohs(net);
    }

    u32 read_u32(const u8 *data, std::size_t offset) noexcept {
        u32 net{};
        std::memcpy(&net, data + offset, sizeof(net));
        return ntohl(net);
    }
}  // namespace

TCPSEG_STATIC_ASSERT(constants::HEADER_LENGTH == 20,
                     "Don't forget to update the serialisation functions :)");
TCPSEG_STATIC_ASSERT(URGENT_POINTER + sizeof(u16) == constants::HEADER_LENGTH);
TCPSEG_STATIC_ASSERT(DATA_OFFSET_BYTE == 0x50);

header_bytes serialise(const header &h) noexcept {
    header_bytes result{};

    write_u16(result, SOURCE_PORT, h.source_port);
    write_u16(result, DEST_PORT, h.dest_port);
    write_u32(result, SEQ_NUM, h.seq_num);
    write_u32(result, ACK_NUM, h.ack_num);

    // Data offset in the high nibble, reserved bits zero.
    result[DATA_OFFSET] = DATA_OFFSET_BYTE;
    result[FLAGS] = h.flags.to_byte();

    write_u16(result, WINDOW_SIZE, h.window_size);
    write_u16(result, CHECKSUM, h.checksum);
    write_u16(result, URGENT_POINTER, 0);

    return result;
}

result<header> deserialise(const u8 *data, std::size_t length) noexcept {
    if (data == nullptr || length < constants::HEADER_LENGTH) {
        TCPSEG_LOG("header needs %zu bytes, received %zu", constants::HEADER_LENGTH, length);
        return {error::malformed_header, header{}};
    }

    header h;
    h.source_port = read_u16(data, SOURCE_PORT);
    h.dest_port = read_u16(data, DEST_PORT);
    h.seq_num = read_u32(data, SEQ_NUM);
    h.ack_num = read_u32(data, ACK_NUM);

    // NOTE: Byte 12 holds the data offset, not the flags. Some earlier revisions of the wire
    // format read the flags from there; offset 13 is the only accepted location.
    h.flags = flag_set::from_byte(data[FLAGS]);

    h.window_size = read_u16(data, WINDOW_SIZE);
    h.checksum = read_u16(data, CHECKSUM);

    return {error::none, h};
}

result<header> deserialise(const std::vector<u8> &data) noexcept {
    return deserialise(data.data(), data.size());
}

std::string header::to_string() const {
    std::ostringstream out;
    out << "TCP Header:\n"
        << "    Source Port: " << source_port << '\n'
        << "    Destination Port: " << dest_port << '\n'
        << "    Sequence Number: " << seq_num << '\n'
        << "    Acknowledgment Number: " << ack_num << '\n'
        << "    Flags: " << flags.render() << '\n'
        << "    Window Size: " << window_size << '\n'
        << "    Checksum: 0x" << std::hex << checksum;
    return out.str();
}

}  // namespace tcpseg
