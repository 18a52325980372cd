#include <gtest/gtest.h>

#include <string>
#include <vector>

#include <tcpseg.hpp>

using tcpseg::error;
using tcpseg::flag;
using tcpseg::header;
using tcpseg::ipv4_address;
using tcpseg::segment_builder;
using tcpseg::u8;

class BuilderTest : public testing::Test {
protected:
    BuilderTest() : src(192, 168, 1, 1), dst(192, 168, 1, 2) {}

    ipv4_address src;
    ipv4_address dst;
};

TEST_F(BuilderTest, Defaults) {
    auto [err, h] = segment_builder().build(src, dst, {});

    ASSERT_EQ(err, error::none);
    ASSERT_EQ(h.source_port, 0);
    ASSERT_EQ(h.dest_port, 0);
    ASSERT_EQ(h.seq_num, 0u);
    ASSERT_EQ(h.ack_num, 0u);
    ASSERT_TRUE(h.flags.empty());
    ASSERT_EQ(h.window_size, tcpseg::constants::DEFAULT_WINDOW_SIZE);
    ASSERT_EQ(h.window_size, 1024);
}

TEST_F(BuilderTest, SettersChain) {
    auto [err, h] = segment_builder()
                        .source_port(49320)
                        .dest_port(8080)
                        .seq_num(305419896)
                        .ack_num(2271560481)
                        .flags(flag::SYN | flag::ACK)
                        .window_size(255)
                        .build(src, dst, {});

    ASSERT_EQ(err, error::none);
    ASSERT_EQ(h.source_port, 49320);
    ASSERT_EQ(h.dest_port, 8080);
    ASSERT_EQ(h.seq_num, 305419896u);
    ASSERT_EQ(h.ack_num, 2271560481u);
    ASSERT_EQ(h.flags, flag::SYN | flag::ACK);
    ASSERT_EQ(h.window_size, 255);
}

TEST_F(BuilderTest, BuildSetsChecksum) {
    std::string text = "Hello, TCP!";
    std::vector<u8> payload(text.begin(), text.end());

    auto [err, h] = segment_builder()
                        .source_port(49320)
                        .dest_port(8080)
                        .seq_num(305419896)
                        .ack_num(2271560481)
                        .flags(flag::SYN | flag::ACK)
                        .window_size(255)
                        .build(src, dst, payload);

    ASSERT_EQ(err, error::none);
    ASSERT_EQ(h.checksum, 0x6F66);
    ASSERT_EQ(tcpseg::verify_checksum(src, dst, h, payload), error::none);
}

TEST_F(BuilderTest, BuilderIsReusable) {
    segment_builder builder;
    builder.source_port(1234).dest_port(80).flags(flag::SYN);

    auto first = builder.build(src, dst, {});
    auto second = builder.seq_num(1).build(src, dst, {});

    ASSERT_EQ(first.err, error::none);
    ASSERT_EQ(second.err, error::none);
    ASSERT_EQ(first.value.seq_num, 0u);
    ASSERT_EQ(second.value.seq_num, 1u);
    ASSERT_NE(first.value.checksum, second.value.checksum);
}

TEST_F(BuilderTest, LengthOverflow) {
    std::vector<u8> payload(65536 - tcpseg::constants::HEADER_LENGTH);

    auto [err, h] = segment_builder().build(src, dst, payload);

    ASSERT_EQ(err, error::length_overflow);
    ASSERT_EQ(h, header{});
}
