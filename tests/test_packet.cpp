// tests/test_packet.cpp
#include <cstdint>
#include <gtest/gtest.h>
#include <vector>

#include "proto/packet.hpp"

using namespace wire;
using uquic::Status;

static std::vector<std::uint8_t> gen_bytes(std::size_t n, std::uint8_t seed = 0)
{
    std::vector<std::uint8_t> v(n);
    for (std::size_t i = 0; i < n; ++i)
        v[i] = static_cast<std::uint8_t>((i + seed) & 0xFF);
    return v;
}

TEST(Packet, HeaderIsBigEndian)
{
    Packet p;
    p.flags         = Flag::StreamLast;
    p.packet_number = 0x01020304;
    auto a          = gen_bytes(3);
    ASSERT_EQ(add_frame(p, 0x0A0B0C0D, 0x00000100, a.data(), a.size()), Status::Ok);

    auto bytes = encode(p);
    ASSERT_EQ(bytes.size(), PACKET_HDR_SIZE + FRAME_HDR_SIZE + 3);

    const std::vector<std::uint8_t> want_hdr = {6,    0x01, 0x02, 0x03, 0x04, 0, 0,
                                                0,    0,    0,    0,    0,    19};
    EXPECT_EQ(std::vector<std::uint8_t>(bytes.begin(), bytes.begin() + PACKET_HDR_SIZE), want_hdr);

    const std::vector<std::uint8_t> want_frame = {0x0A, 0x0B, 0x0C, 0x0D, 0, 0, 0x01, 0,
                                                  0,    0,    0,    0,    0, 0, 0,    3};
    EXPECT_EQ(std::vector<std::uint8_t>(bytes.begin() + PACKET_HDR_SIZE,
                                        bytes.begin() + PACKET_HDR_SIZE + FRAME_HDR_SIZE),
              want_frame);
}

TEST(Packet, HeaderPackUnpack)
{
    PacketHeader h;
    h.flags          = Flag::DataFin;
    h.packet_number  = 4242;
    h.payload_length = 0x0000000100000002ull;

    std::uint8_t buf[PACKET_HDR_SIZE];
    pack_header(h, buf);

    PacketHeader h2;
    ASSERT_TRUE(unpack_header(buf, h2));
    EXPECT_EQ(h2.flags, Flag::DataFin);
    EXPECT_EQ(h2.packet_number, 4242u);
    EXPECT_EQ(h2.payload_length, 0x0000000100000002ull);
}

TEST(Packet, EncodeDecode_MultipleFrames)
{
    Packet p;
    p.flags         = Flag::Data;
    p.packet_number = 77;

    auto a = gen_bytes(1000, 1);
    auto b = gen_bytes(1000, 2);
    auto c = gen_bytes(17, 3);
    ASSERT_EQ(add_frame(p, 3, 0, a.data(), a.size()), Status::Ok);
    ASSERT_EQ(add_frame(p, 3, 1000, b.data(), b.size()), Status::Ok);
    ASSERT_EQ(add_frame(p, 3, 2000, c.data(), c.size()), Status::Ok);

    PacketHeader       hdr;
    std::vector<Frame> frames;
    ASSERT_EQ(decode(encode(p), hdr, frames), Status::Ok);

    EXPECT_EQ(hdr.flags, Flag::Data);
    EXPECT_EQ(hdr.packet_number, 77u);
    EXPECT_EQ(hdr.payload_length, p.payload.size());
    ASSERT_EQ(frames.size(), 3u);
    EXPECT_EQ(frames[0].hdr.offset, 0u);
    EXPECT_EQ(frames[1].hdr.offset, 1000u);
    EXPECT_EQ(frames[2].hdr.offset, 2000u);
    EXPECT_EQ(frames[0].data, a);
    EXPECT_EQ(frames[1].data, b);
    EXPECT_EQ(frames[2].data, c);
    for (const auto &f : frames)
    {
        EXPECT_EQ(f.hdr.stream_id, 3u);
        EXPECT_EQ(f.hdr.data_length, f.data.size());
    }
}

TEST(Packet, EncodeDecode_NoPayload)
{
    Packet p;
    p.flags         = Flag::Syn;
    p.packet_number = 1;

    auto bytes = encode(p);
    EXPECT_EQ(bytes.size(), PACKET_HDR_SIZE);

    PacketHeader       hdr;
    std::vector<Frame> frames;
    ASSERT_EQ(decode(bytes, hdr, frames), Status::Ok);
    EXPECT_EQ(hdr.flags, Flag::Syn);
    EXPECT_EQ(hdr.payload_length, 0u);
    EXPECT_TRUE(frames.empty());
}

TEST(Packet, EncodeDecode_ZeroLengthFrame)
{
    Packet p;
    ASSERT_EQ(add_frame(p, 9, 0, nullptr, 0), Status::Ok);

    PacketHeader       hdr;
    std::vector<Frame> frames;
    ASSERT_EQ(decode(encode(p), hdr, frames), Status::Ok);
    ASSERT_EQ(frames.size(), 1u);
    EXPECT_EQ(frames[0].hdr.stream_id, 9u);
    EXPECT_TRUE(frames[0].data.empty());
}

TEST(Packet, AddFrame_FillsBudgetExactly)
{
    Packet p;
    auto   data = gen_bytes(MAX_PAYLOAD_SIZE - FRAME_HDR_SIZE);
    ASSERT_EQ(add_frame(p, 1, 0, data.data(), data.size()), Status::Ok);
    EXPECT_EQ(encode(p).size(), MAX_DATAGRAM_SIZE);

    // not even an empty frame fits now
    EXPECT_EQ(add_frame(p, 1, 0, nullptr, 0), Status::CapacityExceeded);
}

TEST(Packet, AddFrame_CapacityExceededLeavesPacketUntouched)
{
    Packet p;
    auto   first = gen_bytes(10000);
    ASSERT_EQ(add_frame(p, 1, 0, first.data(), first.size()), Status::Ok);
    const auto before = p.payload;

    auto second = gen_bytes(5000);
    EXPECT_EQ(add_frame(p, 1, 10000, second.data(), second.size()), Status::CapacityExceeded);
    EXPECT_EQ(p.payload, before);
}

TEST(Packet, AddFrame_SmallerDatagramLimit)
{
    Packet p;
    auto   data = gen_bytes(100);
    // 13 + 16 + 100 = 129
    EXPECT_EQ(add_frame(p, 1, 0, data.data(), data.size(), 128), Status::CapacityExceeded);
    EXPECT_TRUE(p.payload.empty());
    EXPECT_EQ(add_frame(p, 1, 0, data.data(), data.size(), 129), Status::Ok);
}

TEST(Packet, Decode_RejectShortDatagram)
{
    std::vector<std::uint8_t> bytes(PACKET_HDR_SIZE - 1, 0);
    bytes[0] = 4;

    PacketHeader       hdr;
    std::vector<Frame> frames;
    EXPECT_EQ(decode(bytes, hdr, frames), Status::MalformedPacket);
}

TEST(Packet, Decode_RejectUnknownFlag)
{
    Packet p;
    auto   bytes = encode(p);
    bytes[0]     = 0;

    PacketHeader       hdr;
    std::vector<Frame> frames;
    EXPECT_EQ(decode(bytes, hdr, frames), Status::MalformedPacket);
    bytes[0] = 9;
    EXPECT_EQ(decode(bytes, hdr, frames), Status::MalformedPacket);
}

TEST(Packet, Decode_RejectFrameOverrun)
{
    Packet p;
    auto   data = gen_bytes(64);
    ASSERT_EQ(add_frame(p, 1, 0, data.data(), data.size()), Status::Ok);
    auto bytes = encode(p);

    // claim one more data byte than the payload holds
    bytes[PACKET_HDR_SIZE + 15] = 65;

    PacketHeader       hdr;
    std::vector<Frame> frames;
    EXPECT_EQ(decode(bytes, hdr, frames), Status::MalformedPacket);
    EXPECT_TRUE(frames.empty());
}

TEST(Packet, Decode_RejectPayloadLongerThanDatagram)
{
    Packet p;
    auto   data = gen_bytes(32);
    ASSERT_EQ(add_frame(p, 1, 0, data.data(), data.size()), Status::Ok);
    auto bytes = encode(p);
    bytes.pop_back();

    PacketHeader       hdr;
    std::vector<Frame> frames;
    EXPECT_EQ(decode(bytes, hdr, frames), Status::MalformedPacket);
}

TEST(Packet, Decode_RejectTruncatedFrameHeader)
{
    Packet p;
    p.payload = gen_bytes(FRAME_HDR_SIZE - 4);

    PacketHeader       hdr;
    std::vector<Frame> frames;
    EXPECT_EQ(decode(encode(p), hdr, frames), Status::MalformedPacket);
}

TEST(Packet, Decode_IgnoresTrailingBytes)
{
    Packet p;
    auto   data = gen_bytes(8);
    ASSERT_EQ(add_frame(p, 2, 0, data.data(), data.size()), Status::Ok);
    auto bytes = encode(p);
    bytes.push_back(0xEE);

    PacketHeader       hdr;
    std::vector<Frame> frames;
    ASSERT_EQ(decode(bytes, hdr, frames), Status::Ok);
    ASSERT_EQ(frames.size(), 1u);
    EXPECT_EQ(frames[0].data, data);
}

TEST(Packet, FlagHelpers)
{
    EXPECT_FALSE(is_valid_flag(0));
    for (std::uint8_t v = 1; v <= 8; ++v)
        EXPECT_TRUE(is_valid_flag(v));
    EXPECT_FALSE(is_valid_flag(9));

    EXPECT_STREQ(flag_name(Flag::AcceptConnection), "ACCEPT_CONNECTION");
}
