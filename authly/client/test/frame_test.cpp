#include "authly/frame.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <string>

#include "authly/authly-error.hpp"

namespace authly {

TEST(Frame, HeaderLayoutIsBigEndian) {
  std::string out;
  AppendFrame(out, FrameType::Request, 0x0102030405060708ULL, "abc");
  ASSERT_EQ(out.size(), FrameHeader::kSize + 3U);
  EXPECT_EQ(out[0], '\x01');
  EXPECT_EQ(out.substr(1, 8), std::string("\x01\x02\x03\x04\x05\x06\x07\x08", 8));
  EXPECT_EQ(out.substr(9, 4), std::string("\x00\x00\x00\x03", 4));
  EXPECT_EQ(out.substr(FrameHeader::kSize), "abc");

  const FrameHeader header = ParseFrameHeader(out);
  EXPECT_EQ(header.type, FrameType::Request);
  EXPECT_EQ(header.sequence, 0x0102030405060708ULL);
  EXPECT_EQ(header.length, 3U);
}

TEST(Frame, TypeNames) {
  EXPECT_EQ(FrameTypeName(FrameType::Ping), "PING");
  EXPECT_EQ(FrameTypeName(static_cast<FrameType>(42)), "UNKNOWN");
  EXPECT_TRUE(IsKnownFrameType(5));
  EXPECT_FALSE(IsKnownFrameType(0));
  EXPECT_FALSE(IsKnownFrameType(6));
}

TEST(FrameDecoder, DecodesSeveralFrames) {
  std::string wire;
  AppendFrame(wire, FrameType::Response, 1, "first");
  AppendFrame(wire, FrameType::Ping, 7, "");
  AppendFrame(wire, FrameType::Response, 2, "second");

  FrameDecoder decoder(1024);
  decoder.feed(wire);
  EXPECT_EQ(decoder.next(), (Frame{FrameType::Response, 1, "first"}));
  EXPECT_EQ(decoder.next(), (Frame{FrameType::Ping, 7, ""}));
  EXPECT_EQ(decoder.next(), (Frame{FrameType::Response, 2, "second"}));
  EXPECT_FALSE(decoder.next().has_value());
  EXPECT_EQ(decoder.bufferedBytes(), 0U);
}

TEST(FrameDecoder, WaitsForCompleteFrames) {
  std::string wire;
  AppendFrame(wire, FrameType::Response, 3, "payload");

  FrameDecoder decoder(1024);
  for (std::size_t pos = 0; pos + 1 < wire.size(); ++pos) {
    decoder.feed(wire.substr(pos, 1));
    EXPECT_FALSE(decoder.next().has_value()) << "at byte " << pos;
  }
  decoder.feed(wire.substr(wire.size() - 1));
  const auto frame = decoder.next();
  ASSERT_TRUE(frame.has_value());
  EXPECT_EQ(frame->payload, "payload");
  EXPECT_EQ(frame->sequence, 3U);
}

TEST(FrameDecoder, KeepsTrailingBytes) {
  std::string wire;
  AppendFrame(wire, FrameType::Pong, 1, "x");
  AppendFrame(wire, FrameType::Pong, 2, "y");

  FrameDecoder decoder(1024);
  decoder.feed(wire.substr(0, wire.size() - 2));
  ASSERT_TRUE(decoder.next().has_value());
  EXPECT_FALSE(decoder.next().has_value());
  EXPECT_EQ(decoder.bufferedBytes(), FrameHeader::kSize - 1U);
  decoder.feed(wire.substr(wire.size() - 2));
  EXPECT_EQ(decoder.next(), (Frame{FrameType::Pong, 2, "y"}));
}

TEST(FrameDecoder, RejectsUnknownType) {
  std::string wire;
  AppendFrame(wire, FrameType::Request, 1, "x");
  wire[0] = '\x09';
  FrameDecoder decoder(1024);
  decoder.feed(wire);
  EXPECT_THROW((void)decoder.next(), ProtocolViolationError);
}

TEST(FrameDecoder, RejectsOversizedFrameFromHeader) {
  char header[FrameHeader::kSize];
  WriteFrameHeader(header, FrameHeader{FrameType::Response, 1, 1025});
  FrameDecoder decoder(1024);
  // the payload has not arrived yet, the header alone is enough to reject it
  decoder.feed(std::string_view(header, sizeof(header)));
  EXPECT_THROW((void)decoder.next(), ProtocolViolationError);
}

TEST(FrameDecoder, AcceptsFrameAtMaximumSize) {
  std::string wire;
  AppendFrame(wire, FrameType::Response, 1, std::string(1024, 'z'));
  FrameDecoder decoder(1024);
  decoder.feed(wire);
  const auto frame = decoder.next();
  ASSERT_TRUE(frame.has_value());
  EXPECT_EQ(frame->payload.size(), 1024U);
}

TEST(FrameDecoder, ManySmallFrames) {
  FrameDecoder decoder(64);
  std::string wire;
  for (uint64_t seq = 1; seq <= 1000; ++seq) {
    AppendFrame(wire, FrameType::Response, seq, std::to_string(seq));
  }
  decoder.feed(wire);
  for (uint64_t seq = 1; seq <= 1000; ++seq) {
    const auto frame = decoder.next();
    ASSERT_TRUE(frame.has_value());
    EXPECT_EQ(frame->sequence, seq);
    EXPECT_EQ(frame->payload, std::to_string(seq));
  }
  EXPECT_EQ(decoder.bufferedBytes(), 0U);
}

}  // namespace authly
