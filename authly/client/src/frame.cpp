#include "authly/frame.hpp"

#include <fmt/format.h>

#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "authly/authly-error.hpp"

namespace authly {

namespace {

// Read a 32-bit big-endian value.
constexpr uint32_t Read32BE(const char* data) noexcept {
  return (static_cast<uint32_t>(static_cast<unsigned char>(data[0])) << 24) |
         (static_cast<uint32_t>(static_cast<unsigned char>(data[1])) << 16) |
         (static_cast<uint32_t>(static_cast<unsigned char>(data[2])) << 8) |
         static_cast<uint32_t>(static_cast<unsigned char>(data[3]));
}

// Read a 64-bit big-endian value.
constexpr uint64_t Read64BE(const char* data) noexcept {
  return (static_cast<uint64_t>(Read32BE(data)) << 32) | static_cast<uint64_t>(Read32BE(data + 4));
}

// Write a 32-bit big-endian value.
constexpr void Write32BE(char* data, uint32_t value) noexcept {
  data[0] = static_cast<char>((value >> 24) & 0xFF);
  data[1] = static_cast<char>((value >> 16) & 0xFF);
  data[2] = static_cast<char>((value >> 8) & 0xFF);
  data[3] = static_cast<char>(value & 0xFF);
}

// Write a 64-bit big-endian value.
constexpr void Write64BE(char* data, uint64_t value) noexcept {
  Write32BE(data, static_cast<uint32_t>(value >> 32));
  Write32BE(data + 4, static_cast<uint32_t>(value & 0xFFFFFFFF));
}

// Compact the buffer once the consumed prefix dominates it.
constexpr std::size_t kCompactThreshold = 4096;

}  // namespace

FrameHeader ParseFrameHeader(std::string_view data) noexcept {
  FrameHeader header;
  header.type = static_cast<FrameType>(static_cast<uint8_t>(data[0]));
  header.sequence = Read64BE(data.data() + 1);
  header.length = Read32BE(data.data() + 9);
  return header;
}

void WriteFrameHeader(char* buffer, FrameHeader header) noexcept {
  buffer[0] = static_cast<char>(header.type);
  Write64BE(buffer + 1, header.sequence);
  Write32BE(buffer + 9, header.length);
}

void AppendFrame(std::string& out, FrameType type, uint64_t sequence, std::string_view payload) {
  if (payload.size() > std::numeric_limits<uint32_t>::max()) {
    throw std::length_error("Frame payload too large");
  }
  const auto oldSize = out.size();
  out.resize(oldSize + FrameHeader::kSize);
  WriteFrameHeader(out.data() + oldSize, FrameHeader{type, sequence, static_cast<uint32_t>(payload.size())});
  out.append(payload);
}

std::optional<Frame> FrameDecoder::next() {
  std::string_view pending(_buffer.data() + _pos, _buffer.size() - _pos);
  if (pending.size() < FrameHeader::kSize) {
    return std::nullopt;
  }
  const auto rawType = static_cast<uint8_t>(pending[0]);
  if (!IsKnownFrameType(rawType)) {
    throw ProtocolViolationError(fmt::format("Unknown frame type {}", rawType));
  }
  const FrameHeader header = ParseFrameHeader(pending);
  if (header.length > _maxFrameSize) {
    throw ProtocolViolationError(
        fmt::format("Frame length {} exceeds maximum frame size {}", header.length, _maxFrameSize));
  }
  if (pending.size() - FrameHeader::kSize < header.length) {
    return std::nullopt;
  }

  Frame frame{header.type, header.sequence, std::string(pending.substr(FrameHeader::kSize, header.length))};
  _pos += FrameHeader::kSize + header.length;
  if (_pos == _buffer.size()) {
    _buffer.clear();
    _pos = 0;
  } else if (_pos >= kCompactThreshold && _pos * 2 >= _buffer.size()) {
    _buffer.erase(0, _pos);
    _pos = 0;
  }
  return std::optional<Frame>(std::move(frame));
}

}  // namespace authly
