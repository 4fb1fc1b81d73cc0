#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace authly {

/// Application frame types exchanged over an established session.
enum class FrameType : uint8_t {
  Request = 1,
  Response = 2,
  Ping = 3,
  Pong = 4,
  Close = 5,
};

/// Convert FrameType to human-readable string for logging/debugging.
constexpr std::string_view FrameTypeName(FrameType type) noexcept {
  switch (type) {
    case FrameType::Request:
      return "REQUEST";
    case FrameType::Response:
      return "RESPONSE";
    case FrameType::Ping:
      return "PING";
    case FrameType::Pong:
      return "PONG";
    case FrameType::Close:
      return "CLOSE";
    default:
      return "UNKNOWN";
  }
}

constexpr bool IsKnownFrameType(uint8_t type) noexcept {
  return type >= static_cast<uint8_t>(FrameType::Request) && type <= static_cast<uint8_t>(FrameType::Close);
}

/// Frame header (13 bytes).
/// Layout: Type (1 byte) | Sequence (8 bytes, big-endian) | Length (4 bytes, big-endian)
struct FrameHeader {
  static constexpr std::size_t kSize = 13;

  FrameType type;
  uint64_t sequence;
  uint32_t length;  ///< Payload length
};

struct Frame {
  bool operator==(const Frame&) const = default;

  FrameType type;
  uint64_t sequence;
  std::string payload;
};

/// Parse a 13-byte frame header from raw bytes. The type is not validated.
/// Precondition: data.size() >= FrameHeader::kSize
[[nodiscard]] FrameHeader ParseFrameHeader(std::string_view data) noexcept;

/// Serialize a frame header to a 13-byte buffer.
void WriteFrameHeader(char* buffer, FrameHeader header) noexcept;

/// Append a complete frame (header + payload) to 'out'.
/// Throws std::length_error if the payload does not fit in 32 bits.
void AppendFrame(std::string& out, FrameType type, uint64_t sequence, std::string_view payload);

/// Accumulates received bytes and yields complete frames.
class FrameDecoder {
 public:
  explicit FrameDecoder(uint32_t maxFrameSize) noexcept : _maxFrameSize(maxFrameSize) {}

  /// Append raw bytes received from the transport.
  void feed(std::string_view data) { _buffer.append(data); }

  /// Extract the next complete frame, if any.
  /// Throws ProtocolViolationError on unknown frame type or on a length above the maximum frame size.
  std::optional<Frame> next();

  /// Number of received bytes not consumed yet.
  [[nodiscard]] std::size_t bufferedBytes() const noexcept { return _buffer.size() - _pos; }

  [[nodiscard]] uint32_t maxFrameSize() const noexcept { return _maxFrameSize; }

 private:
  std::string _buffer;
  std::size_t _pos{};
  uint32_t _maxFrameSize;
};

}  // namespace authly
