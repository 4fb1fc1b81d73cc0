#pragma once

#include <cstddef>
#include <span>
#include <string>

namespace authly {

/// Writes to 'buf' the 2-char hexadecimal code of given byte 'ch'.
/// Given buffer should have space for at least two chars.
/// Letters will be in lower case.
/// Return a pointer to the char immediately positioned after the written hexadecimal code.
/// Examples:
///  0x2c -> "2c"
///  0xff -> "ff"
constexpr char *to_lower_hex(unsigned char ch, char *buf) {
  constexpr const char *const kHexits = "0123456789abcdef";

  buf[0] = kHexits[ch >> 4U];
  buf[1] = kHexits[ch & 0x0F];

  return buf + 2;
}

/// Decode a single hexadecimal digit. Returns -1 if invalid.
constexpr int from_hex_digit(char ch) {
  if (ch >= '0' && ch <= '9') {
    return ch - '0';
  }
  if (ch >= 'A' && ch <= 'F') {
    return 10 + (ch - 'A');
  }
  if (ch >= 'a' && ch <= 'f') {
    return 10 + (ch - 'a');
  }
  return -1;
}

/// Lower case hexadecimal representation of given bytes, 2 chars per byte.
inline std::string ToLowerHex(std::span<const std::byte> bytes) {
  std::string out(bytes.size() * 2U, '\0');
  char *buf = out.data();
  for (std::byte byte : bytes) {
    buf = to_lower_hex(static_cast<unsigned char>(byte), buf);
  }
  return out;
}

}  // namespace authly
