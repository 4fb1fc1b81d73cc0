#include "authly/entity-id.hpp"

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include "authly/char-hexadecimal-converter.hpp"

namespace authly {

namespace {

std::optional<std::uint64_t> ParseHex64(std::string_view hex) noexcept {
  std::uint64_t value{};
  for (char ch : hex) {
    const int digit = from_hex_digit(ch);
    if (digit < 0) {
      return std::nullopt;
    }
    value = (value << 4U) | static_cast<std::uint64_t>(digit);
  }
  return value;
}

char* WriteHex64(std::uint64_t value, char* buf) {
  for (int shift = 56; shift >= 0; shift -= 8) {
    buf = to_lower_hex(static_cast<unsigned char>(value >> shift), buf);
  }
  return buf;
}

}  // namespace

std::optional<EntityId> EntityId::TryParse(std::string_view str) noexcept {
  if (str.size() != kStrLen || !str.starts_with(kPrefix)) {
    return std::nullopt;
  }
  str.remove_prefix(kPrefix.size());
  const auto high = ParseHex64(str.substr(0, kNbHexDigits / 2));
  const auto low = ParseHex64(str.substr(kNbHexDigits / 2));
  if (!high || !low) {
    return std::nullopt;
  }
  EntityId id(*high, *low);
  if (!id.isZero() && id._high == 0 && id._low < kMinValue) {
    return std::nullopt;
  }
  return id;
}

EntityId EntityId::Parse(std::string_view str) {
  auto id = TryParse(str);
  if (!id) {
    throw std::invalid_argument("Invalid entity id '" + std::string(str) + "'");
  }
  return *id;
}

std::string EntityId::str() const {
  std::string out(kStrLen, '\0');
  char* buf = out.data();
  for (char ch : kPrefix) {
    *buf++ = ch;
  }
  buf = WriteHex64(_high, buf);
  WriteHex64(_low, buf);
  return out;
}

}  // namespace authly
