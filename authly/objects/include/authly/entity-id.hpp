#pragma once

#include <compare>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace authly {

// 128-bit identifier of an Authly entity (a service is an entity).
// Textual form is 'e.' followed by 32 lower case hexadecimal digits, most significant first.
class EntityId {
 public:
  static constexpr std::string_view kPrefix = "e.";
  static constexpr std::size_t kNbHexDigits = 32;
  static constexpr std::size_t kStrLen = kPrefix.size() + kNbHexDigits;

  // Values in [1, kMinValue) are reserved.
  static constexpr std::uint64_t kMinValue = 32768;

  constexpr EntityId() noexcept = default;

  constexpr EntityId(std::uint64_t high, std::uint64_t low) noexcept : _high(high), _low(low) {}

  // Parse textual form. Returns std::nullopt if the prefix, the length, a digit is invalid, or if the value is in
  // the reserved range.
  [[nodiscard]] static std::optional<EntityId> TryParse(std::string_view str) noexcept;

  // Same as TryParse, but throws std::invalid_argument on failure.
  [[nodiscard]] static EntityId Parse(std::string_view str);

  [[nodiscard]] std::string str() const;

  [[nodiscard]] constexpr std::uint64_t high() const noexcept { return _high; }
  [[nodiscard]] constexpr std::uint64_t low() const noexcept { return _low; }

  [[nodiscard]] constexpr bool isZero() const noexcept { return _high == 0 && _low == 0; }

  constexpr auto operator<=>(const EntityId&) const noexcept = default;

 private:
  std::uint64_t _high{};
  std::uint64_t _low{};
};

}  // namespace authly
