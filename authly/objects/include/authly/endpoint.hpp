#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace authly {

// Network location of an Authly service, parsed from an 'https://host[:port][/]' URL.
struct Endpoint {
  static constexpr std::uint16_t kDefaultPort = 443;

  // Parse given URL.
  // Throws std::invalid_argument if the URL is malformed, if its scheme is not 'https' (transport encryption is
  // mandatory) or if it has a path other than '/', a query, a fragment or user info.
  static Endpoint Parse(std::string_view url);

  // 'https://host:port', with brackets around IPv6 literals.
  [[nodiscard]] std::string str() const;

  [[nodiscard]] std::string portStr() const { return std::to_string(port); }

  bool operator==(const Endpoint&) const noexcept = default;

  // Lower cased host name or IP literal, without brackets.
  std::string host;
  std::uint16_t port{kDefaultPort};
  // True if host is an IPv4 or IPv6 literal (no SNI is sent, certificate IP SAN is checked instead of DNS).
  bool isIpLiteral{false};
};

}  // namespace authly
