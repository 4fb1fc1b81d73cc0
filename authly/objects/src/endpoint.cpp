#include "authly/endpoint.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

namespace authly {

namespace {

constexpr std::string_view kHttpsScheme = "https://";

bool StartsWithIgnoreCase(std::string_view str, std::string_view prefix) {
  return str.size() >= prefix.size() &&
         std::equal(prefix.begin(), prefix.end(), str.begin(),
                    [](char lhs, char rhs) { return std::tolower(static_cast<unsigned char>(rhs)) == lhs; });
}

std::uint16_t ParsePort(std::string_view portStr) {
  std::uint32_t port{};
  const auto [ptr, errc] = std::from_chars(portStr.data(), portStr.data() + portStr.size(), port);
  if (portStr.empty() || errc != std::errc{} || ptr != portStr.data() + portStr.size() || port == 0 ||
      port > 65535U) {
    throw std::invalid_argument("Invalid port in URL: '" + std::string(portStr) + "'");
  }
  return static_cast<std::uint16_t>(port);
}

bool IsIpLiteral(const std::string& host) {
  in6_addr addr6{};
  in_addr addr4{};
  return ::inet_pton(AF_INET, host.c_str(), &addr4) == 1 || ::inet_pton(AF_INET6, host.c_str(), &addr6) == 1;
}

}  // namespace

Endpoint Endpoint::Parse(std::string_view url) {
  if (!StartsWithIgnoreCase(url, kHttpsScheme)) {
    if (StartsWithIgnoreCase(url, "http://")) {
      throw std::invalid_argument("Plain http URL rejected, transport encryption is mandatory: '" + std::string(url) +
                                  "'");
    }
    throw std::invalid_argument("URL must start with 'https://': '" + std::string(url) + "'");
  }
  std::string_view rest = url.substr(kHttpsScheme.size());

  const auto authorityEnd = rest.find_first_of("/?#");
  std::string_view authority = rest.substr(0, authorityEnd);
  if (authorityEnd != std::string_view::npos && rest.substr(authorityEnd) != "/") {
    throw std::invalid_argument("URL must not have a path, query or fragment: '" + std::string(url) + "'");
  }
  if (authority.find('@') != std::string_view::npos) {
    throw std::invalid_argument("URL must not contain user info: '" + std::string(url) + "'");
  }

  Endpoint endpoint;
  std::string_view hostPart;
  std::string_view portPart;
  if (!authority.empty() && authority.front() == '[') {
    const auto closing = authority.find(']');
    if (closing == std::string_view::npos) {
      throw std::invalid_argument("Unterminated IPv6 literal in URL: '" + std::string(url) + "'");
    }
    hostPart = authority.substr(1, closing - 1);
    std::string_view afterHost = authority.substr(closing + 1);
    if (!afterHost.empty()) {
      if (afterHost.front() != ':') {
        throw std::invalid_argument("Unexpected characters after IPv6 literal in URL: '" + std::string(url) + "'");
      }
      portPart = afterHost.substr(1);
      endpoint.port = ParsePort(portPart);
    }
  } else {
    const auto colon = authority.find(':');
    hostPart = authority.substr(0, colon);
    if (colon != std::string_view::npos) {
      portPart = authority.substr(colon + 1);
      endpoint.port = ParsePort(portPart);
    }
  }

  if (hostPart.empty()) {
    throw std::invalid_argument("URL has an empty host: '" + std::string(url) + "'");
  }
  endpoint.host.assign(hostPart);
  std::ranges::transform(endpoint.host, endpoint.host.begin(),
                         [](char ch) { return static_cast<char>(std::tolower(static_cast<unsigned char>(ch))); });
  endpoint.isIpLiteral = IsIpLiteral(endpoint.host);
  if (!endpoint.isIpLiteral && endpoint.host.find_first_of(" \t[]") != std::string::npos) {
    throw std::invalid_argument("Invalid host in URL: '" + std::string(url) + "'");
  }
  return endpoint;
}

std::string Endpoint::str() const {
  std::string out(kHttpsScheme);
  if (host.find(':') != std::string::npos) {
    out.push_back('[');
    out.append(host);
    out.push_back(']');
  } else {
    out.append(host);
  }
  out.push_back(':');
  out.append(portStr());
  return out;
}

}  // namespace authly
