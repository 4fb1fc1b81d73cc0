#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "authly/entity-id.hpp"
#include "authly/timedef.hpp"

namespace authly {

// Descriptor of a service identity, extracted from a (verified) X509 certificate.
struct Identity {
  // Returns true if 'expected' designates this identity. 'expected' may be the exact RFC 2253 subject, the common
  // name, one of the DNS subject alternative names (case insensitive) or the textual entity id.
  [[nodiscard]] bool matches(std::string_view expected) const;

  // Entity id string if known, else the subject.
  [[nodiscard]] std::string displayName() const;

  [[nodiscard]] bool isValidAt(SysTimePoint tp) const noexcept { return notBefore <= tp && tp <= notAfter; }

  bool operator==(const Identity&) const = default;

  std::string subject;      // RFC 2253
  std::string commonName;   // first CN of subject, empty if none
  std::string issuer;       // RFC 2253
  std::string fingerprint;  // lower case hex SHA-256 of the DER encoding
  std::vector<std::string> dnsNames;
  std::optional<EntityId> entityId;
  SysTimePoint notBefore;
  SysTimePoint notAfter;
};

}  // namespace authly
