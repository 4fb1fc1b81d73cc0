#include "authly/identity.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

namespace authly {

namespace {

bool EqualIgnoreCase(std::string_view lhs, std::string_view rhs) {
  return lhs.size() == rhs.size() && std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char lc, char rc) {
           return std::tolower(static_cast<unsigned char>(lc)) == std::tolower(static_cast<unsigned char>(rc));
         });
}

}  // namespace

bool Identity::matches(std::string_view expected) const {
  if (expected.empty()) {
    return false;
  }
  if (expected == subject || expected == commonName) {
    return true;
  }
  if (entityId && expected == entityId->str()) {
    return true;
  }
  return std::ranges::any_of(dnsNames, [expected](const std::string& dnsName) {
    return EqualIgnoreCase(dnsName, expected);
  });
}

std::string Identity::displayName() const {
  if (entityId) {
    return entityId->str();
  }
  return subject;
}

}  // namespace authly
