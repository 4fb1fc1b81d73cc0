#pragma once

#include <openssl/asn1.h>
#include <openssl/x509.h>

#include <string>
#include <string_view>

#include "authly/identity.hpp"
#include "authly/timedef.hpp"
#include "authly/tls-raii.hpp"

namespace authly {

// RFC 2253 representation of an X509 name. Empty string on failure.
std::string X509NameToString(const X509_NAME* name);

// Converts an ASN1 time (UTCTime or GeneralizedTime) into a system time point.
// Throws std::runtime_error if the time is malformed.
SysTimePoint Asn1TimeToTimePoint(const ASN1_TIME* asn1Time);

// Extract the descriptor of given certificate (subject, common name, DNS names, entity id, validity window).
// The entity id comes from the x500UniqueIdentifier attribute when present, else from a common name shaped like one.
// Throws std::runtime_error if the x500UniqueIdentifier attribute is not a valid entity id.
Identity ExtractIdentity(X509* cert);

// Decode a DER encoded certificate. Returns a null X509Ptr on failure.
X509Ptr ParseCertificateDer(std::string_view der);

}  // namespace authly
