#include "authly/x509-utils.hpp"

#include <openssl/asn1.h>
#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/obj_mac.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>

#include <chrono>
#include <cstddef>
#include <ctime>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>

#include "authly/char-hexadecimal-converter.hpp"
#include "authly/entity-id.hpp"
#include "authly/identity.hpp"
#include "authly/timedef.hpp"
#include "authly/tls-raii.hpp"

namespace authly {

namespace {

// UTF-8 content of an ASN1 string, falling back to its raw bytes for non textual types.
std::string Asn1StringToUtf8(const ASN1_STRING* str) {
  unsigned char* utf8 = nullptr;
  const int len = ::ASN1_STRING_to_UTF8(&utf8, str);
  if (len >= 0) {
    std::string out(reinterpret_cast<const char*>(utf8), static_cast<std::size_t>(len));
    OPENSSL_free(utf8);
    return out;
  }
  return {reinterpret_cast<const char*>(::ASN1_STRING_get0_data(str)),
          static_cast<std::size_t>(::ASN1_STRING_length(str))};
}

std::string FirstEntryOf(const X509_NAME* name, int nid) {
  const int idx = ::X509_NAME_get_index_by_NID(name, nid, -1);
  if (idx < 0) {
    return {};
  }
  const X509_NAME_ENTRY* entry = ::X509_NAME_get_entry(name, idx);
  return Asn1StringToUtf8(::X509_NAME_ENTRY_get_data(entry));
}

std::optional<EntityId> EntityIdOf(const X509_NAME* name, std::string_view commonName) {
  const auto uniqueId = FirstEntryOf(name, NID_x500UniqueIdentifier);
  if (!uniqueId.empty()) {
    auto entityId = EntityId::TryParse(uniqueId);
    if (!entityId) {
      throw std::runtime_error("Malformed entity id '" + uniqueId + "' in certificate subject");
    }
    return entityId;
  }
  return EntityId::TryParse(commonName);
}

std::string Sha256Fingerprint(X509* cert) {
  unsigned char md[EVP_MAX_MD_SIZE];
  unsigned int mdLen = 0;
  if (::X509_digest(cert, ::EVP_sha256(), md, &mdLen) != 1) {
    return {};
  }
  return ToLowerHex(std::as_bytes(std::span<const unsigned char>(md, mdLen)));
}

}  // namespace

std::string X509NameToString(const X509_NAME* name) {
  if (name == nullptr) {
    return {};
  }
  auto memBio = MakeMemoryBio();
  if (::X509_NAME_print_ex(memBio.get(), name, 0, XN_FLAG_RFC2253 & ~ASN1_STRFLGS_ESC_MSB) < 0) {
    return {};
  }
  BUF_MEM* bptr = nullptr;
  BIO_get_mem_ptr(memBio.get(), &bptr);
  if (bptr == nullptr) {
    return {};
  }
  return {bptr->data, bptr->length};
}

SysTimePoint Asn1TimeToTimePoint(const ASN1_TIME* asn1Time) {
  std::tm tm{};
  if (asn1Time == nullptr || ::ASN1_TIME_to_tm(asn1Time, &tm) != 1) {
    throw std::runtime_error("Malformed ASN1 time");
  }
  return SysClock::from_time_t(::timegm(&tm));
}

Identity ExtractIdentity(X509* cert) {
  Identity identity;
  const X509_NAME* subject = ::X509_get_subject_name(cert);
  identity.subject = X509NameToString(subject);
  identity.issuer = X509NameToString(::X509_get_issuer_name(cert));
  if (subject != nullptr) {
    identity.commonName = FirstEntryOf(subject, NID_commonName);
    identity.entityId = EntityIdOf(subject, identity.commonName);
  }
  identity.fingerprint = Sha256Fingerprint(cert);
  identity.notBefore = Asn1TimeToTimePoint(::X509_get0_notBefore(cert));
  identity.notAfter = Asn1TimeToTimePoint(::X509_get0_notAfter(cert));

  auto* sans = static_cast<GENERAL_NAMES*>(::X509_get_ext_d2i(cert, NID_subject_alt_name, nullptr, nullptr));
  if (sans != nullptr) {
    const int nbNames = sk_GENERAL_NAME_num(sans);
    for (int idx = 0; idx < nbNames; ++idx) {
      const GENERAL_NAME* gen = sk_GENERAL_NAME_value(sans, idx);
      if (gen->type == GEN_DNS) {
        identity.dnsNames.push_back(Asn1StringToUtf8(gen->d.dNSName));
      }
    }
    GENERAL_NAMES_free(sans);
  }
  return identity;
}

X509Ptr ParseCertificateDer(std::string_view der) {
  const auto* data = reinterpret_cast<const unsigned char*>(der.data());
  X509* cert = ::d2i_X509(nullptr, &data, static_cast<long>(der.size()));
  if (cert != nullptr && data != reinterpret_cast<const unsigned char*>(der.data() + der.size())) {
    // trailing garbage
    ::X509_free(cert);
    cert = nullptr;
  }
  return {cert, ::X509_free};
}

}  // namespace authly
