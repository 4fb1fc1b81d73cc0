#include "authly/pem-reader.hpp"

#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/pem.h>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <ios>
#include <iterator>
#include <limits>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "authly/authly-error.hpp"
#include "authly/log.hpp"
#include "authly/openssl-errors.hpp"
#include "authly/tls-raii.hpp"

namespace authly {

namespace {

struct OpenSslFree {
  void operator()(void* ptr) const noexcept { OPENSSL_free(ptr); }
};

template <class T>
using OpenSslPtr = std::unique_ptr<T, OpenSslFree>;

}  // namespace

bool PemBlock::isEncrypted() const noexcept {
  return label == "ENCRYPTED PRIVATE KEY" || headers.find("ENCRYPTED") != std::string::npos;
}

bool LooksLikePem(std::string_view content) noexcept { return content.find("-----BEGIN ") != std::string_view::npos; }

std::string ReadWholeFile(const std::filesystem::path& path, ErrorKind errorKind) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    const int err = errno;
    ThrowAuthlyError(errorKind, "Unable to open '" + path.string() + "': " + std::strerror(err));
  }
  std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (in.bad()) {
    ThrowAuthlyError(errorKind, "Unable to read '" + path.string() + "'");
  }
  log::debug("Read {} bytes from {}", content.size(), path.string());
  return content;
}

std::vector<PemBlock> ParsePemBlocks(std::string_view pem, ErrorKind errorKind) {
  std::vector<PemBlock> blocks;
  if (pem.size() > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
    ThrowAuthlyError(errorKind, "PEM input too large");
  }
  auto bio = MakeMemBio(pem.data(), static_cast<int>(pem.size()));
  ::ERR_clear_error();
  while (true) {
    char* rawName = nullptr;
    char* rawHeader = nullptr;
    unsigned char* rawData = nullptr;
    long len = 0;
    const int ret = ::PEM_read_bio(bio.get(), &rawName, &rawHeader, &rawData, &len);
    OpenSslPtr<char> name(rawName);
    OpenSslPtr<char> header(rawHeader);
    OpenSslPtr<unsigned char> data(rawData);
    if (ret != 1) {
      const auto lastErr = ::ERR_peek_last_error();
      if (ERR_GET_LIB(lastErr) == ERR_LIB_PEM && ERR_GET_REASON(lastErr) == PEM_R_NO_START_LINE) {
        // regular end of input
        ::ERR_clear_error();
        break;
      }
      ThrowAuthlyError(errorKind, WithOpenSslErrors("Malformed PEM block #" + std::to_string(blocks.size() + 1)));
    }
    PemBlock& block = blocks.emplace_back();
    block.label = name.get();
    block.headers = header ? header.get() : "";
    block.der.assign(reinterpret_cast<const char*>(data.get()), static_cast<std::size_t>(len));
  }
  return blocks;
}

}  // namespace authly
