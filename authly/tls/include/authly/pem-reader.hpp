#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "authly/authly-error.hpp"

namespace authly {

struct PemBlock {
  [[nodiscard]] bool isEncrypted() const noexcept;

  std::string label;    // e.g. "CERTIFICATE", "PRIVATE KEY"
  std::string headers;  // RFC 1421 headers, non-empty only for legacy encrypted keys
  std::string der;      // decoded content
};

// Returns true if 'content' contains at least one PEM armor line.
[[nodiscard]] bool LooksLikePem(std::string_view content) noexcept;

// Read the whole content of a file.
// Throws the AuthlyError of given kind if the file cannot be read.
[[nodiscard]] std::string ReadWholeFile(const std::filesystem::path& path, ErrorKind errorKind);

// Decode all PEM blocks of 'pem', in order. Text outside blocks is ignored.
// Throws the AuthlyError of given kind if a block is malformed.
[[nodiscard]] std::vector<PemBlock> ParsePemBlocks(std::string_view pem, ErrorKind errorKind);

}  // namespace authly
