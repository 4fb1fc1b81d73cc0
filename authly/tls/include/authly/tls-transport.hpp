#pragma once

#include <openssl/ssl.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>

#include "authly/base-fd.hpp"
#include "authly/tls-raii.hpp"

namespace authly {

// Indicates what the transport layer needs to proceed after a non-blocking I/O operation returns EAGAIN/WANT.
enum class TransportHint : uint8_t {
  None,        // No special action needed (operation completed)
  ReadReady,   // Need socket readable before operation can proceed (SSL_ERROR_WANT_READ)
  WriteReady,  // Need socket writable before operation can proceed (SSL_ERROR_WANT_WRITE)
  Error
};

struct TransportResult {
  std::size_t bytesProcessed;  // bytes read for read operations, or written for write operations
  TransportHint want;          // indicates whether socket needs to be readable or writable for operation to proceed.
};

// Client TLS transport over a non-blocking connected socket. Owns both the SSL object and the socket.
class TlsTransport {
 public:
  TlsTransport(SslPtr sslPtr, BaseFd fd) noexcept : _ssl(std::move(sslPtr)), _fd(std::move(fd)) {}

  // Advance the client handshake by as much as the socket allows.
  // Returns None once the handshake is complete, ReadReady / WriteReady if it should be called again when the
  // socket is ready, Error on fatal failure (OpenSSL error queue left untouched for the caller).
  TransportHint handshakeStep();

  // Non-blocking read. bytesProcessed > 0 on success. bytesProcessed == 0 with want == None means orderly close.
  TransportResult read(char* buf, std::size_t len);

  // Non-blocking write. If bytesProcessed is 0, check the want field.
  TransportResult write(std::string_view data);

  [[nodiscard]] bool handshakeDone() const noexcept { return _handshakeDone; }

  // Perform best-effort TLS shutdown (non-blocking) and close the socket. Safe to call multiple times.
  void shutdown() noexcept;

  [[nodiscard]] bool isOpen() const noexcept { return static_cast<bool>(_fd); }

  [[nodiscard]] int fd() const noexcept { return _fd.fd(); }

  [[nodiscard]] SSL* rawSsl() const noexcept { return _ssl.get(); }

  // Negotiated protocol version (for instance "TLSv1.3"), empty before the handshake is done.
  [[nodiscard]] std::string_view negotiatedVersion() const noexcept;

  // Negotiated cipher suite name, empty before the handshake is done.
  [[nodiscard]] std::string_view negotiatedCipher() const noexcept;

  // First fatal TLS alert (SSL_AD_* description) received from the peer by read or write, if any.
  [[nodiscard]] std::optional<int> peerAlert() const noexcept { return _peerAlert; }

  void logErrorIfAny() noexcept;

 private:
  SslPtr _ssl;
  BaseFd _fd;
  std::optional<int> _peerAlert;
  bool _handshakeDone{false};
};

}  // namespace authly
