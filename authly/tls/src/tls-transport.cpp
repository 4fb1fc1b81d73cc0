#include "authly/tls-transport.hpp"

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <cerrno>
#include <cstddef>
#include <string_view>

#include "authly/log.hpp"
#include "authly/openssl-errors.hpp"
#include "authly/sigpipe-guard.hpp"

namespace authly {

static_assert(EAGAIN == EWOULDBLOCK, "Add handling for EWOULDBLOCK if different from EAGAIN");

namespace {
inline bool isRetry(int code) { return code == SSL_ERROR_WANT_READ || code == SSL_ERROR_WANT_WRITE; }

inline TransportHint RetryHint(int code) {
  return code == SSL_ERROR_WANT_WRITE ? TransportHint::WriteReady : TransportHint::ReadReady;
}
}  // namespace

TransportHint TlsTransport::handshakeStep() {
  if (_handshakeDone) {
    return TransportHint::None;
  }
  SigPipeGuard sigPipeGuard;
  errno = 0;
  const int handshakeRet = ::SSL_do_handshake(_ssl.get());
  if (handshakeRet == 1) {
    _handshakeDone = true;
    return TransportHint::None;
  }
  const int err = ::SSL_get_error(_ssl.get(), handshakeRet);
  if (isRetry(err)) {
    return RetryHint(err);
  }
  // SSL_ERROR_SYSCALL with EAGAIN/EWOULDBLOCK should be treated as retry
  if (err == SSL_ERROR_SYSCALL && errno == EAGAIN) {
    return TransportHint::ReadReady;
  }
  return TransportHint::Error;
}

TransportResult TlsTransport::read(char* buf, std::size_t len) {
  TransportResult ret{0, TransportHint::None};
  if (!_handshakeDone) [[unlikely]] {
    ret.want = TransportHint::Error;
    return ret;
  }

  errno = 0;
  if (::SSL_read_ex(_ssl.get(), buf, len, &ret.bytesProcessed) == 1) [[likely]] {
    return ret;
  }

  ret.bytesProcessed = 0;

  // SSL_read_ex returned <=0. Determine why using SSL_get_error to decide whether this
  // indicates an orderly close (ZERO_RETURN), a retry condition (WANT_READ/WANT_WRITE) or a fatal error.
  const auto err = ::SSL_get_error(_ssl.get(), 0);
  if (err == SSL_ERROR_ZERO_RETURN) {
    // Clean shutdown from the peer (or plain EOF, as unexpected EOF is ignored by the context).
    return ret;
  }
  if (isRetry(err)) {
    ret.want = RetryHint(err);
    return ret;
  }
  if (err == SSL_ERROR_SYSCALL && errno == EAGAIN) {
    ret.want = TransportHint::ReadReady;
    return ret;
  }
  logErrorIfAny();
  ret.want = TransportHint::Error;
  return ret;
}

TransportResult TlsTransport::write(std::string_view data) {
  TransportResult ret{0, TransportHint::None};
  if (!_handshakeDone) [[unlikely]] {
    ret.want = TransportHint::Error;
    return ret;
  }

  // Avoid calling OpenSSL with a zero-length buffer. Some OpenSSL builds
  // treat a null/zero-length pointer as an invalid argument and return 'bad length'.
  SigPipeGuard sigPipeGuard;
  errno = 0;
  if (data.empty() || ::SSL_write_ex(_ssl.get(), data.data(), data.size(), &ret.bytesProcessed) == 1) {
    return ret;
  }

  ret.bytesProcessed = 0;  // return 0 so caller retries with same data

  const auto err = ::SSL_get_error(_ssl.get(), 0);
  if (isRetry(err)) {
    ret.want = RetryHint(err);
    return ret;
  }
  if (err == SSL_ERROR_SYSCALL && errno == EAGAIN) {
    ret.want = TransportHint::WriteReady;
    return ret;
  }

  logErrorIfAny();
  ret.want = TransportHint::Error;
  return ret;
}

void TlsTransport::shutdown() noexcept {
  auto* ssl = _ssl.get();
  if (ssl != nullptr && _handshakeDone && _fd) {
    // Best effort: send our close_notify once, do not wait for the peer's one as the socket is closed right after.
    SigPipeGuard sigPipeGuard;
    ::SSL_shutdown(ssl);
    ::ERR_clear_error();
  }
  _fd.close();
}

std::string_view TlsTransport::negotiatedVersion() const noexcept {
  if (!_handshakeDone) {
    return {};
  }
  return ::SSL_get_version(_ssl.get());
}

std::string_view TlsTransport::negotiatedCipher() const noexcept {
  if (!_handshakeDone) {
    return {};
  }
  const char* name = ::SSL_get_cipher_name(_ssl.get());
  return name == nullptr ? std::string_view{} : std::string_view(name);
}

void TlsTransport::logErrorIfAny() noexcept {
  for (auto errVal = ::ERR_get_error(); errVal != 0; errVal = ::ERR_get_error()) {
    if (!_peerAlert) {
      _peerAlert = ReceivedTlsAlert(errVal);
    }
    char errBuf[256];
    ::ERR_error_string_n(errVal, errBuf, sizeof(errBuf));
    log::error("TLS transport OpenSSL error: {} (handshake done={})", std::string_view(errBuf), _handshakeDone);
  }
}

}  // namespace authly
