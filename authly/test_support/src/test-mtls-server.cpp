#include "authly/test-mtls-server.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/pem.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>
#include <openssl/x509_vfy.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>

#include <array>
#include <cerrno>
#include <cstdint>
#include <exception>
#include <mutex>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include "authly/base-fd.hpp"
#include "authly/client-config.hpp"
#include "authly/errno-throw.hpp"
#include "authly/frame.hpp"
#include "authly/log.hpp"
#include "authly/openssl-errors.hpp"
#include "authly/sigpipe-guard.hpp"
#include "authly/tls-raii.hpp"
#include "authly/x509-utils.hpp"

namespace authly::test {

namespace {

constexpr int kPollPeriodMs = 20;
constexpr suseconds_t kSocketTimeoutUs = 50000;

std::vector<X509Ptr> ReadCertificates(std::string_view pem) {
  std::vector<X509Ptr> certs;
  if (pem.empty()) {
    return certs;
  }
  auto bio = MakeMemBio(pem.data(), static_cast<int>(pem.size()));
  while (X509* cert = ::PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr)) {
    certs.emplace_back(cert, ::X509_free);
  }
  ::ERR_clear_error();  // end of input
  if (certs.empty()) {
    throw std::runtime_error("No certificate in PEM");
  }
  return certs;
}

bool IsRetry(SSL* ssl, int ret) {
  const int err = ::SSL_get_error(ssl, ret);
  return err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE;
}

bool WriteAll(SSL* ssl, std::string_view data, const std::stop_token& stopToken) {
  while (!data.empty()) {
    if (stopToken.stop_requested()) {
      return false;
    }
    std::size_t written = 0;
    const int ret = ::SSL_write_ex(ssl, data.data(), data.size(), &written);
    if (ret == 1) {
      data.remove_prefix(written);
    } else if (!IsRetry(ssl, ret)) {
      return false;
    }
  }
  return true;
}

// Reads the first frame of the client and answers it if it is the ping confirming the handshake.
bool AnswerConfirmation(SSL* ssl, const std::stop_token& stopToken) {
  FrameDecoder decoder(ClientConfig::kDefaultMaxFrameSize);
  std::array<char, 4096> buf;
  while (!stopToken.stop_requested()) {
    if (auto frame = decoder.next()) {
      if (frame->type != FrameType::Ping) {
        return false;
      }
      std::string pong;
      AppendFrame(pong, FrameType::Pong, frame->sequence, frame->payload);
      return WriteAll(ssl, pong, stopToken);
    }
    std::size_t nbRead = 0;
    const int ret = ::SSL_read_ex(ssl, buf.data(), buf.size(), &nbRead);
    if (ret == 1) {
      decoder.feed(std::string_view(buf.data(), nbRead));
    } else if (!IsRetry(ssl, ret)) {
      return false;
    }
  }
  return false;
}

void DrainUntilStopped(SSL* ssl, const std::stop_token& stopToken) {
  std::array<char, 4096> buf;
  while (!stopToken.stop_requested()) {
    std::size_t nbRead = 0;
    const int ret = ::SSL_read_ex(ssl, buf.data(), buf.size(), &nbRead);
    if (ret != 1 && !IsRetry(ssl, ret)) {
      return;
    }
  }
}

}  // namespace

TestMtlsServer::TestMtlsServer(TestMtlsServerConfig config)
    : _config(std::move(config)), _ctx(::SSL_CTX_new(TLS_server_method()), ::SSL_CTX_free) {
  if (!_ctx) {
    throw std::runtime_error(WithOpenSslErrors("SSL_CTX_new failed"));
  }
  ::SSL_CTX_set_min_proto_version(_ctx.get(), TLS1_2_VERSION);
  ::SSL_CTX_set_options(_ctx.get(), SSL_OP_NO_TICKET);
  ::SSL_CTX_set_num_tickets(_ctx.get(), 0);
  if (_config.maxProtoVersion != 0) {
    ::SSL_CTX_set_max_proto_version(_ctx.get(), _config.maxProtoVersion);
  }

  auto certs = ReadCertificates(_config.certPem);
  if (::SSL_CTX_use_certificate(_ctx.get(), certs.front().get()) != 1) {
    throw std::runtime_error(WithOpenSslErrors("SSL_CTX_use_certificate failed"));
  }
  for (auto& chainCert : ReadCertificates(_config.chainPem)) {
    if (::SSL_CTX_add1_chain_cert(_ctx.get(), chainCert.get()) != 1) {
      throw std::runtime_error(WithOpenSslErrors("SSL_CTX_add1_chain_cert failed"));
    }
  }
  auto keyBio = MakeMemBio(_config.keyPem.data(), static_cast<int>(_config.keyPem.size()));
  PKeyPtr key(::PEM_read_bio_PrivateKey(keyBio.get(), nullptr, nullptr, nullptr), ::EVP_PKEY_free);
  if (!key || ::SSL_CTX_use_PrivateKey(_ctx.get(), key.get()) != 1) {
    throw std::runtime_error(WithOpenSslErrors("Unable to use server private key"));
  }

  if (_config.mode != ServerMode::NoClientCertRequest && _config.mode != ServerMode::Silent) {
    X509_STORE* store = ::SSL_CTX_get_cert_store(_ctx.get());
    for (auto& anchor : ReadCertificates(_config.clientCaPem)) {
      if (::X509_STORE_add_cert(store, anchor.get()) != 1) {
        throw std::runtime_error(WithOpenSslErrors("X509_STORE_add_cert failed"));
      }
    }
    ::X509_STORE_set_flags(store, X509_V_FLAG_PARTIAL_CHAIN);
    ::SSL_CTX_set_verify(_ctx.get(), SSL_VERIFY_PEER | SSL_VERIFY_FAIL_IF_NO_PEER_CERT, nullptr);
  }

  _listenFd = BaseFd(::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0));
  if (!_listenFd) {
    throw_errno("socket");
  }
  static constexpr int kEnable = 1;
  ::setsockopt(_listenFd.fd(), SOL_SOCKET, SO_REUSEADDR, &kEnable, sizeof(kEnable));
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  addr.sin_port = 0;
  if (::bind(_listenFd.fd(), reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) != 0) {
    throw_errno("bind");
  }
  if (::listen(_listenFd.fd(), SOMAXCONN) != 0) {
    throw_errno("listen");
  }
  socklen_t addrLen = sizeof(addr);
  if (::getsockname(_listenFd.fd(), reinterpret_cast<sockaddr*>(&addr), &addrLen) != 0) {
    throw_errno("getsockname");
  }
  _port = ntohs(addr.sin_port);

  _acceptThread = std::jthread([this](std::stop_token stopToken) { acceptLoop(stopToken); });
}

std::string TestMtlsServer::url() const { return "https://127.0.0.1:" + std::to_string(_port); }

std::vector<std::string> TestMtlsServer::clientSubjects() const {
  std::scoped_lock lock(_mutex);
  return _clientSubjects;
}

void TestMtlsServer::stop() {
  if (_acceptThread.joinable()) {
    _acceptThread.request_stop();
    _acceptThread.join();
  }
  std::vector<std::jthread> threads;
  {
    std::scoped_lock lock(_mutex);
    threads.swap(_connectionThreads);
  }
  threads.clear();  // request stop and join
  _listenFd.close();
}

void TestMtlsServer::acceptLoop(const std::stop_token& stopToken) {
  while (!stopToken.stop_requested()) {
    pollfd pfd{_listenFd.fd(), POLLIN, 0};
    if (::poll(&pfd, 1, kPollPeriodMs) <= 0) {
      continue;
    }
    BaseFd fd(::accept4(_listenFd.fd(), nullptr, nullptr, SOCK_CLOEXEC));
    if (!fd) {
      continue;
    }
    ++_connectionsAccepted;
    std::scoped_lock lock(_mutex);
    _connectionThreads.emplace_back(
        [this, fd = std::move(fd)](std::stop_token connStopToken) mutable { serve(std::move(fd), connStopToken); });
  }
}

void TestMtlsServer::serve(BaseFd fd, const std::stop_token& stopToken) {
  SigPipeGuard sigPipeGuard;
  timeval timeout{0, kSocketTimeoutUs};
  ::setsockopt(fd.fd(), SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));
  ::setsockopt(fd.fd(), SOL_SOCKET, SO_SNDTIMEO, &timeout, sizeof(timeout));

  if (_config.mode == ServerMode::Silent) {
    char byte;
    while (!stopToken.stop_requested()) {
      const auto nbRead = ::recv(fd.fd(), &byte, 1, 0);
      if (nbRead == 0 || (nbRead < 0 && errno != EAGAIN && errno != EINTR)) {
        break;
      }
    }
    return;
  }

  SslPtr ssl(::SSL_new(_ctx.get()), ::SSL_free);
  if (!ssl || ::SSL_set_fd(ssl.get(), fd.fd()) != 1) {
    LogOpenSslErrors("Test server SSL setup");
    return;
  }
  while (true) {
    if (stopToken.stop_requested()) {
      return;
    }
    const int ret = ::SSL_accept(ssl.get());
    if (ret == 1) {
      break;
    }
    if (!IsRetry(ssl.get(), ret)) {
      log::debug("Test server handshake failed: {}", DrainOpenSslErrors());
      return;
    }
  }
  ++_handshakesCompleted;
  if (const X509* peer = ::SSL_get0_peer_certificate(ssl.get()); peer != nullptr) {
    std::string subject = X509NameToString(::X509_get_subject_name(peer));
    std::scoped_lock lock(_mutex);
    _clientSubjects.push_back(std::move(subject));
  }

  try {
    switch (_config.mode) {
      case ServerMode::CloseAfterHandshake:
        if (AnswerConfirmation(ssl.get(), stopToken)) {
          ::SSL_shutdown(ssl.get());
        }
        break;
      case ServerMode::Mute:
        if (AnswerConfirmation(ssl.get(), stopToken)) {
          DrainUntilStopped(ssl.get(), stopToken);
        }
        break;
      case ServerMode::Unconfirmed:
        DrainUntilStopped(ssl.get(), stopToken);
        break;
      default:
        serveFrames(ssl.get(), stopToken);
        break;
    }
  } catch (const std::exception& ex) {
    log::debug("Test server connection aborted: {}", ex.what());
  }
}

void TestMtlsServer::serveFrames(SSL* ssl, const std::stop_token& stopToken) {
  FrameDecoder decoder(ClientConfig::kDefaultMaxFrameSize);
  std::array<char, 16384> buf;
  uint64_t pingSequence = 1;
  while (!stopToken.stop_requested()) {
    std::size_t nbRead = 0;
    const int ret = ::SSL_read_ex(ssl, buf.data(), buf.size(), &nbRead);
    if (ret != 1) {
      if (IsRetry(ssl, ret)) {
        continue;
      }
      return;
    }
    decoder.feed(std::string_view(buf.data(), nbRead));
    while (auto frame = decoder.next()) {
      std::string out;
      switch (frame->type) {
        case FrameType::Request:
          ++_requestsServed;
          if (_config.mode == ServerMode::WrongSequence) {
            AppendFrame(out, FrameType::Response, frame->sequence + 1, frame->payload);
          } else if (_config.mode == ServerMode::Garbage) {
            out.assign(2 * FrameHeader::kSize, '\xFF');
          } else {
            if (_config.mode == ServerMode::PingBeforeResponse) {
              AppendFrame(out, FrameType::Ping, pingSequence++, "keepalive");
            }
            AppendFrame(out, FrameType::Response, frame->sequence, frame->payload);
          }
          break;
        case FrameType::Ping:
          AppendFrame(out, FrameType::Pong, frame->sequence, frame->payload);
          break;
        case FrameType::Pong:
          ++_pongsReceived;
          break;
        case FrameType::Close:
          ::SSL_shutdown(ssl);
          return;
        default:
          return;
      }
      if (!out.empty() && !WriteAll(ssl, out, stopToken)) {
        return;
      }
    }
  }
}

}  // namespace authly::test
