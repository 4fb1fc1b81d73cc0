#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

#include "authly/base-fd.hpp"
#include "authly/tls-raii.hpp"

namespace authly::test {

enum class ServerMode : uint8_t {
  Echo,                 // answers each request with its payload, each ping with a pong
  Silent,               // accepts TCP connections but never speaks TLS
  Mute,                 // completes the handshake and answers its confirmation ping, then never answers
  CloseAfterHandshake,  // closes the connection right after answering the handshake confirmation ping
  Unconfirmed,          // completes the TLS handshake, then never answers, not even the confirmation ping
  NoClientCertRequest,  // echo server that does not ask for the client certificate
  WrongSequence,        // answers requests with a wrong sequence number
  Garbage,              // answers requests with bytes that are not a valid frame
  PingBeforeResponse,   // sends a ping (and waits for the pong) before each response
};

struct TestMtlsServerConfig {
  std::string certPem;
  std::string chainPem;
  std::string keyPem;
  // Anchor used to verify client certificates. Required unless mode is NoClientCertRequest or Silent.
  std::string clientCaPem;
  ServerMode mode{ServerMode::Echo};
  // Highest protocol version offered (TLS1_2_VERSION...), 0 for the library default.
  int maxProtoVersion{0};
};

// Loopback mutual TLS server for tests, listening on 127.0.0.1 on an ephemeral port.
// Each accepted connection is served by its own thread. Stops and joins on destruction.
class TestMtlsServer {
 public:
  explicit TestMtlsServer(TestMtlsServerConfig config);

  TestMtlsServer(const TestMtlsServer&) = delete;
  TestMtlsServer(TestMtlsServer&&) = delete;
  TestMtlsServer& operator=(const TestMtlsServer&) = delete;
  TestMtlsServer& operator=(TestMtlsServer&&) = delete;

  ~TestMtlsServer() { stop(); }

  [[nodiscard]] uint16_t port() const noexcept { return _port; }

  // https://127.0.0.1:<port>
  [[nodiscard]] std::string url() const;

  // RFC 2253 subjects of the client certificates presented in completed handshakes.
  [[nodiscard]] std::vector<std::string> clientSubjects() const;

  [[nodiscard]] std::size_t connectionsAccepted() const noexcept { return _connectionsAccepted.load(); }

  [[nodiscard]] std::size_t handshakesCompleted() const noexcept { return _handshakesCompleted.load(); }

  [[nodiscard]] std::size_t requestsServed() const noexcept { return _requestsServed.load(); }

  // Pongs received in answer to the pings of the PingBeforeResponse mode.
  [[nodiscard]] std::size_t pongsReceived() const noexcept { return _pongsReceived.load(); }

  // Stop accepting, close all connections and join all threads. Idempotent.
  void stop();

 private:
  void acceptLoop(const std::stop_token& stopToken);

  void serve(BaseFd fd, const std::stop_token& stopToken);

  void serveFrames(SSL* ssl, const std::stop_token& stopToken);

  TestMtlsServerConfig _config;
  SslCtxPtr _ctx;
  BaseFd _listenFd;
  uint16_t _port{};
  std::atomic<std::size_t> _connectionsAccepted{0};
  std::atomic<std::size_t> _handshakesCompleted{0};
  std::atomic<std::size_t> _requestsServed{0};
  std::atomic<std::size_t> _pongsReceived{0};
  mutable std::mutex _mutex;
  std::vector<std::string> _clientSubjects;
  std::vector<std::jthread> _connectionThreads;
  std::jthread _acceptThread;
};

}  // namespace authly::test
