#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>

#include "authly/client-config.hpp"
#include "authly/event.hpp"
#include "authly/frame.hpp"
#include "authly/identity.hpp"
#include "authly/io-waiter.hpp"
#include "authly/timedef.hpp"
#include "authly/tls-transport.hpp"

namespace authly {

struct SessionOptions {
  std::chrono::milliseconds requestTimeout{std::chrono::seconds{30}};
  // Zero disables idle expiry.
  std::chrono::milliseconds keepAliveIdleTimeout{0};
  uint32_t maxFrameSize{ClientConfig::kDefaultMaxFrameSize};
};

// Authenticated channel to a verified peer, created by a successful handshake.
// Requests are serialized: concurrent senders wait for each other.
// Any failure during an exchange (timeout, protocol violation, peer teardown) closes the session, as the channel
// cannot be resynchronized afterwards.
class Session {
 public:
  Session(TlsTransport transport, Identity peerIdentity, SessionOptions options);

  Session(const Session&) = delete;
  Session(Session&&) = delete;
  Session& operator=(const Session&) = delete;
  Session& operator=(Session&&) = delete;

  ~Session();

  // Send 'request' and wait for the matching response payload, at most for the request timeout.
  // Throws:
  //  - ChannelClosedError if the session is closed or the peer tore down the connection
  //  - ProtocolViolationError on malformed framing, unexpected frame type or response sequence mismatch
  //  - TimeoutError if no response arrived in time
  std::string send(std::string_view request);

  // Keepalive round trip. Same errors as send.
  void ping();

  // Returns false if the session is closed, idle for longer than the keepalive idle timeout, or if the peer
  // closed the connection. Does not block.
  [[nodiscard]] bool isAlive();

  // Best effort close frame and TLS close_notify, then release of the socket. Idempotent.
  void close() noexcept;

  [[nodiscard]] bool isClosed() const noexcept { return _closed.load(std::memory_order_acquire); }

  // Identity of the peer, as verified during the handshake.
  [[nodiscard]] const Identity& peerIdentity() const noexcept { return _peerIdentity; }

  // Sequence number that the next request or ping will use.
  [[nodiscard]] uint64_t nextSequence() const;

  [[nodiscard]] SteadyTimePoint lastActivity() const;

  [[nodiscard]] std::string_view negotiatedVersion() const noexcept { return _negotiatedVersion; }

  [[nodiscard]] std::string_view negotiatedCipher() const noexcept { return _negotiatedCipher; }

  [[nodiscard]] const SessionOptions& options() const noexcept { return _options; }

 private:
  Frame exchange(FrameType type, std::string_view payload, FrameType expectedReply);

  void writeAll(std::string_view data, SteadyTimePoint deadline);

  Frame readFrame(SteadyTimePoint deadline);

  void waitFor(EventBmp events, SteadyTimePoint deadline);

  void answerPing(const Frame& ping, SteadyTimePoint deadline);

  void closeLocked(bool sendCloseFrame) noexcept;

  mutable std::mutex _mutex;
  TlsTransport _transport;
  IoWaiter _waiter;
  FrameDecoder _decoder;
  Identity _peerIdentity;
  SessionOptions _options;
  std::string _negotiatedVersion;
  std::string _negotiatedCipher;
  std::string _outBuf;
  uint64_t _nextSequence{1};
  SteadyTimePoint _lastActivity;
  std::atomic<bool> _closed{false};
  std::atomic<bool> _closeRequested{false};
};

}  // namespace authly
