#include "authly/session.hpp"

#include <fmt/format.h>

#include <array>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

#include "authly/authly-error.hpp"
#include "authly/event.hpp"
#include "authly/frame.hpp"
#include "authly/identity.hpp"
#include "authly/io-waiter.hpp"
#include "authly/log.hpp"
#include "authly/timedef.hpp"
#include "authly/tls-transport.hpp"

namespace authly {

namespace {
constexpr std::size_t kReadChunkSize = 16UL * 1024UL;
}  // namespace

Session::Session(TlsTransport transport, Identity peerIdentity, SessionOptions options)
    : _transport(std::move(transport)),
      _decoder(options.maxFrameSize),
      _peerIdentity(std::move(peerIdentity)),
      _options(options),
      _negotiatedVersion(_transport.negotiatedVersion()),
      _negotiatedCipher(_transport.negotiatedCipher()),
      _lastActivity(SteadyClock::now()) {
  log::debug("Session opened with {} on fd # {} ({} {})", _peerIdentity.displayName(), _transport.fd(),
             _negotiatedVersion, _negotiatedCipher);
}

Session::~Session() { close(); }

std::string Session::send(std::string_view request) {
  return std::move(exchange(FrameType::Request, request, FrameType::Response).payload);
}

void Session::ping() { exchange(FrameType::Ping, {}, FrameType::Pong); }

uint64_t Session::nextSequence() const {
  std::scoped_lock lock(_mutex);
  return _nextSequence;
}

SteadyTimePoint Session::lastActivity() const {
  std::scoped_lock lock(_mutex);
  return _lastActivity;
}

Frame Session::exchange(FrameType type, std::string_view payload, FrameType expectedReply) {
  std::scoped_lock lock(_mutex);
  if (_closed.load(std::memory_order_relaxed)) {
    throw ChannelClosedError("Session is closed");
  }
  const uint64_t sequence = _nextSequence++;
  const SteadyTimePoint deadline = SteadyClock::now() + _options.requestTimeout;

  _outBuf.clear();
  AppendFrame(_outBuf, type, sequence, payload);

  try {
    writeAll(_outBuf, deadline);
    while (true) {
      Frame frame = readFrame(deadline);
      _lastActivity = SteadyClock::now();
      switch (frame.type) {
        case FrameType::Ping:
          answerPing(frame, deadline);
          break;
        case FrameType::Close:
          throw ChannelClosedError("Peer closed the session");
        case FrameType::Request:
          throw ProtocolViolationError("Unexpected REQUEST frame received from server");
        default:
          if (frame.type != expectedReply) {
            throw ProtocolViolationError(fmt::format("Expected {} frame, received {}", FrameTypeName(expectedReply),
                                                     FrameTypeName(frame.type)));
          }
          if (frame.sequence != sequence) {
            throw ProtocolViolationError(
                fmt::format("{} sequence mismatch: expected {}, received {}", FrameTypeName(frame.type), sequence,
                            frame.sequence));
          }
          return frame;
      }
    }
  } catch (const AuthlyError& ex) {
    log::error("Session with {} failed ({}): {}", _peerIdentity.displayName(), ex.kindName(), ex.what());
    closeLocked(ex.kind() != ErrorKind::ChannelClosed);
    throw;
  } catch (...) {
    closeLocked(false);
    throw;
  }
}

void Session::writeAll(std::string_view data, SteadyTimePoint deadline) {
  while (!data.empty()) {
    const auto [written, want] = _transport.write(data);
    data.remove_prefix(written);
    if (want == TransportHint::None) {
      continue;
    }
    if (want == TransportHint::Error) {
      throw ChannelClosedError("Failed to write to the peer");
    }
    waitFor(want == TransportHint::ReadReady ? EventIn : EventOut, deadline);
  }
  _lastActivity = SteadyClock::now();
}

Frame Session::readFrame(SteadyTimePoint deadline) {
  std::array<char, kReadChunkSize> buf;
  while (true) {
    if (auto frame = _decoder.next()) {
      return std::move(*frame);
    }
    const auto [nbRead, want] = _transport.read(buf.data(), buf.size());
    if (nbRead != 0) {
      _decoder.feed(std::string_view(buf.data(), nbRead));
      continue;
    }
    switch (want) {
      case TransportHint::None:
        throw ChannelClosedError("Peer closed the connection");
      case TransportHint::Error:
        throw ChannelClosedError("Failed to read from the peer");
      default:
        waitFor(want == TransportHint::WriteReady ? EventOut : EventIn, deadline);
        break;
    }
  }
}

void Session::waitFor(EventBmp events, SteadyTimePoint deadline) {
  _waiter.watch(_transport.fd(), events);
  while (true) {
    const auto result = _waiter.waitUntil(deadline);
    switch (result.status) {
      case IoWaiter::Status::Ready:
        return;
      case IoWaiter::Status::Timeout:
        throw TimeoutError(fmt::format("No response from {} within {} ms", _peerIdentity.displayName(),
                                       _options.requestTimeout.count()));
      case IoWaiter::Status::Woken:
        if (_closeRequested.load(std::memory_order_acquire)) {
          throw ChannelClosedError("Session closed while waiting for the peer");
        }
        break;
      default:
        throw ChannelClosedError("Failed to wait for socket readiness");
    }
  }
}

void Session::answerPing(const Frame& ping, SteadyTimePoint deadline) {
  std::string pong;
  AppendFrame(pong, FrameType::Pong, ping.sequence, ping.payload);
  writeAll(pong, deadline);
}

bool Session::isAlive() {
  std::scoped_lock lock(_mutex);
  if (_closed.load(std::memory_order_relaxed)) {
    return false;
  }
  if (_options.keepAliveIdleTimeout.count() != 0 &&
      SteadyClock::now() - _lastActivity >= _options.keepAliveIdleTimeout) {
    log::debug("Session with {} idle for more than {} ms, closing", _peerIdentity.displayName(),
               _options.keepAliveIdleTimeout.count());
    closeLocked(true);
    return false;
  }

  // Non-blocking check: consume what the peer may have sent meanwhile.
  std::array<char, kReadChunkSize> buf;
  try {
    while (true) {
      const auto [nbRead, want] = _transport.read(buf.data(), buf.size());
      if (nbRead != 0) {
        _decoder.feed(std::string_view(buf.data(), nbRead));
        continue;
      }
      if (want == TransportHint::None || want == TransportHint::Error) {
        log::debug("Session with {} closed by peer", _peerIdentity.displayName());
        closeLocked(false);
        return false;
      }
      break;
    }
    while (auto frame = _decoder.next()) {
      _lastActivity = SteadyClock::now();
      if (frame->type == FrameType::Ping) {
        answerPing(*frame, SteadyClock::now() + _options.requestTimeout);
      } else if (frame->type == FrameType::Close) {
        log::debug("Session with {} received close frame", _peerIdentity.displayName());
        closeLocked(false);
        return false;
      } else {
        throw ProtocolViolationError(fmt::format("Unsolicited {} frame", FrameTypeName(frame->type)));
      }
    }
  } catch (const AuthlyError& ex) {
    log::warn("Session with {} is not alive anymore: {}", _peerIdentity.displayName(), ex.what());
    closeLocked(false);
    return false;
  }
  return true;
}

void Session::close() noexcept {
  _closeRequested.store(true, std::memory_order_release);
  _waiter.wakeup();
  std::scoped_lock lock(_mutex);
  closeLocked(true);
}

void Session::closeLocked(bool sendCloseFrame) noexcept {
  if (_closed.exchange(true, std::memory_order_acq_rel)) {
    return;
  }
  if (sendCloseFrame && _transport.isOpen()) {
    // Single non-blocking attempt, the peer may already be gone.
    char closeFrame[FrameHeader::kSize];
    WriteFrameHeader(closeFrame, FrameHeader{FrameType::Close, _nextSequence, 0});
    const auto [written, want] = _transport.write(std::string_view(closeFrame, sizeof(closeFrame)));
    if (written != sizeof(closeFrame)) {
      log::debug("Close frame not sent to {} (hint {})", _peerIdentity.displayName(), static_cast<int>(want));
    }
  }
  log::debug("Session with {} closing fd # {}", _peerIdentity.displayName(), _transport.fd());
  _transport.shutdown();
}

}  // namespace authly
