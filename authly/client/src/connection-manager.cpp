#include "authly/connection-manager.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <string_view>
#include <utility>

#include "authly/authly-error.hpp"
#include "authly/client-config.hpp"
#include "authly/client-tls-context.hpp"
#include "authly/connect-task.hpp"
#include "authly/endpoint.hpp"
#include "authly/handshake-engine.hpp"
#include "authly/identity-credential.hpp"
#include "authly/log.hpp"
#include "authly/session.hpp"
#include "authly/timedef.hpp"
#include "authly/trust-store.hpp"

namespace authly {

ConnectionManager::ConnectionManager(ClientConfig config) : _config(std::move(config)) { _config.validate(); }

ConnectionManager::ConnectionManager(ClientConfig config, std::shared_ptr<const TrustStore> trustStore,
                                     std::shared_ptr<const IdentityCredential> credential)
    : _config(std::move(config)) {
  _config.validate();
  replaceTrustMaterial(std::move(trustStore), std::move(credential));
}

ConnectionManager::~ConnectionManager() { disconnect(); }

std::shared_ptr<Session> ConnectionManager::connect(std::string_view url, const std::filesystem::path& caPath,
                                                    const std::filesystem::path& identityPath,
                                                    std::optional<std::chrono::milliseconds> timeout,
                                                    std::stop_token stopToken) {
  ClientConfig config = _config;
  config.url = url;
  config.caPath = caPath;
  config.identityPath = identityPath;
  if (timeout) {
    config.handshakeTimeout = *timeout;
  }
  config.validate();
  const Endpoint endpoint = Endpoint::Parse(config.url);

  std::scoped_lock connectLock(_connectMutex);
  supersedeLiveSession();

  std::shared_ptr<const TrustStore> trustStore;
  std::shared_ptr<const IdentityCredential> credential;
  try {
    trustStore = std::make_shared<const TrustStore>(TrustStore::FromFile(config.caPath));
    credential =
        std::make_shared<const IdentityCredential>(IdentityCredential::FromPemFile(config.identityPath, now()));
  } catch (const AuthlyError& ex) {
    log::error("Unable to load trust material for {} ({}): {}", config.url, ex.kindName(), ex.what());
    recordFailure(ex.kind());
    throw;
  }
  return establish(config, endpoint, std::move(trustStore), std::move(credential), stopToken);
}

std::shared_ptr<Session> ConnectionManager::connect(std::stop_token stopToken) {
  const Endpoint endpoint = Endpoint::Parse(_config.url);

  std::scoped_lock connectLock(_connectMutex);
  supersedeLiveSession();

  std::shared_ptr<const TrustStore> trustStore;
  std::shared_ptr<const IdentityCredential> credential;
  {
    std::scoped_lock lock(_mutex);
    trustStore = _trustStore;
    credential = _credential;
  }
  try {
    if (!trustStore) {
      trustStore = std::make_shared<const TrustStore>(TrustStore::FromFile(_config.caPath));
    }
    if (!credential) {
      credential =
          std::make_shared<const IdentityCredential>(IdentityCredential::FromPemFile(_config.identityPath, now()));
    }
  } catch (const AuthlyError& ex) {
    log::error("Unable to load trust material for {} ({}): {}", _config.url, ex.kindName(), ex.what());
    recordFailure(ex.kind());
    throw;
  }
  return establish(_config, endpoint, std::move(trustStore), std::move(credential), stopToken);
}

ConnectTask ConnectionManager::connectAsync(std::string url, std::filesystem::path caPath,
                                            std::filesystem::path identityPath,
                                            std::optional<std::chrono::milliseconds> timeout) {
  return ConnectTask([this, url = std::move(url), caPath = std::move(caPath), identityPath = std::move(identityPath),
                      timeout](std::stop_token stopToken) {
    return connect(url, caPath, identityPath, timeout, std::move(stopToken));
  });
}

ConnectTask ConnectionManager::connectAsync() {
  return ConnectTask([this](std::stop_token stopToken) { return connect(std::move(stopToken)); });
}

std::shared_ptr<Session> ConnectionManager::ensureConnected() {
  std::shared_ptr<Session> session;
  bool rotationDue = false;
  {
    std::scoped_lock lock(_mutex);
    session = _session;
    rotationDue =
        _sessionCredential && _sessionCredential->expiresWithin(_config.credentialRotationMargin, nowLocked());
  }
  if (session) {
    // isAlive may wait for a request in progress, it is not called under the manager lock.
    if (!rotationDue && session->isAlive()) {
      return session;
    }
    log::info("Session with {} needs renewal ({})", _config.url,
              rotationDue ? "credential about to expire" : "not alive anymore");
  }
  return connect();
}

void ConnectionManager::replaceTrustMaterial(std::shared_ptr<const TrustStore> trustStore,
                                             std::shared_ptr<const IdentityCredential> credential) {
  if (!trustStore || !credential) {
    throw std::invalid_argument("Trust store and credential are required");
  }
  log::info("Using identity {} with {} trust anchor(s)", credential->identity().displayName(), trustStore->size());
  std::scoped_lock lock(_mutex);
  _trustStore = std::move(trustStore);
  _credential = std::move(credential);
}

void ConnectionManager::disconnect() noexcept {
  std::scoped_lock lock(_mutex);
  if (_session) {
    _session->close();
    _session.reset();
    _sessionCredential.reset();
  }
}

bool ConnectionManager::isConnected() const {
  std::scoped_lock lock(_mutex);
  return _session && !_session->isClosed();
}

std::shared_ptr<Session> ConnectionManager::session() const {
  std::scoped_lock lock(_mutex);
  return _session;
}

ConnectionStats ConnectionManager::stats() const {
  std::scoped_lock lock(_mutex);
  return _stats;
}

void ConnectionManager::setTransitionObserver(HandshakeOptions::TransitionObserver observer) {
  std::scoped_lock lock(_mutex);
  _transitionObserver = std::move(observer);
}

void ConnectionManager::setClock(HandshakeOptions::Clock clock) {
  std::scoped_lock lock(_mutex);
  _clock = std::move(clock);
}

std::shared_ptr<Session> ConnectionManager::establish(const ClientConfig& config, const Endpoint& endpoint,
                                                      std::shared_ptr<const TrustStore> trustStore,
                                                      std::shared_ptr<const IdentityCredential> credential,
                                                      const std::stop_token& stopToken) {
  auto tlsContext = std::make_shared<const ClientTlsContext>(config, std::move(trustStore), credential);

  HandshakeOptions options = HandshakeOptions::FromConfig(config);
  {
    std::scoped_lock lock(_mutex);
    options.onTransition = _transitionObserver;
    options.clock = _clock;
  }

  std::chrono::milliseconds backoff = config.retryBackoffInitial;
  for (uint32_t attemptPos = 0;; ++attemptPos) {
    HandshakeEngine engine(endpoint, tlsContext, options);
    {
      std::scoped_lock lock(_mutex);
      ++_stats.connectAttempts;
    }

    std::unique_ptr<Session> established;
    try {
      established = engine.run(stopToken);
    } catch (const AuthlyError& ex) {
      recordHandshakeDuration(engine.elapsed());
      if (!IsRetriable(ex.kind()) || attemptPos >= config.retryCount || stopToken.stop_requested()) {
        recordFailure(ex.kind());
        throw;
      }
      log::warn("Attempt {}/{} to connect to {} failed ({}), retrying in {} ms", attemptPos + 1,
                config.retryCount + 1, endpoint.str(), ex.kindName(), backoff.count());
      {
        std::scoped_lock lock(_mutex);
        ++_stats.retries;
      }
      std::mutex backoffMutex;
      std::condition_variable_any backoffCv;
      std::unique_lock backoffLock(backoffMutex);
      // only interrupted by a stop request
      (void)backoffCv.wait_for(backoffLock, stopToken, backoff, []() { return false; });
      if (stopToken.stop_requested()) {
        recordFailure(ErrorKind::Cancelled);
        throw CancelledError(fmt::format("Connection to {} cancelled while waiting before retry", endpoint.str()));
      }
      backoff = std::min(backoff * 2, config.retryBackoffMax);
      continue;
    }
    recordHandshakeDuration(engine.elapsed());

    std::shared_ptr<Session> session(std::move(established));
    if (!config.expectedPeerIdentity.empty() && !session->peerIdentity().matches(config.expectedPeerIdentity)) {
      const std::string peerName = session->peerIdentity().displayName();
      session->close();
      recordFailure(ErrorKind::UntrustedPeer);
      throw UntrustedPeerError(fmt::format("Peer {} of {} does not match expected identity '{}'", peerName,
                                           endpoint.str(), config.expectedPeerIdentity));
    }

    std::scoped_lock lock(_mutex);
    ++_stats.handshakesSucceeded;
    _session = session;
    _sessionCredential = std::move(credential);
    return session;
  }
}

void ConnectionManager::supersedeLiveSession() {
  std::scoped_lock lock(_mutex);
  if (_session) {
    log::debug("Closing session with {} superseded by a new connection", _session->peerIdentity().displayName());
    _session->close();
    _session.reset();
    _sessionCredential.reset();
    ++_stats.supersessions;
  }
}

void ConnectionManager::recordFailure(ErrorKind kind) {
  std::scoped_lock lock(_mutex);
  _stats.recordFailure(kind);
}

void ConnectionManager::recordHandshakeDuration(SteadyDuration duration) {
  std::scoped_lock lock(_mutex);
  _stats.recordHandshakeDuration(
      static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(duration).count()));
}

SysTimePoint ConnectionManager::now() const {
  std::scoped_lock lock(_mutex);
  return nowLocked();
}

}  // namespace authly
