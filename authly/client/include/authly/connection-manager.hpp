#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>

#include "authly/client-config.hpp"
#include "authly/connect-task.hpp"
#include "authly/connection-stats.hpp"
#include "authly/endpoint.hpp"
#include "authly/handshake-engine.hpp"
#include "authly/identity-credential.hpp"
#include "authly/session.hpp"
#include "authly/timedef.hpp"
#include "authly/trust-store.hpp"

namespace authly {

// Public entry point: loads trust material, runs handshake attempts (with optional retries) and owns at most one
// live Session. Thread safe. Connections are serialized: a connect waits for the one in progress.
class ConnectionManager {
 public:
  // Trust material is loaded from the configured paths at each connect.
  explicit ConnectionManager(ClientConfig config = {});

  // Trust material is injected, configured paths are only used by the connect overload taking explicit paths.
  ConnectionManager(ClientConfig config, std::shared_ptr<const TrustStore> trustStore,
                    std::shared_ptr<const IdentityCredential> credential);

  ConnectionManager(const ConnectionManager&) = delete;
  ConnectionManager(ConnectionManager&&) = delete;
  ConnectionManager& operator=(const ConnectionManager&) = delete;
  ConnectionManager& operator=(ConnectionManager&&) = delete;

  // Closes the live session, if any.
  ~ConnectionManager();

  // Load the trust anchor from 'caPath', the identity from 'identityPath', then establish a mutually authenticated
  // session with 'url'. Any previous session is closed first.
  // Throws std::invalid_argument for a malformed url or configuration, and the classified AuthlyError otherwise.
  std::shared_ptr<Session> connect(std::string_view url, const std::filesystem::path& caPath,
                                   const std::filesystem::path& identityPath,
                                   std::optional<std::chrono::milliseconds> timeout = std::nullopt,
                                   std::stop_token stopToken = {});

  // Same, with the configured url, and injected material (or configured paths if none was injected).
  std::shared_ptr<Session> connect(std::stop_token stopToken = {});

  // Asynchronous forms of connect. The manager must outlive the returned task.
  ConnectTask connectAsync(std::string url, std::filesystem::path caPath, std::filesystem::path identityPath,
                           std::optional<std::chrono::milliseconds> timeout = std::nullopt);

  ConnectTask connectAsync();

  // Returns the live session if it is still alive and the credential is not about to expire, otherwise reloads the
  // material from the configured paths (unless it was injected) and reconnects.
  std::shared_ptr<Session> ensureConnected();

  // Use new trust material for the next connections. Live sessions and in-flight handshakes are not affected.
  // Throws std::invalid_argument if any of them is null.
  void replaceTrustMaterial(std::shared_ptr<const TrustStore> trustStore,
                            std::shared_ptr<const IdentityCredential> credential);

  // Close the live session, if any.
  void disconnect() noexcept;

  [[nodiscard]] bool isConnected() const;

  // Live session, null if none.
  [[nodiscard]] std::shared_ptr<Session> session() const;

  [[nodiscard]] ConnectionStats stats() const;

  [[nodiscard]] const ClientConfig& config() const noexcept { return _config; }

  // Observe handshake state transitions of the next attempts.
  void setTransitionObserver(HandshakeOptions::TransitionObserver observer);

  // Time source for certificate validity checks of the next attempts (SysClock::now by default).
  void setClock(HandshakeOptions::Clock clock);

 private:
  std::shared_ptr<Session> establish(const ClientConfig& config, const Endpoint& endpoint,
                                     std::shared_ptr<const TrustStore> trustStore,
                                     std::shared_ptr<const IdentityCredential> credential,
                                     const std::stop_token& stopToken);

  void supersedeLiveSession();

  void recordFailure(ErrorKind kind);

  void recordHandshakeDuration(SteadyDuration duration);

  [[nodiscard]] SysTimePoint now() const;

  [[nodiscard]] SysTimePoint nowLocked() const { return _clock ? _clock() : SysClock::now(); }

  ClientConfig _config;

  // Serializes connection establishments.
  std::mutex _connectMutex;

  mutable std::mutex _mutex;
  std::shared_ptr<const TrustStore> _trustStore;
  std::shared_ptr<const IdentityCredential> _credential;
  std::shared_ptr<const IdentityCredential> _sessionCredential;
  std::shared_ptr<Session> _session;
  HandshakeOptions::TransitionObserver _transitionObserver;
  HandshakeOptions::Clock _clock;
  ConnectionStats _stats;
};

}  // namespace authly
