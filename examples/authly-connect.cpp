#include <authly/authly.hpp>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <utility>

int main(int argc, char** argv) {
  if (argc > 5) {
    std::cerr << "Usage: " << argv[0] << " [url] [ca.crt] [identity.pem] [request]\n";
    return EXIT_FAILURE;
  }

  authly::SetLogLevelFromEnv();

  // AUTHLY_URL, AUTHLY_LOCAL_CA and AUTHLY_IDENTITY, overridden by the command line
  authly::ClientConfig config = authly::ClientConfig::FromEnvironment();
  if (argc > 1) {
    config.withUrl(argv[1]);
  }
  if (argc > 2) {
    config.withCaPath(argv[2]);
  }
  if (argc > 3) {
    config.withIdentityPath(argv[3]);
  }
  const std::string request = argc > 4 ? argv[4] : "";
  config.withLogHandshake();

  try {
    authly::ConnectionManager manager(std::move(config));
    auto session = manager.connect();

    const authly::Identity& peer = session->peerIdentity();
    std::cout << "Connected to " << manager.config().url << '\n';
    std::cout << "Peer subject: " << peer.subject << '\n';
    std::cout << "Peer identity: " << peer.displayName() << '\n';
    std::cout << "Protocol: " << session->negotiatedVersion() << ' ' << session->negotiatedCipher() << '\n';

    if (!request.empty()) {
      std::cout << "Response: " << session->send(request) << '\n';
    } else {
      session->ping();
      std::cout << "Ping OK\n";
    }
    manager.disconnect();
    std::cout << "Stats: " << manager.stats().json_str() << '\n';
  } catch (const authly::AuthlyError& ex) {
    std::cerr << "Error [" << ex.kindName() << "]: " << ex.what() << '\n';
    return EXIT_FAILURE;
  } catch (const std::exception& ex) {
    std::cerr << "Error: " << ex.what() << '\n';
    return EXIT_FAILURE;
  }
}
