// authly Umbrella Header
//
// Include this single header to pull in the public mutual TLS client API:
//   - Entry point (ConnectionManager, ConnectTask) and its configuration (ClientConfig)
//   - Established channel (Session) and the verified peer descriptor (Identity, EntityId)
//   - Trust material loaders (TrustStore, IdentityCredential)
//   - Classified errors (AuthlyError and its typed aliases)
//
// Lower level building blocks (HandshakeEngine, frame codec, TLS transport) are available through their own headers.
//
// Usage Example:
//    #include <authly/authly.hpp>
//    using namespace authly;
//    int main() {
//      ConnectionManager manager(ClientConfig::FromEnvironment());
//      auto session = manager.connect();
//      auto response = session->send("hello");
//    }

#pragma once

// Entry point
#include "authly/connect-task.hpp"        // IWYU pragma: export
#include "authly/connection-manager.hpp"  // IWYU pragma: export
#include "authly/session.hpp"             // IWYU pragma: export

// Configuration
#include "authly/client-config.hpp"  // IWYU pragma: export
#include "authly/endpoint.hpp"       // IWYU pragma: export
#include "authly/log.hpp"            // IWYU pragma: export

// Trust material & identities
#include "authly/entity-id.hpp"            // IWYU pragma: export
#include "authly/identity-credential.hpp"  // IWYU pragma: export
#include "authly/identity.hpp"             // IWYU pragma: export
#include "authly/trust-store.hpp"          // IWYU pragma: export

// Errors & stats
#include "authly/authly-error.hpp"      // IWYU pragma: export
#include "authly/connection-stats.hpp"  // IWYU pragma: export
