#pragma once

#include <netdb.h>

#include <string>
#include <string_view>

#include "authly/base-fd.hpp"

namespace authly {

struct ConnectResult {
  BaseFd fd;
  bool connectPending{false};
  bool failure{false};
  // Human readable cause of the last failure (resolution or connect error), empty on success.
  std::string failureReason;
};

// Start a non-blocking connect to the first of the resolved 'addresses' that accepts it (see PendingResolution).
// The returned socket is non-blocking and close-on-exec, with TCP_NODELAY set.
// When 'connectPending' is true, completion is signalled by writability and must be confirmed with
// PendingConnectError().
// 'host' and 'port' are only used for logging.
ConnectResult ConnectTCP(const addrinfo* addresses, std::string_view host, std::string_view port);

// Returns the pending error (SO_ERROR) of a socket on which a non-blocking connect was started,
// 0 if the connection is established.
int PendingConnectError(int fd) noexcept;

}  // namespace authly
