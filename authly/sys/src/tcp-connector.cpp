#include "authly/tcp-connector.hpp"

#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>

#include <cerrno>
#include <cstring>
#include <string>
#include <string_view>

#include "authly/base-fd.hpp"
#include "authly/log.hpp"

namespace authly {

namespace {

std::string FormatFailure(std::string_view what, int err) {
  std::string reason(what);
  reason.append(": ");
  reason.append(std::strerror(err));
  return reason;
}

}  // namespace

ConnectResult ConnectTCP(const addrinfo* addresses, std::string_view host, std::string_view port) {
  ConnectResult connectResult;

  for (const addrinfo* rp = addresses; rp != nullptr; rp = rp->ai_next) {
    const int socktype = rp->ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC;

    connectResult.fd = BaseFd(::socket(rp->ai_family, socktype, rp->ai_protocol));
    if (!connectResult.fd) [[unlikely]] {
      const int saved = errno;
      log::error("ConnectTCP: socket() failed (family={}, socktype={}, protocol={}): errno={}, msg={}", rp->ai_family,
                 rp->ai_socktype, rp->ai_protocol, saved, std::strerror(saved));
      connectResult.failureReason = FormatFailure("socket", saved);
      if (saved == EMFILE || saved == ENFILE) {
        break;  // no point in continuing
      }
      continue;
    }

    static constexpr int kOne = 1;
    if (::setsockopt(connectResult.fd.fd(), IPPROTO_TCP, TCP_NODELAY, &kOne, sizeof(kOne)) != 0) {
      log::warn("ConnectTCP: unable to set TCP_NODELAY on fd # {}: {}", connectResult.fd.fd(), std::strerror(errno));
    }

    if (::connect(connectResult.fd.fd(), rp->ai_addr, rp->ai_addrlen) == 0) {
      // connected immediately
      connectResult.failureReason.clear();
      return connectResult;
    }

    const int connectErr = errno;
    switch (connectErr) {
      case EINPROGRESS:
        [[fallthrough]];
      case EALREADY:
        connectResult.connectPending = true;
        connectResult.failureReason.clear();
        return connectResult;
      default:
        log::debug("ConnectTCP: connect() to '{}':'{}' failed on fd # {}: {}", host, port, connectResult.fd.fd(),
                   std::strerror(connectErr));
        connectResult.failureReason = FormatFailure("connect", connectErr);
        connectResult.fd.close();
        break;
    }
  }
  connectResult.fd.close();
  connectResult.failure = true;
  if (connectResult.failureReason.empty()) {
    connectResult.failureReason = "no usable address";
  }
  return connectResult;
}

int PendingConnectError(int fd) noexcept {
  int soError = 0;
  socklen_t len = sizeof(soError);
  if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &soError, &len) != 0) {
    return errno;
  }
  return soError;
}

}  // namespace authly
