#include "authly/base-fd.hpp"

#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <utility>

#include "authly/log.hpp"

namespace authly {

BaseFd& BaseFd::operator=(BaseFd&& other) noexcept {
  if (this != &other) {
    close();
    _fd = other.release();
  }
  return *this;
}

void BaseFd::close() noexcept {
  if (_fd != kClosedFd) {
    // Linux always releases the descriptor, even when close() reports EINTR, so it must not be retried.
    if (::close(_fd) != 0 && errno != EINTR) {
      log::error("close fd # {} failed: {}", _fd, std::strerror(errno));
    }
    log::debug("fd # {} closed", _fd);
    _fd = kClosedFd;
  }
}

int BaseFd::release() noexcept { return std::exchange(_fd, kClosedFd); }

}  // namespace authly
