#include "authly/sigpipe-guard.hpp"

#include <pthread.h>
#include <signal.h>

#include <cerrno>
#include <ctime>

namespace authly {

namespace {

sigset_t SigPipeSet() noexcept {
  sigset_t set;
  ::sigemptyset(&set);
  ::sigaddset(&set, SIGPIPE);
  return set;
}

bool IsSigPipePending() noexcept {
  sigset_t pending;
  ::sigemptyset(&pending);
  return ::sigpending(&pending) == 0 && ::sigismember(&pending, SIGPIPE) == 1;
}

}  // namespace

SigPipeGuard::SigPipeGuard() noexcept {
  // A SIGPIPE already pending does not belong to us: leave the mask alone so that it is not swallowed.
  if (IsSigPipePending()) {
    return;
  }
  const sigset_t set = SigPipeSet();
  if (::pthread_sigmask(SIG_BLOCK, &set, &_oldMask) == 0) {
    // Already blocked by the caller: nothing to restore nor to consume.
    _restore = ::sigismember(&_oldMask, SIGPIPE) == 0;
  }
}

SigPipeGuard::~SigPipeGuard() {
  if (!_restore) {
    return;
  }
  if (IsSigPipePending()) {
    const sigset_t set = SigPipeSet();
    const timespec zero{};
    while (::sigtimedwait(&set, nullptr, &zero) == -1 && errno == EINTR) {
    }
  }
  ::pthread_sigmask(SIG_SETMASK, &_oldMask, nullptr);
}

}  // namespace authly
