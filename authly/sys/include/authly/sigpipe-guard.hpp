#pragma once

#include <signal.h>

namespace authly {

// Blocks SIGPIPE for the calling thread during its lifetime, and discards any SIGPIPE raised meanwhile.
// Writes performed by OpenSSL on a socket cannot pass MSG_NOSIGNAL, so a peer closing the connection would otherwise
// kill the process. Does not change the process-wide disposition of SIGPIPE.
class SigPipeGuard {
 public:
  SigPipeGuard() noexcept;

  SigPipeGuard(const SigPipeGuard&) = delete;
  SigPipeGuard(SigPipeGuard&&) = delete;
  SigPipeGuard& operator=(const SigPipeGuard&) = delete;
  SigPipeGuard& operator=(SigPipeGuard&&) = delete;

  ~SigPipeGuard();

 private:
  sigset_t _oldMask;
  bool _restore{false};
};

}  // namespace authly
