#include "authly/connect-task.hpp"

#include <chrono>
#include <exception>
#include <future>
#include <memory>
#include <stop_token>
#include <thread>
#include <utility>

#include "authly/session.hpp"

namespace authly {

ConnectTask::ConnectTask(Job job) {
  std::promise<std::shared_ptr<Session>> promise;
  _future = promise.get_future();
  _thread = std::jthread([job = std::move(job), promise = std::move(promise)](std::stop_token stopToken) mutable {
    try {
      promise.set_value(job(std::move(stopToken)));
    } catch (...) {
      // transferred to the caller of get()
      promise.set_exception(std::current_exception());
    }
  });
}

std::shared_ptr<Session> ConnectTask::get() {
  if (!_future.valid()) {
    throw std::future_error(std::future_errc::no_state);
  }
  return _future.get();
}

bool ConnectTask::waitFor(std::chrono::milliseconds timeout) const {
  return _future.valid() && _future.wait_for(timeout) == std::future_status::ready;
}

}  // namespace authly
