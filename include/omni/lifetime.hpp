#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <vector>

namespace xpto::omni {

/// Process-wide stop flag.  Anyone may request a stop; the main thread
/// waits for it.  Requesting a stop does not cancel work in flight.
class application_lifetime {
 public:
  application_lifetime() = default;
  application_lifetime(const application_lifetime&) = delete;
  application_lifetime& operator=(const application_lifetime&) = delete;

  // Idempotent.  Runs the stopping callbacks once, on the calling thread.
  void request_stop();
  bool stop_requested() const;

  void wait();
  bool wait_for(std::chrono::milliseconds timeout);

  // Runs @p callback right away if a stop was already requested.
  void on_stopping(std::function<void()> callback);

 private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  bool stopping_{false};
  std::vector<std::function<void()>> callbacks_;
};

}  // namespace xpto::omni
