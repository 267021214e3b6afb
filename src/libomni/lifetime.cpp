#include "omni/lifetime.hpp"

#include <utility>

#include "logger.hpp"

namespace xpto::omni {

void application_lifetime::request_stop() {
  std::vector<std::function<void()>> callbacks;
  {
    std::lock_guard<std::mutex> lock{mutex_};
    if (stopping_) return;
    stopping_ = true;
    callbacks.swap(callbacks_);
  }
  LOG_INFO("shutdown requested");
  for (auto& cb : callbacks) cb();
  cv_.notify_all();
}

bool application_lifetime::stop_requested() const {
  std::lock_guard<std::mutex> lock{mutex_};
  return stopping_;
}

void application_lifetime::wait() {
  std::unique_lock<std::mutex> lock{mutex_};
  cv_.wait(lock, [this] { return stopping_; });
}

bool application_lifetime::wait_for(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock{mutex_};
  return cv_.wait_for(lock, timeout, [this] { return stopping_; });
}

void application_lifetime::on_stopping(std::function<void()> callback) {
  {
    std::lock_guard<std::mutex> lock{mutex_};
    if (!stopping_) {
      callbacks_.push_back(std::move(callback));
      return;
    }
  }
  callback();
}

}  // namespace xpto::omni
