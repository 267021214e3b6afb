#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <functional>
#include <optional>

#include "omni/lifetime.hpp"

namespace xpto::omni {

namespace asio = boost::asio;

/// Watches another process for termination.
class process_watcher {
 public:
  virtual ~process_watcher() = default;

  // False if @p pid does not name a live process.
  virtual bool try_attach(int pid) = 0;

  // @p callback runs once, on some executor thread, when the attached
  // process exits.
  virtual void on_exit(std::function<void()> callback) = 0;
};

/// Uses a pidfd where the kernel has them.  Elsewhere polls the pid with
/// kill(pid, 0) every @c poll_interval.
class posix_process_watcher final : public process_watcher {
 public:
  explicit posix_process_watcher(
      asio::any_io_executor executor,
      std::chrono::milliseconds poll_interval = std::chrono::seconds{1});

  bool try_attach(int pid) override;
  void on_exit(std::function<void()> callback) override;

  // Abandon the watch; the exit callback will not run.
  void cancel();

 private:
  void schedule_poll();

  std::chrono::milliseconds poll_interval_;
  int pid_{-1};
  std::optional<asio::posix::stream_descriptor> pidfd_;
  asio::steady_timer timer_;
  std::function<void()> callback_;
};

/** @brief Tie the server lifetime to its host process.
 *
 * Without a pid this does nothing.  If the process can't be attached to
 * (typically because it is already gone) a stop is requested right away;
 * otherwise a stop is requested when it exits.  Never throws.
 */
void supervise_host_process(
    std::optional<int> host_pid, process_watcher& watcher,
    application_lifetime& lifetime);

}  // namespace xpto::omni
