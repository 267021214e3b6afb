#include "omni/host_process.hpp"

#include <sys/syscall.h>
#include <sys/types.h>
#include <unistd.h>

#include <fmt/format.h>

#include <boost/asio/error.hpp>
#include <cerrno>
#include <csignal>
#include <exception>
#include <utility>

#include "logger.hpp"
#include "omni/errors.hpp"

namespace xpto::omni {

namespace {

bool process_alive(int pid) {
  // EPERM still means the process exists.
  return ::kill(static_cast<pid_t>(pid), 0) == 0 || errno == EPERM;
}

int open_pidfd(int pid) {
#ifdef SYS_pidfd_open
  return static_cast<int>(::syscall(SYS_pidfd_open, pid, 0));
#else
  errno = ENOSYS;
  return -1;
#endif
}

}  // namespace

posix_process_watcher::posix_process_watcher(
    asio::any_io_executor executor, std::chrono::milliseconds poll_interval)
    : poll_interval_{poll_interval}, timer_{executor} {}

bool posix_process_watcher::try_attach(int pid) {
  if (pid <= 0 || !process_alive(pid)) return false;

  int fd = open_pidfd(pid);
  if (fd >= 0) {
    pidfd_.emplace(timer_.get_executor(), fd);
  } else if (errno == ESRCH) {
    return false;
  } else {
    LOG_DEBUG("pidfd_open({}) unavailable, polling instead", pid);
  }
  pid_ = pid;
  return true;
}

void posix_process_watcher::on_exit(std::function<void()> callback) {
  if (pid_ <= 0)
    throw host_process_attach_error{"not attached to a host process", pid_};
  callback_ = std::move(callback);

  if (pidfd_) {
    pidfd_->async_wait(
        asio::posix::stream_descriptor::wait_read,
        [this](const boost::system::error_code& ec) {
          if (ec == asio::error::operation_aborted) return;
          LOG_INFO("host process {} exited", pid_);
          callback_();
        });
    return;
  }
  schedule_poll();
}

void posix_process_watcher::schedule_poll() {
  timer_.expires_after(poll_interval_);
  timer_.async_wait([this](const boost::system::error_code& ec) {
    if (ec) return;
    if (process_alive(pid_)) {
      schedule_poll();
      return;
    }
    LOG_INFO("host process {} exited", pid_);
    callback_();
  });
}

void posix_process_watcher::cancel() {
  boost::system::error_code ec{};
  timer_.cancel();
  if (pidfd_) pidfd_->cancel(ec);
}

void supervise_host_process(
    std::optional<int> host_pid, process_watcher& watcher,
    application_lifetime& lifetime) {
  if (!host_pid) return;
  try {
    if (!watcher.try_attach(*host_pid))
      throw host_process_attach_error{
        fmt::format("host process {} is not running", *host_pid), *host_pid};
    watcher.on_exit([&lifetime] { lifetime.request_stop(); });
    LOG_INFO("watching host process {}", *host_pid);
  } catch (const host_process_attach_error& e) {
    LOG_WARN("{}; shutting down", e.what());
    lifetime.request_stop();
  } catch (const std::exception& e) {
    LOG_WARN("can't watch host process {}: {}; shutting down", *host_pid,
             e.what());
    lifetime.request_stop();
  } catch (...) {
    LOG_WARN("can't watch host process {}; shutting down", *host_pid);
    lifetime.request_stop();
  }
}

}  // namespace xpto::omni
