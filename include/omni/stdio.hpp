#pragma once

/**
 * @file stdio.hpp
 * @brief Line-delimited JSON transport.
 *
 * Every input line is one request packet:
 * @code
 * {"Type":"request","Seq":1,"Command":"/codeformat","Language":"x",
 *  "Arguments":{...}}
 * @endcode
 * and is answered by exactly one response packet carrying
 * @c Request_seq, @c Success and either @c Body or @c Error / @c Message.
 * Requests run concurrently, so responses may come back in any order.
 * Input lines are read in the writer's stream encoding.
 */

#include <atomic>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/strand.hpp>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <string>

#include "omni/dispatcher.hpp"
#include "omni/shared_writer.hpp"

namespace xpto::omni {

namespace asio = boost::asio;

class stdio_server {
 public:
  // Takes ownership of @p input_fd.
  stdio_server(
      asio::any_io_executor executor, int input_fd, shared_writer& writer,
      const dispatcher& dispatcher);
  stdio_server(const stdio_server&) = delete;
  stdio_server& operator=(const stdio_server&) = delete;
  ~stdio_server() = default;

  // Announce the "started" event and begin reading.  @p on_eof runs when
  // the input is exhausted (not after stop()).
  void start(std::function<void()> on_eof);

  // Stop reading.  Requests already read keep running.
  void stop();

  // Wait for in-flight requests.  False on timeout.
  bool drain(std::chrono::milliseconds timeout);

  std::size_t in_flight() const;

 private:
  asio::awaitable<void> read_loop();
  asio::awaitable<void> handle_frame(std::string line);
  void finish_one();

  asio::any_io_executor executor_;
  asio::strand<asio::any_io_executor> strand_;
  asio::posix::stream_descriptor input_;
  shared_writer* writer_;
  const dispatcher* dispatcher_;
  std::function<void()> on_eof_;
  std::atomic<bool> stopping_{false};

  mutable std::mutex mutex_;
  std::condition_variable idle_cv_;
  std::size_t in_flight_{0};
};

}  // namespace xpto::omni
