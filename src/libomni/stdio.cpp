#include "omni/stdio.hpp"

#include <fmt/format.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/streambuf.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/json.hpp>
#include <exception>
#include <istream>
#include <string_view>
#include <system_error>
#include <utility>

#include "json_helpers.hpp"
#include "logger.hpp"

namespace json = boost::json;

namespace xpto::omni {

namespace {

json::object error_body(std::string_view message) {
  json::object body{};
  body["Message"] = message;
  return body;
}

}  // namespace

stdio_server::stdio_server(
    asio::any_io_executor executor, int input_fd, shared_writer& writer,
    const dispatcher& dispatcher)
    : executor_{executor},
      strand_{asio::make_strand(executor)},
      input_{strand_, input_fd},
      writer_{&writer},
      dispatcher_{&dispatcher} {}

void stdio_server::start(std::function<void()> on_eof) {
  on_eof_ = std::move(on_eof);
  writer_->write_frame(make_event_packet("started", nullptr));
  asio::co_spawn(strand_, read_loop(), [](std::exception_ptr ep) {
    if (!ep) return;
    try {
      std::rethrow_exception(ep);
    } catch (const std::exception& e) {
      LOG_ERROR("stdio read loop died: {}", e.what());
    } catch (...) {
      LOG_ERROR("stdio read loop died: unknown exception");
    }
  });
}

void stdio_server::stop() {
  if (stopping_.exchange(true)) return;
  asio::post(strand_, [this] {
    boost::system::error_code ec{};
    input_.cancel(ec);
    input_.close(ec);
  });
}

asio::awaitable<void> stdio_server::read_loop() {
  asio::streambuf buf;
  std::istream is{&buf};
  for (;;) {
    boost::system::error_code ec{};
    co_await asio::async_read_until(
        input_, buf, '\n', asio::redirect_error(asio::use_awaitable, ec));
    // A final line may lack its newline.
    if (ec && !(ec == asio::error::eof && buf.size() > 0)) {
      if (stopping_) break;
      if (ec != asio::error::eof)
        LOG_ERROR("stdio read failed: {}", ec.message());
      LOG_INFO("stdio input closed");
      if (on_eof_) on_eof_();
      break;
    }
    if (stopping_) break;

    std::string line{};
    std::getline(is, line);
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line.empty()) continue;

    {
      std::lock_guard<std::mutex> lock{mutex_};
      ++in_flight_;
    }
    asio::co_spawn(
        executor_, handle_frame(std::move(line)),
        [this](std::exception_ptr ep) {
          if (ep) {
            try {
              std::rethrow_exception(ep);
            } catch (const std::exception& e) {
              LOG_ERROR("stdio frame handling failed: {}", e.what());
            } catch (...) {
              LOG_ERROR("stdio frame handling failed: unknown exception");
            }
          }
          finish_one();
        });
  }
}

asio::awaitable<void> stdio_server::handle_frame(std::string line) {
  LOG_TRACE("stdio <- {}", line);

  line = writer_->encoding().decode(line);
  std::error_code ec{};
  json::value packet_val = json::parse(line, ec);
  if (ec) {
    writer_->write_frame(make_event_packet(
        "error", error_body(fmt::format("Parse error: {}", ec.message()))));
    co_return;
  }

  auto* packet = packet_val.if_object();
  if (!packet) {
    writer_->write_frame(make_event_packet(
        "error", error_body("Invalid packet: not an object")));
    co_return;
  }

  auto* type = find_field(*packet, "Type");
  if (type && !(type->is_string() && type->get_string() == "request")) {
    writer_->write_frame(make_event_packet(
        "error", error_body("Invalid packet: not a request")));
    co_return;
  }

  int64_t request_seq{0};
  if (auto* seq = find_field(*packet, "Seq"); seq && seq->is_int64())
    request_seq = seq->get_int64();

  auto* command = find_field(*packet, "Command");
  if (!command || !command->is_string()) {
    dispatch_result missing{};
    missing.error =
        error_info{error_kind::unknown_endpoint, "packet without a Command"};
    writer_->write_frame(make_response_packet(request_seq, "", missing));
    co_return;
  }
  std::string name{command->get_string()};

  json::value arguments{json::object{}};
  if (auto* args = find_field(*packet, "Arguments"); args && !args->is_null())
    arguments = *args;

  // The envelope's language wins over one carried in the arguments.
  std::string language{};
  if (auto* lang = find_field(*packet, "Language"); lang && lang->is_string()) {
    language = std::string{lang->get_string()};
  } else if (auto* args = arguments.if_object()) {
    if (auto* alang = find_field(*args, "Language");
        alang && alang->is_string())
      language = std::string{alang->get_string()};
  }

  auto result = co_await dispatcher_->dispatch(
      name, std::move(language), std::move(arguments));
  writer_->write_frame(
      make_response_packet(request_seq, name, std::move(result)));
}

void stdio_server::finish_one() {
  std::lock_guard<std::mutex> lock{mutex_};
  if (--in_flight_ == 0) idle_cv_.notify_all();
}

bool stdio_server::drain(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock{mutex_};
  return idle_cv_.wait_for(lock, timeout, [this] { return in_flight_ == 0; });
}

std::size_t stdio_server::in_flight() const {
  std::lock_guard<std::mutex> lock{mutex_};
  return in_flight_;
}

}  // namespace xpto::omni
