#include "omni/web.hpp"

#include <fmt/format.h>
#include <re2/re2.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/json.hpp>
#include <exception>
#include <string>
#include <utility>

#include "logger.hpp"
#include "omni/errors.hpp"
#include "utils.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace json = boost::json;
using tcp = boost::asio::ip::tcp;

namespace xpto::omni {

namespace {

http::response<http::string_body> make_json_response(
    http::status status_code, const json::value& body,
    unsigned int http_version, bool keep_alive) {
  http::response<http::string_body> res{status_code, http_version};
  res.set(http::field::content_type, "application/json");
  res.keep_alive(keep_alive);
  res.body() = json::serialize(body);
  res.prepare_payload();
  return res;
}

http::response<http::string_body> make_error(
    http::status status_code, std::string_view message,
    unsigned int http_version, bool keep_alive) {
  json::object obj;
  obj["Message"] = message;
  return make_json_response(status_code, obj, http_version, keep_alive);
}

bool is_http_error(const boost::system::error_code& ec) {
  return ec.category() == http::make_error_code(http::error::need_more).category();
}

std::string_view sv(beast::string_view s) { return {s.data(), s.size()}; }

std::string decode_uri(std::string_view s) {
  std::string out;
  out.reserve(s.size());
  auto hex = [](char c) -> int {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
  };
  for (size_t i = 0; i < s.size(); ++i) {
    if (s[i] == '+') {
      out += ' ';
      continue;
    }
    if (s[i] == '%' && i + 2 < s.size()) {
      int hi = hex(s[i + 1]), lo = hex(s[i + 2]);
      if (hi >= 0 && lo >= 0) {
        out += static_cast<char>(hi * 16 + lo);
        i += 2;
        continue;
      }
    }
    out += s[i];
  }
  return out;
}

}  // namespace

std::optional<route> parse_route(std::string_view target) {
  static const RE2 target_re{R"(/+([A-Za-z0-9_./-]+?)/*(?:\?(.*))?)"};
  static const RE2 language_re{R"((?:^|&)language=([^&]*))"};

  std::string path{}, query{};
  if (!RE2::FullMatch(std::string{target}, target_re, &path, &query))
    return std::nullopt;

  route r{};
  r.endpoint = normalize_endpoint_name(path);
  std::string language{};
  if (RE2::PartialMatch(query, language_re, &language))
    r.language = decode_uri(language);
  return r;
}

http::status status_for(const dispatch_result& result) {
  if (!result.error) return http::status::ok;
  // clang-format off
  switch (result.error->kind) {
  case error_kind::unknown_endpoint:  return http::status::not_found;
  case error_kind::malformed_request: return http::status::bad_request;
  case error_kind::handler_failed:    return http::status::internal_server_error;
  }
  // clang-format on
  return http::status::internal_server_error;
}

web_server::web_server(
    asio::any_io_executor executor, const dispatcher& dispatcher)
    : executor_{executor},
      strand_{asio::make_strand(executor)},
      acceptor_{strand_},
      dispatcher_{&dispatcher} {}

void web_server::body_limit(std::uint64_t bytes) { body_limit_ = bytes; }

void web_server::listen(std::string_view interface, uint16_t port) {
  boost::system::error_code ec{};
  tcp::resolver resolver{executor_};
  auto results = resolver.resolve(
      std::string{interface}, std::to_string(port),
      tcp::resolver::passive, ec);
  if (ec || results.empty())
    utils::throwf<configuration_error>(
        "can't resolve {}:{}: {}", interface, port, ec.message());

  tcp::endpoint endpoint = results.begin()->endpoint();
  acceptor_.open(endpoint.protocol(), ec);
  if (!ec) acceptor_.set_option(asio::socket_base::reuse_address{true}, ec);
  if (!ec) acceptor_.bind(endpoint, ec);
  if (!ec) acceptor_.listen(asio::socket_base::max_listen_connections, ec);
  if (ec)
    utils::throwf<configuration_error>(
        "can't listen on {}:{}: {}", endpoint.address().to_string(),
        endpoint.port(), ec.message());
}

void web_server::start() {
  auto ep = local_endpoint();
  LOG_INFO("omni --http: listening on http://{}:{}", ep.address().to_string(),
           ep.port());
  asio::co_spawn(strand_, accept_loop(), asio::detached);
}

void web_server::stop() {
  asio::post(strand_, [this] {
    boost::system::error_code ec{};
    acceptor_.close(ec);
  });
}

tcp::endpoint web_server::local_endpoint() const {
  boost::system::error_code ec{};
  return acceptor_.local_endpoint(ec);
}

asio::awaitable<void> web_server::accept_loop() {
  for (;;) {
    boost::system::error_code ec{};
    tcp::socket socket = co_await acceptor_.async_accept(
        asio::make_strand(executor_),
        asio::redirect_error(asio::use_awaitable, ec));
    if (ec) {
      if (ec != asio::error::operation_aborted)
        LOG_ERROR("accept failed: {}", ec.message());
      break;  // acceptor was closed
    }

    boost::system::error_code ec2{};
    auto remote = socket.remote_endpoint(ec2);
    LOG_DEBUG(
        "connection from {}:{}", ec2 ? "?" : remote.address().to_string(),
        ec2 ? 0 : remote.port());
    auto ex = socket.get_executor();
    asio::co_spawn(ex, serve(std::move(socket)), [](std::exception_ptr ep) {
      if (!ep) return;
      try {
        std::rethrow_exception(ep);
      } catch (const std::exception& e) {
        LOG_ERROR("connection failed: {}", e.what());
      } catch (...) {
        LOG_ERROR("connection failed: unknown exception");
      }
    });
  }
  LOG_INFO("http acceptor closed");
}

asio::awaitable<void> web_server::serve(tcp::socket socket) {
  beast::tcp_stream stream{std::move(socket)};
  beast::flat_buffer buffer;
  boost::system::error_code ec{};

  for (;;) {
    http::request_parser<http::string_body> parser;
    parser.body_limit(body_limit_);
    co_await http::async_read(
        stream, buffer, parser, asio::redirect_error(asio::use_awaitable, ec));
    if (ec == http::error::end_of_stream) break;
    if (ec && !is_http_error(ec)) break;  // peer gone
    if (ec) {
      // Unreadable request: answer it, then drop the connection.
      auto status = ec == http::error::body_limit
                        ? http::status::payload_too_large
                        : http::status::bad_request;
      LOG_WARN("rejecting http request: {}", ec.message());
      auto res = make_error(status, ec.message(), 11, false);
      co_await http::async_write(
          stream, res, asio::redirect_error(asio::use_awaitable, ec));
      break;
    }
    auto req = parser.release();

    LOG_INFO("{} {}", sv(req.method_string()), sv(req.target()));
    const auto version = req.version();
    const bool keep_alive = req.keep_alive();

    http::response<http::string_body> res;
    auto r = parse_route(sv(req.target()));
    if (!r || !dispatcher_->registry().contains(r->endpoint)) {
      error_info unknown{
          error_kind::unknown_endpoint,
          fmt::format("no endpoint at '{}'", sv(req.target()))};
      res = make_json_response(
          http::status::not_found, error_to_json(unknown), version,
          keep_alive);
    } else if (req.method() != http::verb::post) {
      res = make_error(
          http::status::method_not_allowed, "endpoints only accept POST",
          version, keep_alive);
    } else {
      auto result = co_await dispatcher_->dispatch_text(
          r->endpoint, r->language, std::move(req.body()));
      auto status = status_for(result);
      res = result.error
                ? make_json_response(
                      status, error_to_json(*result.error), version,
                      keep_alive)
                : make_json_response(status, result.body, version, keep_alive);
    }

    LOG_INFO("-> {}", static_cast<unsigned>(res.result_int()));
    co_await http::async_write(
        stream, res, asio::redirect_error(asio::use_awaitable, ec));
    if (ec || !keep_alive) break;
  }

  stream.socket().shutdown(tcp::socket::shutdown_send, ec);
}

}  // namespace xpto::omni
