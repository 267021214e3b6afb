#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/http/status.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "omni/dispatcher.hpp"

namespace xpto::omni {

namespace asio = boost::asio;

struct route {
  std::string endpoint;
  std::string language;  // empty when the target names none
};

// "/codeformat?language=x" -> {"codeformat", "x"}.  Nullopt for targets
// that can't name an endpoint.
std::optional<route> parse_route(std::string_view target);

// 200 on success, 404 unknown endpoint, 400 malformed, 500 handler failure.
boost::beast::http::status status_for(const dispatch_result& result);

/// HTTP transport: every endpoint is a POST route, the body is the raw
/// request and the response body the raw result.
class web_server {
 public:
  web_server(asio::any_io_executor executor, const dispatcher& dispatcher);
  web_server(const web_server&) = delete;
  web_server& operator=(const web_server&) = delete;

  // Resolve and bind.  Throws configuration_error if that fails.
  void listen(std::string_view interface, uint16_t port);
  void start();
  void stop();

  // Largest request body accepted; bigger ones get 413.
  void body_limit(std::uint64_t bytes);

  asio::ip::tcp::endpoint local_endpoint() const;

 private:
  asio::awaitable<void> accept_loop();
  asio::awaitable<void> serve(asio::ip::tcp::socket socket);

  asio::any_io_executor executor_;
  asio::strand<asio::any_io_executor> strand_;
  asio::ip::tcp::acceptor acceptor_;
  const dispatcher* dispatcher_;
  std::uint64_t body_limit_{64 * 1024 * 1024};
};

}  // namespace xpto::omni
