#include <doctest/doctest.h>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/json.hpp>
#include <cstdint>
#include <fmt/format.h>
#include <optional>
#include <stdexcept>
#include <string>

#include "omni/dispatcher.hpp"
#include "omni/errors.hpp"
#include "omni/handler.hpp"
#include "omni/models.hpp"
#include "omni/registry.hpp"
#include "omni/web.hpp"

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
namespace json = boost::json;
namespace omni = xpto::omni;
namespace models = xpto::omni::models;
using tcp = asio::ip::tcp;

TEST_CASE("web-parse-route") {
  auto r = omni::parse_route("/codeformat");
  REQUIRE(r);
  CHECK(r->endpoint == "codeformat");
  CHECK(r->language.empty());

  r = omni::parse_route("/FindSymbols?language=x");
  REQUIRE(r);
  CHECK(r->endpoint == "findsymbols");
  CHECK(r->language == "x");

  r = omni::parse_route("/fixusings/?foo=1&language=c%23");
  REQUIRE(r);
  CHECK(r->endpoint == "fixusings");
  CHECK(r->language == "c#");

  r = omni::parse_route("/codeformat?planguage=x");
  REQUIRE(r);
  CHECK(r->language.empty());

  CHECK_FALSE(omni::parse_route("/"));
  CHECK_FALSE(omni::parse_route(""));
  CHECK_FALSE(omni::parse_route("codeformat"));
  CHECK_FALSE(omni::parse_route("/a b"));
}

TEST_CASE("web-status-mapping") {
  omni::dispatch_result ok{};
  CHECK(omni::status_for(ok) == http::status::ok);

  omni::dispatch_result r{};
  r.error = omni::error_info{omni::error_kind::unknown_endpoint, ""};
  CHECK(omni::status_for(r) == http::status::not_found);
  r.error->kind = omni::error_kind::malformed_request;
  CHECK(omni::status_for(r) == http::status::bad_request);
  r.error->kind = omni::error_kind::handler_failed;
  CHECK(omni::status_for(r) == http::status::internal_server_error);
}

namespace {

using format_reply_t =
    asio::awaitable<std::optional<models::code_format_response>>;

tcp::endpoint loopback(uint16_t port) {
  return {asio::ip::make_address("127.0.0.1"), port};
}

http::request<http::string_body> make_request(
    http::verb method, const std::string& target, const std::string& body,
    bool keep_alive) {
  http::request<http::string_body> req{method, target, 11};
  req.set(http::field::host, "127.0.0.1");
  req.set(http::field::content_type, "application/json");
  req.keep_alive(keep_alive);
  req.body() = body;
  req.prepare_payload();
  return req;
}

http::response<http::string_body> read_response(tcp::socket& socket) {
  beast::flat_buffer buffer;
  http::response<http::string_body> res;
  http::read(socket, buffer, res);
  return res;
}

struct WebFixture {
  omni::endpoint_registry registry;
  omni::dispatcher dispatcher{registry};
  asio::thread_pool pool{2};
  std::optional<omni::web_server> server;
  uint16_t port{};
  asio::io_context client_ctx;

  explicit WebFixture(std::uint64_t body_limit = 0) {
    registry.add(omni::make_handler<models::code_format_request,
                                    models::code_format_response>(
        "codeformat", "x", [](models::code_format_request req) -> format_reply_t {
          if (req.file_name == "none.txt") co_return std::nullopt;
          if (req.file_name == "boom.txt")
            throw std::runtime_error{"formatter crashed"};
          models::code_format_response res{};
          res.buffer = "formatted " + req.file_name;
          if (req.buffer)
            res.buffer->append(fmt::format(" ({} bytes)", req.buffer->size()));
          co_return res;
        }));
    server.emplace(pool.get_executor(), dispatcher);
    if (body_limit) server->body_limit(body_limit);
    server->listen("127.0.0.1", 0);
    port = server->local_endpoint().port();
    server->start();
  }

  WebFixture(const WebFixture&) = delete;
  WebFixture& operator=(const WebFixture&) = delete;
  ~WebFixture() {
    server->stop();
    pool.join();
  }

  tcp::socket connect() {
    tcp::socket socket{client_ctx};
    socket.connect(loopback(port));
    return socket;
  }

  http::response<http::string_body> request(
      http::verb method, const std::string& target, const std::string& body) {
    auto socket = connect();
    http::write(socket, make_request(method, target, body, false));
    auto res = read_response(socket);
    boost::system::error_code ec{};
    socket.shutdown(tcp::socket::shutdown_both, ec);
    return res;
  }

  http::response<http::string_body> post(
      const std::string& target, const std::string& body) {
    return request(http::verb::post, target, body);
  }

  // Write @p text verbatim and read what comes back.
  http::response<http::string_body> send_raw(const std::string& text) {
    auto socket = connect();
    asio::write(socket, asio::buffer(text));
    return read_response(socket);
  }
};

struct SmallBodyWebFixture : WebFixture {
  SmallBodyWebFixture() : WebFixture{1024} {}
};

}  // namespace

TEST_CASE_FIXTURE(WebFixture, "web-post-success") {
  CHECK(port != 0);
  auto res = post("/codeformat?language=x", R"({"FileName":"a.txt"})");
  CHECK(res.result() == http::status::ok);
  auto body = json::parse(res.body()).as_object();
  CHECK(body.at("Buffer").as_string() == "formatted a.txt");
}

TEST_CASE_FIXTURE(WebFixture, "web-null-result") {
  auto res = post("/codeformat?language=x", R"({"FileName":"none.txt"})");
  CHECK(res.result() == http::status::ok);
  CHECK(json::parse(res.body()).is_null());
}

TEST_CASE_FIXTURE(WebFixture, "web-unknown-endpoint") {
  SUBCASE("no such name") {
    auto res = post("/highlight?language=x", "{}");
    CHECK(res.result() == http::status::not_found);
    auto body = json::parse(res.body()).as_object();
    CHECK(body.at("Error").as_string() == "UnknownEndpointError");
  }
  SUBCASE("no handler for the language") {
    auto res = post("/codeformat?language=y", R"({"FileName":"a.txt"})");
    CHECK(res.result() == http::status::not_found);
  }
  SUBCASE("unroutable target") {
    auto res = post("/", "{}");
    CHECK(res.result() == http::status::not_found);
  }
  SUBCASE("unknown name with the wrong method") {
    auto res = request(http::verb::get, "/highlight", "");
    CHECK(res.result() == http::status::not_found);
    auto body = json::parse(res.body()).as_object();
    CHECK(body.at("Error").as_string() == "UnknownEndpointError");
  }
}

TEST_CASE_FIXTURE(WebFixture, "web-malformed-request") {
  auto res = post("/codeformat?language=x", R"({"Buffer":1})");
  CHECK(res.result() == http::status::bad_request);
  auto body = json::parse(res.body()).as_object();
  CHECK(body.at("Error").as_string() == "MalformedRequestError");
  CHECK_FALSE(body.at("Message").as_string().empty());

  res = post("/codeformat?language=x", "{not json");
  CHECK(res.result() == http::status::bad_request);
}

TEST_CASE_FIXTURE(WebFixture, "web-handler-failure") {
  auto res = post("/codeformat?language=x", R"({"FileName":"boom.txt"})");
  CHECK(res.result() == http::status::internal_server_error);
  auto body = json::parse(res.body()).as_object();
  CHECK(body.at("Error").as_string() == "HandlerFailedError");
  CHECK(body.at("Message").as_string() == "formatter crashed");
}

TEST_CASE_FIXTURE(WebFixture, "web-only-post") {
  auto res = request(http::verb::get, "/codeformat?language=x", "");
  CHECK(res.result() == http::status::method_not_allowed);
}

TEST_CASE_FIXTURE(WebFixture, "web-keep-alive-survives-failure") {
  auto socket = connect();

  http::write(
      socket, make_request(
                  http::verb::post, "/codeformat?language=x",
                  R"({"FileName":"boom.txt"})", true));
  auto first = read_response(socket);
  CHECK(first.result() == http::status::internal_server_error);
  CHECK(first.keep_alive());

  http::write(
      socket, make_request(
                  http::verb::post, "/codeformat?language=x",
                  R"({"FileName":"a.txt"})", true));
  auto second = read_response(socket);
  CHECK(second.result() == http::status::ok);
  auto body = json::parse(second.body()).as_object();
  CHECK(body.at("Buffer").as_string() == "formatted a.txt");
}

TEST_CASE_FIXTURE(WebFixture, "web-large-body") {
  json::object payload{};
  payload["FileName"] = "big.txt";
  payload["Buffer"] = std::string(2 * 1024 * 1024, 'x');
  auto res = post("/codeformat?language=x", json::serialize(payload));
  REQUIRE(res.result() == http::status::ok);
  auto body = json::parse(res.body()).as_object();
  CHECK(body.at("Buffer").as_string() == "formatted big.txt (2097152 bytes)");
}

TEST_CASE_FIXTURE(SmallBodyWebFixture, "web-body-over-limit") {
  auto res = send_raw(
      "POST /codeformat?language=x HTTP/1.1\r\n"
      "Host: 127.0.0.1\r\n"
      "Content-Length: 4096\r\n"
      "\r\n");
  CHECK(res.result() == http::status::payload_too_large);
  CHECK_FALSE(res.keep_alive());
}

TEST_CASE_FIXTURE(WebFixture, "web-unparseable-request") {
  auto res = send_raw("GARBAGE\r\n\r\n");
  CHECK(res.result() == http::status::bad_request);
  auto body = json::parse(res.body()).as_object();
  CHECK_FALSE(body.at("Message").as_string().empty());
}

TEST_CASE("web-bind-failure") {
  omni::endpoint_registry registry;
  omni::dispatcher dispatcher{registry};
  asio::thread_pool pool{1};
  omni::web_server first{pool.get_executor(), dispatcher};
  first.listen("127.0.0.1", 0);
  auto port = first.local_endpoint().port();

  omni::web_server second{pool.get_executor(), dispatcher};
  CHECK_THROWS_AS(second.listen("127.0.0.1", port), omni::configuration_error);
  pool.join();
}
