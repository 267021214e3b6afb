#pragma once

#include <boost/asio/awaitable.hpp>
#include <boost/json.hpp>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <typeinfo>
#include <utility>

#include "omni/endpoints.hpp"
#include "omni/errors.hpp"

namespace xpto::omni {

namespace json = boost::json;
namespace asio = boost::asio;

struct endpoint_descriptor {
  std::string name;
  std::string language;
  std::string request_type;   // mangled type names, see typeid
  std::string response_type;
};

/// Type-erased handler, as stored in the registry.
class endpoint_handler {
 public:
  endpoint_handler(const endpoint_handler&) = delete;
  endpoint_handler(endpoint_handler&&) = delete;
  endpoint_handler& operator=(const endpoint_handler&) = delete;
  endpoint_handler& operator=(endpoint_handler&&) = delete;
  virtual ~endpoint_handler() = default;

  const endpoint_descriptor& descriptor() const { return desc_; }

  /** @brief Run the handler on a JSON payload.
   *
   * Throws @c malformed_request_error, without running the handler, if
   * @p payload does not convert to the request type.  Any failure of the
   * handler itself surfaces as @c handler_failed_error.  A handler that
   * produced no response yields JSON @c null.
   */
  virtual asio::awaitable<json::value> invoke(const json::value& payload) = 0;

 protected:
  explicit endpoint_handler(endpoint_descriptor desc) : desc_{std::move(desc)} {}

 private:
  endpoint_descriptor desc_;
};

/// Base for handlers with a fixed request and response shape.  Request
/// must support json::value_to, Response json::value_from.
template <typename Request, typename Response>
class typed_handler : public endpoint_handler {
 public:
  using request_type = Request;
  using response_type = Response;

  explicit typed_handler(
      std::string_view name, std::string_view language = any_language)
      : endpoint_handler{endpoint_descriptor{
          normalize_endpoint_name(name), normalize_language(language),
          typeid(Request).name(), typeid(Response).name()}} {}

  asio::awaitable<json::value> invoke(const json::value& payload) final {
    Request request = decode(payload);
    std::optional<Response> response{};
    try {
      response = co_await handle(std::move(request));
    } catch (const std::exception& e) {
      throw handler_failed_error{e.what()};
    } catch (...) {
      throw handler_failed_error{"unknown exception"};
    }
    if (!response) co_return json::value{nullptr};
    co_return json::value_from(*response);
  }

 protected:
  virtual asio::awaitable<std::optional<Response>> handle(Request request) = 0;

 private:
  static Request decode(const json::value& payload) {
    try {
      return json::value_to<Request>(payload);
    } catch (const std::exception& e) {
      throw malformed_request_error{e.what()};
    }
  }
};

namespace detail {
template <typename Request, typename Response, typename Fn>
class function_handler final : public typed_handler<Request, Response> {
 public:
  function_handler(std::string_view name, std::string_view language, Fn fn)
      : typed_handler<Request, Response>{name, language}, fn_{std::move(fn)} {}

 protected:
  asio::awaitable<std::optional<Response>> handle(Request request) override {
    co_return co_await fn_(std::move(request));
  }

 private:
  Fn fn_;
};
}  // namespace detail

/** @brief Wrap a coroutine function into a registrable handler.
 *
 * @p fn is called as `fn(Request) -> asio::awaitable<std::optional<Response>>`
 * and lives as long as the handler does.
 */
template <typename Request, typename Response, typename Fn>
std::shared_ptr<endpoint_handler> make_handler(
    std::string_view name, std::string_view language, Fn fn) {
  return std::make_shared<detail::function_handler<Request, Response, Fn>>(
      name, language, std::move(fn));
}

}  // namespace xpto::omni
