// SPDX-License-Identifier: MIT
#pragma once

/**
 * @file dispatcher.hpp
 * @brief Transport-independent request dispatch.
 *
 * Both transports hand the dispatcher an endpoint name, a language tag and
 * a payload, and get back either a result body or a tagged error.  Nothing
 * a handler does can make @c dispatch throw.
 */

#include <boost/asio/awaitable.hpp>
#include <boost/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "omni/registry.hpp"

namespace xpto::omni {

namespace json = boost::json;
namespace asio = boost::asio;

enum class error_kind : uint8_t {
  unknown_endpoint,
  malformed_request,
  handler_failed
};

// Wire name of an error kind, e.g. "UnknownEndpointError".
std::string_view to_string(error_kind kind);

struct error_info {
  error_kind kind;
  std::string message;
};

struct dispatch_result {
  json::value body{nullptr};  // null is a valid, empty, response
  std::optional<error_info> error{};

  bool ok() const { return !error.has_value(); }
};

class dispatcher {
 public:
  explicit dispatcher(const endpoint_registry& registry)
      : registry_{&registry} {}

  const endpoint_registry& registry() const { return *registry_; }

  /// Resolve, convert, invoke.  @p payload is already parsed JSON.
  asio::awaitable<dispatch_result> dispatch(
      std::string name, std::string language, json::value payload) const;

  /// Same as dispatch(), for a payload still in its textual form.  An
  /// empty text is an empty object.  Unparseable text is a
  /// malformed_request error.
  asio::awaitable<dispatch_result> dispatch_text(
      std::string name, std::string language, std::string text) const;

 private:
  std::optional<error_info> check_route(
      std::string_view name, std::string_view language) const;

  const endpoint_registry* registry_;
};

// {"Error": "<kind>", "Message": "..."}
json::object error_to_json(const error_info& error);

}  // namespace xpto::omni
