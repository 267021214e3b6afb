// SPDX-License-Identifier: MIT
#include "omni/dispatcher.hpp"

#include <fmt/format.h>

#include <chrono>
#include <exception>
#include <system_error>
#include <utility>

#include "logger.hpp"
#include "omni/errors.hpp"

namespace xpto::omni {

namespace {

using clock_t = std::chrono::steady_clock;

long long duration_ms(clock_t::time_point t0) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             clock_t::now() - t0)
      .count();
}

dispatch_result failure(error_kind kind, std::string message) {
  dispatch_result result{};
  result.error = error_info{kind, std::move(message)};
  return result;
}

}  // namespace

std::string_view to_string(error_kind kind) {
  // clang-format off
  switch (kind) {
  case error_kind::unknown_endpoint:  return "UnknownEndpointError";
  case error_kind::malformed_request: return "MalformedRequestError";
  case error_kind::handler_failed:    return "HandlerFailedError";
  }
  // clang-format on
  return "UnknownError";
}

json::object error_to_json(const error_info& error) {
  json::object obj{};
  obj["Error"] = to_string(error.kind);
  obj["Message"] = error.message;
  return obj;
}

std::optional<error_info> dispatcher::check_route(
    std::string_view name, std::string_view language) const {
  try {
    registry_->resolve(name, language);
  } catch (const unknown_endpoint_error& e) {
    LOG_WARN("{}", e.what());
    return error_info{error_kind::unknown_endpoint, e.what()};
  }
  return std::nullopt;
}

asio::awaitable<dispatch_result> dispatcher::dispatch(
    std::string name, std::string language, json::value payload) const {
  if (auto err = check_route(name, language))
    co_return failure(err->kind, std::move(err->message));

  auto& handler = registry_->resolve(name, language);
  const auto& desc = handler.descriptor();
  LOG_DEBUG("dispatch: {} [{}]", desc.name, desc.language);
  auto t0 = clock_t::now();

  dispatch_result result{};
  try {
    result.body = co_await handler.invoke(payload);
  } catch (const malformed_request_error& e) {
    result = failure(error_kind::malformed_request, e.what());
  } catch (const handler_failed_error& e) {
    result = failure(error_kind::handler_failed, e.what());
  } catch (const std::exception& e) {
    result = failure(error_kind::handler_failed, e.what());
  } catch (...) {
    result = failure(error_kind::handler_failed, "unknown exception");
  }

  if (result.error) {
    LOG_ERROR(
        "{} [{}] failed after {}ms: {}: {}", desc.name, desc.language,
        duration_ms(t0), to_string(result.error->kind),
        result.error->message);
  } else {
    LOG_DEBUG(
        "{} [{}] done in {}ms", desc.name, desc.language, duration_ms(t0));
  }
  co_return result;
}

asio::awaitable<dispatch_result> dispatcher::dispatch_text(
    std::string name, std::string language, std::string text) const {
  if (auto err = check_route(name, language))
    co_return failure(err->kind, std::move(err->message));

  json::value payload{json::object{}};
  if (!text.empty()) {
    std::error_code ec{};
    payload = json::parse(text, ec);
    if (ec) {
      co_return failure(
          error_kind::malformed_request,
          fmt::format("payload is not valid JSON: {}", ec.message()));
    }
  }
  co_return co_await dispatch(
      std::move(name), std::move(language), std::move(payload));
}

}  // namespace xpto::omni
