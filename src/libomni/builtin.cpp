#include "omni/builtin.hpp"

#include <boost/json.hpp>
#include <optional>

#include "logger.hpp"
#include "omni/endpoints.hpp"
#include "omni/handler.hpp"

namespace xpto::omni {

namespace json = boost::json;

using status_t = asio::awaitable<std::optional<bool>>;

void register_builtin_endpoints(
    endpoint_registry& registry, application_lifetime& lifetime) {
  registry.add(make_handler<json::value, bool>(
      endpoints::check_alive_status, any_language,
      [](json::value) -> status_t { co_return true; }));

  // Requests are only read once startup is over.
  registry.add(make_handler<json::value, bool>(
      endpoints::check_ready_status, any_language,
      [](json::value) -> status_t { co_return true; }));

  registry.add(make_handler<json::value, bool>(
      endpoints::stop_server, any_language,
      [&lifetime](json::value) -> status_t {
        LOG_INFO("stop requested by client");
        lifetime.request_stop();
        co_return true;
      }));
}

}  // namespace xpto::omni
