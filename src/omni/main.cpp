#include <fmt/format.h>
#include <fmt/ranges.h>
#include <unistd.h>

#include <boost/asio/signal_set.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/json.hpp>
#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "../libomni/json_helpers.hpp"
#include "../libomni/logger.hpp"
#include "omni/builtin.hpp"
#include "omni/dispatcher.hpp"
#include "omni/encoding.hpp"
#include "omni/environment.hpp"
#include "omni/host_process.hpp"
#include "omni/lifetime.hpp"
#include "omni/plugins.hpp"
#include "omni/registry.hpp"
#include "omni/shared_writer.hpp"
#include "omni/stdio.hpp"
#include "omni/web.hpp"
#include "options.hpp"

namespace asio = boost::asio;
namespace json = boost::json;
namespace omni = xpto::omni;

namespace {

constexpr int kFatalExit{0xbad};
constexpr std::chrono::seconds kDrainTimeout{5};

// Restores the console sink when the stdio writer goes away.
struct log_sink_scope {
  log_sink_scope() = default;
  log_sink_scope(const log_sink_scope&) = delete;
  log_sink_scope& operator=(const log_sink_scope&) = delete;
  ~log_sink_scope() { xpto::logger::set_sink({}); }
};

std::string base_message(const std::exception& e) {
  try {
    std::rethrow_if_nested(e);
  } catch (const std::exception& nested) {
    return base_message(nested);
  }
  return e.what();
}

void log_to_stdio_events(omni::shared_writer& writer) {
  xpto::logger::set_sink(
      [&writer](xpto::logger::level lvl, std::string_view record) {
        json::object body{};
        body["LogLevel"] = xpto::logger::level_to_string(lvl);
        body["Name"] = "omni";
        body["Message"] = record;
        writer.write_frame(omni::make_event_packet("log", std::move(body)));
      });
}

int run(std::span<char*> args) {
  omni::environment env{};
  if (auto done = omni::parse_options(args, env)) return done.value();

  // Frames cross stdio in the requested encoding.
  omni::stream_encoding encoding{};
  if (env.transport == omni::transport_kind::stdio && env.encoding)
    encoding = omni::stream_encoding{*env.encoding};

  omni::shared_writer writer{std::cout, encoding};
  log_sink_scope sink_scope{};
  if (env.transport == omni::transport_kind::stdio)
    log_to_stdio_events(writer);
  xpto::logger::set_level(static_cast<xpto::logger::level>(env.log_level));

  LOG_INFO("omni: {}", fmt::join(args.subspan(1), " "));
  LOG_INFO("root={} transport={}", env.root.string(), to_string(env.transport));
  LOG_DEBUG(
      "loglevel={} threads={} zero_based_indices={}", env.log_level,
      env.threads, env.zero_based_indices);
  if (!env.other_args.empty())
    LOG_DEBUG("passthrough: {}", fmt::join(env.other_args, " "));

  omni::application_lifetime lifetime{};

  // Handlers may live in plugins, so the plugins outlive the registry.
  omni::plugin_set plugins{};
  omni::endpoint_registry registry{};
  omni::register_builtin_endpoints(registry, lifetime);
  for (const auto& name : env.plugins) plugins.load(name, registry);
  for (const auto& desc : registry.endpoints())
    LOG_DEBUG("endpoint {} [{}]", desc.name, desc.language);
  const omni::dispatcher dispatcher{registry};

  asio::thread_pool pool{env.threads};

  asio::signal_set signals{pool, SIGINT, SIGTERM};
  signals.async_wait(
      [&lifetime](const boost::system::error_code& ec, int signo) {
        if (ec) return;
        LOG_INFO("caught signal {}", signo);
        lifetime.request_stop();
      });

  omni::posix_process_watcher watcher{pool.get_executor()};

  std::optional<omni::stdio_server> stdio{};
  std::optional<omni::web_server> web{};
  if (env.transport == omni::transport_kind::stdio) {
    stdio.emplace(
        pool.get_executor(), ::dup(STDIN_FILENO), writer, dispatcher);
    lifetime.on_stopping([&stdio] { stdio->stop(); });
    stdio->start([&lifetime] { lifetime.request_stop(); });
  } else {
    web.emplace(pool.get_executor(), dispatcher);
    web->listen(env.interface, env.port);
    lifetime.on_stopping([&web] { web->stop(); });
    web->start();
  }

  omni::supervise_host_process(env.host_pid, watcher, lifetime);

  lifetime.wait();

  if (stdio && !stdio->drain(kDrainTimeout))
    LOG_WARN("abandoning {} request(s) in flight", stdio->in_flight());
  pool.stop();
  pool.join();
  LOG_INFO("omni: stopped");
  return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
  try {
    return run(std::span(argv, argc));
  } catch (const std::exception& e) {
    std::cerr << base_message(e) << "\n";
    return kFatalExit;
  }
}
