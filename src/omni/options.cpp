#include "options.hpp"

#include <CLI/CLI.hpp>
#include <algorithm>
#include <filesystem>
#include <map>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

namespace xpto::omni {

std::optional<int> parse_options(std::span<char*> args, environment& env) {
  CLI::App app{"Editor endpoint host"};

  app.allow_non_standard_option_names();
  app.allow_extras();

  std::string root{fs::current_path().string()};
  int port{env.port};
  int host_pid{-1};
  bool verbose{false};
  bool stdio{false};
  std::string encoding{};
  unsigned threads{std::max(std::thread::hardware_concurrency(), 8U)};

  app.add_option(
      "-s,--solution", root,
      "Solution / project file or directory to point at")
    ->capture_default_str();
  app.add_option("-p,--port", port, "HTTP port")
    ->check(CLI::Range(1, 65535))
    ->capture_default_str();
  // Level names, or their numbers from 0=Trace to 5=Critical.
  const std::map<std::string, int> log_levels{
      {"trace", 5},   {"debug", 4}, {"information", 3}, {"info", 3},
      {"warning", 2}, {"error", 1}, {"critical", 0},
      {"0", 5},       {"1", 4},     {"2", 3},
      {"3", 2},       {"4", 1},     {"5", 0}};
  app.add_option(
      "-l,--loglevel", env.log_level,
      "Log level (Trace, Debug, Information, Warning, Error, Critical)")
    ->transform(CLI::CheckedTransformer(log_levels, CLI::ignore_case));
  app.add_flag("-v,--verbose", verbose, "Explicitly set DEBUG log level");
  app.add_option("-hpid,--hostPID", host_pid, "Host process ID");
  app.add_flag(
      "-stdio,--stdio", stdio, "Speak line-delimited JSON over stdio instead of HTTP");
  app.add_flag(
      "-z,--zero-based-indices", env.zero_based_indices,
      "Use zero based indices in requests and responses");
  app.add_option("-i,--interface", env.interface, "Server interface address")
    ->capture_default_str();
  app.add_option(
      "-e,--encoding", encoding, "Input / output encoding for stdio");
  app.add_option("-pl,--plugin", env.plugins, "Plugin name(s)");
  app.add_option("--threads", threads, "Worker threads")
    ->check(CLI::PositiveNumber)
    ->capture_default_str();

  try {
    app.parse(static_cast<int>(args.size()), args.data());
  } catch (const CLI ::ParseError& e) {
    return app.exit(e);
  };

  env.root = fs::absolute(root);
  env.port = static_cast<uint16_t>(port);
  if (verbose) env.log_level = 4;  // xpto::logger::level::debug
  env.transport = stdio ? transport_kind::stdio : transport_kind::http;
  if (host_pid != -1) env.host_pid = host_pid;
  if (!encoding.empty()) env.encoding = encoding;
  env.threads = threads;
  env.other_args = app.remaining();

  return std::nullopt;
}

}  // namespace xpto::omni
