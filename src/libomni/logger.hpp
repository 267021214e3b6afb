#pragma once

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <functional>
#include <source_location>
#include <string>
#include <string_view>
#include <utility>

namespace xpto::logger {

enum class level : uint8_t { fatal, error, warning, info, debug, trace };

inline std::string_view level_to_string(level level) {
  // clang-format off
  switch (level) {
  case level::trace:   return "TRACE";
  case level::debug:   return "DEBUG";
  case level::info:    return "INFO";
  case level::warning: return "WARNING";
  case level::error:   return "ERROR";
  case level::fatal:   return "FATAL";
  default: return "UNKNOWN";
  }
  // clang-format on
}

// A sink receives the level and the fully formatted record.  The default
// sink prints to stdout.
using sink_t = std::function<void(level, std::string_view)>;

inline level global_level = level::info;  // NOLINT
inline sink_t global_sink{};              // NOLINT

inline void set_level(level level) { global_level = level; }
inline void set_sink(sink_t sink) { global_sink = std::move(sink); }

inline std::string get_current_timestamp() {
  using namespace std::chrono;

  auto now = time_point_cast<milliseconds>(system_clock::now());
  return fmt::format("{:%F %T}", now);
}

// Core logging function
template <typename... Args>
inline void log(
    level level, const std::source_location& location,
    fmt::format_string<Args...> format, Args&&... args) {
  if (level > global_level) return;

  auto record = fmt::format(
      "{} {}:{} {}: {}", get_current_timestamp(),
      std::filesystem::path{location.file_name()}.filename().c_str(),
      location.line(), level_to_string(level),
      fmt::format(format, std::forward<Args>(args)...));
  if (global_sink) {
    global_sink(level, record);
    return;
  }
  std::fputs(record.c_str(), stdout);
  std::fputc('\n', stdout);
}

}  // namespace xpto::logger

// NOLINTBEGIN
#define LOG_TRACE(...)                                             \
  xpto::logger::log(                                               \
      xpto::logger::level::trace, std::source_location::current(), \
      __VA_ARGS__)

#define LOG_DEBUG(...)                                             \
  xpto::logger::log(                                               \
      xpto::logger::level::debug, std::source_location::current(), \
      __VA_ARGS__)

#define LOG_INFO(...) \
  xpto::logger::log(  \
      xpto::logger::level::info, std::source_location::current(), __VA_ARGS__)

#define LOG_WARN(...)                                                \
  xpto::logger::log(                                                 \
      xpto::logger::level::warning, std::source_location::current(), \
      __VA_ARGS__)

#define LOG_ERROR(...)                                             \
  xpto::logger::log(                                               \
      xpto::logger::level::error, std::source_location::current(), \
      __VA_ARGS__)

#define LOG_FATAL(...)                                             \
  xpto::logger::log(                                               \
      xpto::logger::level::fatal, std::source_location::current(), \
      __VA_ARGS__)
// NOLINTEND
