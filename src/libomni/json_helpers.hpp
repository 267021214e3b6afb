#pragma once

#include <atomic>
#include <boost/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "omni/dispatcher.hpp"
#include "utils.hpp"

namespace xpto::omni {

namespace json = boost::json;

// Field lookup that ignores case, so "fileName" finds "FileName".
inline const json::value* find_field(
    const json::object& obj, std::string_view key) {
  if (auto* v = obj.if_contains(key)) return v;
  for (auto&& kv : obj)
    if (utils::iequals(kv.key(), key)) return &kv.value();
  return nullptr;
}

inline std::string required_string(
    const json::object& obj, std::string_view key) {
  auto* v = find_field(obj, key);
  if (!v || !v->is_string())
    utils::throwf<std::invalid_argument>("missing string field '{}'", key);
  return std::string{v->get_string()};
}

inline std::optional<std::string> optional_string(
    const json::object& obj, std::string_view key) {
  auto* v = find_field(obj, key);
  if (!v || v->is_null()) return std::nullopt;
  if (!v->is_string())
    utils::throwf<std::invalid_argument>("field '{}' is not a string", key);
  return std::string{v->get_string()};
}

inline bool optional_bool(
    const json::object& obj, std::string_view key, bool fallback) {
  auto* v = find_field(obj, key);
  if (!v || v->is_null()) return fallback;
  if (!v->is_bool())
    utils::throwf<std::invalid_argument>("field '{}' is not a boolean", key);
  return v->get_bool();
}

inline int64_t optional_int(
    const json::object& obj, std::string_view key, int64_t fallback) {
  auto* v = find_field(obj, key);
  if (!v || v->is_null()) return fallback;
  if (!v->is_int64())
    utils::throwf<std::invalid_argument>("field '{}' is not an integer", key);
  return v->get_int64();
}

/// Stdio packets

inline int64_t next_packet_seq() {
  // NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
  static std::atomic<int64_t> counter{0};
  return ++counter;
}

inline json::object make_event_packet(std::string_view event, json::value body) {
  json::object msg{};
  msg["Type"] = "event";
  msg["Seq"] = next_packet_seq();
  msg["Event"] = event;
  msg["Body"] = std::move(body);
  return msg;
}

inline json::object make_response_packet(
    int64_t request_seq, std::string_view command, dispatch_result result) {
  json::object msg{};
  msg["Type"] = "response";
  msg["Seq"] = next_packet_seq();
  msg["Request_seq"] = request_seq;
  msg["Command"] = command;
  msg["Running"] = true;
  msg["Success"] = result.ok();
  if (result.error) {
    msg["Error"] = to_string(result.error->kind);
    msg["Message"] = result.error->message;
    msg["Body"] = nullptr;
  } else {
    msg["Body"] = std::move(result.body);
  }
  return msg;
}

}  // namespace xpto::omni
