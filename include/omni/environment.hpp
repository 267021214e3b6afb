#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace xpto::omni {

namespace fs = std::filesystem;

enum class transport_kind : uint8_t { http, stdio };

inline std::string_view to_string(transport_kind kind) {
  return kind == transport_kind::stdio ? "stdio" : "http";
}

// Process-wide settings, fixed once the command line has been read.
struct environment {
  fs::path root{};
  uint16_t port{2000};
  std::string interface{"localhost"};
  int log_level{3};  // xpto::logger::level::info
  transport_kind transport{transport_kind::http};
  std::optional<int> host_pid{};
  std::optional<std::string> encoding{};
  std::vector<std::string> plugins{};
  bool zero_based_indices{};
  unsigned threads{8};
  std::vector<std::string> other_args{};
};

}  // namespace xpto::omni
