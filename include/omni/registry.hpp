#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "omni/handler.hpp"

namespace xpto::omni {

/// Table of (endpoint name, language) -> handler.  Filled once before any
/// transport starts; lookups afterwards are unsynchronized reads.
class endpoint_registry {
 public:
  // Throws duplicate_handler_error if the (name, language) pair is taken,
  // leaving the table as it was.
  void add(std::shared_ptr<endpoint_handler> handler);

  // Exact language first, then the any_language handler.  Throws
  // unknown_endpoint_error if neither exists.
  endpoint_handler& resolve(
      std::string_view name, std::string_view language) const;

  bool contains(std::string_view name) const;
  std::vector<endpoint_descriptor> endpoints() const;
  std::size_t size() const { return handlers_.size(); }

 private:
  using key_t = std::pair<std::string, std::string>;
  std::map<key_t, std::shared_ptr<endpoint_handler>> handlers_;
};

}  // namespace xpto::omni
