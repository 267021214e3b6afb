#pragma once

#include <string>
#include <vector>

#include "omni/registry.hpp"

// Entry point every plugin library exports.
extern "C" {
using omni_register_endpoints_fn = void (*)(xpto::omni::endpoint_registry&);
}

namespace xpto::omni {

inline constexpr const char* plugin_entry_point{"omni_register_endpoints"};

/// Shared libraries that contributed handlers.  Must outlive the registry
/// they were loaded into, since the handlers' code lives in them.
class plugin_set {
 public:
  plugin_set() = default;
  plugin_set(const plugin_set&) = delete;
  plugin_set& operator=(const plugin_set&) = delete;
  ~plugin_set();

  /** @brief Load @p name and let it register its endpoints.
   *
   * @p name is tried as given, then as @c lib<name>.so.  Throws
   * configuration_error if neither loads or the library lacks the entry
   * point.  Errors from the entry point (e.g. duplicate_handler_error)
   * propagate.
   */
  void load(const std::string& name, endpoint_registry& registry);

  const std::vector<std::string>& names() const { return names_; }

 private:
  std::vector<void*> handles_;
  std::vector<std::string> names_;
};

}  // namespace xpto::omni
