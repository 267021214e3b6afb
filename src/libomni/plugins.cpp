#include "omni/plugins.hpp"

#include <dlfcn.h>

#include <string>

#include "logger.hpp"
#include "omni/errors.hpp"
#include "utils.hpp"

namespace xpto::omni {

plugin_set::~plugin_set() {
  for (auto it = handles_.rbegin(); it != handles_.rend(); ++it)
    ::dlclose(*it);
}

void plugin_set::load(const std::string& name, endpoint_registry& registry) {
  void* handle = ::dlopen(name.c_str(), RTLD_NOW | RTLD_LOCAL);
  if (!handle && name.find('/') == std::string::npos) {
    auto soname = "lib" + name + ".so";
    handle = ::dlopen(soname.c_str(), RTLD_NOW | RTLD_LOCAL);
  }
  if (!handle) {
    const char* err = ::dlerror();
    utils::throwf<configuration_error>(
        "can't load plugin '{}': {}", name, err ? err : "unknown error");
  }

  auto entry = reinterpret_cast<omni_register_endpoints_fn>(  // NOLINT
      ::dlsym(handle, plugin_entry_point));
  if (!entry) {
    ::dlclose(handle);
    utils::throwf<configuration_error>(
        "plugin '{}' does not export {}", name, plugin_entry_point);
  }

  // Keep the library loaded even if registration fails half-way: handlers
  // it already added point into it.
  handles_.push_back(handle);
  names_.push_back(name);
  auto before = registry.size();
  entry(registry);
  LOG_INFO(
      "plugin {}: {} endpoint(s) registered", name, registry.size() - before);
}

}  // namespace xpto::omni
