#include "omni/registry.hpp"

#include <string>

#include "logger.hpp"
#include "omni/errors.hpp"
#include "utils.hpp"

namespace xpto::omni {

void endpoint_registry::add(std::shared_ptr<endpoint_handler> handler) {
  if (!handler) utils::throwf<std::invalid_argument>("null endpoint handler");
  const auto& desc = handler->descriptor();
  if (desc.name.empty())
    utils::throwf<std::invalid_argument>("endpoint handler without a name");

  auto [it, inserted] =
      handlers_.try_emplace(key_t{desc.name, desc.language}, handler);
  if (!inserted) {
    const auto& taken = it->second->descriptor();
    utils::throwf<duplicate_handler_error>(
        "endpoint '{}' already has a handler for language '{}' ({})",
        desc.name, desc.language,
        utils::demangle_symbol(taken.request_type));
  }
  LOG_DEBUG(
      "registered {} [{}]: {} -> {}", desc.name, desc.language,
      utils::demangle_symbol(desc.request_type),
      utils::demangle_symbol(desc.response_type));
}

endpoint_handler& endpoint_registry::resolve(
    std::string_view name, std::string_view language) const {
  auto nname = normalize_endpoint_name(name);
  auto nlang = normalize_language(language);

  if (auto it = handlers_.find(key_t{nname, nlang}); it != handlers_.end())
    return *it->second;
  if (auto it = handlers_.find(key_t{nname, std::string{any_language}});
      it != handlers_.end())
    return *it->second;

  utils::throwf<unknown_endpoint_error>(
      "no handler for endpoint '{}' and language '{}'", nname, nlang);
}

bool endpoint_registry::contains(std::string_view name) const {
  auto nname = normalize_endpoint_name(name);
  auto it = handlers_.lower_bound(key_t{nname, std::string{}});
  return it != handlers_.end() && it->first.first == nname;
}

std::vector<endpoint_descriptor> endpoint_registry::endpoints() const {
  std::vector<endpoint_descriptor> result;
  result.reserve(handlers_.size());
  for (auto&& [key, handler] : handlers_) result.push_back(handler->descriptor());
  return result;
}

}  // namespace xpto::omni
