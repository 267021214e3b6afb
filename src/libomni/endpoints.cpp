#include "omni/endpoints.hpp"

#include "utils.hpp"

namespace xpto::omni {

std::string normalize_endpoint_name(std::string_view name) {
  while (name.starts_with('/')) name.remove_prefix(1);
  return utils::to_lower(name);
}

std::string normalize_language(std::string_view language) {
  if (language.empty()) return std::string{any_language};
  return utils::to_lower(language);
}

}  // namespace xpto::omni
