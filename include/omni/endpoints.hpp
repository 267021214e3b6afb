#pragma once

#include <string>
#include <string_view>

namespace xpto::omni {

// Language tag of handlers that serve any language.
inline constexpr std::string_view any_language{"*"};

namespace endpoints {
inline constexpr std::string_view code_format{"codeformat"};
inline constexpr std::string_view find_symbols{"findsymbols"};
inline constexpr std::string_view fix_usings{"fixusings"};
inline constexpr std::string_view check_alive_status{"checkalivestatus"};
inline constexpr std::string_view check_ready_status{"checkreadystatus"};
inline constexpr std::string_view stop_server{"stopserver"};
}  // namespace endpoints

// "/CodeFormat" and "codeformat" name the same endpoint.
std::string normalize_endpoint_name(std::string_view name);

// An empty language tag means "any".
std::string normalize_language(std::string_view language);

}  // namespace xpto::omni
