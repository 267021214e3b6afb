#pragma once

#include "omni/lifetime.hpp"
#include "omni/registry.hpp"

namespace xpto::omni {

// checkalivestatus, checkreadystatus and stopserver, for any language.
void register_builtin_endpoints(
    endpoint_registry& registry, application_lifetime& lifetime);

}  // namespace xpto::omni
