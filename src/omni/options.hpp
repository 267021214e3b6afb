#pragma once

#include <optional>
#include <span>

#include "omni/environment.hpp"

namespace xpto::omni {

// Fill @p env from the command line.  Returns an exit code when the
// program should stop right away (--help, bad options).
std::optional<int> parse_options(std::span<char*> args, environment& env);

}  // namespace xpto::omni
