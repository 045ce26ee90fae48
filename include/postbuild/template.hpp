#pragma once

#include "postbuild/platform.hpp"
#include "postbuild/result.hpp"

#include <string>

namespace postbuild {

// ============================================================================
// Variable Substitution
// ============================================================================

// Substitute shell-style variables in input from env.
//   $NAME, ${NAME}  -> env value; MISSING_VARIABLE if NAME is not in env
//   $$              -> a literal "$"
// NAME is [A-Za-z_][A-Za-z0-9_]*. A "$" followed by anything else is
// INVALID_SPEC. The process environment is never consulted.
Result<std::string> substitute_template(const std::string& input, const EnvMap& env);

} // namespace postbuild
