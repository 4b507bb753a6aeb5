#pragma once

#include <string>
#include <vector>
#include "core/errors/agent_errors.hpp"

namespace sous::exec {

// POSIX-shell-like word splitting: whitespace separates words, single quotes
// are literal, double quotes allow backslash escapes of \ " $ ` and newline.
// Operators are not interpreted; "a;b" stays one word.
core::errors::Result<std::vector<std::string>> split_command(const std::string& command);

}  // namespace sous::exec
