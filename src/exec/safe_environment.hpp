#pragma once

#include <map>
#include <string>

namespace sous::exec {

using Environment = std::map<std::string, std::string>;

// Copies a NAME=VALUE array (as handed to main) into a map.
Environment capture_environment(char** envp);

// Keeps only the allow-listed host variables and adds non-interactive
// defaults. Provider keys and other secrets never survive this filter.
Environment build_safe_environment(const Environment& host);

}  // namespace sous::exec
