#pragma once

#include <optional>
#include <set>
#include <string>

namespace sous::policy {

const std::set<std::string>& read_only_tools();
const std::set<std::string>& write_tools();
const std::set<std::string>& command_tools();

// Pulls the "command" string out of a tool's JSON arguments.
std::optional<std::string> extract_command(const std::string& arguments_json);

// True when a shell command line would modify files or repository state.
bool is_write_command(const std::string& command);

// Name-based for file tools; command tools are judged by their command text.
// Unparseable command arguments count as a write.
bool is_write_operation(const std::string& tool_name, const std::string& arguments_json);

}  // namespace sous::policy
