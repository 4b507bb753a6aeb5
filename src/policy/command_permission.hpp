#pragma once

#include <string>
#include "core/config/runtime_config.hpp"
#include "protocol/tool_contract.hpp"

namespace sous::policy {

// Static allow/deny verdict for a shell command line, independent of mode.
//
// Every segment of a chained command is checked: one denied segment makes the
// whole command NEVER, and ALWAYS requires every segment to be allow-listed.
// Command substitution and redirection never resolve to ALWAYS.
class CommandPermissionClassifier {
public:
    explicit CommandPermissionClassifier(core::config::BashPermissionConfig config);

    protocol::ToolPermission classify(const std::string& command) const;

private:
    bool is_denied(const std::string& segment) const;
    bool is_allowed(const std::string& segment) const;

    core::config::BashPermissionConfig config_;
};

}  // namespace sous::policy
