#include "authz/tool_authorizer.hpp"

#include "core/logging/logger.hpp"

namespace sous::authz {

using protocol::ToolPermission;

std::string to_string(const Decision decision) {
    switch (decision) {
        case Decision::Execute:
            return "execute";
        case Decision::Skip:
            return "skip";
        case Decision::AwaitApproval:
            return "await_approval";
        default:
            return "unknown";
    }
}

ToolAuthorizer::ToolAuthorizer(const policy::ModePolicy& mode,
                               const tools::ToolRegistry& registry)
    : mode_(mode), registry_(registry) {}

Authorization ToolAuthorizer::authorize(const std::string& tool_name,
                                        const std::string& arguments_json,
                                        const std::string& correlation_id) const {
    const auto block = mode_.should_block(tool_name, arguments_json);
    if (block.blocked) {
        SOUS_LOG_INFO("authorize " + correlation_id + ": " + tool_name + " blocked by mode");
        return Authorization{Decision::Skip, block.reason};
    }

    const auto configured = registry_.default_permission(tool_name);
    if (configured == ToolPermission::Never) {
        return Authorization{Decision::Skip,
                             "Tool '" + tool_name + "' is permanently disabled"};
    }

    std::optional<ToolPermission> permission;
    const tools::Tool* tool = registry_.find(tool_name);
    if (tool != nullptr) {
        permission = tool->permission(arguments_json);
    }
    if (permission.value_or(ToolPermission::Ask) == ToolPermission::Never) {
        return Authorization{Decision::Skip,
                             "Tool '" + tool_name +
                                 "' was denied by the command denylist for these arguments"};
    }
    if (permission == ToolPermission::Always) {
        return Authorization{Decision::Execute, ""};
    }

    if (configured == ToolPermission::Always || has_session_grant(tool_name)) {
        return Authorization{Decision::Execute, ""};
    }

    if (mode_.should_auto_approve(tool_name)) {
        return Authorization{Decision::Execute, ""};
    }
    return Authorization{Decision::AwaitApproval, ""};
}

void ToolAuthorizer::grant_session_always(const std::string& tool_name) {
    std::lock_guard<std::mutex> lock(mutex_);
    session_always_.insert(tool_name);
}

void ToolAuthorizer::clear_session_grants() {
    std::lock_guard<std::mutex> lock(mutex_);
    session_always_.clear();
}

bool ToolAuthorizer::has_session_grant(const std::string& tool_name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_always_.count(tool_name) > 0;
}

}  // namespace sous::authz
