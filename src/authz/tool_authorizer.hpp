#pragma once

#include <mutex>
#include <set>
#include <string>
#include "policy/mode_policy.hpp"
#include "tools/tool.hpp"

namespace sous::authz {

enum class Decision {
    Execute,
    Skip,
    AwaitApproval
};

std::string to_string(Decision decision);

struct Authorization {
    Decision decision = Decision::AwaitApproval;
    std::string reason;  // set for Skip
};

// Decides whether one tool call runs, is skipped, or needs a human answer.
// The read-only block is checked first and no later shortcut can undo it.
class ToolAuthorizer {
public:
    ToolAuthorizer(const policy::ModePolicy& mode, const tools::ToolRegistry& registry);

    Authorization authorize(const std::string& tool_name, const std::string& arguments_json,
                            const std::string& correlation_id) const;

    // A user answered ALWAYS: later calls of this tool skip the prompt.
    void grant_session_always(const std::string& tool_name);
    void clear_session_grants();
    bool has_session_grant(const std::string& tool_name) const;

private:
    const policy::ModePolicy& mode_;
    const tools::ToolRegistry& registry_;

    mutable std::mutex mutex_;
    std::set<std::string> session_always_;
};

}  // namespace sous::authz
