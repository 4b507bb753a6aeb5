#include "policy/workspace_guard.hpp"

#include <iterator>
#include <system_error>
#include <utility>

namespace sous::policy {

using core::errors::AgentError;
using core::errors::ErrorCategory;

WorkspaceGuard::WorkspaceGuard(std::filesystem::path workspace_root)
    : workspace_root_(std::move(workspace_root)) {}

bool WorkspaceGuard::is_within_root(const std::filesystem::path& root,
                                    const std::filesystem::path& child) {
    auto root_it = root.begin();
    auto child_it = child.begin();
    for (; root_it != root.end() && child_it != child.end(); ++root_it, ++child_it) {
        if (root_it->empty() && std::next(root_it) == root.end()) {
            // trailing separator on the root
            return true;
        }
        if (*root_it != *child_it) {
            return false;
        }
    }
    return root_it == root.end();
}

core::errors::Result<std::filesystem::path> WorkspaceGuard::resolve(
    const std::filesystem::path& target) const {
    if (target.empty()) {
        return AgentError{ErrorCategory::Input, "Path cannot be empty.", "invalid_path"};
    }

    std::error_code ec;
    if (!std::filesystem::is_directory(workspace_root_, ec) || ec) {
        return AgentError{ErrorCategory::Input,
                          "Workspace root is not a directory: " + workspace_root_.string(),
                          "invalid_workspace_root"};
    }

    const std::filesystem::path canonical_root =
        std::filesystem::weakly_canonical(workspace_root_, ec);
    if (ec) {
        return AgentError{ErrorCategory::Input,
                          "Unable to resolve workspace root: " + workspace_root_.string(),
                          "invalid_workspace_root"};
    }

    std::filesystem::path candidate = target;
    if (candidate.is_relative()) {
        candidate = canonical_root / candidate;
    }

    const std::filesystem::path canonical_candidate =
        std::filesystem::weakly_canonical(candidate, ec);
    if (ec) {
        return AgentError{ErrorCategory::Input,
                          "Unable to resolve path: " + target.string(), "invalid_path"};
    }

    if (!is_within_root(canonical_root, canonical_candidate)) {
        return AgentError{ErrorCategory::Policy,
                          "Path escapes workspace root: " + canonical_candidate.string(),
                          "path_outside_workspace"};
    }
    return canonical_candidate;
}

}  // namespace sous::policy
