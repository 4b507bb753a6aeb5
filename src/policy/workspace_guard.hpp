#pragma once

#include <filesystem>
#include "core/errors/agent_errors.hpp"

namespace sous::policy {

// Confines file-tool paths to the workspace root.
class WorkspaceGuard {
public:
    explicit WorkspaceGuard(std::filesystem::path workspace_root);

    // Resolves `target` (relative paths against the root) and rejects anything
    // that escapes the root, including through symlinks.
    core::errors::Result<std::filesystem::path> resolve(
        const std::filesystem::path& target) const;

    const std::filesystem::path& root() const { return workspace_root_; }

private:
    static bool is_within_root(const std::filesystem::path& root,
                               const std::filesystem::path& child);

    std::filesystem::path workspace_root_;
};

}  // namespace sous::policy
