#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include "core/config/runtime_config.hpp"
#include "exec/secure_executor.hpp"
#include "policy/command_permission.hpp"
#include "policy/workspace_guard.hpp"
#include "tools/tool.hpp"

namespace sous::tools {

// Runs a command line through the secure executor.
class BashTool : public Tool {
public:
    BashTool(std::shared_ptr<exec::SecureCommandExecutor> executor,
             policy::CommandPermissionClassifier classifier);

    std::string name() const override { return "bash"; }
    std::string description() const override;
    std::string parameters_schema() const override;
    core::errors::Status validate(const std::string& arguments_json) const override;
    core::errors::Result<protocol::ToolResult> execute(const std::string& arguments_json,
                                                       const ToolContext& context) override;
    std::optional<protocol::ToolPermission> permission(
        const std::string& arguments_json) const override;
    void reset() override;

private:
    std::shared_ptr<exec::SecureCommandExecutor> executor_;
    policy::CommandPermissionClassifier classifier_;
};

class ReadFileTool : public Tool {
public:
    explicit ReadFileTool(policy::WorkspaceGuard guard);

    std::string name() const override { return "read_file"; }
    std::string description() const override;
    std::string parameters_schema() const override;
    core::errors::Status validate(const std::string& arguments_json) const override;
    core::errors::Result<protocol::ToolResult> execute(const std::string& arguments_json,
                                                       const ToolContext& context) override;

private:
    policy::WorkspaceGuard guard_;
};

// Literal substring search across the workspace.
class GrepTool : public Tool {
public:
    explicit GrepTool(policy::WorkspaceGuard guard);

    std::string name() const override { return "grep"; }
    std::string description() const override;
    std::string parameters_schema() const override;
    core::errors::Status validate(const std::string& arguments_json) const override;
    core::errors::Result<protocol::ToolResult> execute(const std::string& arguments_json,
                                                       const ToolContext& context) override;

private:
    policy::WorkspaceGuard guard_;
};

class WriteFileTool : public Tool {
public:
    explicit WriteFileTool(policy::WorkspaceGuard guard);

    std::string name() const override { return "write_file"; }
    std::string description() const override;
    std::string parameters_schema() const override;
    core::errors::Status validate(const std::string& arguments_json) const override;
    core::errors::Result<protocol::ToolResult> execute(const std::string& arguments_json,
                                                       const ToolContext& context) override;

private:
    policy::WorkspaceGuard guard_;
};

class DeleteFileTool : public Tool {
public:
    explicit DeleteFileTool(policy::WorkspaceGuard guard);

    std::string name() const override { return "delete_file"; }
    std::string description() const override;
    std::string parameters_schema() const override;
    core::errors::Status validate(const std::string& arguments_json) const override;
    core::errors::Result<protocol::ToolResult> execute(const std::string& arguments_json,
                                                       const ToolContext& context) override;

private:
    policy::WorkspaceGuard guard_;
};

// Registers the five built-in tools and the configured default permissions.
core::errors::Status register_builtin_tools(
    ToolRegistry& registry, const core::config::RuntimeConfig& config,
    std::shared_ptr<exec::SecureCommandExecutor> executor);

}  // namespace sous::tools
