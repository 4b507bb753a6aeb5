#pragma once

#include <atomic>
#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/agent_errors.hpp"
#include "protocol/llm_contract.hpp"
#include "protocol/tool_contract.hpp"

namespace sous::tools {

struct ToolContext {
    std::shared_ptr<std::atomic_bool> cancel_token;
};

// Capability interface every tool implements. Arguments arrive as the raw
// JSON text the model produced.
class Tool {
public:
    virtual ~Tool() = default;

    virtual std::string name() const = 0;
    virtual std::string description() const = 0;
    virtual std::string parameters_schema() const = 0;

    virtual core::errors::Status validate(const std::string& arguments_json) const = 0;

    virtual core::errors::Result<protocol::ToolResult> execute(
        const std::string& arguments_json, const ToolContext& context) = 0;

    // Static verdict for this invocation, if the tool has one.
    virtual std::optional<protocol::ToolPermission> permission(
        const std::string& arguments_json) const {
        static_cast<void>(arguments_json);
        return std::nullopt;
    }

    // Drops per-session state (e.g. the shell working directory).
    virtual void reset() {}
};

class ToolRegistry {
public:
    core::errors::Status register_tool(std::unique_ptr<Tool> tool);

    Tool* find(const std::string& name) const;
    std::vector<std::string> names() const;
    std::vector<protocol::ToolSchema> schemas() const;

    void set_default_permission(const std::string& name, protocol::ToolPermission permission);
    std::optional<protocol::ToolPermission> default_permission(const std::string& name) const;

    void reset_all();

private:
    std::map<std::string, std::unique_ptr<Tool>> tools_;
    std::map<std::string, protocol::ToolPermission> default_permissions_;
};

// Caps `text` at `max_bytes` without splitting a UTF-8 sequence and appends a
// note with the number of bytes dropped.
std::string truncate_output(const std::string& text, std::size_t max_bytes);

}  // namespace sous::tools
