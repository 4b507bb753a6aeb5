#include "tools/tool.hpp"

#include <utility>

namespace sous::tools {

using core::errors::AgentError;
using core::errors::ErrorCategory;

core::errors::Status ToolRegistry::register_tool(std::unique_ptr<Tool> tool) {
    if (!tool) {
        return AgentError{ErrorCategory::Internal, "Cannot register a null tool.",
                          "invalid_tool"};
    }
    const std::string name = tool->name();
    if (tools_.count(name) > 0) {
        return AgentError{ErrorCategory::Internal, "Tool already registered: " + name,
                          "duplicate_tool"};
    }
    tools_.emplace(name, std::move(tool));
    return core::errors::ok();
}

Tool* ToolRegistry::find(const std::string& name) const {
    auto it = tools_.find(name);
    return it == tools_.end() ? nullptr : it->second.get();
}

std::vector<std::string> ToolRegistry::names() const {
    std::vector<std::string> out;
    out.reserve(tools_.size());
    for (const auto& entry : tools_) {
        out.push_back(entry.first);
    }
    return out;
}

std::vector<protocol::ToolSchema> ToolRegistry::schemas() const {
    std::vector<protocol::ToolSchema> out;
    out.reserve(tools_.size());
    for (const auto& entry : tools_) {
        const auto& tool = entry.second;
        out.push_back(protocol::ToolSchema{tool->name(), tool->description(),
                                           tool->parameters_schema()});
    }
    return out;
}

void ToolRegistry::set_default_permission(const std::string& name,
                                          const protocol::ToolPermission permission) {
    default_permissions_[name] = permission;
}

std::optional<protocol::ToolPermission> ToolRegistry::default_permission(
    const std::string& name) const {
    auto it = default_permissions_.find(name);
    if (it == default_permissions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void ToolRegistry::reset_all() {
    for (auto& entry : tools_) {
        entry.second->reset();
    }
}

std::string truncate_output(const std::string& text, const std::size_t max_bytes) {
    if (text.size() <= max_bytes) {
        return text;
    }
    std::size_t cut = max_bytes;
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return text.substr(0, cut) + "\n... [output truncated: " +
           std::to_string(text.size() - cut) + " bytes omitted]";
}

}  // namespace sous::tools
