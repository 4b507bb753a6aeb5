#include "core/config/runtime_config.hpp"

#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>

namespace sous::core::config {

using errors::AgentError;
using errors::ErrorCategory;
using nlohmann::json;

namespace {

AgentError config_error(const std::string& message) {
    return AgentError{ErrorCategory::Input, message, "invalid_config",
                      "Check the configuration file against the documented keys."};
}

template <typename T>
void read_if_present(const json& node, const char* key, T& target) {
    auto it = node.find(key);
    if (it != node.end() && !it->is_null()) {
        target = it->get<T>();
    }
}

template <typename T>
void read_optional(const json& node, const char* key, std::optional<T>& target) {
    auto it = node.find(key);
    if (it == node.end()) {
        return;
    }
    if (it->is_null()) {
        target.reset();
        return;
    }
    target = it->get<T>();
}

void apply_model(const json& node, ModelSettings& model) {
    read_if_present(node, "name", model.name);
    read_if_present(node, "provider", model.provider);
    read_if_present(node, "endpoint", model.endpoint);
    read_if_present(node, "temperature", model.temperature);
    read_optional(node, "max_tokens", model.max_tokens);
    read_if_present(node, "input_price", model.input_price_per_million);
    read_if_present(node, "output_price", model.output_price_per_million);
}

void apply_bash(const json& node, BashPermissionConfig& bash) {
    read_if_present(node, "allowlist", bash.allowlist);
    read_if_present(node, "denylist", bash.denylist);
    read_if_present(node, "denylist_standalone", bash.denylist_standalone);
}

void apply_executor(const json& node, ExecutorConfig& executor) {
    read_if_present(node, "allowed_executables", executor.allowed_executables);
    read_if_present(node, "shell_builtins", executor.shell_builtins);
    read_if_present(node, "default_timeout_ms", executor.default_timeout_ms);
    read_if_present(node, "max_output_bytes", executor.max_output_bytes);
}

errors::Status apply_tool_permissions(const json& node, RuntimeConfig& config) {
    if (!node.is_object()) {
        return config_error("'tool_permissions' must be an object.");
    }
    for (auto it = node.begin(); it != node.end(); ++it) {
        const std::string& tool_name = it.key();
        const json& value = it.value();
        const auto permission = protocol::parse_tool_permission(value.get<std::string>());
        if (!permission.has_value()) {
            return config_error("Unknown permission for tool '" + tool_name +
                                "': " + value.get<std::string>());
        }
        config.tool_permissions[tool_name] = permission.value();
    }
    return errors::ok();
}

errors::Result<RuntimeConfig> apply_document(const json& doc) {
    if (!doc.is_object()) {
        return config_error("Configuration root must be a JSON object.");
    }

    RuntimeConfig config = default_runtime_config();
    try {
        if (doc.contains("model")) {
            apply_model(doc.at("model"), config.model);
        }
        read_if_present(doc, "system_prompt", config.system_prompt);
        read_if_present(doc, "compact_prompt", config.compact_prompt);
        read_if_present(doc, "streaming", config.streaming);
        read_if_present(doc, "stream_batch_size", config.stream_batch_size);
        read_optional(doc, "max_turns", config.max_turns);
        read_optional(doc, "max_price", config.max_price);
        read_if_present(doc, "auto_compact_threshold", config.auto_compact_threshold);
        read_if_present(doc, "context_warnings", config.context_warnings);
        read_if_present(doc, "approval_timeout_ms", config.approval_timeout_ms);
        read_if_present(doc, "parallel_tool_calls", config.parallel_tool_calls);
        read_if_present(doc, "session_logging", config.session_logging);
        read_if_present(doc, "initial_mode", config.initial_mode);
        if (doc.contains("session_log_dir")) {
            config.session_log_dir = doc.at("session_log_dir").get<std::string>();
        }
        if (doc.contains("workdir")) {
            config.workdir = doc.at("workdir").get<std::string>();
        }
        if (doc.contains("bash")) {
            apply_bash(doc.at("bash"), config.bash);
        }
        if (doc.contains("executor")) {
            apply_executor(doc.at("executor"), config.executor);
        }
        if (doc.contains("tool_permissions")) {
            auto status = apply_tool_permissions(doc.at("tool_permissions"), config);
            if (errors::is_error(status)) {
                return errors::get_error(status);
            }
        }
    } catch (const json::exception& e) {
        return config_error(std::string("Invalid configuration value: ") + e.what());
    }

    if (config.stream_batch_size == 0) {
        return config_error("'stream_batch_size' must be at least 1.");
    }
    if (config.max_turns.has_value() && config.max_turns.value() <= 0) {
        return config_error("'max_turns' must be positive.");
    }
    return config;
}

}  // namespace

ExecutorConfig default_executor_config() {
    ExecutorConfig config;
    config.allowed_executables = {
        // File inspection and manipulation
        "cat", "head", "tail", "wc", "file", "stat", "ls", "find", "grep", "awk",
        "sed", "cut", "sort", "uniq", "tr", "echo", "printf", "mkdir", "rm", "cp",
        "mv", "touch", "pwd", "tree", "which", "basename", "dirname", "realpath",
        "chmod", "ln", "readlink", "diff", "true", "false", "test",
        // Version control
        "git",
        // Network
        "curl", "wget", "ping", "dig",
        // System
        "ps", "uname", "hostname", "date", "env", "printenv", "whoami", "id",
        "df", "du", "sleep",
        // Languages and build tools
        "python", "python3", "pip", "node", "npm", "npx", "make", "cmake", "gcc",
        "g++", "clang", "clang++", "cargo", "go", "rustc",
        // Shells
        "bash", "sh",
        // Archives
        "tar", "zip", "unzip", "gzip", "gunzip",
        // Structured data
        "jq", "yq", "rg"};
    config.shell_builtins = {
        "cd", "pushd", "popd", "dirs", "source", "exec", "exit", "export", "unset",
        "alias", "unalias", "history", "jobs", "fg", "bg", "wait", "umask",
        "ulimit", "type", "times", "hash"};
    return config;
}

RuntimeConfig default_runtime_config() {
    RuntimeConfig config;
    config.executor = default_executor_config();
    return config;
}

errors::Result<RuntimeConfig> parse_runtime_config(const std::string& json_text) {
    json doc;
    try {
        doc = json::parse(json_text);
    } catch (const json::parse_error& e) {
        return config_error(std::string("Configuration is not valid JSON: ") + e.what());
    }
    return apply_document(doc);
}

errors::Result<RuntimeConfig> load_runtime_config(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return AgentError{ErrorCategory::Input,
                          "Unable to open configuration file: " + path.string(),
                          "config_not_found"};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return parse_runtime_config(buffer.str());
}

}  // namespace sous::core::config
