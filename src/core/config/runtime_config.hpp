#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "core/errors/agent_errors.hpp"
#include "protocol/tool_contract.hpp"

namespace sous::core::config {

struct ModelSettings {
    std::string name = "devstral-small";
    std::string provider = "mistral";
    std::string endpoint = "https://api.mistral.ai/v1/chat/completions";
    double temperature = 0.2;
    std::optional<std::int64_t> max_tokens;
    double input_price_per_million = 0.1;
    double output_price_per_million = 0.3;
};

// Prefix lists matched against each segment of a bash command.
struct BashPermissionConfig {
    std::vector<std::string> allowlist = {
        "echo", "find", "git diff", "git log", "git status", "tree", "whoami",
        "cat", "file", "head", "ls", "pwd", "stat", "tail", "uname", "wc", "which"};
    std::vector<std::string> denylist = {
        "sudo", "rm -rf /", "mkfs", "shutdown", "reboot", "dd if=", ":(){ :|:& };:",
        "gdb", "pdb", "passwd", "nano", "vim", "vi", "emacs", "bash -i", "sh -i",
        "zsh -i", "fish -i", "dash -i", "screen", "tmux"};
    // Denied only when invoked without arguments (interactive shells, REPLs).
    std::vector<std::string> denylist_standalone = {
        "python", "python3", "ipython", "bash", "sh", "nohup", "vi", "vim",
        "emacs", "nano", "su"};
};

struct ExecutorConfig {
    std::set<std::string> allowed_executables;
    std::set<std::string> shell_builtins;
    std::uint32_t default_timeout_ms = 30000;
    std::size_t max_output_bytes = 16000;
};

struct RuntimeConfig {
    ModelSettings model;
    std::string system_prompt =
        "You are a careful coding agent. Use the provided tools to inspect and "
        "change the workspace, and explain what you do.";
    std::string compact_prompt =
        "Summarize the conversation so far so that work can continue from the "
        "summary alone. Keep file names, decisions, open tasks and errors.";

    bool streaming = true;
    std::size_t stream_batch_size = 5;

    std::optional<int> max_turns;
    std::optional<double> max_price;
    std::int64_t auto_compact_threshold = 200000;
    bool context_warnings = false;

    std::uint32_t approval_timeout_ms = 0;  // 0 waits until resolved
    bool parallel_tool_calls = false;

    bool session_logging = true;
    std::filesystem::path session_log_dir = ".sous/sessions";
    std::filesystem::path workdir = std::filesystem::current_path();
    std::string initial_mode = "normal";

    BashPermissionConfig bash;
    ExecutorConfig executor;
    std::map<std::string, protocol::ToolPermission> tool_permissions;
};

ExecutorConfig default_executor_config();
RuntimeConfig default_runtime_config();

// Overlays the JSON document at `path` on top of the defaults.
errors::Result<RuntimeConfig> load_runtime_config(const std::filesystem::path& path);

// Same as load_runtime_config but from JSON text already in memory.
errors::Result<RuntimeConfig> parse_runtime_config(const std::string& json_text);

}  // namespace sous::core::config
