#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "core/config/runtime_config.hpp"
#include "core/errors/agent_errors.hpp"
#include "exec/safe_environment.hpp"

namespace sous::exec {

struct CommandOutput {
    std::string stdout_text;
    std::string stderr_text;
    int exit_code = -1;
    double duration_ms = 0.0;
};

// Per logical shell session. Only `cd` emulation changes it.
struct ExecutionState {
    std::filesystem::path current_working_directory;
};

class SecureCommandExecutor {
public:
    // `base_environment` must already be filtered by build_safe_environment.
    SecureCommandExecutor(std::filesystem::path initial_workdir,
                          core::config::ExecutorConfig config,
                          Environment base_environment);

    core::errors::Result<CommandOutput> execute(
        const std::string& command,
        std::optional<std::uint32_t> timeout_ms = std::nullopt,
        const Environment& extra_env = {},
        const std::shared_ptr<std::atomic_bool>& cancel_token = nullptr);

    std::filesystem::path current_workdir() const;
    void reset_workdir();

    bool is_shell_builtin(const std::string& executable) const;
    bool is_allowed_executable(const std::string& executable) const;

private:
    core::errors::Result<CommandOutput> change_directory(
        const std::vector<std::string>& args);

    std::filesystem::path home_directory() const;

    std::filesystem::path initial_workdir_;
    core::config::ExecutorConfig config_;
    Environment base_environment_;

    mutable std::mutex state_mutex_;
    ExecutionState state_;
};

}  // namespace sous::exec
