#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include "core/config/runtime_config.hpp"
#include "core/errors/agent_errors.hpp"

namespace sous::app::cli {

    enum class CliCommand {
        Run,
        Resume
    };

    struct CliOptions {
        CliCommand command = CliCommand::Run;
        std::optional<std::string> task;
        std::optional<std::filesystem::path> script;
        std::optional<std::filesystem::path> config_path;
        std::optional<std::string> mode;
        std::optional<std::filesystem::path> working_directory;
        std::optional<int> max_turns;
        std::optional<double> max_price;
        bool auto_approve = false;
        bool streaming = true;
        bool verbose = false;

        // resume only
        std::optional<std::string> session_id;
        bool latest = false;
    };

    sous::core::errors::Result<CliOptions> parse_and_validate(int argc, char* argv[]);

    // Flags win over the configuration file.
    void apply_overrides(const CliOptions& options, sous::core::config::RuntimeConfig& config);
}
