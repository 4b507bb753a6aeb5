#include "cli_parser.hpp"
#include <cerrno>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <optional>
#include <system_error>
#include <vector>

namespace sous::app::cli {

    using namespace sous::core::errors;

    namespace {

        constexpr const char* kUsage =
            "Usage: sous run --task \"...\" --script <file> [--config <file>] [--mode <name>] "
            "[--cwd <dir>] [--max-turns N] [--max-price X] [--auto-approve] [--no-stream] "
            "[--verbose]\n"
            "       sous resume --session <id>|--latest --script <file> [--task \"...\"] ...";

        // Flags as typed, before any validation
        struct RawCliOptions {
            std::optional<std::string> task;
            std::optional<std::string> script;
            std::optional<std::string> config;
            std::optional<std::string> mode;
            std::optional<std::string> cwd;
            std::optional<std::string> max_turns;
            std::optional<std::string> max_price;
            std::optional<std::string> session;
            bool latest = false;
            bool auto_approve = false;
            bool no_stream = false;
            bool verbose = false;
        };

        AgentError missing_value(const std::string& flag) {
            return AgentError{ErrorCategory::Input, "Missing value for " + flag, "missing_value"};
        }

        Result<std::filesystem::path> existing_directory(const std::string& text) {
            std::filesystem::path p(text);
            std::error_code ec;
            const bool is_dir = std::filesystem::is_directory(p, ec);
            if (ec || !is_dir) {
                return AgentError{ErrorCategory::Input, "Working directory does not exist or is not a directory", "invalid_path"};
            }
            std::filesystem::path canonical_path = std::filesystem::canonical(p, ec);
            if (ec) {
                return AgentError{ErrorCategory::Input, "Failed to canonicalize working directory", "invalid_path"};
            }
            return canonical_path;
        }

    }  // namespace

    Result<CliOptions> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return AgentError{ErrorCategory::Input, "No command provided.", "missing_command", kUsage};
        }

        CliOptions options;
        const std::string command = argv[1];
        if (command == "run") {
            options.command = CliCommand::Run;
        } else if (command == "resume") {
            options.command = CliCommand::Resume;
        } else {
            return AgentError{ErrorCategory::Input, "Unknown command: " + command, "unknown_command", kUsage};
        }

        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) {
            args.push_back(argv[i]);
        }

        RawCliOptions raw;
        auto take = [&args](size_t& i, std::optional<std::string>& slot) -> bool {
            if (i + 1 >= args.size()) {
                return false;
            }
            slot = args[++i];
            return true;
        };

        for (size_t i = 0; i < args.size(); ++i) {
            const std::string& flag = args[i];
            bool taken = true;
            if (flag == "--task") taken = take(i, raw.task);
            else if (flag == "--script") taken = take(i, raw.script);
            else if (flag == "--config") taken = take(i, raw.config);
            else if (flag == "--mode") taken = take(i, raw.mode);
            else if (flag == "--cwd") taken = take(i, raw.cwd);
            else if (flag == "--max-turns") taken = take(i, raw.max_turns);
            else if (flag == "--max-price") taken = take(i, raw.max_price);
            else if (flag == "--session") taken = take(i, raw.session);
            else if (flag == "--latest") raw.latest = true;
            else if (flag == "--auto-approve") raw.auto_approve = true;
            else if (flag == "--no-stream") raw.no_stream = true;
            else if (flag == "--verbose") raw.verbose = true;
            else {
                return AgentError{ErrorCategory::Input, "Unknown argument: " + flag, "unknown_argument", kUsage};
            }
            if (!taken) {
                return missing_value(flag);
            }
        }

        options.auto_approve = raw.auto_approve;
        options.streaming = !raw.no_stream;
        options.verbose = raw.verbose;
        options.task = raw.task;
        options.mode = raw.mode;

        if (!raw.script.has_value()) {
            return AgentError{ErrorCategory::Input, "Must provide --script with the model replay file", "missing_required_flag", kUsage};
        }
        options.script = std::filesystem::path(raw.script.value());
        if (raw.config) options.config_path = std::filesystem::path(raw.config.value());

        if (options.command == CliCommand::Run) {
            if (!raw.task.has_value() || raw.task->empty()) {
                return AgentError{ErrorCategory::Input, "Must provide --task", "missing_required_flag"};
            }
            if (raw.session.has_value() || raw.latest) {
                return AgentError{ErrorCategory::Input, "--session and --latest only apply to resume", "conflicting_flags"};
            }
        } else {
            if (!raw.session.has_value() && !raw.latest) {
                return AgentError{ErrorCategory::Input, "Must provide either --session or --latest", "missing_required_flag"};
            }
            if (raw.session.has_value() && raw.latest) {
                return AgentError{ErrorCategory::Input, "Cannot provide both --session and --latest", "conflicting_flags"};
            }
            options.session_id = raw.session;
            options.latest = raw.latest;
        }

        if (raw.max_turns) {
            int turns = 0;
            const char* begin = raw.max_turns->data();
            const char* end = raw.max_turns->data() + raw.max_turns->size();
            auto [ptr, ec] = std::from_chars(begin, end, turns);
            if (ec != std::errc() || ptr != end) {
                return AgentError{ErrorCategory::Input, "Invalid number for --max-turns", "invalid_integer", "Provide a positive integer."};
            }
            if (turns <= 0 || turns > 10000) {
                return AgentError{ErrorCategory::Input, "--max-turns out of bounds", "bounds_error", "Must be between 1 and 10000."};
            }
            options.max_turns = turns;
        }

        if (raw.max_price) {
            errno = 0;
            char* end = nullptr;
            const double price = std::strtod(raw.max_price->c_str(), &end);
            if (raw.max_price->empty() || errno != 0 || end != raw.max_price->c_str() + raw.max_price->size() ||
                !std::isfinite(price)) {
                return AgentError{ErrorCategory::Input, "Invalid number for --max-price", "invalid_number", "Provide an amount in dollars, e.g. 0.50."};
            }
            if (price <= 0.0) {
                return AgentError{ErrorCategory::Input, "--max-price out of bounds", "bounds_error", "Must be greater than zero."};
            }
            options.max_price = price;
        }

        if (raw.cwd) {
            auto dir = existing_directory(raw.cwd.value());
            if (is_error(dir)) {
                return get_error(dir);
            }
            options.working_directory = get_value(dir);
        }

        return options;
    }

    void apply_overrides(const CliOptions& options, sous::core::config::RuntimeConfig& config) {
        if (options.working_directory) config.workdir = *options.working_directory;
        if (options.mode) config.initial_mode = *options.mode;
        if (options.max_turns) config.max_turns = options.max_turns;
        if (options.max_price) config.max_price = options.max_price;
        if (!options.streaming) config.streaming = false;
    }

} // namespace sous::app::cli
