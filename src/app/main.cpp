#include <atomic>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <variant>
#include "app/cli_parser.hpp"
#include "approval/approval_gate.hpp"
#include "core/config/runtime_config.hpp"
#include "core/errors/agent_errors.hpp"
#include "core/logging/logger.hpp"
#include "exec/safe_environment.hpp"
#include "exec/secure_executor.hpp"
#include "llm/scripted_backend.hpp"
#include "runtime/agent_engine.hpp"
#include "session/session_registry.hpp"
#include "session/session_store.hpp"
#include "tools/builtin_tools.hpp"

namespace {

using sous::core::errors::AgentError;
using sous::core::errors::get_error;
using sous::core::errors::get_value;
using sous::core::errors::is_error;

// Set from the SIGINT handler; the turn polls it through its cancel token.
std::atomic_bool* g_cancel_flag = nullptr;

void on_interrupt(int) {
    if (g_cancel_flag != nullptr) {
        g_cancel_flag->store(true);
    }
}

void report(const std::string& what, const AgentError& err) {
    SOUS_LOG_ERROR(what + " [" + err.code + "]: " + err.message);
    if (!err.hint.empty()) {
        SOUS_LOG_INFO("Hint: " + err.hint);
    }
}

void print_event(const sous::protocol::AgentEvent& event) {
    using namespace sous::protocol;
    if (const auto* text = std::get_if<AssistantTextEvent>(&event)) {
        std::cout << text->content << std::endl;
        if (text->prompt_tokens > 0 || text->completion_tokens > 0) {
            SOUS_LOG_DEBUG("tokens: prompt=" + std::to_string(text->prompt_tokens) +
                           " completion=" + std::to_string(text->completion_tokens) +
                           " session=" + std::to_string(text->session_total_tokens));
        }
    } else if (const auto* started = std::get_if<ToolCallStartedEvent>(&event)) {
        std::cout << "> " << started->tool_name << " " << started->arguments << std::endl;
    } else if (const auto* result = std::get_if<ToolResultEvent>(&event)) {
        if (result->skipped) {
            std::cout << "  skipped: " << result->skip_reason << std::endl;
        } else if (!result->error.empty()) {
            std::cout << "  error: " << result->error << std::endl;
        } else {
            std::cout << result->output << std::endl;
        }
    } else if (const auto* compact = std::get_if<CompactStartedEvent>(&event)) {
        SOUS_LOG_INFO("Compacting conversation at " +
                      std::to_string(compact->current_context_tokens) + " tokens");
    } else if (const auto* ended = std::get_if<CompactEndedEvent>(&event)) {
        SOUS_LOG_INFO("Compaction done: " + std::to_string(ended->old_context_tokens) +
                      " -> " + std::to_string(ended->new_context_tokens) + " tokens");
    }
}

// Terminal approval channel: y = yes, a = always, anything else = no.
sous::core::errors::Status prompt_on_terminal(sous::approval::ApprovalGate& gate,
                                              const sous::approval::PendingApproval& request) {
    std::cerr << "Allow " << request.tool_name << " " << request.arguments
              << "? [y]es / [n]o / [a]lways: " << std::flush;
    std::string answer;
    if (!std::getline(std::cin, answer)) {
        return AgentError{sous::core::errors::ErrorCategory::Input,
                          "No terminal input available", "approval_unavailable"};
    }
    if (answer == "y" || answer == "yes") {
        gate.resolve(request.correlation_id, sous::approval::Verdict::Yes);
    } else if (answer == "a" || answer == "always") {
        gate.resolve(request.correlation_id, sous::approval::Verdict::Always);
    } else {
        gate.resolve(request.correlation_id, sous::approval::Verdict::No,
                     std::string("User declined to run the tool"));
    }
    return sous::core::errors::ok();
}

}  // namespace

int main(int argc, char* argv[], char* envp[]) {
    auto parsed = sous::app::cli::parse_and_validate(argc, argv);
    if (is_error(parsed)) {
        report("Input error", get_error(parsed));
        return 2;
    }
    const auto& options = get_value(parsed);
    if (options.verbose) {
        sous::core::logging::Logger::get().set_min_level(sous::core::logging::LogLevel::DEBUG);
    }

    auto loaded = options.config_path.has_value()
                      ? sous::core::config::load_runtime_config(*options.config_path)
                      : sous::core::errors::Result<sous::core::config::RuntimeConfig>(
                            sous::core::config::default_runtime_config());
    if (is_error(loaded)) {
        report("Configuration error", get_error(loaded));
        return 2;
    }
    sous::core::config::RuntimeConfig config = get_value(loaded);
    sous::app::cli::apply_overrides(options, config);

    auto script = sous::llm::load_script(*options.script);
    if (is_error(script)) {
        report("Cannot load model script", get_error(script));
        return 2;
    }

    // The host environment is read once here; children only see the filtered copy.
    const auto environment =
        sous::exec::build_safe_environment(sous::exec::capture_environment(envp));
    auto executor = std::make_shared<sous::exec::SecureCommandExecutor>(
        config.workdir, config.executor, environment);

    auto registry = std::make_unique<sous::tools::ToolRegistry>();
    auto registered = sous::tools::register_builtin_tools(*registry, config, executor);
    if (is_error(registered)) {
        report("Tool setup failed", get_error(registered));
        return 3;
    }

    auto gate = std::make_shared<sous::approval::ApprovalGate>();
    sous::approval::ApprovalGate* gate_ref = gate.get();
    gate->set_notifier([gate_ref](const sous::approval::PendingApproval& request) {
        return prompt_on_terminal(*gate_ref, request);
    });

    const auto log_dir = config.session_log_dir.is_absolute()
                             ? config.session_log_dir
                             : config.workdir / config.session_log_dir;
    auto store = std::make_shared<sous::session::JsonSessionStore>(log_dir);

    sous::runtime::EngineParts parts;
    parts.backend = std::make_shared<sous::llm::ScriptedBackend>(get_value(script));
    parts.tools = std::move(registry);
    parts.gate = gate;
    parts.persistence = store;
    auto created = sous::runtime::AgentEngine::create(config, std::move(parts));
    if (is_error(created)) {
        report("Engine setup failed", get_error(created));
        return 3;
    }
    auto& engine = *get_value(created);

    std::string task = options.task.value_or("");
    if (options.command == sous::app::cli::CliCommand::Resume) {
        auto snapshot = options.latest ? store->find_latest_session()
                                       : store->load_session(*options.session_id);
        if (is_error(snapshot)) {
            report("Cannot resume session", get_error(snapshot));
            return 4;
        }
        auto resumed = engine.resume(get_value(snapshot));
        if (is_error(resumed)) {
            report("Cannot resume session", get_error(resumed));
            return 4;
        }
        if (task.empty()) {
            for (const auto& message : engine.messages()) {
                std::cout << sous::protocol::to_string(message.role) << ": "
                          << message.content.value_or("") << std::endl;
            }
            return 0;
        }
    }

    if (options.auto_approve) {
        engine.mode_policy().force_auto_approve(true);
    }

    sous::session::SessionRegistry sessions;
    auto opened = sessions.open_session(engine.session_id());
    if (is_error(opened)) {
        report("Cannot open session", get_error(opened));
        return 3;
    }
    const std::string session_id = get_value(opened);
    auto token = sessions.begin_turn(session_id);
    if (is_error(token)) {
        report("Cannot start turn", get_error(token));
        return 3;
    }

    g_cancel_flag = get_value(token).get();
    std::signal(SIGINT, on_interrupt);
    SOUS_LOG_INFO("Mode: " + engine.mode_policy().indicator());

    auto outcome = engine.act(task, print_event, get_value(token));
    std::signal(SIGINT, SIG_DFL);
    g_cancel_flag = nullptr;

    auto ended = sessions.end_turn(session_id);
    if (is_error(ended)) {
        report("Cannot finish turn", get_error(ended));
    }
    if (is_error(outcome)) {
        report("Turn failed", get_error(outcome));
        return 1;
    }

    const auto& result = get_value(outcome);
    const auto& stats = engine.stats();
    SOUS_LOG_INFO("Stopped: " + sous::protocol::to_string(result.stop_reason) +
                  (result.stop_detail.empty() ? "" : " (" + result.stop_detail + ")"));
    SOUS_LOG_INFO("Turns: " + std::to_string(result.turns) +
                  ", tokens: " + std::to_string(stats.session_total_tokens()) +
                  ", cost: $" + std::to_string(stats.session_cost()));
    auto closed = sessions.close(session_id);
    if (is_error(closed)) {
        report("Cannot close session", get_error(closed));
    }
    return result.stop_reason == sous::protocol::StopReason::Cancelled ? 130 : 0;
}
