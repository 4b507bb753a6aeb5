#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "approval/approval_gate.hpp"
#include "authz/tool_authorizer.hpp"
#include "core/config/runtime_config.hpp"
#include "core/errors/agent_errors.hpp"
#include "llm/backend.hpp"
#include "llm/stream_accumulator.hpp"
#include "middleware/middleware.hpp"
#include "policy/mode_policy.hpp"
#include "protocol/event_contract.hpp"
#include "session/conversation.hpp"
#include "session/session_stats.hpp"
#include "session/session_store.hpp"
#include "tools/tool.hpp"

namespace sous::runtime {

using EventSink = std::function<void(const protocol::AgentEvent&)>;

struct ActOutcome {
    protocol::StopReason stop_reason = protocol::StopReason::Finished;
    std::string stop_detail;
    int turns = 0;  // model queries made by this call
};

struct EngineParts {
    std::shared_ptr<llm::ModelBackend> backend;
    std::unique_ptr<tools::ToolRegistry> tools;
    std::shared_ptr<approval::ApprovalGate> gate;
    std::shared_ptr<session::SessionPersistence> persistence;  // optional
};

// Drives one conversation: queries the model, authorizes and runs the tool
// calls it asks for, and loops until the model finishes or a middleware stops
// it. One turn runs at a time; cancel() and the approval gate may be used from
// other threads.
class AgentEngine {
public:
    static core::errors::Result<std::unique_ptr<AgentEngine>> create(
        core::config::RuntimeConfig config, EngineParts parts);

    AgentEngine(const AgentEngine&) = delete;
    AgentEngine& operator=(const AgentEngine&) = delete;

    // Appends `user_text` and runs turns until done. Events are delivered to
    // `sink` synchronously, in order. Protocol, provider, desync and internal errors are
    // returned after the conversation has been persisted.
    core::errors::Result<ActOutcome> act(
        const std::string& user_text, const EventSink& sink,
        std::shared_ptr<std::atomic_bool> cancel_token = nullptr);

    // Replaces the history with [system, summary]. Returns the summary.
    core::errors::Result<std::string> compact();
    core::errors::Status clear_history();
    core::errors::Status resume(const session::SessionSnapshot& snapshot);

    void set_mode(policy::Mode mode);
    core::errors::Result<policy::Mode> set_mode_by_name(const std::string& name);
    std::pair<policy::Mode, policy::Mode> cycle_mode();

    // Stops the running turn after the current tool and answers any pending
    // approval with NO.
    void cancel();

    const std::vector<protocol::Message>& messages() const { return conversation_.messages(); }
    const session::SessionStats& stats() const { return stats_; }
    const std::string& session_id() const { return session_id_; }
    policy::ModePolicy& mode_policy() { return mode_; }
    authz::ToolAuthorizer& authorizer() { return authorizer_; }
    middleware::MiddlewarePipeline& pipeline() { return pipeline_; }
    approval::ApprovalGate& gate() { return *gate_; }
    const core::config::RuntimeConfig& config() const { return config_; }

private:
    struct PlannedCall {
        protocol::ToolCall call;
        tools::Tool* tool = nullptr;
        bool execute = false;
        bool skipped = false;
        std::string skip_reason;
        std::string output;
        std::string error;
        double duration_ms = 0.0;
        bool succeeded = false;
    };

    struct TurnResult {
        std::optional<std::string> finish_reason;
        bool cancelled = false;
    };

    AgentEngine(core::config::RuntimeConfig config, EngineParts parts, policy::Mode mode);

    core::errors::Result<ActOutcome> run_loop(const EventSink& sink);
    core::errors::Status handle_middleware_result(const middleware::MiddlewareResult& result,
                                                  const EventSink& sink);
    core::errors::Result<TurnResult> perform_turn(const EventSink& sink);
    core::errors::Result<llm::AccumulatedResponse> query_streaming(
        const protocol::CompletionRequest& request, const EventSink& sink, bool& cancelled,
        std::optional<std::string>& tail);
    core::errors::Result<llm::AccumulatedResponse> query_once(
        const protocol::CompletionRequest& request);

    bool run_tool_calls(const std::vector<protocol::ToolCall>& calls, const EventSink& sink);
    PlannedCall plan_call(const protocol::ToolCall& call);
    void execute_call(PlannedCall& planned, const std::shared_ptr<std::atomic_bool>& token);
    void append_result(const PlannedCall& planned, const EventSink& sink);

    core::errors::Result<std::string> compact_locked();
    protocol::CompletionRequest build_request() const;
    middleware::ConversationContext context() const;
    std::string system_prompt() const;
    bool cancel_requested() const;
    void start_new_session();
    void persist();

    core::config::RuntimeConfig config_;
    std::shared_ptr<llm::ModelBackend> backend_;
    std::unique_ptr<tools::ToolRegistry> tools_;
    std::shared_ptr<approval::ApprovalGate> gate_;
    std::shared_ptr<session::SessionPersistence> persistence_;

    policy::ModePolicy mode_;
    authz::ToolAuthorizer authorizer_;
    middleware::MiddlewarePipeline pipeline_;

    session::Conversation conversation_;
    session::SessionStats stats_;
    std::string session_id_;

    std::mutex turn_mutex_;
    mutable std::mutex cancel_mutex_;
    std::shared_ptr<std::atomic_bool> cancel_token_;
};

}  // namespace sous::runtime
