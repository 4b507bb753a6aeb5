#include "runtime/agent_engine.hpp"

#include <chrono>
#include <exception>
#include <future>
#include <utility>
#include "core/config/ids.hpp"
#include "core/logging/logger.hpp"
#include "llm/stream_accumulator.hpp"

namespace sous::runtime {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using core::errors::get_error;
using core::errors::get_value;
using core::errors::is_error;
using middleware::MiddlewareAction;
using middleware::MiddlewareResult;
using protocol::AgentEvent;
using protocol::AssistantTextEvent;
using protocol::CompactEndedEvent;
using protocol::CompactStartedEvent;
using protocol::Message;
using protocol::Role;
using protocol::StopReason;
using protocol::ToolCallStartedEvent;
using protocol::ToolResultEvent;

namespace {

constexpr const char* kCancelReason = "Turn cancelled by user";
constexpr const char* kDeniedReason = "Tool execution denied by user";

void emit(const EventSink& sink, const AgentEvent& event) {
    if (sink) {
        sink(event);
    }
}

double elapsed_ms(const std::chrono::steady_clock::time_point started) {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() -
                                                     started)
        .count();
}

AgentError busy_error() {
    return AgentError{ErrorCategory::Input, "A turn is already running for this session.",
                      "turn_in_progress", "Wait for the current turn or cancel it."};
}

std::string last_user_text(const std::vector<Message>& messages) {
    for (auto it = messages.rbegin(); it != messages.rend(); ++it) {
        if (it->role == Role::User && it->content.has_value()) {
            return *it->content;
        }
    }
    return {};
}

}  // namespace

core::errors::Result<std::unique_ptr<AgentEngine>> AgentEngine::create(
    core::config::RuntimeConfig config, EngineParts parts) {
    if (!parts.backend) {
        return AgentError{ErrorCategory::Input, "A model backend is required.",
                          "missing_backend"};
    }
    auto mode = policy::parse_mode(config.initial_mode);
    if (is_error(mode)) {
        return get_error(mode);
    }
    if (!parts.tools) {
        parts.tools = std::make_unique<tools::ToolRegistry>();
    }
    if (!parts.gate) {
        parts.gate = std::make_shared<approval::ApprovalGate>();
    }
    return std::unique_ptr<AgentEngine>(
        new AgentEngine(std::move(config), std::move(parts), get_value(mode)));
}

AgentEngine::AgentEngine(core::config::RuntimeConfig config, EngineParts parts,
                         const policy::Mode mode)
    : config_(std::move(config)),
      backend_(std::move(parts.backend)),
      tools_(std::move(parts.tools)),
      gate_(std::move(parts.gate)),
      persistence_(std::move(parts.persistence)),
      mode_(mode),
      authorizer_(mode_, *tools_),
      pipeline_(middleware::build_default_pipeline(config_)),
      conversation_(config_.system_prompt) {
    stats_.input_price_per_million = config_.model.input_price_per_million;
    stats_.output_price_per_million = config_.model.output_price_per_million;
    conversation_.set_system_prompt(system_prompt());
    start_new_session();
}

core::errors::Result<ActOutcome> AgentEngine::act(const std::string& user_text,
                                                  const EventSink& sink,
                                                  std::shared_ptr<std::atomic_bool> cancel_token) {
    std::unique_lock<std::mutex> turn_lock(turn_mutex_, std::try_to_lock);
    if (!turn_lock.owns_lock()) {
        return busy_error();
    }
    core::logging::Logger::get().set_session_id(session_id_);

    if (!cancel_token) {
        cancel_token = std::make_shared<std::atomic_bool>(false);
    }
    {
        std::lock_guard<std::mutex> lock(cancel_mutex_);
        cancel_token_ = cancel_token;
    }

    const std::size_t repaired = conversation_.repair();
    if (repaired > 0) {
        SOUS_LOG_WARN("Added " + std::to_string(repaired) +
                      " placeholder result(s) for interrupted tool calls");
    }
    conversation_.append(Message::user(user_text));

    core::errors::Result<ActOutcome> outcome = ActOutcome{};
    try {
        outcome = run_loop(sink);
    } catch (const std::exception& e) {
        outcome = AgentError{ErrorCategory::Internal,
                             std::string("Turn aborted: ") + e.what(), "internal_error"};
    }

    persist();
    {
        std::lock_guard<std::mutex> lock(cancel_mutex_);
        cancel_token_.reset();
    }
    if (is_error(outcome)) {
        const auto& error = get_error(outcome);
        SOUS_LOG_ERROR("Turn failed [" + error.code + "]: " + error.message);
    }
    return outcome;
}

core::errors::Result<ActOutcome> AgentEngine::run_loop(const EventSink& sink) {
    ActOutcome outcome;
    const int turns_at_start = stats_.turns;

    while (true) {
        if (cancel_requested()) {
            outcome.stop_reason = StopReason::Cancelled;
            outcome.stop_detail = kCancelReason;
            break;
        }

        const MiddlewareResult before = pipeline_.run_before_turn(context());
        if (before.action == MiddlewareAction::Stop) {
            emit(sink, AssistantTextEvent{"<sous_stop_event>" + before.reason +
                                              "</sous_stop_event>",
                                          stats_.last_turn_prompt_tokens,
                                          stats_.last_turn_completion_tokens,
                                          stats_.session_total_tokens(), true});
            outcome.stop_reason = StopReason::MiddlewareStop;
            outcome.stop_detail = before.reason;
            break;
        }
        auto handled = handle_middleware_result(before, sink);
        if (is_error(handled)) {
            return get_error(handled);
        }

        auto turn = perform_turn(sink);
        persist();
        if (is_error(turn)) {
            return get_error(turn);
        }
        if (get_value(turn).cancelled) {
            outcome.stop_reason = StopReason::Cancelled;
            outcome.stop_detail = kCancelReason;
            break;
        }

        const bool done = conversation_.back().role != Role::Tool &&
                          get_value(turn).finish_reason.has_value();

        const MiddlewareResult after = pipeline_.run_after_turn(context());
        if (after.action == MiddlewareAction::Stop) {
            emit(sink, AssistantTextEvent{"<sous_stop_event>" + after.reason +
                                              "</sous_stop_event>",
                                          stats_.last_turn_prompt_tokens,
                                          stats_.last_turn_completion_tokens,
                                          stats_.session_total_tokens(), true});
            outcome.stop_reason = StopReason::MiddlewareStop;
            outcome.stop_detail = after.reason;
            break;
        }
        handled = handle_middleware_result(after, sink);
        if (is_error(handled)) {
            return get_error(handled);
        }
        persist();

        if (done) {
            outcome.stop_reason = StopReason::Finished;
            break;
        }
    }

    outcome.turns = stats_.turns - turns_at_start;
    return outcome;
}

core::errors::Status AgentEngine::handle_middleware_result(const MiddlewareResult& result,
                                                           const EventSink& sink) {
    switch (result.action) {
        case MiddlewareAction::InjectMessage:
            conversation_.append_to_last(result.message);
            return core::errors::ok();
        case MiddlewareAction::Compact: {
            const auto old_tokens = result.metadata.count("old_tokens") > 0
                                        ? result.metadata.at("old_tokens")
                                        : stats_.context_tokens;
            const auto threshold = result.metadata.count("threshold") > 0
                                       ? result.metadata.at("threshold")
                                       : config_.auto_compact_threshold;
            emit(sink, CompactStartedEvent{old_tokens, threshold});
            auto summary = compact_locked();
            if (is_error(summary)) {
                return get_error(summary);
            }
            emit(sink, CompactEndedEvent{old_tokens, stats_.context_tokens,
                                         get_value(summary).size()});
            return core::errors::ok();
        }
        default:
            return core::errors::ok();
    }
}

core::errors::Result<AgentEngine::TurnResult> AgentEngine::perform_turn(const EventSink& sink) {
    conversation_.set_system_prompt(system_prompt());
    auto ready = conversation_.check_ready_for_query();
    if (is_error(ready)) {
        return get_error(ready);
    }

    const protocol::CompletionRequest request = build_request();
    ++stats_.turns;
    const auto started = std::chrono::steady_clock::now();

    TurnResult turn;
    std::optional<std::string> tail;
    core::errors::Result<llm::AccumulatedResponse> response =
        config_.streaming ? query_streaming(request, sink, turn.cancelled, tail)
                          : query_once(request);
    if (is_error(response)) {
        return get_error(response);
    }
    if (turn.cancelled) {
        SOUS_LOG_INFO("Model stream abandoned after cancellation");
        return turn;
    }

    llm::AccumulatedResponse& answer = get_value(response);
    stats_.last_turn_duration_ms = elapsed_ms(started);
    stats_.record_usage(answer.usage.prompt_tokens, answer.usage.completion_tokens);
    turn.finish_reason = answer.finish_reason;

    const std::string text =
        config_.streaming ? tail.value_or("") : answer.message.content.value_or("");
    if (!text.empty()) {
        emit(sink, AssistantTextEvent{text, answer.usage.prompt_tokens,
                                      answer.usage.completion_tokens,
                                      stats_.session_total_tokens(), false});
    }

    const bool has_calls = answer.message.has_tool_calls();
    std::vector<protocol::ToolCall> calls;
    if (has_calls) {
        calls = *answer.message.tool_calls;
    }
    conversation_.append(std::move(answer.message));

    if (has_calls && !run_tool_calls(calls, sink)) {
        turn.cancelled = true;
    }
    return turn;
}

core::errors::Result<llm::AccumulatedResponse> AgentEngine::query_streaming(
    const protocol::CompletionRequest& request, const EventSink& sink, bool& cancelled,
    std::optional<std::string>& tail) {
    llm::StreamAccumulator accumulator(config_.stream_batch_size);
    std::optional<AgentError> stream_error;

    auto status = backend_->complete_streaming(
        request, [&](const protocol::Fragment& fragment) {
            if (cancel_requested()) {
                cancelled = true;
                return false;
            }
            auto pushed = accumulator.push(fragment);
            if (is_error(pushed)) {
                stream_error = get_error(pushed);
                return false;
            }
            const auto& batch = get_value(pushed);
            if (batch.has_value()) {
                emit(sink, AssistantTextEvent{*batch, 0, 0, stats_.session_total_tokens(),
                                              false});
            }
            return true;
        });

    if (stream_error.has_value()) {
        return *stream_error;
    }
    if (is_error(status)) {
        return get_error(status);
    }
    if (cancelled) {
        return llm::AccumulatedResponse{};
    }
    tail = accumulator.flush_text();
    return accumulator.finish();
}

core::errors::Result<llm::AccumulatedResponse> AgentEngine::query_once(
    const protocol::CompletionRequest& request) {
    auto fragment = backend_->complete(request);
    if (is_error(fragment)) {
        return get_error(fragment);
    }
    protocol::Fragment& whole = get_value(fragment);
    if (!whole.usage.has_value()) {
        return AgentError{ErrorCategory::Protocol,
                          "Model response carried no usage data from " +
                              backend_->provider_name(),
                          "missing_usage"};
    }

    llm::AccumulatedResponse answer;
    answer.message = std::move(whole.message);
    answer.message.role = Role::Assistant;
    answer.finish_reason = whole.finish_reason;
    answer.usage = *whole.usage;
    if (answer.message.tool_calls.has_value()) {
        for (auto& call : *answer.message.tool_calls) {
            if (call.id.empty()) {
                call.id = core::config::generate_call_id();
            }
        }
    }
    return answer;
}

bool AgentEngine::run_tool_calls(const std::vector<protocol::ToolCall>& calls,
                                 const EventSink& sink) {
    std::shared_ptr<std::atomic_bool> token;
    {
        std::lock_guard<std::mutex> lock(cancel_mutex_);
        token = cancel_token_;
    }

    if (!config_.parallel_tool_calls) {
        for (const auto& call : calls) {
            if (cancel_requested()) {
                return false;
            }
            emit(sink, ToolCallStartedEvent{call.id, call.name, call.arguments});
            PlannedCall planned = plan_call(call);
            if (planned.execute) {
                execute_call(planned, token);
            }
            append_result(planned, sink);
        }
        return !cancel_requested();
    }

    // Authorize in declared order, run the approved calls together, then
    // append every result in declared order.
    std::vector<PlannedCall> planned;
    planned.reserve(calls.size());
    for (const auto& call : calls) {
        if (cancel_requested()) {
            break;
        }
        emit(sink, ToolCallStartedEvent{call.id, call.name, call.arguments});
        planned.push_back(plan_call(call));
    }

    std::vector<std::future<void>> running;
    for (auto& entry : planned) {
        if (entry.execute && !cancel_requested()) {
            PlannedCall* target = &entry;
            running.push_back(std::async(std::launch::async, [this, target, token]() {
                core::logging::Logger::get().set_session_id(session_id_);
                execute_call(*target, token);
            }));
        } else if (entry.execute) {
            entry.execute = false;
            entry.skipped = true;
            entry.skip_reason = kCancelReason;
        }
    }
    for (auto& future : running) {
        future.get();
    }
    for (const auto& entry : planned) {
        append_result(entry, sink);
    }
    return planned.size() == calls.size() && !cancel_requested();
}

AgentEngine::PlannedCall AgentEngine::plan_call(const protocol::ToolCall& call) {
    PlannedCall planned;
    planned.call = call;
    planned.tool = tools_->find(call.name);
    if (planned.tool == nullptr) {
        planned.error = "Unknown tool: " + call.name;
        return planned;
    }
    auto valid = planned.tool->validate(call.arguments);
    if (is_error(valid)) {
        planned.error = get_error(valid).message;
        return planned;
    }

    const authz::Authorization verdict =
        authorizer_.authorize(call.name, call.arguments, call.id);
    if (verdict.decision == authz::Decision::Skip) {
        planned.skipped = true;
        planned.skip_reason = verdict.reason;
        ++stats_.tool_calls_rejected;
        SOUS_LOG_INFO("Skipped " + call.name + ": " + verdict.reason);
        return planned;
    }
    if (verdict.decision == authz::Decision::Execute) {
        planned.execute = true;
        ++stats_.tool_calls_agreed;
        return planned;
    }

    auto requested = gate_->request_approval(call.name, call.arguments, call.id);
    if (is_error(requested)) {
        planned.skipped = true;
        planned.skip_reason = "Approval request failed: " + get_error(requested).message;
        ++stats_.tool_calls_rejected;
        return planned;
    }
    // cancel() may have swept the gate just before this call registered.
    if (cancel_requested()) {
        gate_->resolve(call.id, approval::Verdict::No, std::string(kCancelReason));
    }

    auto answer = gate_->wait(call.id, config_.approval_timeout_ms);
    if (is_error(answer)) {
        planned.skipped = true;
        planned.skip_reason = "Approval request failed: " + get_error(answer).message;
        ++stats_.tool_calls_rejected;
        return planned;
    }

    const approval::ApprovalResponse& response = get_value(answer);
    switch (response.verdict) {
        case approval::Verdict::Always:
            authorizer_.grant_session_always(call.name);
            planned.execute = true;
            ++stats_.tool_calls_agreed;
            break;
        case approval::Verdict::Yes:
            planned.execute = true;
            ++stats_.tool_calls_agreed;
            break;
        default:
            planned.skipped = true;
            planned.skip_reason = response.message.value_or(kDeniedReason);
            ++stats_.tool_calls_rejected;
            break;
    }
    return planned;
}

void AgentEngine::execute_call(PlannedCall& planned,
                               const std::shared_ptr<std::atomic_bool>& token) {
    const auto started = std::chrono::steady_clock::now();
    tools::ToolContext context{token};
    try {
        auto result = planned.tool->execute(planned.call.arguments, context);
        if (is_error(result)) {
            planned.error = get_error(result).message;
        } else {
            const protocol::ToolResult& value = get_value(result);
            planned.output = value.output;
            planned.succeeded = value.success;
            if (!value.success) {
                planned.error = value.error_message.empty() ? "Tool reported failure"
                                                            : value.error_message;
            }
        }
    } catch (const std::exception& e) {
        planned.error = std::string("Unexpected tool failure: ") + e.what();
    }
    planned.duration_ms = elapsed_ms(started);
}

void AgentEngine::append_result(const PlannedCall& planned, const EventSink& sink) {
    ToolResultEvent event;
    event.tool_call_id = planned.call.id;
    event.tool_name = planned.call.name;
    event.duration_ms = planned.duration_ms;

    std::string content;
    if (planned.skipped) {
        content = planned.skip_reason;
        event.skipped = true;
        event.skip_reason = planned.skip_reason;
    } else if (!planned.error.empty()) {
        content = "<tool_error>" + planned.call.name + " failed: " + planned.error;
        if (!planned.output.empty()) {
            content += "\n" + tools::truncate_output(planned.output,
                                                     config_.executor.max_output_bytes);
        }
        content += "</tool_error>";
        event.error = planned.error;
        event.output = planned.output;
        ++stats_.tool_calls_failed;
    } else {
        content = tools::truncate_output(planned.output, config_.executor.max_output_bytes);
        event.output = content;
        ++stats_.tool_calls_succeeded;
    }

    conversation_.append(Message::tool_result(planned.call.id, planned.call.name, content));
    emit(sink, event);
}

core::errors::Result<std::string> AgentEngine::compact() {
    std::unique_lock<std::mutex> turn_lock(turn_mutex_, std::try_to_lock);
    if (!turn_lock.owns_lock()) {
        return busy_error();
    }
    core::logging::Logger::get().set_session_id(session_id_);
    return compact_locked();
}

core::errors::Result<std::string> AgentEngine::compact_locked() {
    persist();
    const std::vector<Message> saved = conversation_.messages();
    const std::int64_t estimate_before = conversation_.estimate_tokens();

    conversation_.set_system_prompt(system_prompt());
    conversation_.append(Message::user(config_.compact_prompt));

    protocol::CompletionRequest request = build_request();
    request.tools.clear();
    auto response = query_once(request);
    if (is_error(response)) {
        conversation_.restore(saved);
        persist();
        return get_error(response);
    }

    const llm::AccumulatedResponse& answer = get_value(response);
    stats_.record_usage(answer.usage.prompt_tokens, answer.usage.completion_tokens);

    std::string summary = answer.message.content.value_or("");
    const std::string last_request = last_user_text(saved);
    if (!last_request.empty()) {
        summary += "\n\nLast request from user was: " + last_request;
    }
    conversation_.replace_with_summary(summary);

    auto counted = backend_->count_tokens(build_request());
    stats_.context_tokens =
        is_error(counted) ? conversation_.estimate_tokens() : get_value(counted);
    SOUS_LOG_INFO("Compacted history from ~" + std::to_string(estimate_before) + " to ~" +
                  std::to_string(conversation_.estimate_tokens()) + " tokens");

    start_new_session();
    pipeline_.reset(middleware::ResetReason::Compact);
    persist();
    return summary;
}

core::errors::Status AgentEngine::clear_history() {
    std::unique_lock<std::mutex> turn_lock(turn_mutex_, std::try_to_lock);
    if (!turn_lock.owns_lock()) {
        return busy_error();
    }
    core::logging::Logger::get().set_session_id(session_id_);
    persist();
    conversation_.reset_to_system();
    stats_.reset_keep_pricing();
    pipeline_.reset(middleware::ResetReason::Clear);
    tools_->reset_all();
    authorizer_.clear_session_grants();
    start_new_session();
    SOUS_LOG_INFO("Conversation history cleared");
    return core::errors::ok();
}

core::errors::Status AgentEngine::resume(const session::SessionSnapshot& snapshot) {
    std::unique_lock<std::mutex> turn_lock(turn_mutex_, std::try_to_lock);
    if (!turn_lock.owns_lock()) {
        return busy_error();
    }
    if (!snapshot.mode.empty()) {
        auto mode = policy::parse_mode(snapshot.mode);
        if (is_error(mode)) {
            return get_error(mode);
        }
        mode_.set_mode(get_value(mode));
    }

    conversation_.restore(snapshot.messages);
    conversation_.set_system_prompt(system_prompt());
    stats_ = snapshot.stats;
    stats_.input_price_per_million = config_.model.input_price_per_million;
    stats_.output_price_per_million = config_.model.output_price_per_million;
    session_id_ = snapshot.session_id;
    core::logging::Logger::get().set_session_id(session_id_);
    SOUS_LOG_INFO("Resumed session with " + std::to_string(conversation_.size()) +
                  " messages");
    return core::errors::ok();
}

void AgentEngine::set_mode(const policy::Mode mode) {
    const policy::Mode before = mode_.current_mode();
    mode_.set_mode(mode);
    SOUS_LOG_INFO(mode_.transition_message(before, mode));
}

core::errors::Result<policy::Mode> AgentEngine::set_mode_by_name(const std::string& name) {
    auto mode = policy::parse_mode(name);
    if (is_error(mode)) {
        return get_error(mode);
    }
    set_mode(get_value(mode));
    return get_value(mode);
}

std::pair<policy::Mode, policy::Mode> AgentEngine::cycle_mode() {
    const auto change = mode_.cycle_mode();
    SOUS_LOG_INFO(mode_.transition_message(change.first, change.second));
    return change;
}

void AgentEngine::cancel() {
    {
        std::lock_guard<std::mutex> lock(cancel_mutex_);
        if (cancel_token_) {
            cancel_token_->store(true);
        }
    }
    const std::size_t answered = gate_->cancel_all(kCancelReason);
    SOUS_LOG_INFO("Cancel requested; " + std::to_string(answered) +
                  " pending approval(s) answered NO");
}

protocol::CompletionRequest AgentEngine::build_request() const {
    protocol::CompletionRequest request;
    request.model = config_.model.name;
    request.messages = conversation_.messages();
    request.tools = tools_->schemas();
    request.temperature = config_.model.temperature;
    request.max_tokens = config_.model.max_tokens;
    return request;
}

middleware::ConversationContext AgentEngine::context() const {
    return middleware::ConversationContext{conversation_.messages(), stats_, config_};
}

std::string AgentEngine::system_prompt() const {
    const std::string modifier = mode_.prompt_modifier();
    if (modifier.empty()) {
        return config_.system_prompt;
    }
    return config_.system_prompt + "\n\n" + modifier;
}

bool AgentEngine::cancel_requested() const {
    std::lock_guard<std::mutex> lock(cancel_mutex_);
    return cancel_token_ && cancel_token_->load();
}

void AgentEngine::start_new_session() {
    session_id_ = core::config::generate_session_id();
    core::logging::Logger::get().set_session_id(session_id_);
}

void AgentEngine::persist() {
    if (!persistence_ || !config_.session_logging) {
        return;
    }
    session::SessionSnapshot snapshot;
    snapshot.session_id = session_id_;
    snapshot.saved_at_ms = session::now_unix_ms();
    snapshot.mode = policy::to_string(mode_.current_mode());
    snapshot.auto_approve = mode_.auto_approve();
    snapshot.tool_names = tools_->names();
    snapshot.workdir = config_.workdir.string();
    snapshot.mode_state_json = mode_.snapshot_json();
    snapshot.stats = stats_;
    snapshot.messages = conversation_.messages();

    auto saved = persistence_->save_interaction(snapshot);
    if (is_error(saved)) {
        SOUS_LOG_WARN("Could not save session " + session_id_ + ": " +
                      get_error(saved).message);
    }
}

}  // namespace sous::runtime
