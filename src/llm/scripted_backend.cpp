#include "llm/scripted_backend.hpp"

#include <fstream>
#include <sstream>
#include <utility>
#include <nlohmann/json.hpp>
#include "llm/fragment_codec.hpp"
#include "llm/provider_errors.hpp"
#include "llm/stream_accumulator.hpp"

namespace sous::llm {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

AgentError script_error(const std::string& detail) {
    return AgentError{ErrorCategory::Input, "Invalid model script: " + detail,
                      "invalid_script"};
}

}  // namespace

ScriptedTurn make_text_turn(const std::string& text, const protocol::Usage usage) {
    protocol::Fragment fragment;
    fragment.message.content = text;
    fragment.finish_reason = "stop";
    fragment.usage = usage;
    return ScriptedTurn{{fragment}, std::nullopt};
}

ScriptedTurn make_tool_turn(const std::vector<protocol::ToolCall>& calls,
                            const protocol::Usage usage) {
    protocol::Fragment fragment;
    std::vector<protocol::ToolCall> indexed = calls;
    for (std::size_t i = 0; i < indexed.size(); ++i) {
        if (!indexed[i].index.has_value()) {
            indexed[i].index = static_cast<int>(i);
        }
    }
    fragment.message.tool_calls = indexed;
    fragment.finish_reason = "tool_calls";
    fragment.usage = usage;
    return ScriptedTurn{{fragment}, std::nullopt};
}

ScriptedTurn make_failure_turn(ScriptedFailure failure) {
    return ScriptedTurn{{}, std::move(failure)};
}

core::errors::Result<std::vector<ScriptedTurn>> parse_script(const std::string& json_text) {
    json doc;
    try {
        doc = json::parse(json_text);
    } catch (const json::parse_error& e) {
        return script_error(e.what());
    }
    if (!doc.is_object() || !doc.contains("turns") || !doc.at("turns").is_array()) {
        return script_error("expected an object with a 'turns' array");
    }

    std::vector<ScriptedTurn> turns;
    std::size_t turn_number = 0;
    for (const auto& entry : doc.at("turns")) {
        ++turn_number;
        ScriptedTurn turn;
        if (entry.contains("error")) {
            const auto& error = entry.at("error");
            ScriptedFailure failure;
            if (error.contains("status") && error.at("status").is_number_integer()) {
                failure.http_status = error.at("status").get<int>();
            }
            failure.body = error.value("body", std::string{});
            failure.transport_failed = error.value("transport", false);
            turn.failure = failure;
        } else if (entry.contains("fragments") && entry.at("fragments").is_array()) {
            for (const auto& chunk : entry.at("fragments")) {
                auto fragment = decode_fragment(chunk.dump());
                if (core::errors::is_error(fragment)) {
                    return script_error("turn " + std::to_string(turn_number) + ": " +
                                        core::errors::get_error(fragment).message);
                }
                turn.fragments.push_back(core::errors::get_value(fragment));
            }
        } else {
            return script_error("turn " + std::to_string(turn_number) +
                                " has neither 'fragments' nor 'error'");
        }
        turns.push_back(std::move(turn));
    }
    return turns;
}

core::errors::Result<std::vector<ScriptedTurn>> load_script(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return AgentError{ErrorCategory::Input, "Unable to open model script: " + path.string(),
                          "script_not_found"};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return parse_script(buffer.str());
}

ScriptedBackend::ScriptedBackend(std::vector<ScriptedTurn> turns, std::string provider)
    : provider_(std::move(provider)), turns_(turns.begin(), turns.end()) {}

void ScriptedBackend::push_turn(ScriptedTurn turn) {
    std::lock_guard<std::mutex> lock(mutex_);
    turns_.push_back(std::move(turn));
}

std::vector<protocol::CompletionRequest> ScriptedBackend::requests() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_;
}

std::size_t ScriptedBackend::remaining_turns() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return turns_.size();
}

core::errors::Result<ScriptedTurn> ScriptedBackend::next_turn(
    const protocol::CompletionRequest& request) {
    std::lock_guard<std::mutex> lock(mutex_);
    requests_.push_back(request);
    if (turns_.empty()) {
        return classify_provider_error(ProviderFailure{
            provider_, "script", request.model, 500, "Model script exhausted.", false});
    }
    ScriptedTurn turn = std::move(turns_.front());
    turns_.pop_front();
    if (turn.failure.has_value()) {
        const auto& failure = turn.failure.value();
        return classify_provider_error(ProviderFailure{provider_, "script", request.model,
                                                       failure.http_status, failure.body,
                                                       failure.transport_failed});
    }
    return turn;
}

core::errors::Result<protocol::Fragment> ScriptedBackend::complete(
    const protocol::CompletionRequest& request) {
    auto turn = next_turn(request);
    if (core::errors::is_error(turn)) {
        return core::errors::get_error(turn);
    }

    StreamAccumulator accumulator(1);
    for (const auto& fragment : core::errors::get_value(turn).fragments) {
        auto pushed = accumulator.push(fragment);
        if (core::errors::is_error(pushed)) {
            return core::errors::get_error(pushed);
        }
    }
    auto finished = accumulator.finish();
    if (core::errors::is_error(finished)) {
        return core::errors::get_error(finished);
    }
    const auto& response = core::errors::get_value(finished);
    protocol::Fragment merged;
    merged.message = response.message;
    merged.usage = response.usage;
    merged.finish_reason = response.finish_reason;
    return merged;
}

core::errors::Status ScriptedBackend::complete_streaming(
    const protocol::CompletionRequest& request, const FragmentCallback& on_fragment) {
    auto turn = next_turn(request);
    if (core::errors::is_error(turn)) {
        return core::errors::get_error(turn);
    }
    for (const auto& fragment : core::errors::get_value(turn).fragments) {
        if (!on_fragment(fragment)) {
            break;
        }
    }
    return core::errors::ok();
}

core::errors::Result<std::int64_t> ScriptedBackend::count_tokens(
    const protocol::CompletionRequest& request) {
    std::size_t chars = 0;
    for (const auto& message : request.messages) {
        chars += message.content.value_or("").size();
        if (message.has_tool_calls()) {
            for (const auto& call : message.tool_calls.value()) {
                chars += call.name.size() + call.arguments.size();
            }
        }
    }
    return static_cast<std::int64_t>(chars / 4);
}

}  // namespace sous::llm
