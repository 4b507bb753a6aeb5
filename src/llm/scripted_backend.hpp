#pragma once

#include <deque>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "llm/backend.hpp"

namespace sous::llm {

struct ScriptedFailure {
    std::optional<int> http_status;
    std::string body;
    bool transport_failed = false;
};

// One model answer: either the fragments to replay or a provider failure.
struct ScriptedTurn {
    std::vector<protocol::Fragment> fragments;
    std::optional<ScriptedFailure> failure;
};

ScriptedTurn make_text_turn(const std::string& text,
                            protocol::Usage usage = {100, 20});
ScriptedTurn make_tool_turn(const std::vector<protocol::ToolCall>& calls,
                            protocol::Usage usage = {100, 20});
ScriptedTurn make_failure_turn(ScriptedFailure failure);

// {"turns": [{"fragments": [<chat-completion chunk>, ...]},
//            {"error": {"status": 429, "body": "..."}},
//            {"error": {"transport": true}}]}
core::errors::Result<std::vector<ScriptedTurn>> parse_script(const std::string& json_text);
core::errors::Result<std::vector<ScriptedTurn>> load_script(const std::filesystem::path& path);

// Deterministic backend that replays scripted turns in order and records every
// request it was given.
class ScriptedBackend : public ModelBackend {
public:
    explicit ScriptedBackend(std::vector<ScriptedTurn> turns = {},
                             std::string provider = "scripted");

    void push_turn(ScriptedTurn turn);

    std::string provider_name() const override { return provider_; }

    core::errors::Result<protocol::Fragment> complete(
        const protocol::CompletionRequest& request) override;

    core::errors::Status complete_streaming(const protocol::CompletionRequest& request,
                                            const FragmentCallback& on_fragment) override;

    core::errors::Result<std::int64_t> count_tokens(
        const protocol::CompletionRequest& request) override;

    std::vector<protocol::CompletionRequest> requests() const;
    std::size_t remaining_turns() const;

private:
    core::errors::Result<ScriptedTurn> next_turn(const protocol::CompletionRequest& request);

    std::string provider_;
    mutable std::mutex mutex_;
    std::deque<ScriptedTurn> turns_;
    std::vector<protocol::CompletionRequest> requests_;
};

}  // namespace sous::llm
