#pragma once
#include <cstdint>

namespace sous::session {

    // Token and tool counters for one session. Prices are per million tokens.
    struct SessionStats {
        int turns = 0;  // model queries made
        std::int64_t session_prompt_tokens = 0;
        std::int64_t session_completion_tokens = 0;
        std::int64_t last_turn_prompt_tokens = 0;
        std::int64_t last_turn_completion_tokens = 0;
        std::int64_t context_tokens = 0;
        double last_turn_duration_ms = 0.0;

        int tool_calls_agreed = 0;
        int tool_calls_rejected = 0;
        int tool_calls_succeeded = 0;
        int tool_calls_failed = 0;

        double input_price_per_million = 0.0;
        double output_price_per_million = 0.0;

        std::int64_t session_total_tokens() const {
            return session_prompt_tokens + session_completion_tokens;
        }

        double session_cost() const {
            return static_cast<double>(session_prompt_tokens) * input_price_per_million / 1e6 +
                   static_cast<double>(session_completion_tokens) * output_price_per_million /
                       1e6;
        }

        void record_usage(std::int64_t prompt_tokens, std::int64_t completion_tokens) {
            last_turn_prompt_tokens = prompt_tokens;
            last_turn_completion_tokens = completion_tokens;
            session_prompt_tokens += prompt_tokens;
            session_completion_tokens += completion_tokens;
            context_tokens = prompt_tokens + completion_tokens;
        }

        // Fresh counters, same pricing.
        void reset_keep_pricing() {
            SessionStats fresh;
            fresh.input_price_per_million = input_price_per_million;
            fresh.output_price_per_million = output_price_per_million;
            *this = fresh;
        }
    };

} // namespace sous::session
