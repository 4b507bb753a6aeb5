#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include "core/config/runtime_config.hpp"
#include "protocol/message_contract.hpp"
#include "session/session_stats.hpp"

namespace sous::middleware {

enum class MiddlewareAction {
    Continue,
    Stop,
    InjectMessage,
    Compact
};

enum class ResetReason {
    Clear,    // conversation cleared: every policy starts over
    Compact   // history summarized: counters may survive
};

struct MiddlewareResult {
    MiddlewareAction action = MiddlewareAction::Continue;
    std::string reason;   // Stop
    std::string message;  // InjectMessage
    std::map<std::string, std::int64_t> metadata;  // Compact

    static MiddlewareResult proceed() { return {}; }

    static MiddlewareResult stop(std::string why) {
        MiddlewareResult result;
        result.action = MiddlewareAction::Stop;
        result.reason = std::move(why);
        return result;
    }

    static MiddlewareResult inject(std::string text) {
        MiddlewareResult result;
        result.action = MiddlewareAction::InjectMessage;
        result.message = std::move(text);
        return result;
    }

    static MiddlewareResult compact(std::map<std::string, std::int64_t> details) {
        MiddlewareResult result;
        result.action = MiddlewareAction::Compact;
        result.metadata = std::move(details);
        return result;
    }
};

struct ConversationContext {
    const std::vector<protocol::Message>& messages;
    const session::SessionStats& stats;
    const core::config::RuntimeConfig& config;
};

class Middleware {
public:
    virtual ~Middleware() = default;

    virtual std::string name() const = 0;
    virtual MiddlewareResult before_turn(const ConversationContext& context) = 0;
    virtual MiddlewareResult after_turn(const ConversationContext& context) {
        static_cast<void>(context);
        return MiddlewareResult::proceed();
    }
    virtual void reset(ResetReason reason) { static_cast<void>(reason); }
};

// Runs policies in registration order and stops at the first result that is
// not Continue.
class MiddlewarePipeline {
public:
    MiddlewarePipeline& add(std::unique_ptr<Middleware> middleware);
    void clear();
    std::size_t size() const { return middlewares_.size(); }

    MiddlewareResult run_before_turn(const ConversationContext& context);
    MiddlewareResult run_after_turn(const ConversationContext& context);
    void reset(ResetReason reason);

private:
    std::vector<std::unique_ptr<Middleware>> middlewares_;
};

// STOP once the session has made `max_turns` model queries.
class TurnLimitMiddleware : public Middleware {
public:
    explicit TurnLimitMiddleware(int max_turns) : max_turns_(max_turns) {}
    std::string name() const override { return "turn_limit"; }
    MiddlewareResult before_turn(const ConversationContext& context) override;

private:
    int max_turns_;
};

// STOP once the session cost exceeds `max_price`.
class PriceLimitMiddleware : public Middleware {
public:
    explicit PriceLimitMiddleware(double max_price) : max_price_(max_price) {}
    std::string name() const override { return "price_limit"; }
    MiddlewareResult before_turn(const ConversationContext& context) override;

private:
    double max_price_;
};

// COMPACT once the context reaches `threshold` tokens.
class AutoCompactMiddleware : public Middleware {
public:
    explicit AutoCompactMiddleware(std::int64_t threshold) : threshold_(threshold) {}
    std::string name() const override { return "auto_compact"; }
    MiddlewareResult before_turn(const ConversationContext& context) override;

private:
    std::int64_t threshold_;
};

// INJECT a one-time reminder once the context passes a fraction of its budget.
class ContextWarningMiddleware : public Middleware {
public:
    ContextWarningMiddleware(std::int64_t max_context, double threshold_fraction = 0.5)
        : max_context_(max_context), threshold_fraction_(threshold_fraction) {}
    std::string name() const override { return "context_warning"; }
    MiddlewareResult before_turn(const ConversationContext& context) override;
    void reset(ResetReason reason) override;

private:
    std::int64_t max_context_;
    double threshold_fraction_;
    bool warned_ = false;
};

// Pipeline for a configuration: turn cap, spend cap, auto-compaction and the
// optional context warning, in that order.
MiddlewarePipeline build_default_pipeline(const core::config::RuntimeConfig& config);

}  // namespace sous::middleware
