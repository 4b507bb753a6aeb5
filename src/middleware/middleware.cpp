#include "middleware/middleware.hpp"

#include <cstdio>
#include <utility>

namespace sous::middleware {

namespace {

std::string format_money(const double value) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "$%.4f", value);
    return buffer;
}

}  // namespace

MiddlewarePipeline& MiddlewarePipeline::add(std::unique_ptr<Middleware> middleware) {
    middlewares_.push_back(std::move(middleware));
    return *this;
}

void MiddlewarePipeline::clear() {
    middlewares_.clear();
}

MiddlewareResult MiddlewarePipeline::run_before_turn(const ConversationContext& context) {
    for (auto& middleware : middlewares_) {
        MiddlewareResult result = middleware->before_turn(context);
        if (result.action != MiddlewareAction::Continue) {
            return result;
        }
    }
    return MiddlewareResult::proceed();
}

MiddlewareResult MiddlewarePipeline::run_after_turn(const ConversationContext& context) {
    for (auto& middleware : middlewares_) {
        MiddlewareResult result = middleware->after_turn(context);
        if (result.action != MiddlewareAction::Continue) {
            return result;
        }
    }
    return MiddlewareResult::proceed();
}

void MiddlewarePipeline::reset(const ResetReason reason) {
    for (auto& middleware : middlewares_) {
        middleware->reset(reason);
    }
}

MiddlewareResult TurnLimitMiddleware::before_turn(const ConversationContext& context) {
    if (context.stats.turns >= max_turns_) {
        return MiddlewareResult::stop("Turn limit of " + std::to_string(max_turns_) +
                                      " reached");
    }
    return MiddlewareResult::proceed();
}

MiddlewareResult PriceLimitMiddleware::before_turn(const ConversationContext& context) {
    const double cost = context.stats.session_cost();
    if (cost > max_price_) {
        return MiddlewareResult::stop("Price limit exceeded: " + format_money(cost) + " > " +
                                      format_money(max_price_));
    }
    return MiddlewareResult::proceed();
}

MiddlewareResult AutoCompactMiddleware::before_turn(const ConversationContext& context) {
    if (context.stats.context_tokens >= threshold_) {
        return MiddlewareResult::compact(
            {{"old_tokens", context.stats.context_tokens}, {"threshold", threshold_}});
    }
    return MiddlewareResult::proceed();
}

MiddlewareResult ContextWarningMiddleware::before_turn(const ConversationContext& context) {
    if (warned_ || max_context_ <= 0) {
        return MiddlewareResult::proceed();
    }
    const auto used = context.stats.context_tokens;
    if (static_cast<double>(used) < static_cast<double>(max_context_) * threshold_fraction_) {
        return MiddlewareResult::proceed();
    }
    warned_ = true;
    const auto percent = static_cast<int>(static_cast<double>(used) * 100.0 /
                                          static_cast<double>(max_context_));
    return MiddlewareResult::inject("<sous_warning>You have used " + std::to_string(percent) +
                                    "% of your total context (" + std::to_string(used) + "/" +
                                    std::to_string(max_context_) +
                                    " tokens)</sous_warning>");
}

void ContextWarningMiddleware::reset(const ResetReason reason) {
    static_cast<void>(reason);
    warned_ = false;
}

MiddlewarePipeline build_default_pipeline(const core::config::RuntimeConfig& config) {
    MiddlewarePipeline pipeline;
    if (config.max_turns.has_value()) {
        pipeline.add(std::make_unique<TurnLimitMiddleware>(config.max_turns.value()));
    }
    if (config.max_price.has_value()) {
        pipeline.add(std::make_unique<PriceLimitMiddleware>(config.max_price.value()));
    }
    if (config.auto_compact_threshold > 0) {
        pipeline.add(std::make_unique<AutoCompactMiddleware>(config.auto_compact_threshold));
    }
    if (config.context_warnings) {
        pipeline.add(std::make_unique<ContextWarningMiddleware>(config.auto_compact_threshold));
    }
    return pipeline;
}

}  // namespace sous::middleware
