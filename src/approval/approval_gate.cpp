#include "approval/approval_gate.hpp"

#include <exception>
#include <utility>
#include "core/logging/logger.hpp"

namespace sous::approval {

using core::errors::AgentError;
using core::errors::ErrorCategory;

std::string to_string(const Verdict verdict) {
    switch (verdict) {
        case Verdict::Yes:
            return "yes";
        case Verdict::No:
            return "no";
        case Verdict::Always:
            return "always";
        default:
            return "unknown";
    }
}

ApprovalGate::ApprovalGate(ApprovalNotifier notifier) : notifier_(std::move(notifier)) {}

void ApprovalGate::set_notifier(ApprovalNotifier notifier) {
    std::lock_guard<std::mutex> lock(mutex_);
    notifier_ = std::move(notifier);
}

core::errors::Status ApprovalGate::request_approval(const std::string& tool_name,
                                                    const std::string& arguments,
                                                    const std::string& correlation_id) {
    if (correlation_id.empty()) {
        return AgentError{ErrorCategory::Input, "Correlation id cannot be empty.",
                          "invalid_correlation_id"};
    }

    PendingApproval request{correlation_id, tool_name, arguments,
                            std::chrono::steady_clock::now()};
    ApprovalNotifier notifier;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = slots_.find(correlation_id);
        if (it != slots_.end() && !it->second->resolved) {
            return AgentError{ErrorCategory::Internal,
                              "Approval already pending for id: " + correlation_id,
                              "duplicate_correlation_id"};
        }
        auto slot = std::make_shared<Slot>();
        slot->request = request;
        slot->future = slot->promise.get_future().share();
        slots_[correlation_id] = slot;
        notifier = notifier_;
    }

    // The callback runs unlocked so it may call resolve() directly.
    std::string failure;
    if (!notifier) {
        failure = "no approval channel is attached";
    } else {
        try {
            auto status = notifier(request);
            if (core::errors::is_error(status)) {
                failure = core::errors::get_error(status).message;
            }
        } catch (const std::exception& e) {
            failure = e.what();
        }
    }

    if (!failure.empty()) {
        SOUS_LOG_WARN("Approval notification for " + tool_name + " failed: " + failure);
        resolve(correlation_id, Verdict::No, std::string("Failed to display approval request"));
    }
    return core::errors::ok();
}

core::errors::Result<ApprovalResponse> ApprovalGate::wait(const std::string& correlation_id,
                                                          const std::uint32_t timeout_ms) {
    std::shared_ptr<Slot> slot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = slots_.find(correlation_id);
        if (it == slots_.end()) {
            return AgentError{ErrorCategory::Internal,
                              "No approval registered for id: " + correlation_id,
                              "unknown_correlation_id"};
        }
        slot = it->second;
    }

    if (timeout_ms > 0 &&
        slot->future.wait_for(std::chrono::milliseconds(timeout_ms)) !=
            std::future_status::ready) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!slot->resolved) {
            slot->resolved = true;
            slot->promise.set_value(ApprovalResponse{
                Verdict::No, "Approval request expired after " +
                                 std::to_string(timeout_ms) + " ms without an answer"});
        }
    }

    ApprovalResponse response = slot->future.get();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = slots_.find(correlation_id);
        if (it != slots_.end() && it->second == slot) {
            slots_.erase(it);
        }
    }
    return response;
}

bool ApprovalGate::resolve_locked(const std::string& correlation_id,
                                  ApprovalResponse response) {
    auto it = slots_.find(correlation_id);
    if (it == slots_.end() || it->second->resolved) {
        return false;
    }
    it->second->resolved = true;
    it->second->promise.set_value(std::move(response));
    return true;
}

bool ApprovalGate::resolve(const std::string& correlation_id, const Verdict verdict,
                           std::optional<std::string> message) {
    std::lock_guard<std::mutex> lock(mutex_);
    const bool resolved =
        resolve_locked(correlation_id, ApprovalResponse{verdict, std::move(message)});
    if (!resolved) {
        SOUS_LOG_DEBUG("Ignoring resolution for unknown or settled id: " + correlation_id);
    }
    return resolved;
}

std::size_t ApprovalGate::expire_older_than(const std::chrono::milliseconds ttl) {
    const auto now = std::chrono::steady_clock::now();
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t expired = 0;
    // Settled slots stay until wait() collects them.
    for (auto& entry : slots_) {
        auto& slot = entry.second;
        if (!slot->resolved && now - slot->request.created_at >= ttl) {
            slot->resolved = true;
            slot->promise.set_value(ApprovalResponse{
                Verdict::No, std::string("Approval request expired without an answer")});
            ++expired;
        }
    }
    return expired;
}

std::size_t ApprovalGate::cancel_all(const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t cancelled = 0;
    for (auto& entry : slots_) {
        if (resolve_locked(entry.first, ApprovalResponse{Verdict::No, reason})) {
            ++cancelled;
        }
    }
    return cancelled;
}

std::size_t ApprovalGate::pending_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t count = 0;
    for (const auto& entry : slots_) {
        if (!entry.second->resolved) {
            ++count;
        }
    }
    return count;
}

std::vector<PendingApproval> ApprovalGate::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<PendingApproval> out;
    for (const auto& entry : slots_) {
        if (!entry.second->resolved) {
            out.push_back(entry.second->request);
        }
    }
    return out;
}

}  // namespace sous::approval
