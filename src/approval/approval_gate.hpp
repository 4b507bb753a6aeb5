#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/agent_errors.hpp"

namespace sous::approval {

enum class Verdict {
    Yes,
    No,
    Always
};

std::string to_string(Verdict verdict);

struct ApprovalResponse {
    Verdict verdict = Verdict::No;
    std::optional<std::string> message;
};

struct PendingApproval {
    std::string correlation_id;
    std::string tool_name;
    std::string arguments;
    std::chrono::steady_clock::time_point created_at;
};

// Notifies the external confirmation channel. Returning an error (or
// throwing) resolves the request as NO.
using ApprovalNotifier = std::function<core::errors::Status(const PendingApproval&)>;

// Correlation table of one-shot result channels. request_approval registers an
// entry and notifies the channel; resolve completes it exactly once; wait
// blocks the turn until then.
class ApprovalGate {
public:
    explicit ApprovalGate(ApprovalNotifier notifier = nullptr);

    void set_notifier(ApprovalNotifier notifier);

    core::errors::Status request_approval(const std::string& tool_name,
                                          const std::string& arguments,
                                          const std::string& correlation_id);

    // timeout_ms == 0 waits until resolved. On timeout the entry is removed
    // and the result is NO with an expiry message.
    core::errors::Result<ApprovalResponse> wait(const std::string& correlation_id,
                                                std::uint32_t timeout_ms = 0);

    // False for unknown or already-resolved ids; never throws.
    bool resolve(const std::string& correlation_id, Verdict verdict,
                 std::optional<std::string> message = std::nullopt);

    // Answers NO to unresolved requests older than `ttl`. Resolved entries are
    // kept for wait().
    std::size_t expire_older_than(std::chrono::milliseconds ttl);
    std::size_t cancel_all(const std::string& reason);

    std::size_t pending_count() const;
    std::vector<PendingApproval> pending() const;

private:
    struct Slot {
        PendingApproval request;
        std::promise<ApprovalResponse> promise;
        std::shared_future<ApprovalResponse> future;
        bool resolved = false;
    };

    bool resolve_locked(const std::string& correlation_id, ApprovalResponse response);

    mutable std::mutex mutex_;
    ApprovalNotifier notifier_;
    std::map<std::string, std::shared_ptr<Slot>> slots_;
};

}  // namespace sous::approval
