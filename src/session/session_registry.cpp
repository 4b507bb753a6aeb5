#include "session/session_registry.hpp"

#include <utility>
#include "core/config/ids.hpp"
#include "core/logging/logger.hpp"

namespace sous::session {

using core::errors::AgentError;
using core::errors::ErrorCategory;

namespace {

AgentError not_found(const std::string& session_id) {
    return AgentError{ErrorCategory::Input, "Session not found: " + session_id,
                      "session_not_found"};
}

}  // namespace

std::string to_string(const SessionState state) {
    switch (state) {
        case SessionState::Idle:
            return "idle";
        case SessionState::Running:
            return "running";
        case SessionState::Cancelled:
            return "cancelled";
        case SessionState::Closed:
            return "closed";
        default:
            return "unknown";
    }
}

core::errors::Result<std::string> SessionRegistry::open_session(
    const std::optional<std::string>& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (session_id.has_value()) {
        if (sessions_.count(session_id.value()) > 0) {
            return AgentError{ErrorCategory::Input,
                              "Session already open: " + session_id.value(),
                              "session_exists"};
        }
        sessions_.emplace(session_id.value(),
                          SessionRecord{session_id.value(), SessionState::Idle,
                                        std::make_shared<std::atomic_bool>(false)});
        return session_id.value();
    }

    constexpr int kMaxAttempts = 16;
    for (int attempt = 0; attempt < kMaxAttempts; ++attempt) {
        const std::string id = core::config::generate_session_id();
        if (sessions_.count(id) > 0) {
            continue;
        }
        sessions_.emplace(id, SessionRecord{id, SessionState::Idle,
                                            std::make_shared<std::atomic_bool>(false)});
        SOUS_LOG_DEBUG("SessionRegistry: opened " + id);
        return id;
    }
    return AgentError{ErrorCategory::Internal, "Unable to allocate unique session ID.",
                      "session_id_generation_failed"};
}

core::errors::Result<std::shared_ptr<std::atomic_bool>> SessionRegistry::begin_turn(
    const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return not_found(session_id);
    }
    auto& record = it->second;
    if (record.state == SessionState::Running) {
        return AgentError{ErrorCategory::Input,
                          "A turn is already running for session " + session_id,
                          "turn_in_progress", "Wait for it to finish or cancel it."};
    }
    if (record.state == SessionState::Closed) {
        return AgentError{ErrorCategory::Input, "Session is closed: " + session_id,
                          "session_closed"};
    }
    // Each turn gets a fresh token so an old cancel cannot leak into it.
    record.cancel_token = std::make_shared<std::atomic_bool>(false);
    record.state = SessionState::Running;
    return record.cancel_token;
}

core::errors::Result<SessionState> SessionRegistry::end_turn(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return not_found(session_id);
    }
    if (it->second.state == SessionState::Running) {
        it->second.state = SessionState::Idle;
    }
    return it->second.state;
}

core::errors::Result<SessionState> SessionRegistry::cancel(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return not_found(session_id);
    }
    auto& record = it->second;
    if (record.state != SessionState::Running) {
        return AgentError{ErrorCategory::Input,
                          "No running turn to cancel (state: " + to_string(record.state) +
                              ")",
                          "invalid_state_transition"};
    }
    record.cancel_token->store(true);
    record.state = SessionState::Cancelled;
    SOUS_LOG_INFO("SessionRegistry: session " + session_id + " running -> cancelled");
    return record.state;
}

core::errors::Result<SessionState> SessionRegistry::close(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return not_found(session_id);
    }
    it->second.cancel_token->store(true);
    it->second.state = SessionState::Closed;
    return it->second.state;
}

core::errors::Result<SessionState> SessionRegistry::state(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return not_found(session_id);
    }
    return it->second.state;
}

core::errors::Result<std::shared_ptr<std::atomic_bool>> SessionRegistry::cancel_token(
    const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return not_found(session_id);
    }
    return it->second.cancel_token;
}

std::size_t SessionRegistry::session_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

}  // namespace sous::session
