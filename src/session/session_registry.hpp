#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include "core/errors/agent_errors.hpp"

namespace sous::session {

enum class SessionState {
    Idle,
    Running,
    Cancelled,
    Closed
};

std::string to_string(SessionState state);

struct SessionRecord {
    std::string session_id;
    SessionState state = SessionState::Idle;
    std::shared_ptr<std::atomic_bool> cancel_token;
};

// Tracks live sessions for front ends that drive several conversations.
// At most one turn runs per session at a time.
class SessionRegistry {
public:
    // Registers `session_id`, or a fresh id when none is given.
    core::errors::Result<std::string> open_session(
        const std::optional<std::string>& session_id = std::nullopt);

    // Idle/Cancelled -> Running. Rejects a second concurrent turn.
    core::errors::Result<std::shared_ptr<std::atomic_bool>> begin_turn(
        const std::string& session_id);
    core::errors::Result<SessionState> end_turn(const std::string& session_id);

    core::errors::Result<SessionState> cancel(const std::string& session_id);
    core::errors::Result<SessionState> close(const std::string& session_id);

    core::errors::Result<SessionState> state(const std::string& session_id) const;
    core::errors::Result<std::shared_ptr<std::atomic_bool>> cancel_token(
        const std::string& session_id) const;

    std::size_t session_count() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, SessionRecord> sessions_;
};

}  // namespace sous::session
