#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include "core/errors/agent_errors.hpp"
#include "protocol/message_contract.hpp"
#include "session/session_stats.hpp"

namespace sous::session {

// Everything needed to resume a session later.
struct SessionSnapshot {
    std::string session_id;
    std::int64_t saved_at_ms = 0;
    std::string mode;
    bool auto_approve = false;
    std::vector<std::string> tool_names;
    std::string workdir;
    std::string mode_state_json;
    SessionStats stats;
    std::vector<protocol::Message> messages;
};

class SessionPersistence {
public:
    virtual ~SessionPersistence() = default;

    virtual core::errors::Status save_interaction(const SessionSnapshot& snapshot) = 0;
    virtual core::errors::Result<SessionSnapshot> load_session(
        const std::string& session_id) const = 0;
    virtual core::errors::Result<SessionSnapshot> find_latest_session() const = 0;
};

// One session_<id>.json per session under `log_dir`, rewritten atomically on
// every save.
class JsonSessionStore : public SessionPersistence {
public:
    explicit JsonSessionStore(std::filesystem::path log_dir);

    core::errors::Status save_interaction(const SessionSnapshot& snapshot) override;
    core::errors::Result<SessionSnapshot> load_session(
        const std::string& session_id) const override;
    core::errors::Result<SessionSnapshot> find_latest_session() const override;

    core::errors::Result<std::filesystem::path> session_path(
        const std::string& session_id) const;

private:
    core::errors::Result<SessionSnapshot> read_file(const std::filesystem::path& path) const;

    std::filesystem::path log_dir_;
};

std::int64_t now_unix_ms();

}  // namespace sous::session
