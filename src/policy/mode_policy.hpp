#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "core/errors/agent_errors.hpp"

namespace sous::policy {

enum class Mode {
    Plan,
    Normal,
    Auto,
    Yolo,
    Architect
};

struct ModeConfig {
    bool auto_approve = false;
    bool read_only = false;
    std::string indicator;
    std::string description;
    std::string prompt_modifier;
};

struct ModeTransition {
    Mode mode;
    std::chrono::system_clock::time_point at;
};

struct BlockDecision {
    bool blocked = false;
    std::string reason;
};

std::string to_string(Mode mode);
const ModeConfig& mode_config(Mode mode);
const std::vector<Mode>& mode_cycle_order();

// Case-insensitive; fails with unknown_mode listing the valid names.
core::errors::Result<Mode> parse_mode(const std::string& name);

// Current mode plus derived flags. Every transition is timestamped into a
// bounded history. All methods are safe to call from concurrent tool dispatch.
class ModePolicy {
public:
    static constexpr std::size_t kMaxHistory = 100;

    explicit ModePolicy(Mode initial = Mode::Normal);

    Mode current_mode() const;
    bool auto_approve() const;
    bool read_only() const;

    void set_mode(Mode mode);
    core::errors::Result<Mode> set_mode_from_name(const std::string& name);
    // Returns {old, new}.
    std::pair<Mode, Mode> cycle_mode();

    // Overrides the auto_approve flag without a transition. The next
    // set_mode/cycle_mode recomputes it from the mode config.
    void force_auto_approve(bool value);

    std::vector<ModeTransition> history() const;

    bool should_auto_approve(const std::string& tool_name) const;
    bool is_write_operation(const std::string& tool_name,
                            const std::string& arguments_json) const;
    BlockDecision should_block(const std::string& tool_name,
                               const std::string& arguments_json) const;

    std::string indicator() const;
    std::string prompt_modifier() const;
    std::string transition_message(Mode from, Mode to) const;

    // {"current_mode", "auto_approve", "read_only", "history": [{mode, at_ms}]}
    std::string snapshot_json() const;

private:
    void apply_locked(Mode mode);

    mutable std::mutex mutex_;
    Mode mode_;
    bool auto_approve_ = false;
    bool read_only_ = false;
    std::deque<ModeTransition> history_;
};

}  // namespace sous::policy
