#include "policy/mode_policy.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <nlohmann/json.hpp>
#include "policy/write_classifier.hpp"

namespace sous::policy {

using core::errors::AgentError;
using core::errors::ErrorCategory;

namespace {

const std::map<Mode, ModeConfig>& mode_configs() {
    static const std::map<Mode, ModeConfig> configs = {
        {Mode::Plan,
         {false, true, "[plan]", "Research and planning only. No changes until approved.",
          "<active_mode>PLAN MODE</active_mode>\n"
          "Use read-only tools only. Do not write, modify or delete files.\n"
          "Produce a detailed implementation plan and wait for explicit approval."}},
        {Mode::Normal,
         {false, false, "[normal]", "Ask before executing any tool.",
          "<active_mode>NORMAL MODE</active_mode>\n"
          "Every tool call is confirmed by the user before it runs."}},
        {Mode::Auto,
         {true, false, "[auto]", "Auto-approve all tool executions.",
          "<active_mode>AUTO MODE</active_mode>\n"
          "Tools run without confirmation. Explain each change as you make it."}},
        {Mode::Yolo,
         {true, false, "[yolo]", "Maximum speed, minimal output, auto-approve everything.",
          "<active_mode>YOLO MODE</active_mode>\n"
          "Tools run without confirmation. Keep responses as short as possible."}},
        {Mode::Architect,
         {false, true, "[architect]", "High-level design. Architecture, not implementation.",
          "<active_mode>ARCHITECT MODE</active_mode>\n"
          "Reason about structure and interfaces. Do not modify files."}},
    };
    return configs;
}

std::string uppercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return value;
}

std::int64_t to_unix_ms(const std::chrono::system_clock::time_point at) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(at.time_since_epoch())
        .count();
}

}  // namespace

std::string to_string(const Mode mode) {
    switch (mode) {
        case Mode::Plan:
            return "plan";
        case Mode::Normal:
            return "normal";
        case Mode::Auto:
            return "auto";
        case Mode::Yolo:
            return "yolo";
        case Mode::Architect:
            return "architect";
        default:
            return "unknown";
    }
}

const ModeConfig& mode_config(const Mode mode) {
    return mode_configs().at(mode);
}

const std::vector<Mode>& mode_cycle_order() {
    static const std::vector<Mode> order = {Mode::Normal, Mode::Auto, Mode::Plan, Mode::Yolo,
                                            Mode::Architect};
    return order;
}

core::errors::Result<Mode> parse_mode(const std::string& name) {
    std::string normalized;
    for (const char c : name) {
        if (std::isspace(static_cast<unsigned char>(c)) == 0) {
            normalized.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
    }
    std::string valid;
    for (const Mode mode : mode_cycle_order()) {
        if (to_string(mode) == normalized) {
            return mode;
        }
        valid += (valid.empty() ? "" : ", ") + to_string(mode);
    }
    return AgentError{ErrorCategory::Input,
                      "Unknown mode '" + name + "'. Valid modes: " + valid + ".",
                      "unknown_mode"};
}

ModePolicy::ModePolicy(const Mode initial) : mode_(initial) {
    std::lock_guard<std::mutex> lock(mutex_);
    apply_locked(initial);
}

void ModePolicy::apply_locked(const Mode mode) {
    const auto& config = mode_config(mode);
    mode_ = mode;
    auto_approve_ = config.auto_approve;
    read_only_ = config.read_only;
    history_.push_back(ModeTransition{mode, std::chrono::system_clock::now()});
    while (history_.size() > kMaxHistory) {
        history_.pop_front();
    }
}

Mode ModePolicy::current_mode() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return mode_;
}

bool ModePolicy::auto_approve() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return auto_approve_;
}

bool ModePolicy::read_only() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return read_only_;
}

void ModePolicy::set_mode(const Mode mode) {
    std::lock_guard<std::mutex> lock(mutex_);
    apply_locked(mode);
}

core::errors::Result<Mode> ModePolicy::set_mode_from_name(const std::string& name) {
    auto parsed = parse_mode(name);
    if (core::errors::is_error(parsed)) {
        return core::errors::get_error(parsed);
    }
    set_mode(core::errors::get_value(parsed));
    return parsed;
}

std::pair<Mode, Mode> ModePolicy::cycle_mode() {
    std::lock_guard<std::mutex> lock(mutex_);
    const Mode old_mode = mode_;
    const auto& order = mode_cycle_order();
    auto it = std::find(order.begin(), order.end(), old_mode);
    std::size_t next = 0;
    if (it != order.end()) {
        next = (static_cast<std::size_t>(it - order.begin()) + 1) % order.size();
    }
    apply_locked(order[next]);
    return {old_mode, order[next]};
}

void ModePolicy::force_auto_approve(const bool value) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto_approve_ = value;
}

std::vector<ModeTransition> ModePolicy::history() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<ModeTransition>(history_.begin(), history_.end());
}

bool ModePolicy::should_auto_approve(const std::string& tool_name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto_approve_) {
        return true;
    }
    if (read_only_) {
        return read_only_tools().count(tool_name) > 0;
    }
    return false;
}

bool ModePolicy::is_write_operation(const std::string& tool_name,
                                    const std::string& arguments_json) const {
    return policy::is_write_operation(tool_name, arguments_json);
}

BlockDecision ModePolicy::should_block(const std::string& tool_name,
                                       const std::string& arguments_json) const {
    Mode mode = Mode::Normal;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!read_only_) {
            return {};
        }
        mode = mode_;
    }
    if (!is_write_operation(tool_name, arguments_json)) {
        return {};
    }

    const std::string mode_name = uppercase(to_string(mode));
    BlockDecision decision;
    decision.blocked = true;
    decision.reason = "Tool '" + tool_name + "' blocked in " + mode_name +
                      " mode: this operation would modify files and " + mode_name +
                      " mode is read-only. Switch to NORMAL or AUTO mode to run it, "
                      "or add the change to the plan instead.";
    return decision;
}

std::string ModePolicy::indicator() const {
    return mode_config(current_mode()).indicator;
}

std::string ModePolicy::prompt_modifier() const {
    return mode_config(current_mode()).prompt_modifier;
}

std::string ModePolicy::transition_message(const Mode from, const Mode to) const {
    return "Mode: " + uppercase(to_string(from)) + " -> " + uppercase(to_string(to)) + "\n" +
           mode_config(to).indicator + " " + mode_config(to).description;
}

std::string ModePolicy::snapshot_json() const {
    std::lock_guard<std::mutex> lock(mutex_);
    nlohmann::json snapshot;
    snapshot["current_mode"] = to_string(mode_);
    snapshot["auto_approve"] = auto_approve_;
    snapshot["read_only"] = read_only_;
    nlohmann::json history = nlohmann::json::array();
    for (const auto& entry : history_) {
        history.push_back({{"mode", to_string(entry.mode)}, {"at_ms", to_unix_ms(entry.at)}});
    }
    snapshot["history"] = history;
    return snapshot.dump();
}

}  // namespace sous::policy
