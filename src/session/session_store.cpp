#include "session/session_store.hpp"

#include <cctype>
#include <chrono>
#include <fstream>
#include <optional>
#include <sstream>
#include <system_error>
#include <utility>
#include <nlohmann/json.hpp>
#include "core/logging/logger.hpp"
#include "protocol/message_json.hpp"

namespace sous::session {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

constexpr const char* kFilePrefix = "session_";
constexpr const char* kFileSuffix = ".json";

bool is_valid_session_id(const std::string& id) {
    if (id.empty()) {
        return false;
    }
    for (const char c : id) {
        const auto u = static_cast<unsigned char>(c);
        if (std::isalnum(u) == 0 && c != '-' && c != '_') {
            return false;
        }
    }
    return true;
}

json stats_to_json(const SessionStats& stats) {
    json payload;
    payload["turns"] = stats.turns;
    payload["session_prompt_tokens"] = stats.session_prompt_tokens;
    payload["session_completion_tokens"] = stats.session_completion_tokens;
    payload["last_turn_prompt_tokens"] = stats.last_turn_prompt_tokens;
    payload["last_turn_completion_tokens"] = stats.last_turn_completion_tokens;
    payload["context_tokens"] = stats.context_tokens;
    payload["last_turn_duration_ms"] = stats.last_turn_duration_ms;
    payload["tool_calls_agreed"] = stats.tool_calls_agreed;
    payload["tool_calls_rejected"] = stats.tool_calls_rejected;
    payload["tool_calls_succeeded"] = stats.tool_calls_succeeded;
    payload["tool_calls_failed"] = stats.tool_calls_failed;
    payload["input_price_per_million"] = stats.input_price_per_million;
    payload["output_price_per_million"] = stats.output_price_per_million;
    payload["session_cost"] = stats.session_cost();
    return payload;
}

SessionStats stats_from_json(const json& payload) {
    SessionStats stats;
    stats.turns = payload.value("turns", 0);
    stats.session_prompt_tokens = payload.value("session_prompt_tokens", std::int64_t{0});
    stats.session_completion_tokens =
        payload.value("session_completion_tokens", std::int64_t{0});
    stats.last_turn_prompt_tokens = payload.value("last_turn_prompt_tokens", std::int64_t{0});
    stats.last_turn_completion_tokens =
        payload.value("last_turn_completion_tokens", std::int64_t{0});
    stats.context_tokens = payload.value("context_tokens", std::int64_t{0});
    stats.last_turn_duration_ms = payload.value("last_turn_duration_ms", 0.0);
    stats.tool_calls_agreed = payload.value("tool_calls_agreed", 0);
    stats.tool_calls_rejected = payload.value("tool_calls_rejected", 0);
    stats.tool_calls_succeeded = payload.value("tool_calls_succeeded", 0);
    stats.tool_calls_failed = payload.value("tool_calls_failed", 0);
    stats.input_price_per_million = payload.value("input_price_per_million", 0.0);
    stats.output_price_per_million = payload.value("output_price_per_million", 0.0);
    return stats;
}

}  // namespace

std::int64_t now_unix_ms() {
    const auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch())
        .count();
}

JsonSessionStore::JsonSessionStore(std::filesystem::path log_dir)
    : log_dir_(std::move(log_dir)) {}

core::errors::Result<std::filesystem::path> JsonSessionStore::session_path(
    const std::string& session_id) const {
    if (!is_valid_session_id(session_id)) {
        return AgentError{ErrorCategory::Input, "Invalid session id: '" + session_id + "'",
                          "invalid_session_id"};
    }
    return log_dir_ / (kFilePrefix + session_id + kFileSuffix);
}

core::errors::Status JsonSessionStore::save_interaction(const SessionSnapshot& snapshot) {
    auto path_result = session_path(snapshot.session_id);
    if (core::errors::is_error(path_result)) {
        return core::errors::get_error(path_result);
    }
    const auto path = core::errors::get_value(path_result);

    std::error_code ec;
    std::filesystem::create_directories(log_dir_, ec);
    if (ec) {
        return AgentError{ErrorCategory::Internal,
                          "Unable to create session log directory: " + log_dir_.string(),
                          "session_dir_create_failed"};
    }

    json metadata;
    metadata["session_id"] = snapshot.session_id;
    metadata["saved_at_ms"] = snapshot.saved_at_ms;
    metadata["mode"] = snapshot.mode;
    metadata["auto_approve"] = snapshot.auto_approve;
    metadata["tools"] = snapshot.tool_names;
    metadata["workdir"] = snapshot.workdir;
    metadata["stats"] = stats_to_json(snapshot.stats);
    if (!snapshot.mode_state_json.empty()) {
        metadata["mode_state"] = json::parse(snapshot.mode_state_json, nullptr, false);
    }

    json messages = json::array();
    for (const auto& message : snapshot.messages) {
        messages.push_back(protocol::message_to_json(message));
    }

    json document;
    document["metadata"] = metadata;
    document["messages"] = messages;

    const auto temp_path = path.string() + ".tmp";
    {
        std::ofstream out(temp_path, std::ios::trunc);
        if (!out.is_open()) {
            return AgentError{ErrorCategory::Internal,
                              "Unable to open session file: " + temp_path,
                              "session_open_failed"};
        }
        // Malformed UTF-8 is written as U+FFFD.
        out << document.dump(2, ' ', false, json::error_handler_t::replace) << "\n";
        if (!out.good()) {
            return AgentError{ErrorCategory::Internal,
                              "Unable to write session file: " + temp_path,
                              "session_write_failed"};
        }
    }
    std::filesystem::rename(temp_path, path, ec);
    if (ec) {
        std::filesystem::remove(temp_path, ec);
        return AgentError{ErrorCategory::Internal,
                          "Unable to move session file into place: " + path.string(),
                          "session_write_failed"};
    }
    return core::errors::ok();
}

core::errors::Result<SessionSnapshot> JsonSessionStore::read_file(
    const std::filesystem::path& path) const {
    std::ifstream in(path);
    if (!in.is_open()) {
        return AgentError{ErrorCategory::Input, "Session file not found: " + path.string(),
                          "session_not_found"};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();

    try {
        const json document = json::parse(buffer.str());
        const json& metadata = document.at("metadata");

        SessionSnapshot snapshot;
        snapshot.session_id = metadata.at("session_id").get<std::string>();
        snapshot.saved_at_ms = metadata.value("saved_at_ms", std::int64_t{0});
        snapshot.mode = metadata.value("mode", std::string{});
        snapshot.auto_approve = metadata.value("auto_approve", false);
        snapshot.tool_names = metadata.value("tools", std::vector<std::string>{});
        snapshot.workdir = metadata.value("workdir", std::string{});
        if (metadata.contains("mode_state")) {
            snapshot.mode_state_json = metadata.at("mode_state").dump();
        }
        if (metadata.contains("stats")) {
            snapshot.stats = stats_from_json(metadata.at("stats"));
        }
        for (const auto& node : document.at("messages")) {
            auto message = protocol::message_from_json(node);
            if (core::errors::is_error(message)) {
                return core::errors::get_error(message);
            }
            snapshot.messages.push_back(core::errors::get_value(message));
        }
        return snapshot;
    } catch (const json::exception& e) {
        return AgentError{ErrorCategory::Input,
                          "Corrupt session file " + path.string() + ": " + e.what(),
                          "session_corrupt"};
    }
}

core::errors::Result<SessionSnapshot> JsonSessionStore::load_session(
    const std::string& session_id) const {
    auto path = session_path(session_id);
    if (core::errors::is_error(path)) {
        return core::errors::get_error(path);
    }
    return read_file(core::errors::get_value(path));
}

core::errors::Result<SessionSnapshot> JsonSessionStore::find_latest_session() const {
    std::error_code ec;
    if (!std::filesystem::is_directory(log_dir_, ec)) {
        return AgentError{ErrorCategory::Input,
                          "No saved sessions in " + log_dir_.string(), "session_not_found"};
    }

    std::optional<SessionSnapshot> latest;
    for (const auto& entry : std::filesystem::directory_iterator(log_dir_, ec)) {
        const std::string file_name = entry.path().filename().string();
        if (file_name.rfind(kFilePrefix, 0) != 0 || entry.path().extension() != kFileSuffix) {
            continue;
        }
        auto snapshot = read_file(entry.path());
        if (core::errors::is_error(snapshot)) {
            SOUS_LOG_WARN("Skipping unreadable session file: " +
                          core::errors::get_error(snapshot).message);
            continue;
        }
        const auto& candidate = core::errors::get_value(snapshot);
        if (!latest.has_value() || candidate.saved_at_ms > latest->saved_at_ms) {
            latest = candidate;
        }
    }
    if (!latest.has_value()) {
        return AgentError{ErrorCategory::Input,
                          "No saved sessions in " + log_dir_.string(), "session_not_found"};
    }
    return latest.value();
}

}  // namespace sous::session
