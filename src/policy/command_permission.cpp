#include "policy/command_permission.hpp"

#include <algorithm>
#include <cctype>
#include <utility>
#include "policy/shell_segments.hpp"

namespace sous::policy {

using protocol::ToolPermission;

namespace {

// Prefix match on a word boundary: "ls" matches "ls -la" but not "lsblk".
bool matches_prefix(const std::string& segment, const std::string& pattern) {
    if (pattern.empty() || segment.rfind(pattern, 0) != 0) {
        return false;
    }
    if (segment.size() == pattern.size()) {
        return true;
    }
    const auto last = static_cast<unsigned char>(pattern.back());
    if (std::isalnum(last) == 0 && last != '_' && last != '-') {
        return true;
    }
    return std::isspace(static_cast<unsigned char>(segment[pattern.size()])) != 0;
}

}  // namespace

CommandPermissionClassifier::CommandPermissionClassifier(
    core::config::BashPermissionConfig config)
    : config_(std::move(config)) {}

bool CommandPermissionClassifier::is_denied(const std::string& segment) const {
    const std::string normalized = normalize_segment(segment);
    const auto hits = [&](const std::string& pattern) {
        return matches_prefix(segment, pattern) || matches_prefix(normalized, pattern);
    };
    if (std::any_of(config_.denylist.begin(), config_.denylist.end(), hits)) {
        return true;
    }

    const auto words = segment_words(segment);
    if (words.size() == 1) {
        const std::string& program = normalized;
        return std::find(config_.denylist_standalone.begin(),
                         config_.denylist_standalone.end(),
                         program) != config_.denylist_standalone.end();
    }
    return false;
}

bool CommandPermissionClassifier::is_allowed(const std::string& segment) const {
    return std::any_of(config_.allowlist.begin(), config_.allowlist.end(),
                       [&](const std::string& pattern) {
                           return matches_prefix(segment, pattern);
                       });
}

ToolPermission CommandPermissionClassifier::classify(const std::string& command) const {
    const auto analysis = analyze_shell_command(command);
    if (analysis.segments.empty()) {
        return ToolPermission::Ask;
    }

    for (const auto& segment : analysis.segments) {
        if (is_denied(segment)) {
            return ToolPermission::Never;
        }
    }
    for (const auto& body : analysis.substitutions) {
        if (classify(body) == ToolPermission::Never) {
            return ToolPermission::Never;
        }
    }

    if (analysis.has_substitution || analysis.has_redirection) {
        return ToolPermission::Ask;
    }

    const bool all_allowed =
        std::all_of(analysis.segments.begin(), analysis.segments.end(),
                    [&](const std::string& segment) { return is_allowed(segment); });
    return all_allowed ? ToolPermission::Always : ToolPermission::Ask;
}

}  // namespace sous::policy
