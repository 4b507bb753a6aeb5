#include "policy/write_classifier.hpp"

#include <filesystem>
#include <vector>
#include <nlohmann/json.hpp>
#include "policy/shell_segments.hpp"

namespace sous::policy {

namespace {

const std::set<std::string> kMutatingUtilities = {
    "rm", "rmdir", "mv", "cp", "touch", "mkdir", "chmod", "chown", "chgrp", "ln",
    "truncate", "dd", "tee", "install", "shred", "unlink"};

const std::set<std::string> kMutatingGitSubcommands = {
    "commit", "push", "add", "rm", "mv", "reset", "checkout", "merge", "rebase",
    "apply", "clean", "stash", "restore", "switch", "cherry-pick", "revert", "tag"};

const std::set<std::string> kPackageManagers = {"npm", "pip", "pip3", "yarn", "pnpm",
                                                "cargo"};
const std::set<std::string> kPackageMutations = {"install", "i", "uninstall", "add",
                                                 "remove", "rm"};

// Wrappers that run their arguments as a command.
const std::set<std::string> kCommandPrefixes = {"sudo", "env", "nohup", "time", "nice",
                                                "xargs", "command", "exec"};

std::string base_name(const std::string& word) {
    if (word.find('/') == std::string::npos) {
        return word;
    }
    return std::filesystem::path(word).filename().string();
}

bool is_in_place_flag(const std::string& arg) {
    if (arg.rfind("--in-place", 0) == 0) {
        return true;
    }
    if (arg.size() < 2 || arg[0] != '-' || arg[1] == '-') {
        return false;
    }
    return arg.find('i', 1) != std::string::npos;
}

std::string git_subcommand(const std::vector<std::string>& words, std::size_t start) {
    for (std::size_t i = start; i < words.size(); ++i) {
        const auto& word = words[i];
        if (word == "-C" || word == "-c" || word == "--git-dir" || word == "--work-tree") {
            ++i;
            continue;
        }
        if (!word.empty() && word[0] == '-') {
            continue;
        }
        return word;
    }
    return "";
}

bool is_write_segment(const std::string& segment) {
    const auto words = segment_words(segment);
    std::size_t first = 0;
    while (first < words.size() && kCommandPrefixes.count(base_name(words[first])) > 0) {
        ++first;
        // env may carry its own assignments
        while (first < words.size() && words[first].find('=') != std::string::npos &&
               words[first][0] != '-') {
            ++first;
        }
    }
    if (first >= words.size()) {
        return false;
    }

    const std::string program = base_name(words[first]);
    if (kMutatingUtilities.count(program) > 0) {
        return true;
    }
    if (program == "sed" || program == "perl") {
        for (std::size_t i = first + 1; i < words.size(); ++i) {
            if (is_in_place_flag(words[i])) {
                return true;
            }
        }
        return false;
    }
    if (program == "git") {
        return kMutatingGitSubcommands.count(git_subcommand(words, first + 1)) > 0;
    }
    if (kPackageManagers.count(program) > 0 && first + 1 < words.size()) {
        return kPackageMutations.count(words[first + 1]) > 0;
    }
    return false;
}

}  // namespace

const std::set<std::string>& read_only_tools() {
    static const std::set<std::string> tools = {"read_file", "grep",    "list_files",
                                                "git_status", "git_log", "git_diff"};
    return tools;
}

const std::set<std::string>& write_tools() {
    static const std::set<std::string> tools = {"write_file", "search_replace", "create_file",
                                                "delete_file", "apply_patch"};
    return tools;
}

const std::set<std::string>& command_tools() {
    static const std::set<std::string> tools = {"bash"};
    return tools;
}

std::optional<std::string> extract_command(const std::string& arguments_json) {
    const auto doc = nlohmann::json::parse(arguments_json, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return std::nullopt;
    }
    auto it = doc.find("command");
    if (it == doc.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

bool is_write_command(const std::string& command) {
    const auto analysis = analyze_shell_command(command);
    if (analysis.has_write_redirection) {
        return true;
    }
    for (const auto& segment : analysis.segments) {
        if (is_write_segment(segment)) {
            return true;
        }
    }
    for (const auto& body : analysis.substitutions) {
        if (is_write_command(body)) {
            return true;
        }
    }
    return false;
}

bool is_write_operation(const std::string& tool_name, const std::string& arguments_json) {
    if (write_tools().count(tool_name) > 0) {
        return true;
    }
    if (command_tools().count(tool_name) > 0) {
        const auto command = extract_command(arguments_json);
        if (!command.has_value()) {
            return true;
        }
        return is_write_command(command.value());
    }
    return false;
}

}  // namespace sous::policy
