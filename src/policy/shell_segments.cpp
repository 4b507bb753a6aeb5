#include "policy/shell_segments.hpp"

#include <cctype>
#include <filesystem>

namespace sous::policy {

namespace {

std::string trim(const std::string& value) {
    std::size_t begin = 0;
    std::size_t end = value.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(value[begin])) != 0) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(value[end - 1])) != 0) --end;
    return value.substr(begin, end - begin);
}

void push_segment(std::vector<std::string>& segments, const std::string& text) {
    const std::string trimmed = trim(text);
    if (!trimmed.empty()) {
        segments.push_back(trimmed);
    }
}

bool is_assignment(const std::string& word) {
    const auto eq = word.find('=');
    if (eq == std::string::npos || eq == 0) {
        return false;
    }
    if (std::isdigit(static_cast<unsigned char>(word[0])) != 0) {
        return false;
    }
    for (std::size_t i = 0; i < eq; ++i) {
        const auto c = static_cast<unsigned char>(word[i]);
        if (std::isalnum(c) == 0 && c != '_') {
            return false;
        }
    }
    return true;
}

// Index just past the ')' that closes the '(' at `open`, honouring nesting
// and quotes. Returns text.size() when unbalanced.
std::size_t find_closing_paren(const std::string& text, const std::size_t open) {
    int depth = 0;
    char quote = '\0';
    for (std::size_t i = open; i < text.size(); ++i) {
        const char c = text[i];
        if (quote != '\0') {
            if (c == quote) quote = '\0';
            continue;
        }
        if (c == '\'' || c == '"') {
            quote = c;
        } else if (c == '(') {
            ++depth;
        } else if (c == ')') {
            if (--depth == 0) {
                return i + 1;
            }
        }
    }
    return text.size();
}

// Examines the redirect starting at `pos` (a '>'); returns the index after it.
std::size_t scan_redirection(const std::string& text, std::size_t pos, ShellAnalysis& analysis) {
    analysis.has_redirection = true;
    std::size_t i = pos + 1;
    if (i < text.size() && (text[i] == '>' || text[i] == '|')) {
        ++i;
    }
    if (i < text.size() && text[i] == '&') {
        // fd duplication such as 2>&1
        return i + 1;
    }
    while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i])) != 0) {
        ++i;
    }
    std::size_t end = i;
    while (end < text.size() && std::isspace(static_cast<unsigned char>(text[end])) == 0 &&
           text[end] != ';' && text[end] != '|' && text[end] != '&') {
        ++end;
    }
    std::string target = text.substr(i, end - i);
    if (target.size() >= 2 && (target.front() == '"' || target.front() == '\'') &&
        target.back() == target.front()) {
        target = target.substr(1, target.size() - 2);
    }
    if (target != "/dev/null") {
        analysis.has_write_redirection = true;
    }
    return end;
}

}  // namespace

ShellAnalysis analyze_shell_command(const std::string& command) {
    ShellAnalysis analysis;
    std::string current;
    char quote = '\0';

    std::size_t i = 0;
    while (i < command.size()) {
        const char c = command[i];
        const char next = i + 1 < command.size() ? command[i + 1] : '\0';

        if (quote == '\'') {
            current.push_back(c);
            if (c == '\'') quote = '\0';
            ++i;
            continue;
        }

        if (c == '\\' && i + 1 < command.size()) {
            current.push_back(c);
            current.push_back(next);
            i += 2;
            continue;
        }

        // Substitution is live both unquoted and inside double quotes.
        if ((c == '$' || c == '<' || (c == '>' && quote == '\0')) && next == '(') {
            const std::size_t end = find_closing_paren(command, i + 1);
            const bool closed = end > i + 2 && command[end - 1] == ')';
            const std::size_t body_begin = i + 2;
            const std::size_t body_end = closed ? end - 1 : command.size();
            analysis.has_substitution = true;
            analysis.substitutions.push_back(trim(command.substr(
                body_begin, body_end > body_begin ? body_end - body_begin : 0)));
            current.append(command, i, end - i);
            i = end;
            continue;
        }
        if (c == '`') {
            const auto close = command.find('`', i + 1);
            const std::size_t end = close == std::string::npos ? command.size() : close + 1;
            const std::size_t body_len =
                close == std::string::npos ? command.size() - (i + 1) : close - (i + 1);
            analysis.has_substitution = true;
            analysis.substitutions.push_back(trim(command.substr(i + 1, body_len)));
            current.append(command, i, end - i);
            i = end;
            continue;
        }

        if (quote == '"') {
            current.push_back(c);
            if (c == '"') quote = '\0';
            ++i;
            continue;
        }

        if (c == '\'' || c == '"') {
            quote = c;
            current.push_back(c);
            ++i;
            continue;
        }

        if (c == ';' || c == '\n') {
            analysis.has_chaining = true;
            push_segment(analysis.segments, current);
            current.clear();
            ++i;
            continue;
        }
        if ((c == '&' && next == '&') || (c == '|' && next == '|')) {
            analysis.has_chaining = true;
            push_segment(analysis.segments, current);
            current.clear();
            i += 2;
            continue;
        }
        if (c == '|') {
            analysis.has_chaining = true;
            push_segment(analysis.segments, current);
            current.clear();
            ++i;
            continue;
        }
        if (c == '&') {
            // Part of a redirect such as &> or >&; otherwise backgrounding.
            if (next == '>') {
                current.push_back(c);
                ++i;
                continue;
            }
            analysis.has_chaining = true;
            push_segment(analysis.segments, current);
            current.clear();
            ++i;
            continue;
        }
        if (c == '>') {
            const std::size_t end = scan_redirection(command, i, analysis);
            current.append(command, i, end - i);
            i = end;
            continue;
        }
        if (c == '<') {
            analysis.has_redirection = true;
        }

        current.push_back(c);
        ++i;
    }
    push_segment(analysis.segments, current);
    return analysis;
}

std::vector<std::string> segment_words(const std::string& segment) {
    std::vector<std::string> words;
    std::string current;
    bool in_word = false;
    char quote = '\0';

    for (std::size_t i = 0; i < segment.size(); ++i) {
        const char c = segment[i];
        if (quote != '\0') {
            if (c == quote) {
                quote = '\0';
            } else {
                current.push_back(c);
            }
            continue;
        }
        if (c == '\'' || c == '"') {
            quote = c;
            in_word = true;
        } else if (c == '\\' && i + 1 < segment.size()) {
            current.push_back(segment[++i]);
            in_word = true;
        } else if (std::isspace(static_cast<unsigned char>(c)) != 0) {
            if (in_word) {
                words.push_back(current);
                current.clear();
                in_word = false;
            }
        } else {
            current.push_back(c);
            in_word = true;
        }
    }
    if (in_word) {
        words.push_back(current);
    }

    std::size_t first = 0;
    while (first < words.size() && is_assignment(words[first])) {
        ++first;
    }
    return std::vector<std::string>(words.begin() + static_cast<std::ptrdiff_t>(first),
                                    words.end());
}

std::string normalize_segment(const std::string& segment) {
    auto words = segment_words(segment);
    if (words.empty()) {
        return "";
    }
    if (words.front().find('/') != std::string::npos) {
        const auto base = std::filesystem::path(words.front()).filename().string();
        if (!base.empty()) {
            words.front() = base;
        }
    }
    std::string joined;
    for (const auto& word : words) {
        if (!joined.empty()) joined.push_back(' ');
        joined += word;
    }
    return joined;
}

}  // namespace sous::policy
