#pragma once

#include <string>
#include <vector>

namespace sous::policy {

// Structural view of a shell command line. Quote-aware but lenient: an
// unbalanced quote never fails, it simply runs to the end of the text.
struct ShellAnalysis {
    std::vector<std::string> segments;       // split on ; && || | & and newlines
    std::vector<std::string> substitutions;  // bodies of $(...), `...`, <(...), >(...)
    bool has_chaining = false;
    bool has_substitution = false;
    bool has_redirection = false;
    bool has_write_redirection = false;      // a redirect not aimed at /dev/null or an fd
};

ShellAnalysis analyze_shell_command(const std::string& command);

// Words of one segment with quotes removed. Leading NAME=value assignments
// are dropped so "FOO=1 rm x" yields {"rm", "x"}.
std::vector<std::string> segment_words(const std::string& segment);

// Re-joins segment_words with single spaces and strips the directory from the
// first word, giving a canonical form for prefix matching.
std::string normalize_segment(const std::string& segment);

}  // namespace sous::policy
