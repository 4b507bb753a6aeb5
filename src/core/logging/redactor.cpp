#include "core/logging/redactor.hpp"

#include <regex>
#include <vector>

namespace sous::core::logging {

namespace {

constexpr const char* kRedacted = "***REDACTED***";

struct LabelledPattern {
    std::regex pattern;
    bool keep_label;
};

const std::vector<LabelledPattern>& secret_patterns() {
    static const std::vector<LabelledPattern> patterns = {
        {std::regex(R"((api[_-]?key["'\s]*[:=]["'\s]*)([A-Za-z0-9_\-]{16,}))",
                    std::regex::icase),
         true},
        {std::regex(R"((bearer[\s:=]+)([A-Za-z0-9._\-]{16,}))", std::regex::icase),
         true},
        {std::regex(R"((pass(?:word|wd)?["'\s]*[:=]["'\s]*)([^"'\s]{6,}))",
                    std::regex::icase),
         true},
        {std::regex(R"(()(sk-[A-Za-z0-9_\-]{20,}))"), true},
        {std::regex(R"(()(ghp_[A-Za-z0-9]{36}))"), true},
    };
    return patterns;
}

const std::regex& url_credentials_pattern() {
    static const std::regex pattern(R"((https?://)[^:@/\s]+:[^:@/\s]+@)",
                                    std::regex::icase);
    return pattern;
}

}  // namespace

std::string redact_secrets(const std::string& text) {
    std::string redacted = text;
    for (const auto& entry : secret_patterns()) {
        redacted = std::regex_replace(redacted, entry.pattern,
                                      std::string("$1") + kRedacted);
    }
    redacted = std::regex_replace(redacted, url_credentials_pattern(), "$1***@");
    return redacted;
}

}  // namespace sous::core::logging
