#include "exec/command_parser.hpp"

#include <cctype>

namespace sous::exec {

using core::errors::AgentError;
using core::errors::ErrorCategory;

namespace {

AgentError syntax_error(const std::string& detail) {
    return AgentError{ErrorCategory::Input, "Invalid command syntax: " + detail,
                      "invalid_command_syntax"};
}

bool escapable_in_double_quotes(const char c) {
    return c == '\\' || c == '"' || c == '$' || c == '`' || c == '\n';
}

}  // namespace

core::errors::Result<std::vector<std::string>> split_command(const std::string& command) {
    enum class State { Outside, InWord, Single, Double };

    std::vector<std::string> words;
    std::string current;
    State state = State::Outside;

    for (std::size_t i = 0; i < command.size(); ++i) {
        const char c = command[i];
        switch (state) {
            case State::Outside:
            case State::InWord:
                if (std::isspace(static_cast<unsigned char>(c)) != 0) {
                    if (state == State::InWord) {
                        words.push_back(current);
                        current.clear();
                        state = State::Outside;
                    }
                } else if (c == '\'') {
                    state = State::Single;
                } else if (c == '"') {
                    state = State::Double;
                } else if (c == '\\') {
                    if (i + 1 >= command.size()) {
                        return syntax_error("no escaped character");
                    }
                    current.push_back(command[++i]);
                    state = State::InWord;
                } else {
                    current.push_back(c);
                    state = State::InWord;
                }
                break;
            case State::Single:
                if (c == '\'') {
                    state = State::InWord;
                } else {
                    current.push_back(c);
                }
                break;
            case State::Double:
                if (c == '"') {
                    state = State::InWord;
                } else if (c == '\\' && i + 1 < command.size() &&
                           escapable_in_double_quotes(command[i + 1])) {
                    current.push_back(command[++i]);
                } else {
                    current.push_back(c);
                }
                break;
        }
    }

    if (state == State::Single || state == State::Double) {
        return syntax_error("no closing quotation");
    }
    if (state == State::InWord) {
        words.push_back(current);
    }
    return words;
}

}  // namespace sous::exec
