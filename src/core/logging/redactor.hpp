#pragma once
#include <string>

namespace sous::core::logging {

    // Masks API keys, bearer tokens, passwords and URL credentials.
    std::string redact_secrets(const std::string& text);

} // namespace sous::core::logging
