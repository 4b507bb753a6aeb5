#pragma once
#include <random>
#include <sstream>
#include <string>

namespace sous::core::config {

    // Random lowercase hex string of the given length.
    inline std::string random_hex(int length) {
        static thread_local std::mt19937 gen{std::random_device{}()};
        std::uniform_int_distribution<> dis(0, 15);

        std::stringstream ss;
        for (int i = 0; i < length; ++i) {
            ss << std::hex << dis(gen);
        }
        return ss.str();
    }

    // "sess-" followed by 12 hex characters
    inline std::string generate_session_id() {
        return "sess-" + random_hex(12);
    }

    // Used when the model omits a tool call id.
    inline std::string generate_call_id() {
        return "call-" + random_hex(8);
    }

} // namespace sous::core::config
