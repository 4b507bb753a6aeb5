#include "exec/text_decoding.hpp"

namespace sous::exec {

namespace {

constexpr const char* kReplacement = "\xEF\xBF\xBD";

bool is_continuation(const unsigned char c) {
    return (c & 0xC0) == 0x80;
}

// Length of the valid sequence starting at `i`, or 0 when malformed.
std::size_t valid_sequence_length(const std::string& bytes, const std::size_t i) {
    const auto lead = static_cast<unsigned char>(bytes[i]);
    std::size_t length = 0;
    if (lead < 0x80) {
        return 1;
    } else if (lead >= 0xC2 && lead <= 0xDF) {
        length = 2;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        length = 3;
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        length = 4;
    } else {
        return 0;
    }
    if (i + length > bytes.size()) {
        return 0;
    }
    for (std::size_t k = 1; k < length; ++k) {
        if (!is_continuation(static_cast<unsigned char>(bytes[i + k]))) {
            return 0;
        }
    }

    const auto second = static_cast<unsigned char>(bytes[i + 1]);
    // Overlong forms, UTF-16 surrogates and code points above U+10FFFF.
    if (lead == 0xE0 && second < 0xA0) return 0;
    if (lead == 0xED && second > 0x9F) return 0;
    if (lead == 0xF0 && second < 0x90) return 0;
    if (lead == 0xF4 && second > 0x8F) return 0;
    return length;
}

}  // namespace

std::string decode_utf8_lossy(const std::string& bytes) {
    std::string out;
    out.reserve(bytes.size());
    std::size_t i = 0;
    while (i < bytes.size()) {
        const std::size_t length = valid_sequence_length(bytes, i);
        if (length == 0) {
            out += kReplacement;
            ++i;
            continue;
        }
        out.append(bytes, i, length);
        i += length;
    }
    return out;
}

}  // namespace sous::exec
