#pragma once

#include <string>

namespace sous::exec {

// Returns valid UTF-8; every malformed sequence becomes U+FFFD.
std::string decode_utf8_lossy(const std::string& bytes);

}  // namespace sous::exec
