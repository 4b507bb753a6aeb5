#include "exec/safe_environment.hpp"

#include <array>

namespace sous::exec {

namespace {

constexpr std::array<const char*, 12> kPassThroughVariables = {
    "PATH", "HOME", "USER", "SHELL", "TERM", "LANG", "LC_ALL", "TZ", "TMPDIR",
    "XDG_CONFIG_HOME", "XDG_CACHE_HOME", "XDG_DATA_HOME"};

constexpr const char* kFallbackPath = "/usr/local/bin:/usr/bin:/bin";

}  // namespace

Environment capture_environment(char** envp) {
    Environment env;
    if (envp == nullptr) {
        return env;
    }
    for (char** entry = envp; *entry != nullptr; ++entry) {
        const std::string pair(*entry);
        const auto eq = pair.find('=');
        if (eq == std::string::npos || eq == 0) {
            continue;
        }
        env[pair.substr(0, eq)] = pair.substr(eq + 1);
    }
    return env;
}

Environment build_safe_environment(const Environment& host) {
    Environment env;
    for (const char* name : kPassThroughVariables) {
        auto it = host.find(name);
        if (it != host.end()) {
            env[name] = it->second;
        }
    }
    if (env.find("PATH") == env.end()) {
        env["PATH"] = kFallbackPath;
    }

    env["CI"] = "true";
    env["NONINTERACTIVE"] = "1";
    env["NO_TTY"] = "1";
    env["NO_COLOR"] = "1";
    env["PAGER"] = "cat";
    env["EDITOR"] = "cat";
    env["VISUAL"] = "cat";
    env["GIT_PAGER"] = "cat";
    env["PYTHONUNBUFFERED"] = "1";
    env["PYTHONDONTWRITEBYTECODE"] = "1";
    env["TERM"] = "dumb";
    return env;
}

}  // namespace sous::exec
