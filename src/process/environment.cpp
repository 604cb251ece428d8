#include <qbroker/process/environment.h>

#include <algorithm>
#include <filesystem>

#include <unistd.h>

extern char** environ;

namespace qbroker::process {

Environment captureEnvironment() {
    Environment env;
    for (char** entry = environ; entry && *entry; ++entry) {
        std::string kv{*entry};
        auto eq = kv.find('=');
        if (eq == std::string::npos || eq == 0) {
            continue;
        }
        env.emplace(kv.substr(0, eq), kv.substr(eq + 1));
    }
    return env;
}

Environment sanitizeEnvironment(const Environment& base, std::span<const std::string> shadowed) {
    Environment out;
    for (const auto& [key, value] : base) {
        const bool drop = std::any_of(shadowed.begin(), shadowed.end(),
                                      [&key](const std::string& s) { return s == key; });
        if (!drop) {
            out.emplace(key, value);
        }
    }
    return out;
}

std::vector<std::string> toEnvStrings(const Environment& env) {
    std::vector<std::string> out;
    out.reserve(env.size());
    for (const auto& [key, value] : env) {
        out.push_back(key + "=" + value);
    }
    return out;
}

std::string resolveExecutable(const std::string& name, const Environment& env) {
    if (name.empty()) {
        return {};
    }
    if (name.find('/') != std::string::npos) {
        return ::access(name.c_str(), X_OK) == 0 ? name : std::string{};
    }

    std::string pathVar = "/usr/local/bin:/usr/bin:/bin";
    if (auto it = env.find("PATH"); it != env.end()) {
        pathVar = it->second;
    }

    size_t start = 0;
    while (start <= pathVar.size()) {
        size_t colon = pathVar.find(':', start);
        std::string dir = pathVar.substr(start, colon == std::string::npos ? std::string::npos
                                                                           : colon - start);
        if (dir.empty()) {
            dir = ".";
        }
        auto candidate = (std::filesystem::path(dir) / name).string();
        std::error_code ec;
        if (::access(candidate.c_str(), X_OK) == 0 &&
            !std::filesystem::is_directory(candidate, ec)) {
            return candidate;
        }
        if (colon == std::string::npos) {
            break;
        }
        start = colon + 1;
    }
    return {};
}

} // namespace qbroker::process
