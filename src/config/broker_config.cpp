#include <qbroker/config/broker_config.h>
#include <qbroker/config/config_helpers.h>

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <optional>
#include <string_view>

namespace qbroker::config {

namespace {

const char* env_value(const char* name) {
    const char* v = std::getenv(name);
    return (v && *v) ? v : nullptr;
}

// Durations must be positive and fit the signed rep
std::optional<std::chrono::milliseconds> positive_ms(std::string_view s) {
    auto v = parse_ms(s);
    if (!v || v->count() <= 0) {
        return std::nullopt;
    }
    return v;
}

// Env wins over file; invalid values keep whatever was there before
void apply_ms(std::chrono::milliseconds& target, const std::string& fileValue, const char* envName,
              std::string_view label) {
    if (!fileValue.empty()) {
        if (auto v = positive_ms(fileValue)) {
            target = *v;
        } else {
            spdlog::warn("[BrokerConfig] Ignoring invalid {} '{}' in config file", label, fileValue);
        }
    }
    if (envName) {
        if (const char* env = env_value(envName)) {
            if (auto v = positive_ms(env)) {
                target = *v;
            } else {
                spdlog::warn("[BrokerConfig] Ignoring invalid {}='{}'", envName, env);
            }
        }
    }
}

} // namespace

std::filesystem::path BrokerConfig::resolvedArtifactDir() const {
    if (!artifactDir.empty()) {
        return artifactDir;
    }
    std::error_code ec;
    auto tmp = std::filesystem::temp_directory_path(ec);
    if (ec) {
        return std::filesystem::path("/tmp");
    }
    return tmp;
}

Result<BrokerConfig> loadBrokerConfig(const std::filesystem::path& configPath) {
    BrokerConfig cfg;

    const auto path = configPath.empty() ? get_config_path() : configPath;
    std::error_code ec;
    const bool haveFile = !path.empty() && std::filesystem::exists(path, ec);
    if (haveFile) {
        spdlog::debug("[BrokerConfig] Reading {}", path.string());
    } else if (!configPath.empty()) {
        return Error{ErrorCode::NotFound, "Config file not found: " + configPath.string()};
    }

    auto fileValue = [&](const char* section, const char* key) -> std::string {
        return haveFile ? parse_config_value(path, section, key) : std::string{};
    };

    if (auto v = fileValue("broker", "executable"); !v.empty()) {
        cfg.executable = expand_tilde(v);
    }
    if (const char* env = env_value("CLAUDE_CLI_PATH")) {
        cfg.executable = expand_tilde(env);
    }

    if (auto v = fileValue("broker", "max_concurrent"); !v.empty()) {
        if (auto n = parse_count(v)) {
            cfg.capacity = *n;
        } else {
            spdlog::warn("[BrokerConfig] Ignoring invalid max_concurrent '{}'", v);
        }
    }
    if (const char* env = env_value("CLAUDE_CLI_MAX_CONCURRENT")) {
        if (auto n = parse_count(env)) {
            cfg.capacity = *n;
        } else {
            spdlog::warn("[BrokerConfig] Ignoring invalid CLAUDE_CLI_MAX_CONCURRENT='{}'", env);
        }
    }

    apply_ms(cfg.defaultTimeout, fileValue("broker", "timeout_ms"), "CLAUDE_CLI_TIMEOUT",
             "timeout_ms");
    apply_ms(cfg.probeTimeout, fileValue("broker", "probe_timeout_ms"), nullptr,
             "probe_timeout_ms");
    apply_ms(cfg.statusTtl, fileValue("broker", "status_ttl_ms"), nullptr, "status_ttl_ms");
    apply_ms(cfg.terminationGrace, fileValue("broker", "termination_grace_ms"), nullptr,
             "termination_grace_ms");

    if (auto v = fileValue("broker", "artifact_dir"); !v.empty()) {
        cfg.artifactDir = expand_tilde(v);
    }
    if (auto v = fileValue("broker", "shadowed_env"); !v.empty()) {
        auto list = parse_string_list(v);
        if (!list.empty()) {
            cfg.shadowedVariables = std::move(list);
        }
    }

    if (auto v = fileValue("remote", "endpoint"); !v.empty()) {
        cfg.remote.endpoint = v;
    }
    if (auto v = fileValue("remote", "api_version"); !v.empty()) {
        cfg.remote.apiVersion = v;
    }
    if (auto v = fileValue("remote", "model"); !v.empty()) {
        cfg.remote.model = v;
    }
    if (auto v = fileValue("remote", "max_tokens"); !v.empty()) {
        if (auto n = parse_count(v); n && *n > 0) {
            cfg.remote.maxTokens = static_cast<uint32_t>(*n);
        } else {
            spdlog::warn("[BrokerConfig] Ignoring invalid remote max_tokens '{}'", v);
        }
    }
    apply_ms(cfg.remote.timeout, fileValue("remote", "timeout_ms"), nullptr, "remote timeout_ms");
    if (const char* key = env_value("ANTHROPIC_API_KEY")) {
        cfg.remote.apiKey = key;
    }

    if (cfg.capacity == 0) {
        return Error{ErrorCode::InvalidArgument, "max_concurrent must be at least 1"};
    }

    spdlog::debug("[BrokerConfig] executable={} capacity={} timeout={}ms", cfg.executable.string(),
                  cfg.capacity, cfg.defaultTimeout.count());
    return cfg;
}

} // namespace qbroker::config
