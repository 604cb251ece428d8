#pragma once

#include <qbroker/core/types.h>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace qbroker::config {

/**
 * @brief Settings for the direct HTTP completion path used when the CLI path fails.
 */
struct RemoteApiConfig {
    std::string endpoint = "https://api.anthropic.com/v1/messages";
    std::string apiVersion = "2023-06-01";
    std::string model = "claude-sonnet-4-20250514";
    std::string apiKey; ///< Only ever taken from the environment
    uint32_t maxTokens = 4096;
    std::chrono::milliseconds timeout{120'000};
};

/**
 * @brief Broker settings.
 *
 * Defaults match the values the desktop application shipped with: three concurrent
 * CLI processes and a two minute per-request timeout.
 */
struct BrokerConfig {
    std::filesystem::path executable = "claude";
    std::size_t capacity = 3;
    std::chrono::milliseconds defaultTimeout{120'000};
    std::chrono::milliseconds probeTimeout{5'000};
    std::chrono::milliseconds statusTtl{5'000};
    std::chrono::milliseconds terminationGrace{1'500};
    std::filesystem::path artifactDir; ///< Empty means the OS temp directory
    std::vector<std::string> shadowedVariables{"ANTHROPIC_API_KEY", "ANTHROPIC_API_KEY_ID",
                                               "ANTHROPIC_AUTH_TOKEN"};
    RemoteApiConfig remote;

    /// artifactDir, or std::filesystem::temp_directory_path() when unset
    std::filesystem::path resolvedArtifactDir() const;
};

/**
 * @brief Resolve configuration: environment, then config file, then defaults.
 *
 * @param configPath Explicit file; empty selects get_config_path()
 * @return InvalidArgument if the resolved capacity is zero
 */
Result<BrokerConfig> loadBrokerConfig(const std::filesystem::path& configPath = {});

} // namespace qbroker::config
