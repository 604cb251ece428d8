#pragma once

#include <qbroker/core/types.h>
#include <qbroker/process/environment.h>

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace qbroker::process {
class ProcessLauncher;
}

namespace qbroker::broker {

struct InstallStatus {
    bool installed = false;
    std::string version;
    std::optional<std::string> error;
};

struct AuthStatus {
    bool authenticated = false;
    std::optional<std::string> account;
    std::optional<std::string> error;
};

struct AvailabilitySnapshot {
    InstallStatus install;
    AuthStatus auth;
    TimePoint lastChecked{};
};

/**
 * @brief Cached, non-throwing probes of the external CLI.
 *
 * Runs `<exe> --version` and `<exe> auth status` outside the slot pool, each
 * bounded by the probe timeout. Results are advisory and reused for the status
 * TTL unless a refresh is forced.
 */
class AvailabilityChecker {
public:
    struct Settings {
        std::filesystem::path executable = "claude";
        std::chrono::milliseconds probeTimeout{5'000};
        std::chrono::milliseconds statusTtl{5'000};
        std::vector<std::string> shadowedVariables;
        std::function<process::Environment()> environmentSource;
    };

    AvailabilityChecker(Settings settings, std::shared_ptr<process::ProcessLauncher> launcher);

    InstallStatus checkInstalled(bool forceRefresh = false);

    /// Reports "CLI not available" without probing when the install check fails
    AuthStatus checkAuthenticated(bool forceRefresh = false);

    AvailabilitySnapshot snapshot(bool forceRefresh = false);

    /// Drop cached results; the next check probes again
    void invalidate();

private:
    using Clock = std::chrono::steady_clock;

    bool fresh(const std::optional<SteadyTimePoint>& checkedAt) const;
    InstallStatus probeInstalled();
    AuthStatus probeAuthenticated();

    Settings settings_;
    std::shared_ptr<process::ProcessLauncher> launcher_;

    // Probes run under their own mutex so readers of the cache never wait on a child
    std::mutex installProbeMutex_;
    std::mutex authProbeMutex_;
    std::mutex mutex_; ///< Guards the cached results below
    bool installProbing_ = false;
    bool authProbing_ = false;
    InstallStatus install_;
    AuthStatus auth_;
    std::optional<SteadyTimePoint> installCheckedAt_;
    std::optional<SteadyTimePoint> authCheckedAt_;
    TimePoint lastChecked_{};
};

} // namespace qbroker::broker
