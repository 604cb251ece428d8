#include <qbroker/broker/availability_checker.h>
#include <qbroker/broker/cli_invocation.h>
#include <qbroker/config/config_helpers.h>
#include <qbroker/process/external_process.h>

#include <spdlog/spdlog.h>

namespace qbroker::broker {

namespace {

std::string failureDetail(const process::CapturedRun& run) {
    std::string detail = run.stderrText.empty() ? run.stdoutText : run.stderrText;
    config::trim(detail);
    return fmt::format("exit code {}{}{}", run.exitCode, detail.empty() ? "" : ": ", detail);
}

} // namespace

AvailabilityChecker::AvailabilityChecker(Settings settings,
                                         std::shared_ptr<process::ProcessLauncher> launcher)
    : settings_(std::move(settings)), launcher_(std::move(launcher)) {
    if (!settings_.environmentSource) {
        settings_.environmentSource = [] { return process::captureEnvironment(); };
    }
}

bool AvailabilityChecker::fresh(const std::optional<SteadyTimePoint>& checkedAt) const {
    return checkedAt && Clock::now() - *checkedAt < settings_.statusTtl;
}

InstallStatus AvailabilityChecker::checkInstalled(bool forceRefresh) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!forceRefresh && (fresh(installCheckedAt_) || (installProbing_ && installCheckedAt_))) {
            // A stale result is served while another caller probes
            return install_;
        }
    }

    std::lock_guard<std::mutex> probeLock(installProbeMutex_);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!forceRefresh && fresh(installCheckedAt_)) {
            return install_;
        }
        installProbing_ = true;
    }

    auto status = probeInstalled();

    std::lock_guard<std::mutex> lock(mutex_);
    install_ = std::move(status);
    installCheckedAt_ = Clock::now();
    lastChecked_ = std::chrono::system_clock::now();
    installProbing_ = false;
    return install_;
}

AuthStatus AvailabilityChecker::checkAuthenticated(bool forceRefresh) {
    const auto install = checkInstalled(forceRefresh);
    if (!install.installed) {
        std::lock_guard<std::mutex> lock(mutex_);
        auth_ = AuthStatus{false, std::nullopt, std::string("CLI not available")};
        authCheckedAt_ = installCheckedAt_;
        return auth_;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!forceRefresh && (fresh(authCheckedAt_) || (authProbing_ && authCheckedAt_))) {
            return auth_;
        }
    }

    std::lock_guard<std::mutex> probeLock(authProbeMutex_);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!forceRefresh && fresh(authCheckedAt_)) {
            return auth_;
        }
        authProbing_ = true;
    }

    auto status = probeAuthenticated();

    std::lock_guard<std::mutex> lock(mutex_);
    auth_ = std::move(status);
    authCheckedAt_ = Clock::now();
    lastChecked_ = std::chrono::system_clock::now();
    authProbing_ = false;
    return auth_;
}

AvailabilitySnapshot AvailabilityChecker::snapshot(bool forceRefresh) {
    AvailabilitySnapshot snap;
    snap.auth = checkAuthenticated(forceRefresh);
    std::lock_guard<std::mutex> lock(mutex_);
    snap.install = install_;
    snap.lastChecked = lastChecked_;
    return snap;
}

void AvailabilityChecker::invalidate() {
    std::lock_guard<std::mutex> lock(mutex_);
    installCheckedAt_.reset();
    authCheckedAt_.reset();
}

InstallStatus AvailabilityChecker::probeInstalled() {
    process::ProcessSpec spec;
    spec.executable = settings_.executable;
    spec.args = {"--version"};
    spec.env =
        process::sanitizeEnvironment(settings_.environmentSource(), settings_.shadowedVariables);

    InstallStatus status;
    auto run = process::runCaptured(*launcher_, spec, settings_.probeTimeout);
    if (!run) {
        status.error = run.error().message;
    } else if (run.value().exitCode != 0) {
        status.error = "Version check failed with " + failureDetail(run.value());
    } else {
        status.installed = true;
        status.version = parseVersion(run.value().stdoutText);
    }

    if (status.installed) {
        spdlog::debug("[AvailabilityChecker] CLI installed, version '{}'", status.version);
    } else {
        spdlog::info("[AvailabilityChecker] CLI not installed: {}", status.error.value_or(""));
    }
    return status;
}

AuthStatus AvailabilityChecker::probeAuthenticated() {
    process::ProcessSpec spec;
    spec.executable = settings_.executable;
    spec.args = {"auth", "status"};
    spec.env =
        process::sanitizeEnvironment(settings_.environmentSource(), settings_.shadowedVariables);

    AuthStatus status;
    auto run = process::runCaptured(*launcher_, spec, settings_.probeTimeout);
    if (!run) {
        status.error = run.error().message;
        spdlog::info("[AvailabilityChecker] Auth probe failed: {}", *status.error);
        return status;
    }

    const auto& captured = run.value();
    auto probe = parseAuthStatus(captured.stdoutText + "\n" + captured.stderrText);
    if (probe.authenticated) {
        status.authenticated = true;
        status.account = std::move(probe.account);
        spdlog::debug("[AvailabilityChecker] CLI authenticated");
    } else if (captured.exitCode != 0) {
        status.error = "Auth check failed with " + failureDetail(captured);
    } else {
        status.error = "Not authenticated";
    }
    return status;
}

} // namespace qbroker::broker
