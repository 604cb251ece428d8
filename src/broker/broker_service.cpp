#include <qbroker/broker/broker_service.h>
#include <qbroker/broker/request_controller.h>
#include <qbroker/broker/slot_pool.h>
#include <qbroker/broker/stream_broker.h>
#include <qbroker/broker/work_coordinator.h>
#include <qbroker/process/external_process.h>
#include <qbroker/process/temp_artifact.h>

#include <spdlog/spdlog.h>

#include <utility>

namespace qbroker::broker {

namespace {

// Covers SIGTERM grace plus the one second SIGKILL wait in terminate()
std::chrono::milliseconds drainBudget(const config::BrokerConfig& cfg) {
    return cfg.terminationGrace * 2 + std::chrono::seconds{2};
}

} // namespace

BrokerService::BrokerService(config::BrokerConfig config,
                             std::shared_ptr<process::ProcessLauncher> launcher,
                             std::function<process::Environment()> environmentSource)
    : config_(std::move(config)), launcher_(std::move(launcher)) {
    if (!launcher_) {
        launcher_ = std::make_shared<process::PosixProcessLauncher>();
    }
    if (!environmentSource) {
        environmentSource = [] { return process::captureEnvironment(); };
    }

    coordinator_ = std::make_unique<WorkCoordinator>();
    pool_ = std::make_unique<ProcessSlotPool>(config_.capacity, coordinator_->getExecutor());
    streams_ = std::make_unique<StreamBroker>();
    artifacts_ = std::make_unique<process::TempArtifactManager>(config_.resolvedArtifactDir());

    AvailabilityChecker::Settings probe;
    probe.executable = config_.executable;
    probe.probeTimeout = config_.probeTimeout;
    probe.statusTtl = config_.statusTtl;
    probe.shadowedVariables = config_.shadowedVariables;
    probe.environmentSource = environmentSource;
    availability_ = std::make_unique<AvailabilityChecker>(std::move(probe), launcher_);

    RequestController::Settings exec;
    exec.executable = config_.executable;
    exec.defaultTimeout = config_.defaultTimeout;
    exec.terminationGrace = config_.terminationGrace;
    exec.shadowedVariables = config_.shadowedVariables;
    exec.environmentSource = std::move(environmentSource);
    controller_ = std::make_unique<RequestController>(std::move(exec), launcher_, *pool_,
                                                      *streams_, *artifacts_, *coordinator_);
}

BrokerService::~BrokerService() {
    shutdown();
}

Result<void> BrokerService::start() {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    switch (lifecycle_) {
        case Lifecycle::Running:
            return {};
        case Lifecycle::Stopped:
            return Error{ErrorCode::InvalidState, "Broker has been shut down"};
        case Lifecycle::Created:
            break;
    }
    try {
        // One spare thread so deadline timers fire while every slot is busy
        coordinator_->start(config_.capacity + 1);
    } catch (const std::exception& e) {
        return Error{ErrorCode::InternalError, e.what()};
    }
    lifecycle_ = Lifecycle::Running;
    spdlog::info("[BrokerService] Started: executable '{}', capacity {}, timeout {}ms, {} workers",
                 config_.executable.string(), config_.capacity, config_.defaultTimeout.count(),
                 coordinator_->getWorkerCount());
    return {};
}

void BrokerService::shutdown() {
    {
        std::lock_guard<std::mutex> lock(lifecycleMutex_);
        if (lifecycle_ == Lifecycle::Stopped) {
            return;
        }
        lifecycle_ = Lifecycle::Stopped;
    }

    spdlog::debug("[BrokerService] Shutting down");
    if (!controller_->shutdown(drainBudget(config_))) {
        spdlog::warn("[BrokerService] Some executions did not finish before shutdown");
    }
    coordinator_->stop();
    coordinator_->join();

    if (auto failed = artifacts_->releaseAll(); failed > 0) {
        spdlog::warn("[BrokerService] {} temporary artifacts could not be removed", failed);
    }
    spdlog::info("[BrokerService] Shut down");
}

bool BrokerService::isRunning() const {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    return lifecycle_ == Lifecycle::Running && coordinator_->isRunning();
}

InstallStatus BrokerService::checkInstalled(bool forceRefresh) {
    return availability_->checkInstalled(forceRefresh);
}

AuthStatus BrokerService::checkAuthenticated(bool forceRefresh) {
    return availability_->checkAuthenticated(forceRefresh);
}

BrokerStatus BrokerService::status(bool forceRefresh) {
    auto snap = availability_->snapshot(forceRefresh);
    auto occupancy = pool_->snapshot();

    BrokerStatus st;
    st.installed = snap.install.installed;
    st.version = snap.install.version;
    st.authenticated = snap.auth.authenticated;
    st.account = snap.auth.account;
    st.activeSlots = occupancy.active;
    st.capacity = occupancy.capacity;
    st.queued = occupancy.queued;
    st.lastChecked = snap.lastChecked;
    st.lastError = snap.install.error ? snap.install.error : snap.auth.error;
    return st;
}

Result<void> BrokerService::checkReady() {
    {
        std::lock_guard<std::mutex> lock(lifecycleMutex_);
        if (lifecycle_ == Lifecycle::Created) {
            return Error{ErrorCode::NotInitialized, "Broker has not been started"};
        }
        if (lifecycle_ == Lifecycle::Stopped) {
            return Error{ErrorCode::SystemShutdown, "Broker has been shut down"};
        }
    }

    auto auth = availability_->checkAuthenticated();
    auto install = availability_->checkInstalled();
    if (!install.installed) {
        return Error{ErrorCode::NotInstalled, install.error.value_or("CLI not installed")};
    }
    if (!auth.authenticated) {
        return Error{ErrorCode::NotAuthenticated, auth.error.value_or("Not authenticated")};
    }
    return {};
}

Result<RequestHandle> BrokerService::submit(RequestSpec spec, ChunkCallback onChunk,
                                            TerminalCallback onTerminal) {
    if (spec.prompt.empty()) {
        return Error{ErrorCode::InvalidArgument, "Prompt must not be empty"};
    }
    if (auto ready = checkReady(); !ready) {
        spdlog::debug("[BrokerService] Not submitting: {}", ready.error().message);
        return ready.error();
    }
    return controller_->submit(std::move(spec), std::move(onChunk), std::move(onTerminal));
}

QueryResult BrokerService::await(Result<RequestHandle> submitted) {
    if (!submitted) {
        return QueryResult::failure({}, submitted.error(), RequestState::Failed);
    }
    return submitted.value().result.get();
}

QueryResult BrokerService::query(const std::string& prompt, const QueryOptions& options) {
    RequestSpec spec;
    spec.prompt = prompt;
    spec.options = options;
    return await(submit(std::move(spec)));
}

QueryResult BrokerService::queryWithImage(const std::string& prompt, ByteVector image,
                                          const QueryOptions& options,
                                          std::string imageExtension) {
    if (image.empty()) {
        return QueryResult::failure({}, Error{ErrorCode::InvalidArgument, "Image is empty"},
                                    RequestState::Failed);
    }
    RequestSpec spec;
    spec.prompt = prompt;
    spec.image = std::move(image);
    spec.imageExtension = std::move(imageExtension);
    spec.options = options;
    return await(submit(std::move(spec)));
}

QueryResult BrokerService::stream(const std::string& prompt, const QueryOptions& options,
                                  ChunkCallback onChunk, TerminalCallback onTerminal) {
    RequestSpec spec;
    spec.prompt = prompt;
    spec.mode = RequestMode::Stream;
    spec.options = options;
    // Always subscribe so the terminal event precedes the return
    if (!onTerminal) {
        onTerminal = [](const QueryResult&) {};
    }
    return await(submit(std::move(spec), std::move(onChunk), std::move(onTerminal)));
}

bool BrokerService::cancel(const RequestId& id) {
    return controller_->cancel(id);
}

std::optional<RequestState> BrokerService::requestState(const RequestId& id) const {
    return controller_->state(id);
}

} // namespace qbroker::broker
