#include <qbroker/broker/cli_invocation.h>
#include <qbroker/broker/request_controller.h>
#include <qbroker/broker/slot_pool.h>
#include <qbroker/broker/stream_broker.h>
#include <qbroker/broker/work_coordinator.h>
#include <qbroker/config/config_helpers.h>
#include <qbroker/core/uuid.h>
#include <qbroker/process/external_process.h>
#include <qbroker/process/temp_artifact.h>

#include <spdlog/spdlog.h>

#include <cstddef>
#include <exception>
#include <utility>

namespace qbroker::broker {

namespace {

constexpr auto kWaitSlice = std::chrono::milliseconds{50};

std::string describeExit(int code, const std::string& stderrText) {
    std::string detail = stderrText;
    config::trim(detail);
    return fmt::format("CLI exited with code {}: {}", code,
                       detail.empty() ? std::string("Unknown error") : detail);
}

} // namespace

RequestController::RequestController(Settings settings,
                                     std::shared_ptr<process::ProcessLauncher> launcher,
                                     ProcessSlotPool& pool, StreamBroker& streams,
                                     process::TempArtifactManager& artifacts,
                                     WorkCoordinator& coordinator)
    : settings_(std::move(settings)), launcher_(std::move(launcher)), pool_(pool),
      streams_(streams), artifacts_(artifacts), coordinator_(coordinator) {
    if (!settings_.environmentSource) {
        settings_.environmentSource = [] { return process::captureEnvironment(); };
    }
    pool_.setAdmissionHandler([this](const RequestId& id) { onAdmitted(id); });
    pool_.setDeadlineHandler([this](const RequestId& id) { onDeadline(id); });
}

RequestController::~RequestController() {
    shutdown(settings_.terminationGrace * 2);
    pool_.setAdmissionHandler({});
    pool_.setDeadlineHandler({});
}

Result<RequestHandle> RequestController::submit(RequestSpec spec, ChunkCallback onChunk,
                                                TerminalCallback onTerminal) {
    if (spec.prompt.empty()) {
        return Error{ErrorCode::InvalidArgument, "Prompt must not be empty"};
    }
    if (spec.options.timeout && spec.options.timeout->count() <= 0) {
        return Error{ErrorCode::InvalidArgument, "Timeout must be positive"};
    }

    auto rec = std::make_shared<RequestRecord>();
    rec->id = core::generateUUID();
    rec->timeout = spec.options.timeout.value_or(settings_.defaultTimeout);
    rec->spec = std::move(spec);
    rec->submittedAt = std::chrono::system_clock::now();

    RequestHandle handle{rec->id, rec->promise.get_future().share()};

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!accepting_) {
            return Error{ErrorCode::SystemShutdown, "Broker is shutting down"};
        }
        if (auto opened = streams_.open(rec->id); !opened) {
            return opened.error();
        }
        records_.emplace(rec->id, rec);
    }

    if (onChunk || onTerminal) {
        if (auto subscribed =
                streams_.subscribe(rec->id, std::move(onChunk), std::move(onTerminal));
            !subscribed) {
            spdlog::warn("[RequestController] Subscribe failed for {}: {}", rec->id,
                         subscribed.error().message);
        }
    }

    spdlog::debug("[RequestController] Submitted {} ({} mode, timeout {}ms)", rec->id,
                  rec->spec.mode == RequestMode::Stream ? "stream" : "query",
                  rec->timeout.count());

    // May run onAdmitted() synchronously on this thread
    auto admission = pool_.submit(rec->id, rec->timeout);
    if (admission == ProcessSlotPool::Admission::Rejected) {
        finalize(rec, QueryResult::failure(
                          rec->id, Error{ErrorCode::SystemShutdown, "Broker is shutting down"},
                          RequestState::Failed));
    }
    return handle;
}

void RequestController::onAdmitted(const RequestId& id) {
    auto rec = find(id);
    if (!rec) {
        spdlog::warn("[RequestController] Admitted unknown request {}", id);
        pool_.release(id);
        return;
    }
    {
        std::lock_guard<std::mutex> lock(rec->mutex);
        rec->state = RequestState::Running;
        rec->startedAt = std::chrono::system_clock::now();
    }
    {
        std::lock_guard<std::mutex> lock(drainMutex_);
        ++activeExecutions_;
    }
    coordinator_.post([this, rec]() { execute(rec); });
}

void RequestController::onDeadline(const RequestId& id) {
    auto rec = find(id);
    if (rec && requestStop(rec, StopCause::Timeout)) {
        spdlog::warn("[RequestController] Request {} exceeded {}ms, terminating", id,
                     rec->timeout.count());
    }
}

void RequestController::execute(const RecordPtr& rec) {
    QueryResult result;
    try {
        result = run(rec);
    } catch (const std::exception& e) {
        spdlog::error("[RequestController] Execution of {} threw: {}", rec->id, e.what());
        result = QueryResult::failure(rec->id, Error{ErrorCode::InternalError, e.what()},
                                      RequestState::Failed);
    }
    finalize(rec, std::move(result));

    {
        std::lock_guard<std::mutex> lock(drainMutex_);
        --activeExecutions_;
    }
    drainCv_.notify_all();
}

QueryResult RequestController::run(const RecordPtr& rec) {
    if (auto cause = stopCause(rec); cause != StopCause::None) {
        return stoppedResult(rec, cause);
    }

    const auto& spec = rec->spec;
    process::ScopedArtifact artifact;
    std::optional<std::filesystem::path> imagePath;
    if (spec.image) {
        std::string_view ext = spec.imageExtension.empty()
                                   ? process::sniffImageExtension(*spec.image)
                                   : std::string_view{spec.imageExtension};
        auto acquired = artifacts_.acquire(rec->id, *spec.image, ext);
        if (!acquired) {
            return QueryResult::failure(rec->id, acquired.error(), RequestState::Failed);
        }
        artifact = process::ScopedArtifact(artifacts_, acquired.value());
        imagePath = artifact.path();
    }

    process::ProcessSpec procSpec;
    procSpec.executable = settings_.executable;
    procSpec.args = buildCliArgs(spec.mode, spec.options, imagePath);
    procSpec.env =
        process::sanitizeEnvironment(settings_.environmentSource(), settings_.shadowedVariables);

    auto spawned = launcher_->spawn(procSpec, [this, rec](std::string_view chunk) {
        onOutput(rec, chunk);
    });
    if (!spawned) {
        spdlog::error("[RequestController] Spawn failed for {}: {}", rec->id,
                      spawned.error().message);
        return QueryResult::failure(rec->id, spawned.error(), RequestState::Failed);
    }
    std::unique_ptr<process::ExternalProcessHandle> proc = std::move(spawned).value();
    spdlog::debug("[RequestController] {} running as pid {}", rec->id, proc->pid());

    bool stopRequested = false;
    {
        std::lock_guard<std::mutex> lock(rec->mutex);
        rec->process = proc.get();
        stopRequested = rec->stopCause != StopCause::None;
    }

    if (!stopRequested) {
        const auto* bytes = reinterpret_cast<const std::byte*>(spec.prompt.data());
        size_t written = proc->write_stdin({bytes, spec.prompt.size()});
        if (written < spec.prompt.size()) {
            spdlog::debug("[RequestController] Prompt for {} truncated at {}/{} bytes", rec->id,
                          written, spec.prompt.size());
        }
    }
    proc->close_stdin();

    bool exited = false;
    while (!stopRequested && !(exited = proc->wait_for_exit(kWaitSlice))) {
        stopRequested = stopCause(rec) != StopCause::None;
    }
    if (!exited) {
        if (!proc->terminate(settings_.terminationGrace)) {
            spdlog::error("[RequestController] pid {} for {} could not be reaped", proc->pid(),
                          rec->id);
        }
    }

    {
        std::lock_guard<std::mutex> lock(rec->mutex);
        rec->process = nullptr;
    }

    if (auto cause = stopCause(rec); cause != StopCause::None) {
        return stoppedResult(rec, cause);
    }

    const int code = proc->exit_code().value_or(-1);
    if (code != 0) {
        return QueryResult::failure(
            rec->id, Error{ErrorCode::RuntimeFailure, describeExit(code, proc->stderr_output())},
            RequestState::Failed);
    }

    std::string output = streams_.aggregate(rec->id);
    QueryResult result;
    result.id = rec->id;
    if (spec.mode == RequestMode::Stream) {
        result.success = true;
        result.content = std::move(output);
        result.state = RequestState::Completed;
        return result;
    }

    auto parsed = parseQueryOutput(output);
    if (!parsed) {
        return QueryResult::failure(rec->id, parsed.error(), RequestState::Failed);
    }
    result.success = true;
    result.content = std::move(parsed).value();
    result.state = RequestState::Completed;
    return result;
}

void RequestController::onOutput(const RecordPtr& rec, std::string_view chunk) {
    if (rec->spec.mode == RequestMode::Stream) {
        std::lock_guard<std::mutex> lock(rec->mutex);
        if (rec->state == RequestState::Running) {
            rec->state = RequestState::Streaming;
        }
    }
    streams_.publish(rec->id, chunk);
}

bool RequestController::requestStop(const RecordPtr& rec, StopCause cause) {
    std::lock_guard<std::mutex> lock(rec->mutex);
    if (rec->finalized || rec->stopCause != StopCause::None) {
        return false;
    }
    rec->stopCause = cause;
    if (rec->process) {
        rec->process->signal(process::ProcessSignal::Terminate);
    }
    return true;
}

RequestController::StopCause RequestController::stopCause(const RecordPtr& rec) {
    std::lock_guard<std::mutex> lock(rec->mutex);
    return rec->stopCause;
}

QueryResult RequestController::stoppedResult(const RecordPtr& rec, StopCause cause) const {
    switch (cause) {
        case StopCause::Timeout:
            return QueryResult::failure(
                rec->id,
                Error{ErrorCode::Timeout,
                      fmt::format("Request timed out after {}ms", rec->timeout.count())},
                RequestState::TimedOut);
        case StopCause::Shutdown:
            return QueryResult::failure(
                rec->id, Error{ErrorCode::SystemShutdown, "Broker is shutting down"},
                RequestState::Cancelled);
        case StopCause::Cancel:
        case StopCause::None:
            break;
    }
    return QueryResult::failure(rec->id, Error{ErrorCode::OperationCancelled, "Request cancelled"},
                                RequestState::Cancelled);
}

void RequestController::finalize(const RecordPtr& rec, QueryResult result) {
    {
        std::lock_guard<std::mutex> lock(rec->mutex);
        if (rec->finalized) {
            return;
        }
        rec->finalized = true;
        rec->state = result.state;
        result.submittedAt = rec->submittedAt;
        result.startedAt = rec->startedAt;
    }
    result.id = rec->id;
    result.completedAt = std::chrono::system_clock::now();

    streams_.terminate(rec->id, result);
    pool_.release(rec->id);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        records_.erase(rec->id);
    }

    if (result.success) {
        spdlog::debug("[RequestController] {} completed ({} bytes)", rec->id,
                      result.content.size());
    } else {
        spdlog::info("[RequestController] {} ended {}: {}", rec->id, toString(result.state),
                     result.error);
    }
    rec->promise.set_value(std::move(result));
}

bool RequestController::cancel(const RequestId& id) {
    auto rec = find(id);
    if (!rec) {
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(rec->mutex);
        if (rec->finalized || rec->stopCause != StopCause::None) {
            return false;
        }
    }

    switch (pool_.cancel(id)) {
        case ProcessSlotPool::CancelOutcome::RemovedFromQueue:
            spdlog::debug("[RequestController] {} cancelled while queued", id);
            finalize(rec, stoppedResult(rec, StopCause::Cancel));
            return true;
        case ProcessSlotPool::CancelOutcome::Leased:
            return requestStop(rec, StopCause::Cancel);
        case ProcessSlotPool::CancelOutcome::NotFound:
            break;
    }
    return false;
}

std::optional<RequestState> RequestController::state(const RequestId& id) const {
    auto rec = find(id);
    if (!rec) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(rec->mutex);
    return rec->state;
}

bool RequestController::shutdown(std::chrono::milliseconds drainTimeout) {
    std::vector<RecordPtr> running;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!accepting_) {
            return true;
        }
        accepting_ = false;
    }

    for (const auto& id : pool_.close()) {
        if (auto rec = find(id)) {
            finalize(rec, stoppedResult(rec, StopCause::Shutdown));
        }
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        running.reserve(records_.size());
        for (const auto& [id, rec] : records_) {
            running.push_back(rec);
        }
    }
    for (const auto& rec : running) {
        requestStop(rec, StopCause::Shutdown);
    }

    std::unique_lock<std::mutex> lock(drainMutex_);
    bool drained = drainCv_.wait_for(lock, drainTimeout, [this] { return activeExecutions_ == 0; });
    if (!drained) {
        spdlog::warn("[RequestController] {} executions still running after {}ms",
                     activeExecutions_, drainTimeout.count());
    } else {
        spdlog::debug("[RequestController] Drained ({} requests stopped)", running.size());
    }
    return drained;
}

RequestController::RecordPtr RequestController::find(const RequestId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(id);
    return it == records_.end() ? nullptr : it->second;
}

} // namespace qbroker::broker
