#pragma once

#include <qbroker/broker/request.h>
#include <qbroker/core/types.h>
#include <qbroker/process/environment.h>

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace qbroker::process {
class ExternalProcessHandle;
class ProcessLauncher;
class TempArtifactManager;
} // namespace qbroker::process

namespace qbroker::broker {

class ProcessSlotPool;
class StreamBroker;
class WorkCoordinator;

/**
 * @brief Owns every request from submission to its terminal state.
 *
 * submit() registers the request, opens its output channel and hands it to the
 * slot pool. When the pool admits it, execution is posted to the work
 * coordinator: acquire the image artifact, spawn the CLI with a sanitized
 * environment, feed the prompt, relay output, wait for exit or a stop request.
 *
 * Whatever happens, finalize() runs exactly once per request and, in this
 * order: the artifact is gone, the stream gets its terminal event, the slot is
 * released (promoting the next queued request) and the caller's future is
 * fulfilled. Errors never escape as exceptions; they become a QueryResult.
 */
class RequestController {
public:
    struct Settings {
        std::filesystem::path executable = "claude";
        std::chrono::milliseconds defaultTimeout{120'000};
        std::chrono::milliseconds terminationGrace{1'500};
        std::vector<std::string> shadowedVariables;
        /// Ambient environment the child's environment is derived from
        std::function<process::Environment()> environmentSource;
    };

    RequestController(Settings settings, std::shared_ptr<process::ProcessLauncher> launcher,
                      ProcessSlotPool& pool, StreamBroker& streams,
                      process::TempArtifactManager& artifacts, WorkCoordinator& coordinator);
    ~RequestController();

    RequestController(const RequestController&) = delete;
    RequestController& operator=(const RequestController&) = delete;

    /**
     * @brief Register and enqueue a request.
     *
     * @param onChunk Optional per-chunk callback (stream mode output)
     * @param onTerminal Optional callback, invoked exactly once with the final result
     * @return InvalidArgument for an empty prompt, SystemShutdown once shutdown started
     */
    Result<RequestHandle> submit(RequestSpec spec, ChunkCallback onChunk = {},
                                 TerminalCallback onTerminal = {});

    /**
     * @brief Cancel a queued or running request.
     * @return false if the id is unknown or the request is already terminal
     */
    bool cancel(const RequestId& id);

    /// Current state; nullopt once the request has finished and been handed back
    std::optional<RequestState> state(const RequestId& id) const;

    /**
     * @brief Refuse new work, cancel queued requests, stop running ones and
     * wait up to @p drainTimeout for their executions to finish.
     *
     * @return true if everything drained in time
     */
    bool shutdown(std::chrono::milliseconds drainTimeout);

private:
    enum class StopCause : uint8_t { None, Cancel, Timeout, Shutdown };

    struct RequestRecord {
        RequestId id;
        RequestSpec spec;
        std::chrono::milliseconds timeout{0};

        std::mutex mutex;
        RequestState state = RequestState::Queued;
        StopCause stopCause = StopCause::None;
        bool finalized = false;
        process::ExternalProcessHandle* process = nullptr; ///< Valid while executing
        TimePoint submittedAt{};
        TimePoint startedAt{};

        std::promise<QueryResult> promise;
    };
    using RecordPtr = std::shared_ptr<RequestRecord>;

    void onAdmitted(const RequestId& id);
    void onDeadline(const RequestId& id);
    void execute(const RecordPtr& rec);
    QueryResult run(const RecordPtr& rec);
    void onOutput(const RecordPtr& rec, std::string_view chunk);
    bool requestStop(const RecordPtr& rec, StopCause cause);
    StopCause stopCause(const RecordPtr& rec);
    QueryResult stoppedResult(const RecordPtr& rec, StopCause cause) const;
    void finalize(const RecordPtr& rec, QueryResult result);
    RecordPtr find(const RequestId& id) const;

    Settings settings_;
    std::shared_ptr<process::ProcessLauncher> launcher_;
    ProcessSlotPool& pool_;
    StreamBroker& streams_;
    process::TempArtifactManager& artifacts_;
    WorkCoordinator& coordinator_;

    mutable std::mutex mutex_;
    std::unordered_map<RequestId, RecordPtr> records_;
    bool accepting_ = true;

    std::mutex drainMutex_;
    std::condition_variable drainCv_;
    std::size_t activeExecutions_ = 0;
};

} // namespace qbroker::broker
