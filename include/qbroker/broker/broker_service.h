#pragma once

#include <qbroker/broker/availability_checker.h>
#include <qbroker/broker/request.h>
#include <qbroker/config/broker_config.h>
#include <qbroker/core/types.h>
#include <qbroker/process/environment.h>

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace qbroker::process {
class ProcessLauncher;
class TempArtifactManager;
} // namespace qbroker::process

namespace qbroker::broker {

class ProcessSlotPool;
class RequestController;
class StreamBroker;
class WorkCoordinator;

/**
 * @brief Availability plus live occupancy, as reported by BrokerService::status().
 */
struct BrokerStatus {
    bool installed = false;
    std::string version;
    bool authenticated = false;
    std::optional<std::string> account;
    std::size_t activeSlots = 0;
    std::size_t capacity = 0;
    std::size_t queued = 0;
    TimePoint lastChecked{};
    std::optional<std::string> lastError;
};

/**
 * @brief Explicitly constructed broker instance.
 *
 * Owns the executor, the slot pool, the stream broker, the artifact manager, the
 * availability checker and the request controller. Nothing runs until start();
 * shutdown() is final.
 *
 * @code
 * auto cfg = config::loadBrokerConfig();
 * BrokerService svc(cfg.value());
 * svc.start();
 * auto r = svc.query("Summarize this", {});
 * @endcode
 */
class BrokerService {
public:
    /**
     * @param launcher Process launcher; nullptr selects PosixProcessLauncher
     * @param environmentSource Ambient environment for children; empty reads environ
     * @throws std::invalid_argument if config.capacity is zero
     */
    explicit BrokerService(config::BrokerConfig config,
                           std::shared_ptr<process::ProcessLauncher> launcher = nullptr,
                           std::function<process::Environment()> environmentSource = {});
    ~BrokerService();

    BrokerService(const BrokerService&) = delete;
    BrokerService& operator=(const BrokerService&) = delete;

    /// Start the worker threads. InvalidState after shutdown(); no-op if running.
    Result<void> start();

    /**
     * @brief Cancel queued requests, terminate running processes, wait for them
     * and remove leftover artifacts. Idempotent.
     */
    void shutdown();

    bool isRunning() const;

    InstallStatus checkInstalled(bool forceRefresh = false);
    AuthStatus checkAuthenticated(bool forceRefresh = false);
    BrokerStatus status(bool forceRefresh = false);

    /// Blocking plain query
    QueryResult query(const std::string& prompt, const QueryOptions& options = {});

    /// Blocking query with an image handed to the CLI as a temporary file
    QueryResult queryWithImage(const std::string& prompt, ByteVector image,
                               const QueryOptions& options = {},
                               std::string imageExtension = {});

    /**
     * @brief Blocking streaming query.
     *
     * @p onChunk sees stdout chunks in production order; @p onTerminal, if set,
     * fires exactly once before this returns.
     */
    QueryResult stream(const std::string& prompt, const QueryOptions& options,
                       ChunkCallback onChunk, TerminalCallback onTerminal = {});

    /**
     * @brief Asynchronous submission; the handle's id can be passed to cancel().
     *
     * @return NotInitialized before start(), SystemShutdown after shutdown(),
     *         NotInstalled / NotAuthenticated when the CLI cannot serve it
     */
    Result<RequestHandle> submit(RequestSpec spec, ChunkCallback onChunk = {},
                                 TerminalCallback onTerminal = {});

    bool cancel(const RequestId& id);
    std::optional<RequestState> requestState(const RequestId& id) const;

    const config::BrokerConfig& config() const noexcept { return config_; }

private:
    enum class Lifecycle : uint8_t { Created, Running, Stopped };

    Result<void> checkReady();
    QueryResult await(Result<RequestHandle> submitted);

    config::BrokerConfig config_;
    std::shared_ptr<process::ProcessLauncher> launcher_;

    std::unique_ptr<WorkCoordinator> coordinator_;
    std::unique_ptr<ProcessSlotPool> pool_;
    std::unique_ptr<StreamBroker> streams_;
    std::unique_ptr<process::TempArtifactManager> artifacts_;
    std::unique_ptr<AvailabilityChecker> availability_;
    std::unique_ptr<RequestController> controller_;

    mutable std::mutex lifecycleMutex_;
    Lifecycle lifecycle_ = Lifecycle::Created;
};

} // namespace qbroker::broker
