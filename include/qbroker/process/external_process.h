#pragma once

#include <qbroker/core/types.h>
#include <qbroker/process/environment.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace qbroker::process {

/**
 * @brief Lifecycle state of a spawned CLI process.
 */
enum class ProcessState : uint8_t {
    Running,      ///< Spawned, not yet signalled
    ShuttingDown, ///< Terminate or kill sent
    Exited        ///< Reaped; exit_code() is valid
};

enum class ProcessSignal : uint8_t {
    Terminate, ///< SIGTERM: ask nicely
    Kill       ///< SIGKILL: not negotiable
};

/**
 * @brief What to run and with which environment.
 *
 * Example:
 * @code
 * ProcessSpec spec{.executable = "claude", .args = {"-p"}, .env = sanitized};
 * spec.in_directory(workdir);
 * @endcode
 */
struct ProcessSpec {
    std::filesystem::path executable;             ///< Name (PATH lookup) or path
    std::vector<std::string> args;                ///< argv[1..]
    Environment env;                              ///< Complete child environment
    std::optional<std::filesystem::path> workdir; ///< Working directory (optional)

    auto& in_directory(std::filesystem::path dir) {
        workdir = std::move(dir);
        return *this;
    }
};

/**
 * @brief Receives stdout data in the exact order the child produced it.
 *
 * Always invoked from a single reader thread per process.
 */
using OutputSink = std::function<void(std::string_view)>;

/**
 * @brief Handle to one running external process.
 *
 * Implementations must be safe to signal() from a thread other than the one
 * waiting in wait_for_exit().
 */
class ExternalProcessHandle {
public:
    virtual ~ExternalProcessHandle() = default;

    [[nodiscard]] virtual int64_t pid() const noexcept = 0;
    [[nodiscard]] virtual ProcessState state() const noexcept = 0;

    /**
     * @brief Write to the child's stdin.
     * @return Bytes written; short when the child stops reading or is being shut down
     */
    virtual size_t write_stdin(std::span<const std::byte> data) = 0;

    /// Send EOF to the child
    virtual void close_stdin() = 0;

    /// No-op once the process has been reaped
    virtual void signal(ProcessSignal sig) = 0;

    /**
     * @brief Wait until the process has exited and its stdout has been fully delivered.
     * @return true if that happened within @p timeout
     */
    [[nodiscard]] virtual bool wait_for_exit(std::chrono::milliseconds timeout) = 0;

    /// Exit status (128+signal when killed), nullopt while running
    [[nodiscard]] virtual std::optional<int> exit_code() const noexcept = 0;

    /// Everything the child wrote to stderr so far
    [[nodiscard]] virtual std::string stderr_output() const = 0;

    /**
     * @brief Graceful-then-forced shutdown.
     *
     * Closes stdin, sends Terminate, waits @p grace, then sends Kill.
     *
     * @return true if the process was reaped
     */
    bool terminate(std::chrono::milliseconds grace);
};

/**
 * @brief Factory seam between the broker and the operating system.
 */
class ProcessLauncher {
public:
    virtual ~ProcessLauncher() = default;

    /**
     * @brief Start @p spec.
     * @return SpawnFailure if the executable cannot be found or exec fails
     */
    virtual Result<std::unique_ptr<ExternalProcessHandle>> spawn(const ProcessSpec& spec,
                                                                 OutputSink onStdout) = 0;
};

/**
 * @brief fork/execve launcher with pipes for stdin/stdout/stderr.
 *
 * All pipes are CLOEXEC so concurrently spawned children never inherit each
 * other's stdin. A failed exec is reported synchronously through an extra pipe.
 */
class PosixProcessLauncher final : public ProcessLauncher {
public:
    PosixProcessLauncher();

    Result<std::unique_ptr<ExternalProcessHandle>> spawn(const ProcessSpec& spec,
                                                         OutputSink onStdout) override;
};

/**
 * @brief Convenience: run to completion, collecting stdout, bounded by @p timeout.
 *
 * Used for short probes (version, auth status). Timeout terminates the process
 * and yields ErrorCode::Timeout.
 */
struct CapturedRun {
    int exitCode = -1;
    std::string stdoutText;
    std::string stderrText;
};

Result<CapturedRun> runCaptured(ProcessLauncher& launcher, const ProcessSpec& spec,
                                std::chrono::milliseconds timeout,
                                std::chrono::milliseconds grace = std::chrono::milliseconds{500});

} // namespace qbroker::process
