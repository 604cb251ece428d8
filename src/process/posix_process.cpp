#include <qbroker/process/external_process.h>

#include <spdlog/spdlog.h>

#include <array>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <mutex>
#include <stop_token>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>

namespace qbroker::process {

namespace {

constexpr int kPollIntervalMs = 50;

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

// pipe2 with CLOEXEC on both ends
bool make_pipe(std::array<int, 2>& fds) {
    return ::pipe2(fds.data(), O_CLOEXEC) == 0;
}

// In the child: move fd onto target and make sure the copy survives exec
void redirect(int fd, int target) {
    if (fd == target) {
        ::fcntl(target, F_SETFD, 0);
    } else {
        ::dup2(fd, target);
    }
}

/**
 * @brief One forked child with its pipes and reader threads.
 */
class PosixProcess final : public ExternalProcessHandle {
public:
    PosixProcess(pid_t pid, int stdinFd, int stdoutFd, int stderrFd, OutputSink sink,
                 std::string executable)
        : pid_(pid), stdinFd_(stdinFd), stdoutFd_(stdoutFd), stderrFd_(stderrFd),
          sink_(std::move(sink)), executable_(std::move(executable)) {
        // Non-blocking stdin so writes can give up when the child is being shut down
        ::fcntl(stdinFd_, F_SETFL, ::fcntl(stdinFd_, F_GETFL) | O_NONBLOCK);

        stdoutReader_ = std::jthread{[this](std::stop_token st) { read_stdout_loop(st); }};
        stderrReader_ = std::jthread{[this](std::stop_token st) { read_stderr_loop(st); }};
    }

    ~PosixProcess() override {
        if (!reaped_.load(std::memory_order_acquire)) {
            spdlog::debug("[PosixProcess] Destroying live pid={}, killing", pid_);
            ::kill(pid_, SIGKILL);
            int status = 0;
            while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
            }
            reaped_.store(true, std::memory_order_release);
        }
        stdoutReader_.request_stop();
        stderrReader_.request_stop();
        if (stdoutReader_.joinable())
            stdoutReader_.join();
        if (stderrReader_.joinable())
            stderrReader_.join();

        {
            std::lock_guard lock{stdinMutex_};
            close_fd(stdinFd_);
        }
        close_fd(stdoutFd_);
        close_fd(stderrFd_);
    }

    PosixProcess(const PosixProcess&) = delete;
    PosixProcess& operator=(const PosixProcess&) = delete;

    int64_t pid() const noexcept override { return static_cast<int64_t>(pid_); }

    ProcessState state() const noexcept override { return state_.load(std::memory_order_acquire); }

    size_t write_stdin(std::span<const std::byte> data) override {
        std::lock_guard lock{stdinMutex_};
        size_t written = 0;

        while (written < data.size()) {
            if (stdinFd_ < 0 || state() != ProcessState::Running) {
                break;
            }
            ssize_t n = ::write(stdinFd_, data.data() + written, data.size() - written);
            if (n > 0) {
                written += static_cast<size_t>(n);
                continue;
            }
            if (n < 0 && errno == EINTR) {
                continue;
            }
            if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
                pollfd pfd{stdinFd_, POLLOUT, 0};
                ::poll(&pfd, 1, kPollIntervalMs);
                continue;
            }
            if (n < 0 && errno == EPIPE) {
                spdlog::debug("[PosixProcess] pid={} closed stdin early (EPIPE)", pid_);
            } else {
                spdlog::error("[PosixProcess] Write to pid={} failed: {}", pid_,
                              std::strerror(errno));
            }
            break;
        }
        return written;
    }

    void close_stdin() override {
        std::lock_guard lock{stdinMutex_};
        close_fd(stdinFd_);
    }

    void signal(ProcessSignal sig) override {
        std::lock_guard lock{waitMutex_};
        if (reaped_.load(std::memory_order_acquire)) {
            return;
        }
        state_.store(ProcessState::ShuttingDown, std::memory_order_release);
        const int signo = sig == ProcessSignal::Kill ? SIGKILL : SIGTERM;
        if (::kill(pid_, signo) != 0 && errno != ESRCH) {
            spdlog::warn("[PosixProcess] kill({}, {}) failed: {}", pid_, signo,
                         std::strerror(errno));
        }
    }

    bool wait_for_exit(std::chrono::milliseconds timeout) override {
        const auto deadline = std::chrono::steady_clock::now() + timeout;

        while (true) {
            try_reap();
            if (reaped_.load(std::memory_order_acquire) &&
                stdoutDone_.load(std::memory_order_acquire) &&
                stderrDone_.load(std::memory_order_acquire)) {
                return true;
            }
            if (std::chrono::steady_clock::now() >= deadline) {
                return false;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds{10});
        }
    }

    std::optional<int> exit_code() const noexcept override {
        std::lock_guard lock{waitMutex_};
        return exitCode_;
    }

    std::string stderr_output() const override {
        std::lock_guard lock{stderrMutex_};
        return stderr_;
    }

private:
    void try_reap() {
        std::lock_guard lock{waitMutex_};
        if (reaped_.load(std::memory_order_acquire)) {
            return;
        }
        int status = 0;
        pid_t r = ::waitpid(pid_, &status, WNOHANG);
        if (r == pid_) {
            if (WIFEXITED(status)) {
                exitCode_ = WEXITSTATUS(status);
            } else if (WIFSIGNALED(status)) {
                exitCode_ = 128 + WTERMSIG(status);
            }
            reaped_.store(true, std::memory_order_release);
            state_.store(ProcessState::Exited, std::memory_order_release);
            spdlog::debug("[PosixProcess] {} (pid={}) exited with {}", executable_, pid_,
                          exitCode_.value_or(-1));
        } else if (r < 0 && errno == ECHILD) {
            // Someone else reaped it; nothing more to learn
            reaped_.store(true, std::memory_order_release);
            state_.store(ProcessState::Exited, std::memory_order_release);
        }
    }

    void read_stdout_loop(std::stop_token st) {
        std::array<char, 4096> buffer;
        while (!st.stop_requested()) {
            pollfd pfd{stdoutFd_, POLLIN, 0};
            int pr = ::poll(&pfd, 1, kPollIntervalMs);
            if (pr < 0 && errno != EINTR) {
                break;
            }
            if (pr <= 0) {
                continue;
            }
            ssize_t n = ::read(stdoutFd_, buffer.data(), buffer.size());
            if (n > 0) {
                if (sink_) {
                    try {
                        sink_(std::string_view{buffer.data(), static_cast<size_t>(n)});
                    } catch (const std::exception& e) {
                        spdlog::error("[PosixProcess] stdout sink threw for pid={}: {}", pid_,
                                      e.what());
                    }
                }
            } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
                break;
            }
        }
        stdoutDone_.store(true, std::memory_order_release);
    }

    void read_stderr_loop(std::stop_token st) {
        std::array<char, 4096> buffer;
        while (!st.stop_requested()) {
            pollfd pfd{stderrFd_, POLLIN, 0};
            int pr = ::poll(&pfd, 1, kPollIntervalMs);
            if (pr < 0 && errno != EINTR) {
                break;
            }
            if (pr <= 0) {
                continue;
            }
            ssize_t n = ::read(stderrFd_, buffer.data(), buffer.size());
            if (n > 0) {
                std::lock_guard lock{stderrMutex_};
                stderr_.append(buffer.data(), static_cast<size_t>(n));
            } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
                break;
            }
        }
        stderrDone_.store(true, std::memory_order_release);
    }

    pid_t pid_;
    int stdinFd_;
    int stdoutFd_;
    int stderrFd_;
    OutputSink sink_;
    std::string executable_;

    std::atomic<ProcessState> state_{ProcessState::Running};
    std::atomic<bool> reaped_{false};
    std::atomic<bool> stdoutDone_{false};
    std::atomic<bool> stderrDone_{false};
    std::optional<int> exitCode_;
    std::string stderr_;

    mutable std::mutex waitMutex_;
    mutable std::mutex stdinMutex_;
    mutable std::mutex stderrMutex_;

    std::jthread stdoutReader_;
    std::jthread stderrReader_;
};

} // namespace

PosixProcessLauncher::PosixProcessLauncher() {
    // A child that dies mid-write must surface as EPIPE, not kill the broker
    ::signal(SIGPIPE, SIG_IGN);
}

Result<std::unique_ptr<ExternalProcessHandle>> PosixProcessLauncher::spawn(const ProcessSpec& spec,
                                                                           OutputSink onStdout) {
    const auto exeName = spec.executable.string();
    const auto resolved = resolveExecutable(exeName, spec.env);
    if (resolved.empty()) {
        return Error{ErrorCode::SpawnFailure, "Executable not found: " + exeName};
    }

    // Everything the child needs is built before fork(); the child only calls
    // async-signal-safe functions.
    std::vector<std::string> argStrings;
    argStrings.reserve(spec.args.size() + 1);
    argStrings.push_back(exeName);
    argStrings.insert(argStrings.end(), spec.args.begin(), spec.args.end());
    std::vector<char*> argv;
    for (auto& a : argStrings)
        argv.push_back(a.data());
    argv.push_back(nullptr);

    auto envStrings = toEnvStrings(spec.env);
    std::vector<char*> envp;
    for (auto& e : envStrings)
        envp.push_back(e.data());
    envp.push_back(nullptr);

    std::string workdir = spec.workdir ? spec.workdir->string() : std::string{};

    std::array<int, 2> in{-1, -1}, out{-1, -1}, err{-1, -1}, status{-1, -1};
    auto closeAll = [&] {
        for (auto* p : {&in, &out, &err, &status}) {
            close_fd((*p)[0]);
            close_fd((*p)[1]);
        }
    };

    if (!make_pipe(in) || !make_pipe(out) || !make_pipe(err) || !make_pipe(status)) {
        int e = errno;
        closeAll();
        return Error{ErrorCode::SpawnFailure, std::string("pipe2() failed: ") + std::strerror(e)};
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        int e = errno;
        closeAll();
        return Error{ErrorCode::SpawnFailure, std::string("fork() failed: ") + std::strerror(e)};
    }

    if (pid == 0) {
        redirect(in[0], STDIN_FILENO);
        redirect(out[1], STDOUT_FILENO);
        redirect(err[1], STDERR_FILENO);
        ::signal(SIGPIPE, SIG_DFL);

        if (!workdir.empty() && ::chdir(workdir.c_str()) != 0) {
            int e = errno;
            (void)!::write(status[1], &e, sizeof(e));
            ::_exit(127);
        }

        ::execve(resolved.c_str(), argv.data(), envp.data());

        int e = errno;
        (void)!::write(status[1], &e, sizeof(e));
        ::_exit(127);
    }

    close_fd(in[0]);
    close_fd(out[1]);
    close_fd(err[1]);
    close_fd(status[1]);

    int childErrno = 0;
    ssize_t n;
    do {
        n = ::read(status[0], &childErrno, sizeof(childErrno));
    } while (n < 0 && errno == EINTR);
    close_fd(status[0]);

    if (n == static_cast<ssize_t>(sizeof(childErrno))) {
        int st = 0;
        while (::waitpid(pid, &st, 0) < 0 && errno == EINTR) {
        }
        close_fd(in[1]);
        close_fd(out[0]);
        close_fd(err[0]);
        spdlog::error("[PosixProcessLauncher] exec of {} failed: {}", resolved,
                      std::strerror(childErrno));
        return Error{ErrorCode::SpawnFailure,
                     "Failed to start " + exeName + ": " + std::strerror(childErrno)};
    }

    spdlog::info("[PosixProcessLauncher] Spawned {} (pid={})", resolved, pid);
    return std::unique_ptr<ExternalProcessHandle>(
        std::make_unique<PosixProcess>(pid, in[1], out[0], err[0], std::move(onStdout), resolved));
}

} // namespace qbroker::process
