#include <qbroker/process/external_process.h>

#include <spdlog/spdlog.h>

#include <mutex>

namespace qbroker::process {

bool ExternalProcessHandle::terminate(std::chrono::milliseconds grace) {
    if (state() == ProcessState::Exited) {
        return true;
    }

    spdlog::debug("[ExternalProcess] Terminating pid={} (grace {}ms)", pid(), grace.count());
    close_stdin();
    signal(ProcessSignal::Terminate);
    if (wait_for_exit(grace)) {
        return true;
    }

    spdlog::warn("[ExternalProcess] pid={} ignored SIGTERM, forcing kill", pid());
    signal(ProcessSignal::Kill);
    return wait_for_exit(std::chrono::seconds{1});
}

Result<CapturedRun> runCaptured(ProcessLauncher& launcher, const ProcessSpec& spec,
                                std::chrono::milliseconds timeout,
                                std::chrono::milliseconds grace) {
    auto buffer = std::make_shared<std::string>();
    auto bufferMutex = std::make_shared<std::mutex>();

    auto spawned = launcher.spawn(spec, [buffer, bufferMutex](std::string_view chunk) {
        std::lock_guard lock{*bufferMutex};
        buffer->append(chunk);
    });
    if (!spawned) {
        return spawned.error();
    }

    auto handle = std::move(spawned).value();
    handle->close_stdin();

    if (!handle->wait_for_exit(timeout)) {
        handle->terminate(grace);
        return Error{ErrorCode::Timeout, spec.executable.string() + " did not finish within " +
                                             std::to_string(timeout.count()) + "ms"};
    }

    CapturedRun run;
    run.exitCode = handle->exit_code().value_or(-1);
    run.stderrText = handle->stderr_output();
    {
        std::lock_guard lock{*bufferMutex};
        run.stdoutText = *buffer;
    }
    return run;
}

} // namespace qbroker::process
