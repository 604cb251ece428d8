#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <qbroker/cli/qbroker_cli.h>

int main(int argc, char* argv[]) {
    try {
        // stdout carries model output only
        auto stderr_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        spdlog::set_default_logger(std::make_shared<spdlog::logger>("qbroker", stderr_sink));

        // Conservative default; QbrokerCLI::run() adjusts based on flags
        spdlog::set_level(spdlog::level::warn);
        spdlog::set_pattern("[%H:%M:%S] [%l] %v");

        qbroker::cli::QbrokerCLI cli;
        return cli.run(argc, argv);
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
