#include <qbroker/broker/broker_service.h>
#include <qbroker/cli/command_registry.h>
#include <qbroker/cli/qbroker_cli.h>
#include <qbroker/fallback/fallback_orchestrator.h>
#include <qbroker/fallback/remote_client.h>

#include <spdlog/spdlog.h>

#include <cctype>
#include <cstdlib>
#include <iostream>

#ifndef QBROKER_VERSION_STRING
#define QBROKER_VERSION_STRING "0.1.0"
#endif

namespace qbroker::cli {

namespace {

std::optional<spdlog::level::level_enum> parseLevel(const std::string& s) {
    std::string v;
    v.reserve(s.size());
    for (char c : s)
        v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (v == "trace")
        return spdlog::level::trace;
    if (v == "debug")
        return spdlog::level::debug;
    if (v == "info")
        return spdlog::level::info;
    if (v == "warn" || v == "warning")
        return spdlog::level::warn;
    if (v == "error" || v == "err")
        return spdlog::level::err;
    if (v == "critical" || v == "crit")
        return spdlog::level::critical;
    if (v == "off" || v == "none" || v == "silent")
        return spdlog::level::off;
    return std::nullopt;
}

} // namespace

QbrokerCLI::QbrokerCLI() {
    // Conservative default; finalized after parsing flags in run()
    spdlog::set_level(spdlog::level::warn);

    app_ = std::make_unique<CLI::App>("qbroker - bounded CLI query broker", "qbroker");
    app_->set_version_flag("--version", QBROKER_VERSION_STRING);
    app_->require_subcommand(1);

    app_->add_option("--config", configPath_, "Config file (default: $QBROKER_CONFIG or XDG)");
    app_->add_option("--log-level", logLevel_,
                     "Log level: trace, debug, info, warn, error, critical, off");
    app_->add_flag("-v,--verbose", verbose_, "Enable debug logging");
    app_->add_flag("--no-fallback", noFallback_, "Never fall back to the remote API");
}

QbrokerCLI::~QbrokerCLI() {
    // Orchestrator holds a raw pointer to the broker
    orchestrator_.reset();
    if (broker_) {
        broker_->shutdown();
    }
}

void QbrokerCLI::registerBuiltinCommands() {
    CommandRegistry::registerAllCommands(this);
}

void QbrokerCLI::registerCommand(std::unique_ptr<ICommand> command) {
    command->registerCommand(*app_, this);
    commands_.push_back(std::move(command));
}

void QbrokerCLI::setPendingCommand(ICommand* cmd) {
    pendingCommand_ = cmd;
}

void QbrokerCLI::applyLogLevel() {
    // Precedence: env QBROKER_LOG_LEVEL > --log-level > --verbose > warn
    if (const char* envLvl = std::getenv("QBROKER_LOG_LEVEL"); envLvl && *envLvl) {
        if (auto lvl = parseLevel(envLvl)) {
            spdlog::set_level(*lvl);
            return;
        }
    }
    if (!logLevel_.empty()) {
        if (auto lvl = parseLevel(logLevel_)) {
            spdlog::set_level(*lvl);
            return;
        }
        std::cerr << "Unknown log level '" << logLevel_ << "', using warn\n";
    }
    spdlog::set_level(verbose_ ? spdlog::level::debug : spdlog::level::warn);
}

int QbrokerCLI::run(int argc, char* argv[]) {
    registerBuiltinCommands();

    try {
        app_->parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app_->exit(e);
    }

    applyLogLevel();

    if (!pendingCommand_) {
        std::cerr << app_->help();
        return 1;
    }

    auto result = pendingCommand_->execute();
    if (!result) {
        std::cerr << "[FAIL] " << pendingCommand_->getName() << ": " << result.error().message
                  << "\n";
        spdlog::debug("Command '{}' failed with {}", pendingCommand_->getName(),
                      result.error().code);
        return 1;
    }
    return 0;
}

Result<config::BrokerConfig> QbrokerCLI::getConfig() {
    if (!config_) {
        auto loaded = config::loadBrokerConfig(configPath_);
        if (!loaded) {
            return loaded.error();
        }
        config_ = std::move(loaded).value();
    }
    return *config_;
}

Result<broker::BrokerService*> QbrokerCLI::getBroker() {
    if (broker_) {
        return broker_.get();
    }
    auto cfg = getConfig();
    if (!cfg) {
        return cfg.error();
    }
    try {
        auto svc = std::make_unique<broker::BrokerService>(cfg.value());
        if (auto started = svc->start(); !started) {
            return started.error();
        }
        broker_ = std::move(svc);
    } catch (const std::exception& e) {
        return Error{ErrorCode::InternalError, std::string("Failed to create broker: ") + e.what()};
    }
    return broker_.get();
}

fallback::FallbackOrchestrator& QbrokerCLI::getOrchestrator() {
    if (!orchestrator_) {
        broker::BrokerService* svc = nullptr;
        if (auto b = getBroker()) {
            svc = b.value();
        } else {
            spdlog::warn("Local broker unavailable: {}", b.error().message);
        }

        std::shared_ptr<fallback::RemoteCompletionClient> remote;
        if (!noFallback_) {
            auto cfg = getConfig();
            remote = std::make_shared<fallback::AnthropicHttpClient>(
                cfg ? cfg.value().remote : config::RemoteApiConfig{});
        }

        fallback::FallbackOrchestrator::Options opts;
        opts.allowRemote = !noFallback_;
        orchestrator_ = std::make_unique<fallback::FallbackOrchestrator>(svc, std::move(remote),
                                                                         std::move(opts));
    }
    return *orchestrator_;
}

} // namespace qbroker::cli
