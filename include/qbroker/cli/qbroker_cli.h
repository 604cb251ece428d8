#pragma once

#include <CLI/CLI.hpp>
#include <qbroker/cli/command.h>
#include <qbroker/config/broker_config.h>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace qbroker::broker {
class BrokerService;
}

namespace qbroker::fallback {
class FallbackOrchestrator;
}

namespace qbroker::cli {

/**
 * Main CLI application class
 */
class QbrokerCLI {
public:
    QbrokerCLI();
    ~QbrokerCLI();

    /**
     * Run the CLI with given arguments
     */
    int run(int argc, char* argv[]);

    /**
     * Register a command
     */
    void registerCommand(std::unique_ptr<ICommand> command);

    /**
     * Run @p cmd once parsing has finished
     */
    void setPendingCommand(ICommand* cmd);

    /**
     * Loaded configuration (lazy; honours --config)
     */
    Result<config::BrokerConfig> getConfig();

    /**
     * Started broker instance (lazy)
     */
    Result<broker::BrokerService*> getBroker();

    /**
     * Orchestrator over the broker and the remote API (lazy)
     *
     * A broker that cannot be constructed is not an error here: every request
     * then goes to the remote API, unless --no-fallback was given.
     */
    fallback::FallbackOrchestrator& getOrchestrator();

    bool getNoFallback() const { return noFallback_; }

private:
    void registerBuiltinCommands();
    void applyLogLevel();

    std::unique_ptr<CLI::App> app_;
    std::vector<std::unique_ptr<ICommand>> commands_;
    ICommand* pendingCommand_ = nullptr;

    std::string configPath_;
    std::string logLevel_;
    bool verbose_ = false;
    bool noFallback_ = false;

    std::optional<config::BrokerConfig> config_;
    std::unique_ptr<broker::BrokerService> broker_;
    std::unique_ptr<fallback::FallbackOrchestrator> orchestrator_;
};

} // namespace qbroker::cli
