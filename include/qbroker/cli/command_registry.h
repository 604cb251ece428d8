#pragma once

#include <memory>
#include <qbroker/cli/command.h>

namespace qbroker::cli {

class QbrokerCLI;

std::unique_ptr<ICommand> createChatCommand();
std::unique_ptr<ICommand> createVisionCommand();
std::unique_ptr<ICommand> createChainCommand();
std::unique_ptr<ICommand> createExtractCommand();
std::unique_ptr<ICommand> createStatusCommand();
std::unique_ptr<ICommand> createCheckCommand();

/**
 * Registry of all available CLI commands
 */
class CommandRegistry {
public:
    /**
     * Register all built-in commands with the CLI
     */
    static void registerAllCommands(QbrokerCLI* cli);
};

} // namespace qbroker::cli
