#include <qbroker/cli/command_registry.h>
#include <qbroker/cli/qbroker_cli.h>

namespace qbroker::cli {

void CommandRegistry::registerAllCommands(QbrokerCLI* cli) {
    // Call sites
    cli->registerCommand(createChatCommand());
    cli->registerCommand(createVisionCommand());
    cli->registerCommand(createChainCommand());
    cli->registerCommand(createExtractCommand());
    // Diagnostics
    cli->registerCommand(createStatusCommand());
    cli->registerCommand(createCheckCommand());
}

} // namespace qbroker::cli
