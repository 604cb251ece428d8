#include <qbroker/broker/broker_service.h>
#include <qbroker/cli/command.h>
#include <qbroker/cli/qbroker_cli.h>

#include <spdlog/spdlog.h>

#include <iostream>

namespace qbroker::cli {

class CheckCommand : public ICommand {
public:
    std::string getName() const override { return "check"; }

    std::string getDescription() const override {
        return "Probe the CLI and report which completion paths are usable";
    }

    void registerCommand(CLI::App& app, QbrokerCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("check", getDescription());
        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        auto cfg = cli_->getConfig();
        if (!cfg) {
            std::cout << "[FAIL] config: " << cfg.error().message << "\n";
            return cfg.error();
        }
        std::cout << "[OK]   config: executable '" << cfg.value().executable.string()
                  << "', capacity " << cfg.value().capacity << "\n";

        bool cliUsable = false;
        auto svc = cli_->getBroker();
        if (!svc) {
            std::cout << "[FAIL] broker: " << svc.error().message << "\n";
        } else {
            auto install = svc.value()->checkInstalled(/*forceRefresh=*/true);
            if (install.installed) {
                std::cout << "[OK]   installed: " << install.version << "\n";
            } else {
                std::cout << "[FAIL] installed: " << install.error.value_or("unknown") << "\n";
            }

            auto auth = svc.value()->checkAuthenticated(/*forceRefresh=*/true);
            if (auth.authenticated) {
                std::cout << "[OK]   authenticated" << (auth.account ? " as " + *auth.account : "")
                          << "\n";
            } else {
                std::cout << "[FAIL] authenticated: " << auth.error.value_or("unknown") << "\n";
            }
            cliUsable = install.installed && auth.authenticated;
        }

        const bool remoteUsable = !cli_->getNoFallback() && !cfg.value().remote.apiKey.empty();
        if (cli_->getNoFallback()) {
            std::cout << "[SKIP] remote api: disabled by --no-fallback\n";
        } else if (remoteUsable) {
            std::cout << "[OK]   remote api: key present, model " << cfg.value().remote.model
                      << "\n";
        } else {
            std::cout << "[WARN] remote api: ANTHROPIC_API_KEY not set\n";
        }

        if (!cliUsable && !remoteUsable) {
            return Error{ErrorCode::NotInstalled, "No completion path is usable"};
        }
        return {};
    }

private:
    QbrokerCLI* cli_ = nullptr;
};

std::unique_ptr<ICommand> createCheckCommand() {
    return std::make_unique<CheckCommand>();
}

} // namespace qbroker::cli
