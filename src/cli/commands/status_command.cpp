#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <chrono>
#include <iostream>

#include <qbroker/broker/broker_service.h>
#include <qbroker/cli/command.h>
#include <qbroker/cli/qbroker_cli.h>

namespace qbroker::cli {

using json = nlohmann::json;

class StatusCommand : public ICommand {
public:
    std::string getName() const override { return "status"; }

    std::string getDescription() const override {
        return "Show CLI availability and slot occupancy";
    }

    void registerCommand(CLI::App& app, QbrokerCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("status", getDescription());
        cmd->add_flag("--json", jsonOutput_, "Output in JSON format");
        cmd->add_flag("--refresh", refresh_, "Ignore cached availability results");

        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        auto svc = cli_->getBroker();
        if (!svc) {
            return svc.error();
        }
        auto st = svc.value()->status(refresh_);

        if (jsonOutput_) {
            json out = {
                {"installed", st.installed},
                {"version", st.version.empty() ? json(nullptr) : json(st.version)},
                {"authenticated", st.authenticated},
                {"account", st.account ? json(*st.account) : json(nullptr)},
                {"activeSlots", st.activeSlots},
                {"capacity", st.capacity},
                {"queued", st.queued},
                {"lastChecked", std::chrono::duration_cast<std::chrono::milliseconds>(
                                    st.lastChecked.time_since_epoch())
                                    .count()},
                {"lastError", st.lastError ? json(*st.lastError) : json(nullptr)}};
            std::cout << out.dump(2) << std::endl;
            return {};
        }

        std::cout << "CLI installed:  " << (st.installed ? "yes" : "no");
        if (!st.version.empty())
            std::cout << " (" << st.version << ")";
        std::cout << "\n";
        std::cout << "Authenticated:  " << (st.authenticated ? "yes" : "no");
        if (st.account)
            std::cout << " as " << *st.account;
        std::cout << "\n";
        std::cout << "Slots:          " << st.activeSlots << "/" << st.capacity << " busy, "
                  << st.queued << " queued\n";
        if (st.lastError)
            std::cout << "Last error:     " << *st.lastError << "\n";
        return {};
    }

private:
    QbrokerCLI* cli_ = nullptr;
    bool jsonOutput_ = false;
    bool refresh_ = false;
};

std::unique_ptr<ICommand> createStatusCommand() {
    return std::make_unique<StatusCommand>();
}

} // namespace qbroker::cli
