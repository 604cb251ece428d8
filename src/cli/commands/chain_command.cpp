#include <qbroker/cli/command.h>
#include <qbroker/cli/prompt_util.h>
#include <qbroker/cli/query_flags.h>
#include <qbroker/cli/qbroker_cli.h>

#include <spdlog/spdlog.h>

#include <future>
#include <iostream>
#include <vector>

namespace qbroker::cli {

class ChainCommand : public ICommand {
public:
    std::string getName() const override { return "chain"; }

    std::string getDescription() const override {
        return "Run one task over several inputs concurrently (batch agents)";
    }

    void registerCommand(CLI::App& app, QbrokerCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("chain", getDescription());
        cmd->add_option("--task", task_, "Task specification given to every agent")->required();
        cmd->add_option("inputs", inputs_, "One input per agent")->required();
        flags_.addTo(cmd, 4096);

        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        auto& orchestrator = cli_->getOrchestrator();
        const auto options = flags_.toOptions();

        // The broker's slot pool bounds how many of these reach the CLI at once
        std::vector<std::future<fallback::FallbackResult>> pending;
        pending.reserve(inputs_.size());
        for (const auto& input : inputs_) {
            pending.push_back(std::async(std::launch::async, [&, prompt = buildChainPrompt(
                                                                     task_, input)]() {
                return orchestrator.query(prompt, options);
            }));
        }

        size_t failed = 0;
        for (size_t i = 0; i < pending.size(); ++i) {
            auto r = pending[i].get();
            std::cout << "## Agent " << (i + 1) << " [" << fallback::toString(r.path) << "]\n";
            if (r.success) {
                std::cout << r.content << "\n\n";
            } else {
                ++failed;
                std::cout << "(failed: " << r.error << ")\n\n";
            }
        }
        spdlog::info("Chain finished: {}/{} agents succeeded", inputs_.size() - failed,
                     inputs_.size());

        if (failed > 0) {
            return Error{ErrorCode::RuntimeFailure,
                         std::to_string(failed) + " of " + std::to_string(inputs_.size()) +
                             " agents failed"};
        }
        return {};
    }

private:
    QbrokerCLI* cli_ = nullptr;
    std::string task_;
    std::vector<std::string> inputs_;
    QueryFlags flags_;
};

std::unique_ptr<ICommand> createChainCommand() {
    return std::make_unique<ChainCommand>();
}

} // namespace qbroker::cli
