#include <qbroker/cli/command.h>
#include <qbroker/cli/query_flags.h>
#include <qbroker/cli/qbroker_cli.h>

#include <spdlog/spdlog.h>

#include <iostream>
#include <vector>

namespace qbroker::cli {

class ChatCommand : public ICommand {
public:
    std::string getName() const override { return "chat"; }

    std::string getDescription() const override {
        return "Send a chat message and stream the reply";
    }

    void registerCommand(CLI::App& app, QbrokerCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("chat", getDescription());
        cmd->add_option("message", words_, "Message text")->required();
        cmd->add_flag("--no-stream", noStream_, "Wait for the whole reply instead of streaming");
        flags_.addTo(cmd);

        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        std::string prompt;
        for (const auto& w : words_) {
            if (!prompt.empty())
                prompt.push_back(' ');
            prompt += w;
        }
        if (prompt.empty()) {
            return Error{ErrorCode::InvalidArgument, "Message must not be empty"};
        }

        auto& orchestrator = cli_->getOrchestrator();
        if (noStream_) {
            auto r = orchestrator.query(prompt, flags_.toOptions());
            if (r.success) {
                std::cout << r.content << "\n";
            }
            printProvenance(r);
            return toCommandResult(r);
        }

        fallback::StreamSink sink;
        sink.onChunk = [](std::string_view chunk) { std::cout << chunk << std::flush; };
        sink.onDiscard = []() {
            std::cout << std::endl;
            std::cerr << "[partial CLI output discarded, retrying via remote API]\n";
        };

        auto r = orchestrator.stream(prompt, flags_.toOptions(), sink);
        if (r.success) {
            std::cout << "\n";
        }
        printProvenance(r);
        return toCommandResult(r);
    }

private:
    QbrokerCLI* cli_ = nullptr;
    std::vector<std::string> words_;
    bool noStream_ = false;
    QueryFlags flags_;
};

std::unique_ptr<ICommand> createChatCommand() {
    return std::make_unique<ChatCommand>();
}

} // namespace qbroker::cli
