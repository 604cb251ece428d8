#include <qbroker/cli/command.h>
#include <qbroker/cli/prompt_util.h>
#include <qbroker/cli/query_flags.h>
#include <qbroker/cli/qbroker_cli.h>

#include <spdlog/spdlog.h>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

namespace qbroker::cli {

namespace fs = std::filesystem;

class ExtractCommand : public ICommand {
public:
    std::string getName() const override { return "extract"; }

    std::string getDescription() const override {
        return "Extract memories from a conversation transcript as JSON";
    }

    void registerCommand(CLI::App& app, QbrokerCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("extract", getDescription());
        cmd->add_option("file", inputPath_, "Transcript text file")
            ->required()
            ->check(CLI::ExistingFile);
        flags_.addTo(cmd, 4096);

        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        std::ifstream in(inputPath_);
        if (!in) {
            return Error{ErrorCode::NotFound, "Cannot open " + inputPath_.string()};
        }
        std::ostringstream buf;
        buf << in.rdbuf();
        const std::string text = buf.str();
        if (text.empty()) {
            return Error{ErrorCode::InvalidArgument, inputPath_.string() + " is empty"};
        }

        auto r = cli_->getOrchestrator().query(buildExtractionPrompt(text), flags_.toOptions());
        printProvenance(r);
        if (!r.success) {
            return toCommandResult(r);
        }

        auto memories = parseExtractionReply(r.content);
        if (!memories) {
            spdlog::debug("Unparsable extraction reply ({} bytes)", r.content.size());
            return memories.error();
        }
        std::cout << memories.value().dump(2) << "\n";
        return {};
    }

private:
    QbrokerCLI* cli_ = nullptr;
    fs::path inputPath_;
    QueryFlags flags_;
};

std::unique_ptr<ICommand> createExtractCommand() {
    return std::make_unique<ExtractCommand>();
}

} // namespace qbroker::cli
