#include <qbroker/cli/command.h>
#include <qbroker/cli/query_flags.h>
#include <qbroker/cli/qbroker_cli.h>

#include <spdlog/spdlog.h>

#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>

namespace qbroker::cli {

namespace fs = std::filesystem;

class VisionCommand : public ICommand {
public:
    std::string getName() const override { return "vision"; }

    std::string getDescription() const override { return "Analyze an image file"; }

    void registerCommand(CLI::App& app, QbrokerCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("vision", getDescription());
        cmd->add_option("image", imagePath_, "Image file (png, jpeg, gif, webp)")
            ->required()
            ->check(CLI::ExistingFile);
        cmd->add_option("prompt", prompt_, "What to ask about the image")
            ->default_val("Describe this image in detail.");
        flags_.addTo(cmd);

        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        std::ifstream in(imagePath_, std::ios::binary);
        if (!in) {
            return Error{ErrorCode::NotFound, "Cannot open " + imagePath_.string()};
        }
        std::vector<char> raw((std::istreambuf_iterator<char>(in)),
                              std::istreambuf_iterator<char>());
        if (raw.empty()) {
            return Error{ErrorCode::InvalidArgument, imagePath_.string() + " is empty"};
        }
        ByteVector image(raw.size());
        std::memcpy(image.data(), raw.data(), raw.size());
        spdlog::debug("Loaded {} ({} bytes)", imagePath_.string(), image.size());

        auto r = cli_->getOrchestrator().queryWithImage(prompt_, image,
                                                        imagePath_.extension().string(),
                                                        flags_.toOptions());
        if (r.success) {
            std::cout << r.content << "\n";
        }
        printProvenance(r);
        return toCommandResult(r);
    }

private:
    QbrokerCLI* cli_ = nullptr;
    fs::path imagePath_;
    std::string prompt_;
    QueryFlags flags_;
};

std::unique_ptr<ICommand> createVisionCommand() {
    return std::make_unique<VisionCommand>();
}

} // namespace qbroker::cli
