#include <qbroker/broker/cli_invocation.h>
#include <qbroker/config/config_helpers.h>

#include <nlohmann/json.hpp>

#include <regex>

namespace qbroker::broker {

using json = nlohmann::json;

std::vector<std::string> buildCliArgs(RequestMode mode, const QueryOptions& options,
                                      const std::optional<std::filesystem::path>& imagePath) {
    std::vector<std::string> args{"-p"};
    if (mode == RequestMode::Query) {
        args.emplace_back("--output-format");
        args.emplace_back("json");
    }
    if (imagePath) {
        args.emplace_back("--image");
        args.push_back(imagePath->string());
    }
    if (options.maxTokens) {
        args.emplace_back("--max-tokens");
        args.push_back(std::to_string(*options.maxTokens));
    }
    if (options.model && !options.model->empty()) {
        args.emplace_back("--model");
        args.push_back(*options.model);
    }
    return args;
}

Result<std::string> parseQueryOutput(std::string_view stdoutText) {
    std::string text{stdoutText};
    config::trim(text);
    if (text.empty()) {
        return Error{ErrorCode::MalformedOutput, "CLI produced no output"};
    }

    auto parsed = json::parse(text, nullptr, /*allow_exceptions=*/false);
    if (parsed.is_discarded()) {
        // Plain text is what older CLI builds print; take it as is
        return text;
    }
    if (!parsed.is_object()) {
        return Error{ErrorCode::MalformedOutput, "CLI output is JSON but not an object"};
    }

    std::optional<std::string> content;
    for (const char* field : {"result", "content", "message"}) {
        auto it = parsed.find(field);
        if (it != parsed.end() && it->is_string()) {
            content = it->get<std::string>();
            break;
        }
    }

    auto errIt = parsed.find("is_error");
    if (errIt != parsed.end() && errIt->is_boolean() && errIt->get<bool>()) {
        return Error{ErrorCode::RuntimeFailure,
                     content && !content->empty() ? *content : std::string("CLI reported an error")};
    }
    if (!content) {
        return Error{ErrorCode::MalformedOutput, "CLI JSON output has no result text"};
    }
    return *content;
}

AuthProbe parseAuthStatus(std::string_view combinedOutput) {
    static const std::regex kAuthenticated{R"(Authenticated as:\s*([^\r\n]+))",
                                           std::regex::icase};
    AuthProbe probe;
    std::string haystack{combinedOutput};
    std::smatch m;
    if (std::regex_search(haystack, m, kAuthenticated)) {
        std::string account = m[1].str();
        config::trim(account);
        probe.authenticated = true;
        if (!account.empty()) {
            probe.account = std::move(account);
        }
    }
    return probe;
}

std::string parseVersion(std::string_view stdoutText) {
    size_t start = 0;
    while (start < stdoutText.size()) {
        size_t nl = stdoutText.find('\n', start);
        std::string line{stdoutText.substr(start, nl == std::string_view::npos ? std::string_view::npos
                                                                             : nl - start)};
        config::trim(line);
        if (!line.empty()) {
            return line;
        }
        if (nl == std::string_view::npos) {
            break;
        }
        start = nl + 1;
    }
    return {};
}

} // namespace qbroker::broker
