#include <qbroker/cli/prompt_util.h>

#include <spdlog/spdlog.h>

namespace qbroker::cli {

using json = nlohmann::json;

std::string buildChainPrompt(std::string_view taskSpec, std::string_view input) {
    std::string prompt;
    prompt.reserve(taskSpec.size() + input.size() + 2);
    prompt.append(taskSpec);
    prompt.append("\n\n");
    prompt.append(input);
    return prompt;
}

std::string buildExtractionPrompt(std::string_view text) {
    std::string prompt =
        "Extract the durable memories from the conversation below: decisions, preferences, "
        "facts about people or projects, and commitments.\n"
        "Respond with only a JSON array. Each element is an object with the fields\n"
        "  type (decision | preference | fact | commitment),\n"
        "  category (short lowercase label),\n"
        "  title (under 80 characters),\n"
        "  content (one or two sentences),\n"
        "  confidence_score (integer 0-100).\n"
        "Return [] when nothing is worth remembering.\n\n"
        "Conversation:\n";
    prompt.append(text);
    return prompt;
}

Result<json> parseExtractionReply(std::string_view reply) {
    std::string_view body = reply;

    // Prefer a fenced block when there is one
    if (auto fence = body.find("```"); fence != std::string_view::npos) {
        auto start = body.find('\n', fence);
        auto end = start == std::string_view::npos ? std::string_view::npos
                                                   : body.find("```", start);
        if (end != std::string_view::npos) {
            body = body.substr(start + 1, end - start - 1);
        }
    }

    auto open = body.find('[');
    auto close = body.rfind(']');
    if (open == std::string_view::npos || close == std::string_view::npos || close < open) {
        return Error{ErrorCode::MalformedOutput, "Reply contains no JSON array"};
    }

    auto parsed = json::parse(body.substr(open, close - open + 1), nullptr,
                              /*allow_exceptions=*/false);
    if (parsed.is_discarded() || !parsed.is_array()) {
        return Error{ErrorCode::MalformedOutput, "Reply array is not valid JSON"};
    }

    json memories = json::array();
    for (auto& item : parsed) {
        auto content = item.is_object() ? item.find("content") : item.end();
        if (!item.is_object() || content == item.end() || !content->is_string()) {
            continue;
        }
        memories.push_back(std::move(item));
    }
    if (memories.size() != parsed.size()) {
        spdlog::debug("Dropped {} malformed memory entries", parsed.size() - memories.size());
    }
    return memories;
}

} // namespace qbroker::cli
