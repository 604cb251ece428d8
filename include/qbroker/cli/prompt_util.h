#pragma once

#include <nlohmann/json.hpp>
#include <qbroker/core/types.h>

#include <string>
#include <string_view>

namespace qbroker::cli {

/// "<task>\n\n<input>", the prompt each chain agent receives
std::string buildChainPrompt(std::string_view taskSpec, std::string_view input);

/**
 * @brief Instruction asking for a JSON array of memories extracted from @p text.
 *
 * Each element carries type, category, title, content and confidence_score.
 */
std::string buildExtractionPrompt(std::string_view text);

/**
 * @brief Pull the JSON array out of a model reply.
 *
 * Accepts a bare array, an array inside a ``` fence, or an array embedded in
 * prose. Elements that are not objects with a string "content" are dropped.
 *
 * @return MalformedOutput when no array can be parsed
 */
Result<nlohmann::json> parseExtractionReply(std::string_view reply);

} // namespace qbroker::cli
