#pragma once

#include <qbroker/broker/request.h>
#include <qbroker/core/types.h>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace qbroker::broker {

/**
 * @brief Argument vector for one request (prompt itself goes to stdin).
 *
 * Query: -p --output-format json [--image PATH] [--max-tokens N] [--model M]
 * Stream: -p [--image PATH] [--max-tokens N] [--model M]
 */
std::vector<std::string> buildCliArgs(RequestMode mode, const QueryOptions& options,
                                      const std::optional<std::filesystem::path>& imagePath);

/**
 * @brief Extract the completion text from a finished query's stdout.
 *
 * JSON object: "result", then "content", then "message". "is_error": true turns
 * the text into a RuntimeFailure. A JSON object without any of those fields, or
 * empty output, is MalformedOutput. Output that is not JSON is returned trimmed.
 */
Result<std::string> parseQueryOutput(std::string_view stdoutText);

/**
 * @brief Parsed "<tool> auth status" output.
 */
struct AuthProbe {
    bool authenticated = false;
    std::optional<std::string> account;
};

/// Looks for "Authenticated as: <account>" anywhere in the combined output
AuthProbe parseAuthStatus(std::string_view combinedOutput);

/// First non-empty line of "<tool> --version", trimmed
std::string parseVersion(std::string_view stdoutText);

} // namespace qbroker::broker
