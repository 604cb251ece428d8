#pragma once

#include <qbroker/config/broker_config.h>
#include <qbroker/core/types.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace qbroker::fallback {

struct RemoteImage {
    ByteVector data;
    std::string mediaType = "image/png";
};

/**
 * @brief One completion request for the remote Messages API.
 */
struct RemoteRequest {
    std::string prompt;
    std::optional<std::string> system;
    std::optional<RemoteImage> image;
    std::optional<uint32_t> maxTokens; ///< Defaults to the configured maxTokens
    std::optional<std::string> model;  ///< Defaults to the configured model
};

/**
 * @brief The direct network path used when the CLI cannot serve a request.
 */
class RemoteCompletionClient {
public:
    virtual ~RemoteCompletionClient() = default;

    /// Completion text, or NotAuthenticated / NetworkError / RuntimeFailure / MalformedOutput
    virtual Result<std::string> complete(const RemoteRequest& request) = 0;
};

/**
 * @brief libcurl client for POST /v1/messages.
 */
class AnthropicHttpClient final : public RemoteCompletionClient {
public:
    explicit AnthropicHttpClient(config::RemoteApiConfig config);

    Result<std::string> complete(const RemoteRequest& request) override;

private:
    config::RemoteApiConfig config_;
};

/// JSON request body: {model, max_tokens, system?, messages:[{role:user, content}]}
std::string buildMessagesBody(const RemoteRequest& request, const config::RemoteApiConfig& config);

/// Concatenated content[*].text of a reply, or the API's error.message for HTTP >= 400
Result<std::string> parseMessagesReply(long httpStatus, std::string_view body);

std::string encodeBase64(ByteSpan bytes);

/// ".jpg" -> "image/jpeg"; unknown extensions map to "image/png"
std::string mediaTypeForExtension(std::string_view extension);

} // namespace qbroker::fallback
