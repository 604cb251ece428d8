/*
 * remote_client.cpp
 *
 * Notes
 * - Single blocking POST per completion using the libcurl easy API.
 * - The API key only ever travels in the x-api-key header; it is never logged.
 */

#include <qbroker/fallback/remote_client.h>

#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <mutex>

namespace qbroker::fallback {

using json = nlohmann::json;

namespace {

std::once_flag g_curlInit;

size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    if (userdata == nullptr) {
        return 0;
    }
    static_cast<std::string*>(userdata)->append(ptr, total);
    return total;
}

Error makeCurlError(CURLcode code) {
    Error err;
    err.message = std::string("Remote API request failed: ") + curl_easy_strerror(code);
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
            err.code = ErrorCode::Timeout;
            break;
        default:
            err.code = ErrorCode::NetworkError;
            break;
    }
    return err;
}

} // namespace

std::string encodeBase64(ByteSpan bytes) {
    static constexpr char base64_chars[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    std::string base64;
    base64.reserve(((bytes.size() + 2) / 3) * 4);

    const auto* data = reinterpret_cast<const uint8_t*>(bytes.data());
    const size_t len = bytes.size();

    for (size_t i = 0; i < len; i += 3) {
        uint32_t n = static_cast<uint32_t>(data[i]) << 16;
        if (i + 1 < len)
            n |= static_cast<uint32_t>(data[i + 1]) << 8;
        if (i + 2 < len)
            n |= static_cast<uint32_t>(data[i + 2]);

        base64 += base64_chars[(n >> 18) & 0x3F];
        base64 += base64_chars[(n >> 12) & 0x3F];
        base64 += (i + 1 < len) ? base64_chars[(n >> 6) & 0x3F] : '=';
        base64 += (i + 2 < len) ? base64_chars[n & 0x3F] : '=';
    }
    return base64;
}

std::string mediaTypeForExtension(std::string_view extension) {
    std::string ext(extension);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (ext == ".jpg" || ext == ".jpeg")
        return "image/jpeg";
    if (ext == ".gif")
        return "image/gif";
    if (ext == ".webp")
        return "image/webp";
    return "image/png";
}

std::string buildMessagesBody(const RemoteRequest& request,
                              const config::RemoteApiConfig& config) {
    json content = json::array();
    if (request.image) {
        content.push_back({{"type", "image"},
                           {"source",
                            {{"type", "base64"},
                             {"media_type", request.image->mediaType},
                             {"data", encodeBase64(request.image->data)}}}});
    }
    content.push_back({{"type", "text"}, {"text", request.prompt}});

    json body = {{"model", request.model.value_or(config.model)},
                 {"max_tokens", request.maxTokens.value_or(config.maxTokens)},
                 {"messages", json::array({{{"role", "user"}, {"content", content}}})}};
    if (request.system && !request.system->empty()) {
        body["system"] = *request.system;
    }
    return body.dump();
}

Result<std::string> parseMessagesReply(long httpStatus, std::string_view body) {
    auto parsed = json::parse(body, nullptr, /*allow_exceptions=*/false);

    if (httpStatus >= 400) {
        std::string message = "HTTP " + std::to_string(httpStatus);
        if (!parsed.is_discarded() && parsed.is_object()) {
            auto err = parsed.find("error");
            if (err != parsed.end() && err->is_object()) {
                auto msg = err->find("message");
                if (msg != err->end() && msg->is_string()) {
                    message += ": " + msg->get<std::string>();
                }
            }
        }
        auto code = (httpStatus == 401 || httpStatus == 403) ? ErrorCode::NotAuthenticated
                                                             : ErrorCode::RuntimeFailure;
        return Error{code, "Remote API error " + message};
    }

    if (parsed.is_discarded() || !parsed.is_object()) {
        return Error{ErrorCode::MalformedOutput, "Remote API reply is not a JSON object"};
    }
    auto contentIt = parsed.find("content");
    if (contentIt == parsed.end() || !contentIt->is_array()) {
        return Error{ErrorCode::MalformedOutput, "Remote API reply has no content"};
    }

    std::string text;
    bool found = false;
    for (const auto& block : *contentIt) {
        if (!block.is_object()) {
            continue;
        }
        auto t = block.find("text");
        if (t != block.end() && t->is_string()) {
            text += t->get<std::string>();
            found = true;
        }
    }
    if (!found) {
        return Error{ErrorCode::MalformedOutput, "Remote API reply has no text blocks"};
    }
    return text;
}

AnthropicHttpClient::AnthropicHttpClient(config::RemoteApiConfig config)
    : config_(std::move(config)) {
    std::call_once(g_curlInit, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

Result<std::string> AnthropicHttpClient::complete(const RemoteRequest& request) {
    if (config_.apiKey.empty()) {
        return Error{ErrorCode::NotAuthenticated, "ANTHROPIC_API_KEY is not set"};
    }

    const std::string body = buildMessagesBody(request, config_);

    CURL* curl = curl_easy_init();
    if (!curl) {
        return Error{ErrorCode::InternalError, "curl_easy_init failed"};
    }

    const std::string keyHeader = "x-api-key: " + config_.apiKey;
    const std::string versionHeader = "anthropic-version: " + config_.apiVersion;
    curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "content-type: application/json");
    headers = curl_slist_append(headers, keyHeader.c_str());
    headers = curl_slist_append(headers, versionHeader.c_str());

    std::string response;
    curl_easy_setopt(curl, CURLOPT_URL, config_.endpoint.c_str());
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(config_.timeout.count()));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                     static_cast<long>(std::min<long>(config_.timeout.count(), 30000)));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);

    spdlog::debug("[RemoteApi] POST {} ({} byte body, image: {})", config_.endpoint, body.size(),
                  request.image.has_value());
    CURLcode rc = curl_easy_perform(curl);

    long httpStatus = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &httpStatus);

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (rc != CURLE_OK) {
        spdlog::warn("[RemoteApi] {}", curl_easy_strerror(rc));
        return makeCurlError(rc);
    }

    auto reply = parseMessagesReply(httpStatus, response);
    if (!reply) {
        spdlog::warn("[RemoteApi] {}", reply.error().message);
    }
    return reply;
}

} // namespace qbroker::fallback
