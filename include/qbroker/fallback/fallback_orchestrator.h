#pragma once

#include <qbroker/broker/request.h>
#include <qbroker/core/types.h>
#include <qbroker/fallback/remote_client.h>

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace qbroker::broker {
class BrokerService;
}

namespace qbroker::fallback {

/// Which path produced the text
enum class CompletionPath : uint8_t { Subscription, RemoteApi, None };

constexpr const char* toString(CompletionPath p) noexcept {
    switch (p) {
        case CompletionPath::Subscription: return "subscription";
        case CompletionPath::RemoteApi: return "remote-api";
        case CompletionPath::None: return "none";
    }
    return "none";
}

struct FallbackResult {
    bool success = false;
    std::string content;
    std::string error;
    CompletionPath path = CompletionPath::None;
    std::optional<Error> primaryError; ///< Why the CLI path was not used or failed
};

/**
 * @brief Streaming consumer.
 *
 * onDiscard() is called when chunks already delivered from the CLI must be
 * thrown away because the request is being restarted on the remote API.
 */
struct StreamSink {
    std::function<void(std::string_view)> onChunk;
    std::function<void()> onDiscard;
};

/**
 * @brief Availability check, CLI attempt, remote API on failure.
 *
 * Every call site goes through this sequence:
 * 1. status(); skip the CLI when it is not installed or not authenticated
 * 2. submit through the broker
 * 3. on failure or timeout, complete via the remote client
 * 4. report which path answered
 *
 * A request the caller cancelled is not retried remotely.
 */
class FallbackOrchestrator {
public:
    struct Options {
        bool allowRemote = true;
        std::optional<std::string> system; ///< System prompt for the remote path
    };

    /**
     * @param broker May be null: every request goes to the remote client
     * @param remote May be null: CLI failures are final
     */
    FallbackOrchestrator(broker::BrokerService* broker,
                         std::shared_ptr<RemoteCompletionClient> remote, Options options);

    FallbackResult query(const std::string& prompt, const broker::QueryOptions& options = {});

    FallbackResult queryWithImage(const std::string& prompt, const ByteVector& image,
                                  std::string_view extension,
                                  const broker::QueryOptions& options = {});

    FallbackResult stream(const std::string& prompt, const broker::QueryOptions& options,
                          const StreamSink& sink);

private:
    std::optional<Error> unavailableReason();
    FallbackResult fromBroker(const broker::QueryResult& r);
    FallbackResult viaRemote(RemoteRequest request, std::optional<Error> primaryError);

    broker::BrokerService* broker_;
    std::shared_ptr<RemoteCompletionClient> remote_;
    Options options_;
};

} // namespace qbroker::fallback
