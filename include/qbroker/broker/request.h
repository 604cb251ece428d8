#pragma once

#include <qbroker/core/types.h>

#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <optional>
#include <string>
#include <string_view>

namespace qbroker::broker {

/**
 * @brief Request lifecycle.
 *
 * Queued -> Running -> (Streaming) -> Completed | Failed | TimedOut | Cancelled,
 * plus Queued -> Cancelled when cancelled before a slot was leased.
 */
enum class RequestState : uint8_t {
    Queued,
    Running,
    Streaming,
    Completed,
    Failed,
    Cancelled,
    TimedOut
};

constexpr bool isTerminal(RequestState s) noexcept {
    return s == RequestState::Completed || s == RequestState::Failed ||
           s == RequestState::Cancelled || s == RequestState::TimedOut;
}

constexpr const char* toString(RequestState s) noexcept {
    switch (s) {
        case RequestState::Queued: return "Queued";
        case RequestState::Running: return "Running";
        case RequestState::Streaming: return "Streaming";
        case RequestState::Completed: return "Completed";
        case RequestState::Failed: return "Failed";
        case RequestState::Cancelled: return "Cancelled";
        case RequestState::TimedOut: return "TimedOut";
    }
    return "Unknown";
}

enum class RequestMode : uint8_t {
    Query, ///< Collect stdout, parse the JSON envelope
    Stream ///< Relay raw stdout chunks as they arrive
};

struct QueryOptions {
    std::optional<uint32_t> maxTokens;
    std::optional<std::chrono::milliseconds> timeout;
    std::optional<std::string> model;
};

/**
 * @brief Terminal outcome of one request, as handed back to callers.
 */
struct QueryResult {
    RequestId id;
    bool success = false;
    std::string content;
    std::string error;
    ErrorCode errorKind = ErrorCode::Success;
    RequestState state = RequestState::Failed;
    TimePoint submittedAt{};
    TimePoint startedAt{}; ///< Epoch when no slot was ever leased
    TimePoint completedAt{};

    static QueryResult failure(RequestId id, const Error& err, RequestState state) {
        QueryResult r;
        r.id = std::move(id);
        r.error = err.message;
        r.errorKind = err.code;
        r.state = state;
        return r;
    }
};

/**
 * @brief Everything needed to run one request.
 */
struct RequestSpec {
    std::string prompt;
    RequestMode mode = RequestMode::Query;
    std::optional<ByteVector> image; ///< Handed to the CLI through a temporary file
    std::string imageExtension;      ///< Empty: sniff from the payload
    QueryOptions options;
};

using ChunkCallback = std::function<void(std::string_view)>;
using TerminalCallback = std::function<void(const QueryResult&)>;

/**
 * @brief Caller-side view of a submitted request.
 */
struct RequestHandle {
    RequestId id;
    std::shared_future<QueryResult> result;
};

} // namespace qbroker::broker
