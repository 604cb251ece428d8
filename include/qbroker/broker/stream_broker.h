#pragma once

#include <qbroker/broker/request.h>
#include <qbroker/core/types.h>

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace qbroker::broker {

/**
 * @brief Per-request output channels with a single subscriber each.
 *
 * A channel is opened when a request is submitted and lives until terminate().
 * Chunks are appended to the channel's aggregate and forwarded to the
 * subscriber, if any, in publish order. terminate() delivers exactly one
 * terminal event and tears the channel down; publishes after that are dropped.
 *
 * Callbacks run on the publishing thread while the channel's own lock is held,
 * so a terminal event can never overtake a chunk.
 */
class StreamBroker {
public:
    StreamBroker() = default;

    StreamBroker(const StreamBroker&) = delete;
    StreamBroker& operator=(const StreamBroker&) = delete;

    /**
     * @brief Create the channel for @p id.
     * @return InvalidState if a channel for @p id is already open
     */
    Result<void> open(const RequestId& id);

    /**
     * @brief Register the one subscriber for @p id.
     * @return NotFound if no channel is open (never opened or already terminated),
     *         InvalidState if a subscriber is already registered
     */
    Result<void> subscribe(const RequestId& id, ChunkCallback onChunk,
                           TerminalCallback onTerminal);

    /**
     * @brief Append @p chunk and forward it to the subscriber.
     * @return false if the channel is gone (no-op)
     */
    bool publish(const RequestId& id, std::string_view chunk);

    /**
     * @brief Deliver the terminal event once and drop the channel.
     * @return false if there was nothing to terminate
     */
    bool terminate(const RequestId& id, const QueryResult& result);

    /// Everything published so far ("" for unknown ids)
    std::string aggregate(const RequestId& id) const;

    /// Number of chunks published so far (0 for unknown ids)
    std::size_t chunkCount(const RequestId& id) const;

    bool hasSubscriber(const RequestId& id) const;
    std::size_t openChannels() const;

private:
    struct Channel {
        std::mutex mutex;
        ChunkCallback onChunk;
        TerminalCallback onTerminal;
        std::string aggregate;
        std::size_t chunks = 0;
        bool subscribed = false;
        bool terminated = false;
    };

    std::shared_ptr<Channel> find(const RequestId& id) const;

    mutable std::mutex mutex_;
    std::unordered_map<RequestId, std::shared_ptr<Channel>> channels_;
};

} // namespace qbroker::broker
