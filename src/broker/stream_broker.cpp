#include <qbroker/broker/stream_broker.h>

#include <spdlog/spdlog.h>

namespace qbroker::broker {

Result<void> StreamBroker::open(const RequestId& id) {
    std::lock_guard lock{mutex_};
    auto [it, inserted] = channels_.try_emplace(id, nullptr);
    if (!inserted) {
        return Error{ErrorCode::InvalidState, "Channel already open for " + id};
    }
    it->second = std::make_shared<Channel>();
    return {};
}

Result<void> StreamBroker::subscribe(const RequestId& id, ChunkCallback onChunk,
                                     TerminalCallback onTerminal) {
    auto channel = find(id);
    if (!channel) {
        return Error{ErrorCode::NotFound, "No open channel for " + id};
    }
    std::lock_guard lock{channel->mutex};
    if (channel->terminated) {
        return Error{ErrorCode::NotFound, "Channel for " + id + " already terminated"};
    }
    if (channel->subscribed) {
        return Error{ErrorCode::InvalidState, "Request " + id + " already has a subscriber"};
    }
    channel->onChunk = std::move(onChunk);
    channel->onTerminal = std::move(onTerminal);
    channel->subscribed = true;
    return {};
}

bool StreamBroker::publish(const RequestId& id, std::string_view chunk) {
    auto channel = find(id);
    if (!channel) {
        return false;
    }
    std::lock_guard lock{channel->mutex};
    if (channel->terminated) {
        return false;
    }
    channel->aggregate.append(chunk);
    ++channel->chunks;
    if (channel->onChunk) {
        try {
            channel->onChunk(chunk);
        } catch (const std::exception& e) {
            spdlog::error("[StreamBroker] Chunk callback for {} threw: {}", id, e.what());
        }
    }
    return true;
}

bool StreamBroker::terminate(const RequestId& id, const QueryResult& result) {
    std::shared_ptr<Channel> channel;
    {
        std::lock_guard lock{mutex_};
        auto it = channels_.find(id);
        if (it == channels_.end()) {
            return false;
        }
        channel = std::move(it->second);
        channels_.erase(it);
    }

    std::lock_guard lock{channel->mutex};
    if (channel->terminated) {
        return false;
    }
    channel->terminated = true;
    auto onTerminal = std::move(channel->onTerminal);
    channel->onChunk = nullptr;

    spdlog::debug("[StreamBroker] Terminating {} after {} chunk(s): {}", id, channel->chunks,
                  toString(result.state));
    if (onTerminal) {
        try {
            onTerminal(result);
        } catch (const std::exception& e) {
            spdlog::error("[StreamBroker] Terminal callback for {} threw: {}", id, e.what());
        }
    }
    return true;
}

std::string StreamBroker::aggregate(const RequestId& id) const {
    auto channel = find(id);
    if (!channel) {
        return {};
    }
    std::lock_guard lock{channel->mutex};
    return channel->aggregate;
}

std::size_t StreamBroker::chunkCount(const RequestId& id) const {
    auto channel = find(id);
    if (!channel) {
        return 0;
    }
    std::lock_guard lock{channel->mutex};
    return channel->chunks;
}

bool StreamBroker::hasSubscriber(const RequestId& id) const {
    auto channel = find(id);
    if (!channel) {
        return false;
    }
    std::lock_guard lock{channel->mutex};
    return channel->subscribed;
}

std::size_t StreamBroker::openChannels() const {
    std::lock_guard lock{mutex_};
    return channels_.size();
}

std::shared_ptr<StreamBroker::Channel> StreamBroker::find(const RequestId& id) const {
    std::lock_guard lock{mutex_};
    auto it = channels_.find(id);
    return it == channels_.end() ? nullptr : it->second;
}

} // namespace qbroker::broker
