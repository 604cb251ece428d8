#include <qbroker/broker/broker_service.h>
#include <qbroker/fallback/fallback_orchestrator.h>
#include <qbroker/process/temp_artifact.h>

#include <spdlog/spdlog.h>

#include <atomic>
#include <utility>

namespace qbroker::fallback {

FallbackOrchestrator::FallbackOrchestrator(broker::BrokerService* broker,
                                           std::shared_ptr<RemoteCompletionClient> remote,
                                           Options options)
    : broker_(broker), remote_(std::move(remote)), options_(std::move(options)) {}

std::optional<Error> FallbackOrchestrator::unavailableReason() {
    if (!broker_) {
        return Error{ErrorCode::NotInitialized, "No local broker configured"};
    }
    auto st = broker_->status();
    if (!st.installed) {
        return Error{ErrorCode::NotInstalled, st.lastError.value_or("CLI not installed")};
    }
    if (!st.authenticated) {
        return Error{ErrorCode::NotAuthenticated, st.lastError.value_or("Not authenticated")};
    }
    return std::nullopt;
}

FallbackResult FallbackOrchestrator::fromBroker(const broker::QueryResult& r) {
    FallbackResult out;
    out.success = r.success;
    out.content = r.content;
    out.error = r.error;
    out.path = r.success ? CompletionPath::Subscription : CompletionPath::None;
    if (!r.success) {
        out.primaryError = Error{r.errorKind, r.error};
    }
    return out;
}

FallbackResult FallbackOrchestrator::viaRemote(RemoteRequest request,
                                               std::optional<Error> primaryError) {
    FallbackResult out;
    out.primaryError = primaryError;
    const std::string primary = primaryError ? primaryError->message : std::string{};

    if (!options_.allowRemote || !remote_) {
        out.error = primary.empty() ? "No completion path available" : primary;
        return out;
    }
    if (primaryError) {
        spdlog::info("[Fallback] CLI path unavailable ({}), using remote API",
                     primaryError->message);
    }

    if (options_.system && !request.system) {
        request.system = options_.system;
    }
    auto reply = remote_->complete(request);
    if (!reply) {
        out.error = primary.empty() ? reply.error().message
                                    : fmt::format("CLI: {}; API: {}", primary,
                                                  reply.error().message);
        spdlog::warn("[Fallback] Both paths failed: {}", out.error);
        return out;
    }
    out.success = true;
    out.content = std::move(reply).value();
    out.path = CompletionPath::RemoteApi;
    return out;
}

FallbackResult FallbackOrchestrator::query(const std::string& prompt,
                                           const broker::QueryOptions& options) {
    RemoteRequest remote{prompt, std::nullopt, std::nullopt, options.maxTokens, options.model};

    auto reason = unavailableReason();
    if (reason) {
        return viaRemote(std::move(remote), std::move(reason));
    }
    auto r = broker_->query(prompt, options);
    if (r.success || r.errorKind == ErrorCode::OperationCancelled) {
        return fromBroker(r);
    }
    return viaRemote(std::move(remote), Error{r.errorKind, r.error});
}

FallbackResult FallbackOrchestrator::queryWithImage(const std::string& prompt,
                                                    const ByteVector& image,
                                                    std::string_view extension,
                                                    const broker::QueryOptions& options) {
    std::string ext(extension.empty() ? process::sniffImageExtension(image) : extension);
    RemoteRequest remote{prompt, std::nullopt, RemoteImage{image, mediaTypeForExtension(ext)},
                         options.maxTokens, options.model};

    auto reason = unavailableReason();
    if (reason) {
        return viaRemote(std::move(remote), std::move(reason));
    }
    auto r = broker_->queryWithImage(prompt, image, options, ext);
    if (r.success || r.errorKind == ErrorCode::OperationCancelled) {
        return fromBroker(r);
    }
    return viaRemote(std::move(remote), Error{r.errorKind, r.error});
}

FallbackResult FallbackOrchestrator::stream(const std::string& prompt,
                                            const broker::QueryOptions& options,
                                            const StreamSink& sink) {
    RemoteRequest remote{prompt, std::nullopt, std::nullopt, options.maxTokens, options.model};

    auto deliverRemote = [&](std::optional<Error> primary) {
        auto out = viaRemote(std::move(remote), std::move(primary));
        if (out.success && sink.onChunk) {
            sink.onChunk(out.content);
        }
        return out;
    };

    auto reason = unavailableReason();
    if (reason) {
        return deliverRemote(std::move(reason));
    }

    std::atomic<bool> delivered{false};
    auto r = broker_->stream(prompt, options, [&](std::string_view chunk) {
        delivered = true;
        if (sink.onChunk) {
            sink.onChunk(chunk);
        }
    });
    if (r.success || r.errorKind == ErrorCode::OperationCancelled) {
        return fromBroker(r);
    }

    // Text from two different generations does not splice; start over
    if (delivered && sink.onDiscard) {
        spdlog::info("[Fallback] Discarding partial CLI stream after: {}", r.error);
        sink.onDiscard();
    }
    return deliverRemote(Error{r.errorKind, r.error});
}

} // namespace qbroker::fallback
