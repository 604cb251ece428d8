#pragma once

#include <CLI/CLI.hpp>
#include <qbroker/broker/request.h>
#include <qbroker/fallback/fallback_orchestrator.h>

#include <chrono>
#include <cstdint>
#include <iostream>
#include <string>

namespace qbroker::cli {

/**
 * Per-request flags shared by the call-site commands
 */
struct QueryFlags {
    uint32_t maxTokens = 0;
    uint64_t timeoutMs = 0;
    std::string model;

    void addTo(CLI::App* cmd, uint32_t defaultMaxTokens = 0) {
        maxTokens = defaultMaxTokens;
        cmd->add_option("--max-tokens", maxTokens, "Maximum output tokens (0: CLI default)");
        cmd->add_option("--timeout-ms", timeoutMs, "Per-request timeout (0: configured default)");
        cmd->add_option("--model", model, "Model selector passed to the CLI");
    }

    broker::QueryOptions toOptions() const {
        broker::QueryOptions opts;
        if (maxTokens > 0)
            opts.maxTokens = maxTokens;
        if (timeoutMs > 0)
            opts.timeout = std::chrono::milliseconds{timeoutMs};
        if (!model.empty())
            opts.model = model;
        return opts;
    }
};

/// Provenance line on stderr so stdout stays the model's text
inline void printProvenance(const fallback::FallbackResult& r) {
    std::cerr << "[via " << fallback::toString(r.path) << "]";
    if (r.path == fallback::CompletionPath::RemoteApi && r.primaryError) {
        std::cerr << " (CLI: " << r.primaryError->message << ")";
    }
    std::cerr << "\n";
}

inline Result<void> toCommandResult(const fallback::FallbackResult& r) {
    if (r.success) {
        return {};
    }
    auto code = r.primaryError ? r.primaryError->code : ErrorCode::Unknown;
    return Error{code, r.error};
}

} // namespace qbroker::cli
