#pragma once

#include "agentctx/core/types.hpp"

#include <cstdint>
#include <mutex>
#include <optional>

namespace agentctx::compaction {

using namespace agentctx::core;

// Session token accounting.
//
// input_tokens is the absolute context size of the latest request and is
// always replaced. output_tokens is cumulative and always added to. Treating
// input_tokens as incremental inflates the context estimate by an order of
// magnitude and triggers compaction far too early.
struct TokenTracker {
    uint64_t input_tokens = 0;
    uint64_t output_tokens = 0;
    uint64_t cumulative_billed_input = 0;
    uint64_t cumulative_billed_output = 0;
    std::optional<uint64_t> cache_read_input_tokens;      // latest call, display only
    std::optional<uint64_t> cache_creation_input_tokens;  // latest call, display only

    // Final usage for a completed request
    void update_from_usage(const TokenUsage& usage);

    // Intermediate streaming usage: display fields only, billing untouched
    void update_display_only(const TokenUsage& usage);

    // Context was rebuilt; billing reflects real usage and is kept
    void reset_after_compaction(uint64_t new_estimated_input);

    // Current context size used for threshold checks
    uint64_t total_input() const { return input_tokens; }

    // Input after the 90% cache-read discount, for display
    uint64_t effective_tokens() const;

    Json to_json() const;
};

// The single owner of a session's TokenTracker. Every mutation goes through
// this handle so streaming callbacks on other threads cannot race the main loop.
class SharedTokenTracker {
public:
    SharedTokenTracker() = default;

    SharedTokenTracker(const SharedTokenTracker&) = delete;
    SharedTokenTracker& operator=(const SharedTokenTracker&) = delete;

    void update_from_usage(const TokenUsage& usage);
    void update_display_only(const TokenUsage& usage);
    void reset_after_compaction(uint64_t new_estimated_input);

    // Copy of the current state
    TokenTracker snapshot() const;

    uint64_t total_input() const;

private:
    mutable std::mutex mutex_;
    TokenTracker tracker_;
};

}  // namespace agentctx::compaction
