#include "agentctx/compaction/token_tracker.hpp"

namespace agentctx::compaction {

namespace {

bool has_input(const TokenUsage& usage) {
    return usage.input_tokens || usage.cache_read_input_tokens || usage.cache_creation_input_tokens;
}

}  // namespace

void TokenTracker::update_from_usage(const TokenUsage& usage) {
    if (usage.is_empty()) return;

    if (has_input(usage)) {
        input_tokens = usage.total_input();
        cumulative_billed_input += usage.input_tokens.value_or(0);
    }

    if (usage.output_tokens) {
        output_tokens += *usage.output_tokens;
        cumulative_billed_output += *usage.output_tokens;
    }

    if (usage.cache_read_input_tokens) {
        cache_read_input_tokens = usage.cache_read_input_tokens;
    }
    if (usage.cache_creation_input_tokens) {
        cache_creation_input_tokens = usage.cache_creation_input_tokens;
    }
}

void TokenTracker::update_display_only(const TokenUsage& usage) {
    if (usage.is_empty()) return;

    if (has_input(usage)) {
        input_tokens = usage.total_input();
    }
    if (usage.cache_read_input_tokens) {
        cache_read_input_tokens = usage.cache_read_input_tokens;
    }
    if (usage.cache_creation_input_tokens) {
        cache_creation_input_tokens = usage.cache_creation_input_tokens;
    }
}

void TokenTracker::reset_after_compaction(uint64_t new_estimated_input) {
    input_tokens = new_estimated_input;
    cache_read_input_tokens.reset();
    cache_creation_input_tokens.reset();
}

uint64_t TokenTracker::effective_tokens() const {
    auto discount = static_cast<uint64_t>(static_cast<double>(cache_read_input_tokens.value_or(0)) * 0.9);
    return discount >= input_tokens ? 0 : input_tokens - discount;
}

Json TokenTracker::to_json() const {
    Json j{
        {"input_tokens", input_tokens},
        {"output_tokens", output_tokens},
        {"cumulative_billed_input", cumulative_billed_input},
        {"cumulative_billed_output", cumulative_billed_output},
        {"effective_tokens", effective_tokens()}
    };
    if (cache_read_input_tokens) j["cache_read_input_tokens"] = *cache_read_input_tokens;
    if (cache_creation_input_tokens) j["cache_creation_input_tokens"] = *cache_creation_input_tokens;
    return j;
}

void SharedTokenTracker::update_from_usage(const TokenUsage& usage) {
    std::lock_guard lock(mutex_);
    tracker_.update_from_usage(usage);
}

void SharedTokenTracker::update_display_only(const TokenUsage& usage) {
    std::lock_guard lock(mutex_);
    tracker_.update_display_only(usage);
}

void SharedTokenTracker::reset_after_compaction(uint64_t new_estimated_input) {
    std::lock_guard lock(mutex_);
    tracker_.reset_after_compaction(new_estimated_input);
}

TokenTracker SharedTokenTracker::snapshot() const {
    std::lock_guard lock(mutex_);
    return tracker_;
}

uint64_t SharedTokenTracker::total_input() const {
    std::lock_guard lock(mutex_);
    return tracker_.total_input();
}

}  // namespace agentctx::compaction
