#pragma once

#include "agentctx/core/config.hpp"

#include <cstdint>
#include <string_view>

namespace agentctx::compaction {

using namespace agentctx::core;

// Context limits of one model, supplied by the model registry
struct ModelLimits {
    uint64_t context_window = 0;
    uint64_t max_output_tokens = 0;
};

// Outcome of a threshold check, kept for logging and status display
struct ThresholdDecision {
    bool should_compact = false;
    uint64_t current_tokens = 0;
    uint64_t trigger = 0;
    uint64_t usable = 0;

    Json to_json() const;
};

// Decides whether compaction should run.
//
//   usable  = context_window - max_output_tokens - autocompact_buffer  (floored at 0)
//   trigger = usable * threshold_ratio
//
// Compaction runs when the tracked input reaches the trigger, so it always
// happens before the provider's hard limit.
class ThresholdCalculator {
public:
    explicit ThresholdCalculator(const CompactionConfig& config);

    uint64_t usable_context(const ModelLimits& limits) const;
    uint64_t compaction_trigger(const ModelLimits& limits) const;

    // Token budget for the verbatim tail
    uint64_t retained_budget(const ModelLimits& limits) const;

    ThresholdDecision evaluate(uint64_t total_input, const ModelLimits& limits) const;

    bool should_compact(uint64_t total_input, const ModelLimits& limits) const {
        return evaluate(total_input, limits).should_compact;
    }

    // Resumed session: include the estimate of the prompt about to be sent
    ThresholdDecision pre_prompt_check(uint64_t total_input,
                                       std::string_view prompt,
                                       const ModelLimits& limits) const;

private:
    uint64_t buffer_;
    double ratio_;
    double retained_ratio_;
};

}  // namespace agentctx::compaction
