#include "agentctx/compaction/threshold.hpp"
#include "agentctx/compaction/turn.hpp"

#include <spdlog/spdlog.h>

namespace agentctx::compaction {

Json ThresholdDecision::to_json() const {
    return Json{
        {"should_compact", should_compact},
        {"current_tokens", current_tokens},
        {"trigger", trigger},
        {"usable", usable}
    };
}

ThresholdCalculator::ThresholdCalculator(const CompactionConfig& config)
    : buffer_(config.autocompact_buffer)
    , ratio_(config.threshold_ratio)
    , retained_ratio_(config.retained_budget_ratio)
{
}

uint64_t ThresholdCalculator::usable_context(const ModelLimits& limits) const {
    uint64_t reserved = limits.max_output_tokens + buffer_;
    return limits.context_window > reserved ? limits.context_window - reserved : 0;
}

uint64_t ThresholdCalculator::compaction_trigger(const ModelLimits& limits) const {
    return static_cast<uint64_t>(static_cast<double>(usable_context(limits)) * ratio_);
}

uint64_t ThresholdCalculator::retained_budget(const ModelLimits& limits) const {
    return static_cast<uint64_t>(static_cast<double>(usable_context(limits)) * retained_ratio_);
}

ThresholdDecision ThresholdCalculator::evaluate(uint64_t total_input, const ModelLimits& limits) const {
    ThresholdDecision decision;
    decision.current_tokens = total_input;
    decision.usable = usable_context(limits);
    decision.trigger = compaction_trigger(limits);
    decision.should_compact = total_input >= decision.trigger;

    spdlog::debug("Threshold check: {} / {} tokens (usable {}), compact={}",
                  total_input, decision.trigger, decision.usable, decision.should_compact);
    return decision;
}

ThresholdDecision ThresholdCalculator::pre_prompt_check(uint64_t total_input,
                                                        std::string_view prompt,
                                                        const ModelLimits& limits) const {
    return evaluate(total_input + TokenEstimator::estimate(prompt), limits);
}

}  // namespace agentctx::compaction
