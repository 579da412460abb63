#include "agentctx/compaction/compactor.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>

namespace agentctx::compaction {

std::string_view compaction_state_to_string(CompactionState state) {
    switch (state) {
        case CompactionState::Idle: return "idle";
        case CompactionState::Evaluating: return "evaluating";
        case CompactionState::NotNeeded: return "not_needed";
        case CompactionState::Selecting: return "selecting";
        case CompactionState::Synthesizing: return "synthesizing";
        case CompactionState::Completed: return "completed";
        case CompactionState::Failed: return "failed";
    }
    return "unknown";
}

std::string_view compaction_status_to_string(CompactionStatus status) {
    switch (status) {
        case CompactionStatus::NotNeeded: return "not_needed";
        case CompactionStatus::Completed: return "completed";
        case CompactionStatus::Failed: return "failed";
    }
    return "unknown";
}

Json CompactionWarning::to_json() const {
    return Json{
        {"code", static_cast<int>(code)},
        {"message", message}
    };
}

Json CompactionMetrics::to_json() const {
    return Json{
        {"turns_before", turns_before},
        {"turns_retained", turns_retained},
        {"turns_summarized", turns_summarized},
        {"tokens_before", tokens_before},
        {"tokens_after", tokens_after},
        {"compression_ratio", compression_ratio},
        {"anchor_type", std::string(anchor_type_to_string(anchor_type))},
        {"low_compression", low_compression}
    };
}

bool CompactionOutcome::has_warning(ErrorCode code) const {
    return std::any_of(warnings.begin(), warnings.end(),
                       [code](const CompactionWarning& w) { return w.code == code; });
}

Json CompactionOutcome::to_json() const {
    Json j{
        {"status", std::string(compaction_status_to_string(status))},
        {"threshold", threshold.to_json()},
        {"warnings", Json::array()}
    };
    for (const auto& w : warnings) {
        j["warnings"].push_back(w.to_json());
    }
    if (result) {
        j["metrics"] = result->metrics.to_json();
        j["anchor"] = result->anchor.to_json();
        j["preserved"] = result->preserved.to_json();
    }
    return j;
}

PriorSummary CompactionResult::carry_forward() const {
    return PriorSummary{
        .text = summary_text,
        .preserved = preserved,
        .stats = stats,
        .summarized_through = summarized_through
    };
}

namespace {

void mark_failed(CompactionOutcome& outcome,
                 const std::vector<ConversationTurn>& turns,
                 std::string message) {
    outcome.status = CompactionStatus::Failed;
    outcome.result.reset();
    outcome.original_turns = turns;
    outcome.warnings.push_back({ErrorCode::CompactionFailed, std::move(message)});
}

uint64_t prior_tokens(const std::optional<PriorSummary>& prior) {
    return prior ? TokenEstimator::estimate(prior->text) : 0;
}

}  // namespace

Compactor::Compactor(const CompactionConfig& config)
    : config_(config)
    , threshold_(config)
    , detector_(static_cast<size_t>(std::max(config.min_retained_turns, 1)))
    , selector_(static_cast<size_t>(std::max(config.min_retained_turns, 1)))
    , extractor_(static_cast<size_t>(std::max(config.max_goals, 0)))
{
}

Result<CompactionOutcome, Error> Compactor::compact(
    const std::vector<ConversationTurn>& turns,
    uint64_t total_input,
    const ModelLimits& limits,
    const std::optional<PriorSummary>& prior,
    const SummaryCallback& legacy_callback) {

    state_.store(CompactionState::Evaluating);
    return run(turns, limits, prior, legacy_callback, threshold_.evaluate(total_input, limits), true);
}

Result<CompactionOutcome, Error> Compactor::force(
    const std::vector<ConversationTurn>& turns,
    const ModelLimits& limits,
    const std::optional<PriorSummary>& prior,
    const SummaryCallback& legacy_callback) {

    state_.store(CompactionState::Evaluating);
    uint64_t estimate = TokenEstimator::estimate(turns) + prior_tokens(prior);
    return run(turns, limits, prior, legacy_callback, threshold_.evaluate(estimate, limits), false);
}

Result<CompactionOutcome, Error> Compactor::run(
    const std::vector<ConversationTurn>& turns,
    const ModelLimits& limits,
    const std::optional<PriorSummary>& prior,
    const SummaryCallback& legacy_callback,
    ThresholdDecision decision,
    bool check_threshold) {

    if (auto valid = validate_history(turns); valid.is_err()) {
        spdlog::error("Rejected history for compaction: {}", valid.error().to_string());
        state_.store(CompactionState::Idle);
        return Result<CompactionOutcome, Error>::err(valid.error());
    }

    CompactionOutcome outcome;
    outcome.threshold = decision;

    if (check_threshold && !decision.should_compact) {
        state_.store(CompactionState::NotNeeded);
        return Result<CompactionOutcome, Error>::ok(std::move(outcome));
    }

    if (turns.empty()) {
        outcome.warnings.push_back({ErrorCode::InsufficientData, "No turns available to compact"});
        spdlog::warn("Compaction requested with an empty history");
        state_.store(CompactionState::NotNeeded);
        return Result<CompactionOutcome, Error>::ok(std::move(outcome));
    }

    // The earlier summary must cover only turns that are no longer in the history
    if (prior && turns.front().index <= prior->summarized_through) {
        spdlog::error("Earlier summary covers turn {} but history starts at {}",
                      prior->summarized_through, turns.front().index);
        mark_failed(outcome, turns,
                    "Earlier summary overlaps turn " + std::to_string(turns.front().index));
        state_.store(CompactionState::Failed);
        return Result<CompactionOutcome, Error>::ok(std::move(outcome));
    }

    try {
        select_and_synthesize(turns, limits, prior, legacy_callback, outcome);
    } catch (const std::exception& e) {
        spdlog::error("Compaction failed, keeping original history: {}", e.what());
        mark_failed(outcome, turns, e.what());
        state_.store(CompactionState::Failed);
        return Result<CompactionOutcome, Error>::ok(std::move(outcome));
    }

    for (const auto& w : outcome.warnings) {
        spdlog::warn("Compaction warning [{}]: {}", static_cast<int>(w.code), w.message);
    }

    switch (outcome.status) {
        case CompactionStatus::NotNeeded: state_.store(CompactionState::NotNeeded); break;
        case CompactionStatus::Completed: state_.store(CompactionState::Completed); break;
        case CompactionStatus::Failed: state_.store(CompactionState::Failed); break;
    }
    return Result<CompactionOutcome, Error>::ok(std::move(outcome));
}

void Compactor::select_and_synthesize(
    const std::vector<ConversationTurn>& turns,
    const ModelLimits& limits,
    const std::optional<PriorSummary>& prior,
    const SummaryCallback& legacy_callback,
    CompactionOutcome& outcome) {

    // Selecting
    state_.store(CompactionState::Selecting);
    AnchorPoint anchor = detector_.detect(turns);
    if (anchor.is_synthetic()) {
        spdlog::debug("No natural anchor; synthetic checkpoint at {}", anchor.turn_index);
    }

    uint64_t budget = threshold_.retained_budget(limits);
    TurnSelection selection = selector_.select(turns, anchor, budget);

    if (!selection.fits_budget) {
        outcome.warnings.push_back({
            ErrorCode::SelectionUnableToFit,
            "Most recent turn needs " + std::to_string(selection.retained_tokens) +
                " tokens, budget is " + std::to_string(budget)
        });
    }

    if (selection.discarded_count == 0) {
        outcome.status = CompactionStatus::NotNeeded;
        outcome.warnings.push_back({
            ErrorCode::InsufficientData,
            "All " + std::to_string(turns.size()) + " turns fall in the retained tail"
        });
        return;
    }

    // Synthesizing
    state_.store(CompactionState::Synthesizing);
    const size_t end = selection.start_index;

    PreservationContext preserved = extractor_.extract(turns, end);
    DiscardedRegionStats stats = DiscardedRegionStats::collect(turns, end);
    if (prior) {
        preserved = extractor_.merge(prior->preserved, preserved);
        stats.absorb(prior->stats);
    }

    std::vector<std::string> outcomes;
    outcomes.reserve(end);
    for (size_t i = 0; i < end; ++i) {
        outcomes.push_back(turn_outcome(turns[i], detector_.classify(turns, i).has_value()));
    }

    std::string summary = synthesizer_.synthesize(preserved, stats, outcomes, legacy_callback);

    CompactionMetrics metrics;
    metrics.turns_before = turns.size();
    metrics.turns_retained = selection.retained_turns.size();
    metrics.turns_summarized = end;
    metrics.tokens_before = TokenEstimator::estimate(turns) + prior_tokens(prior);
    metrics.tokens_after = TokenEstimator::estimate(summary) + selection.retained_tokens;
    metrics.compression_ratio = metrics.tokens_before > 0
        ? static_cast<double>(metrics.tokens_after) / static_cast<double>(metrics.tokens_before)
        : 0.0;
    metrics.anchor_type = anchor.anchor_type;
    metrics.low_compression = metrics.compression_ratio > config_.low_compression_ratio;

    if (metrics.low_compression) {
        outcome.warnings.push_back({
            ErrorCode::LowCompressionRatio,
            fmt::format("Compacted history is still {:.1f}% of the original size",
                        metrics.compression_ratio * 100.0)
        });
    }

    if (outcome.threshold.trigger > 0 && metrics.tokens_after >= outcome.threshold.trigger) {
        outcome.warnings.push_back({
            ErrorCode::LowCompressionRatio,
            "Compacted history needs " + std::to_string(metrics.tokens_after) +
                " tokens, still at or above the trigger of " +
                std::to_string(outcome.threshold.trigger)
        });
    }

    spdlog::info("Compacted {} turns into summary, kept {} ({} -> {} tokens, anchor {})",
                 metrics.turns_summarized, metrics.turns_retained,
                 metrics.tokens_before, metrics.tokens_after,
                 anchor_type_to_string(anchor.anchor_type));

    outcome.status = CompactionStatus::Completed;
    outcome.result = CompactionResult{
        .summary_text = std::move(summary),
        .retained_turns = std::move(selection.retained_turns),
        .metrics = metrics,
        .anchor = anchor,
        .preserved = std::move(preserved),
        .stats = std::move(stats),
        .summarized_through = turns[end - 1].index
    };
}

}  // namespace agentctx::compaction
