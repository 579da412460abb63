#pragma once

#include "agentctx/compaction/anchor_detector.hpp"
#include "agentctx/compaction/preservation.hpp"
#include "agentctx/compaction/summary_synthesizer.hpp"
#include "agentctx/compaction/threshold.hpp"
#include "agentctx/compaction/turn.hpp"
#include "agentctx/compaction/turn_selector.hpp"

#include <atomic>
#include <optional>
#include <string>
#include <vector>

namespace agentctx::compaction {

enum class CompactionState {
    Idle,
    Evaluating,
    NotNeeded,
    Selecting,
    Synthesizing,
    Completed,
    Failed
};

std::string_view compaction_state_to_string(CompactionState state);

enum class CompactionStatus {
    NotNeeded,
    Completed,
    Failed
};

std::string_view compaction_status_to_string(CompactionStatus status);

// Non-fatal problem attached to an outcome
struct CompactionWarning {
    ErrorCode code;
    std::string message;

    Json to_json() const;
};

struct CompactionMetrics {
    size_t turns_before = 0;
    size_t turns_retained = 0;
    size_t turns_summarized = 0;
    uint64_t tokens_before = 0;     // estimate of the full history, earlier summary included
    uint64_t tokens_after = 0;      // summary + retained turns
    double compression_ratio = 0.0;  // tokens_after / tokens_before
    AnchorType anchor_type = AnchorType::Synthetic;
    bool low_compression = false;

    Json to_json() const;
};

struct CompactionResult {
    std::string summary_text;
    std::vector<ConversationTurn> retained_turns;  // contiguous suffix, original order
    CompactionMetrics metrics;
    AnchorPoint anchor;
    PreservationContext preserved;    // merged with the earlier summary's facts
    DiscardedRegionStats stats;       // every turn summarized so far
    uint64_t summarized_through = 0;

    // Input for the next compaction of the same history
    PriorSummary carry_forward() const;
};

struct CompactionOutcome {
    CompactionStatus status = CompactionStatus::NotNeeded;
    std::optional<CompactionResult> result;          // set when Completed
    std::vector<ConversationTurn> original_turns;    // set when Failed, unmodified
    std::vector<CompactionWarning> warnings;
    ThresholdDecision threshold;

    bool completed() const { return status == CompactionStatus::Completed; }
    bool has_warning(ErrorCode code) const;

    Json to_json() const;
};

// Composes threshold, anchor, selection, preservation and summary into one
// call per agent turn.
//
// Idle -> Evaluating -> NotNeeded
//                    -> Selecting -> Synthesizing -> Completed
//                    -> Failed
//
// Problems inside a run degrade to warnings on the outcome; only structurally
// invalid history is rejected with an error before the run starts. A summary
// left by an earlier run is folded into the new one, so repeated compactions
// keep a single summary of bounded size.
class Compactor {
public:
    explicit Compactor(const CompactionConfig& config);

    Result<CompactionOutcome, Error> compact(
        const std::vector<ConversationTurn>& turns,
        uint64_t total_input,
        const ModelLimits& limits,
        const std::optional<PriorSummary>& prior = std::nullopt,
        const SummaryCallback& legacy_callback = {}
    );

    // Skip the threshold check (manual compaction)
    Result<CompactionOutcome, Error> force(
        const std::vector<ConversationTurn>& turns,
        const ModelLimits& limits,
        const std::optional<PriorSummary>& prior = std::nullopt,
        const SummaryCallback& legacy_callback = {}
    );

    // State of the current or most recent run
    CompactionState state() const { return state_.load(); }

    const ThresholdCalculator& threshold() const { return threshold_; }

private:
    CompactionConfig config_;
    ThresholdCalculator threshold_;
    AnchorDetector detector_;
    TurnSelector selector_;
    PreservationExtractor extractor_;
    SummarySynthesizer synthesizer_;

    std::atomic<CompactionState> state_{CompactionState::Idle};

    Result<CompactionOutcome, Error> run(
        const std::vector<ConversationTurn>& turns,
        const ModelLimits& limits,
        const std::optional<PriorSummary>& prior,
        const SummaryCallback& legacy_callback,
        ThresholdDecision decision,
        bool check_threshold
    );

    void select_and_synthesize(
        const std::vector<ConversationTurn>& turns,
        const ModelLimits& limits,
        const std::optional<PriorSummary>& prior,
        const SummaryCallback& legacy_callback,
        CompactionOutcome& outcome
    );
};

}  // namespace agentctx::compaction
