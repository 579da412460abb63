#pragma once

#include "agentctx/compaction/preservation.hpp"
#include "agentctx/compaction/turn.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace agentctx::compaction {

// Legacy hook for a model-generated summary. Accepted so existing callers keep
// compiling; it is never invoked and has no effect on the summary text.
using SummaryCallback = std::function<Result<std::string, Error>(const std::string& prompt)>;

// Statistics of the turns being folded into the summary
struct DiscardedRegionStats {
    size_t turn_count = 0;
    std::map<std::string, size_t> tool_counts;  // by tool name, sorted
    std::optional<TimePoint> first_timestamp;
    std::optional<TimePoint> last_timestamp;

    int64_t time_span_seconds() const;

    // Stats over turns[0, end)
    static DiscardedRegionStats collect(const std::vector<ConversationTurn>& turns, size_t end);

    // Add the counts of an earlier region
    void absorb(const DiscardedRegionStats& earlier);

    Json to_json() const;
};

// Summary left by an earlier compaction of the same history. The next run
// folds its facts into the new summary instead of appending to the text.
struct PriorSummary {
    std::string text;
    PreservationContext preserved;
    DiscardedRegionStats stats;
    uint64_t summarized_through = 0;  // index of the last turn it covers
};

// "✓ Modified main.rs: Fixed the parser" / "[ANCHOR] <response>"
std::string turn_outcome(const ConversationTurn& turn, bool is_anchor);

// Deterministic, template-based summary renderer. Identical inputs give
// byte-identical output; no clock, locale or model is consulted.
class SummarySynthesizer {
public:
    std::string synthesize(const PreservationContext& context,
                           const DiscardedRegionStats& stats,
                           const std::vector<std::string>& outcomes,
                           const SummaryCallback& legacy_callback = {}) const;
};

}  // namespace agentctx::compaction
