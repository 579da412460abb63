#pragma once

#include "agentctx/compaction/anchor_detector.hpp"
#include "agentctx/compaction/turn.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace agentctx::compaction {

// Split of a history into a discarded prefix and a verbatim suffix
struct TurnSelection {
    size_t start_index = 0;                        // first retained position
    std::vector<ConversationTurn> retained_turns;  // turns[start_index, n)
    size_t discarded_count = 0;                    // == start_index
    uint64_t retained_tokens = 0;
    bool fits_budget = true;
    bool anchor_advanced = false;                  // budget moved the start past the anchor

    Json to_json() const;
};

// Decides which turns are kept verbatim.
//
// The retained region is always a contiguous suffix in original order. It
// starts at the anchor, or earlier when that would leave fewer than
// min_retained_turns. If the tail exceeds the budget, the oldest retained
// turns are dropped one at a time until it fits or a single turn remains;
// fits_budget is false in the latter case.
class TurnSelector {
public:
    explicit TurnSelector(size_t min_retained_turns = 3);

    TurnSelection select(const std::vector<ConversationTurn>& turns,
                         const AnchorPoint& anchor,
                         uint64_t token_budget) const;

private:
    size_t min_retained_turns_;
};

}  // namespace agentctx::compaction
