#include "agentctx/compaction/turn_selector.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace agentctx::compaction {

Json TurnSelection::to_json() const {
    return Json{
        {"start_index", start_index},
        {"retained_count", retained_turns.size()},
        {"discarded_count", discarded_count},
        {"retained_tokens", retained_tokens},
        {"fits_budget", fits_budget},
        {"anchor_advanced", anchor_advanced}
    };
}

TurnSelector::TurnSelector(size_t min_retained_turns)
    : min_retained_turns_(std::max<size_t>(min_retained_turns, 1))
{
}

TurnSelection TurnSelector::select(const std::vector<ConversationTurn>& turns,
                                   const AnchorPoint& anchor,
                                   uint64_t token_budget) const {
    TurnSelection selection;
    const size_t n = turns.size();
    if (n == 0) {
        return selection;
    }

    size_t floor_start = n > min_retained_turns_ ? n - min_retained_turns_ : 0;
    size_t start = std::min({anchor.turn_index, floor_start, n - 1});

    // Per-turn estimates so the shrink loop stays linear
    std::vector<uint64_t> costs(n, 0);
    uint64_t tail_tokens = 0;
    for (size_t i = start; i < n; ++i) {
        costs[i] = TokenEstimator::estimate(turns[i]);
        tail_tokens += costs[i];
    }

    const size_t anchor_start = start;
    while (tail_tokens > token_budget && start + 1 < n) {
        tail_tokens -= costs[start];
        ++start;
    }

    selection.start_index = start;
    selection.discarded_count = start;
    selection.retained_tokens = tail_tokens;
    selection.fits_budget = tail_tokens <= token_budget;
    selection.anchor_advanced = start != anchor_start;
    selection.retained_turns.assign(turns.begin() + static_cast<std::ptrdiff_t>(start), turns.end());

    if (selection.anchor_advanced) {
        spdlog::debug("Retained tail advanced from {} to {} to fit {} tokens",
                      anchor_start, start, token_budget);
    }

    return selection;
}

}  // namespace agentctx::compaction
