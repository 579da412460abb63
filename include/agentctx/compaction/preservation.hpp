#pragma once

#include "agentctx/compaction/turn.hpp"

#include <cstddef>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace agentctx::compaction {

enum class BuildStatus {
    Passing,
    Failing,
    Unknown
};

std::string_view build_status_to_string(BuildStatus status);

// Durable facts recovered from turns that are about to be discarded
struct PreservationContext {
    std::set<std::string> active_files;
    std::vector<std::string> goals;
    std::optional<std::string> error_state;
    std::optional<BuildStatus> build_status;

    bool empty() const {
        return active_files.empty() && goals.empty() && !error_state && !build_status;
    }

    // "Active files: ...\nGoals: ...\nLast error: ...\nBuild: ..."; lines without data are omitted
    std::string format_for_summary() const;

    Json to_json() const;
};

// Single linear scan over the discard region
class PreservationExtractor {
public:
    explicit PreservationExtractor(size_t max_goals = 5);

    // Scan turns[0, end)
    PreservationContext extract(const std::vector<ConversationTurn>& turns, size_t end) const;

    PreservationContext extract(const std::vector<ConversationTurn>& turns) const {
        return extract(turns, turns.size());
    }

    // Fold facts kept from an earlier compaction under newer ones. Newer
    // error and build state win; goals stay capped at max_goals.
    PreservationContext merge(const PreservationContext& earlier,
                              const PreservationContext& later) const;

private:
    size_t max_goals_;
};

// Objective phrased by the user ("fix the login bug"), first sentence only
std::optional<std::string> extract_goal(std::string_view user_message);

// Lowercase, collapsed whitespace, trailing punctuation dropped
std::string normalize_goal(std::string_view goal);

}  // namespace agentctx::compaction
