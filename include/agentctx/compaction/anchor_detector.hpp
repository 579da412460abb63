#pragma once

#include "agentctx/compaction/turn.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace agentctx::compaction {

enum class AnchorType {
    TaskCompletion,       // a test/build run succeeded
    ErrorResolution,      // an error turn followed by a clean turn on the same files/commands
    BashMilestone,        // build, test or install command
    WebSearchMilestone,   // web search issued
    Synthetic             // fallback, no natural signal
};

std::string_view anchor_type_to_string(AnchorType type);

// Preservation weight by anchor type
double anchor_weight(AnchorType type);

struct AnchorPoint {
    size_t turn_index = 0;  // position in the history vector
    AnchorType anchor_type = AnchorType::Synthetic;
    double weight = 0.0;
    double confidence = 0.0;
    std::string description;

    bool is_synthetic() const { return anchor_type == AnchorType::Synthetic; }

    Json to_json() const;
};

inline bool operator==(const AnchorPoint& a, const AnchorPoint& b) {
    return a.turn_index == b.turn_index && a.anchor_type == b.anchor_type;
}

// True if the text reports a passing test run or a successful build
bool signals_success(std::string_view tool_output);

// True if the text reports failing tests, compiler errors or a failed build
bool signals_failure(std::string_view tool_output);

// True if the command runs a build, test or install step
bool is_milestone_command(std::string_view command);

// Finds the most recent safe cut-point in a turn history.
//
// Turns are scanned from the newest backward; per turn the first matching
// rule wins, in the order TaskCompletion, ErrorResolution, BashMilestone,
// WebSearchMilestone. With no match, a Synthetic anchor is placed
// synthetic_offset turns from the end.
class AnchorDetector {
public:
    explicit AnchorDetector(size_t synthetic_offset = 3);

    // Always yields an anchor; Synthetic when nothing qualifies
    AnchorPoint detect(const std::vector<ConversationTurn>& turns) const;

    // Most recent natural anchor, if any
    std::optional<AnchorPoint> find_natural(const std::vector<ConversationTurn>& turns) const;

    // Classify a single position; considers the preceding turn for ErrorResolution
    std::optional<AnchorPoint> classify(const std::vector<ConversationTurn>& turns, size_t index) const;

    size_t synthetic_offset() const { return synthetic_offset_; }

private:
    size_t synthetic_offset_;

    AnchorPoint synthetic(size_t turn_count) const;
};

}  // namespace agentctx::compaction
