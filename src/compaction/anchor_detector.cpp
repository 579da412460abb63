#include "agentctx/compaction/anchor_detector.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <regex>

namespace agentctx::compaction {

std::string_view anchor_type_to_string(AnchorType type) {
    switch (type) {
        case AnchorType::TaskCompletion: return "task_completion";
        case AnchorType::ErrorResolution: return "error_resolution";
        case AnchorType::BashMilestone: return "bash_milestone";
        case AnchorType::WebSearchMilestone: return "web_search_milestone";
        case AnchorType::Synthetic: return "synthetic";
    }
    return "unknown";
}

double anchor_weight(AnchorType type) {
    switch (type) {
        case AnchorType::ErrorResolution: return 0.9;
        case AnchorType::TaskCompletion: return 0.8;
        case AnchorType::BashMilestone: return 0.75;
        case AnchorType::WebSearchMilestone: return 0.7;
        case AnchorType::Synthetic: return 0.7;
    }
    return 0.0;
}

Json AnchorPoint::to_json() const {
    return Json{
        {"turn_index", turn_index},
        {"anchor_type", std::string(anchor_type_to_string(anchor_type))},
        {"weight", weight},
        {"confidence", confidence},
        {"description", description}
    };
}

namespace {

const std::regex& success_pattern() {
    static const std::regex re(
        R"(\b(pass|passed|passes|passing|success|successful|successfully|succeeded|ok|finished)\b)");
    return re;
}

const std::regex& failure_pattern() {
    static const std::regex re(
        R"(\b[1-9][0-9]* (failed|failures|failing|errors?)\b|\berror(\[|:)|\b(build|tests?|compilation) failed\b|\bfailed to\b)");
    return re;
}

const std::regex& milestone_pattern() {
    static const std::regex re(
        R"(^\s*(cargo (build|test|check)|npm (install|ci|test|run build)|yarn (install|test|build)|)"
        R"(pnpm (install|test|build)|pip3? install|python3? -m pytest|pytest|go (build|test)|)"
        R"(make\b|cmake --build|ctest|ninja|mvn (package|test|install)|(gradle|\./gradlew) (build|test)))");
    return re;
}

std::vector<std::string> split_command_chain(std::string_view command) {
    std::vector<std::string> segments;
    std::string current;
    for (size_t i = 0; i < command.size(); ++i) {
        char c = command[i];
        bool two_char = i + 1 < command.size() &&
                        ((c == '&' && command[i + 1] == '&') || (c == '|' && command[i + 1] == '|'));
        if (two_char || c == ';') {
            segments.push_back(current);
            current.clear();
            if (two_char) ++i;
            continue;
        }
        current.push_back(c);
    }
    segments.push_back(current);
    return segments;
}

bool shares_any(const std::vector<std::string>& a, const std::vector<std::string>& b) {
    for (const auto& x : a) {
        if (std::find(b.begin(), b.end(), x) != b.end()) return true;
    }
    return false;
}

std::string truncate(std::string_view text, size_t max_len) {
    if (text.size() <= max_len) return std::string(text);
    return std::string(text.substr(0, max_len)) + "...";
}

}  // namespace

bool signals_success(std::string_view tool_output) {
    const std::string lower = to_lower(tool_output);

    bool mentions = lower.find("test") != std::string::npos ||
                    lower.find("build") != std::string::npos ||
                    lower.find("compil") != std::string::npos;
    if (!mentions) return false;

    return std::regex_search(lower, success_pattern()) &&
           !std::regex_search(lower, failure_pattern());
}

bool signals_failure(std::string_view tool_output) {
    return std::regex_search(to_lower(tool_output), failure_pattern());
}

bool is_milestone_command(std::string_view command) {
    const std::string lower = to_lower(command);
    for (const auto& segment : split_command_chain(lower)) {
        if (std::regex_search(segment, milestone_pattern())) {
            return true;
        }
    }
    return false;
}

AnchorDetector::AnchorDetector(size_t synthetic_offset)
    : synthetic_offset_(std::max<size_t>(synthetic_offset, 1))
{
}

std::optional<AnchorPoint> AnchorDetector::classify(
    const std::vector<ConversationTurn>& turns, size_t index) const {

    if (index >= turns.size()) return std::nullopt;
    const auto& turn = turns[index];

    // TaskCompletion: passing output of a shell command only
    for (const auto& result : turn.tool_results) {
        const ToolCall* call = turn.find_call(result.tool_call_id);
        if (!call || classify_tool(call->name) != ToolKind::Shell) continue;
        if (!result.is_error && signals_success(result.content)) {
            return AnchorPoint{
                .turn_index = index,
                .anchor_type = AnchorType::TaskCompletion,
                .weight = anchor_weight(AnchorType::TaskCompletion),
                .confidence = 0.92,
                .description = "Tests or build passed"
            };
        }
    }

    // ErrorResolution
    if (index > 0 && turns[index - 1].has_error() && !turn.has_error()) {
        const auto& failed = turns[index - 1];
        if (shares_any(failed.file_paths(), turn.file_paths()) ||
            shares_any(failed.command_keys(), turn.command_keys())) {
            return AnchorPoint{
                .turn_index = index,
                .anchor_type = AnchorType::ErrorResolution,
                .weight = anchor_weight(AnchorType::ErrorResolution),
                .confidence = 0.95,
                .description = "Error from the previous turn resolved"
            };
        }
    }

    // BashMilestone
    for (const auto& call : turn.tool_calls) {
        if (classify_tool(call.name) != ToolKind::Shell) continue;
        auto cmd = call.command();
        if (!cmd || !is_milestone_command(*cmd)) continue;

        const auto* result = turn.find_result(call.id);
        if (result && result->is_error) continue;

        return AnchorPoint{
            .turn_index = index,
            .anchor_type = AnchorType::BashMilestone,
            .weight = anchor_weight(AnchorType::BashMilestone),
            .confidence = 0.9,
            .description = "Bash milestone: " + truncate(*cmd, 60)
        };
    }

    // WebSearchMilestone
    for (const auto& call : turn.tool_calls) {
        if (classify_tool(call.name) != ToolKind::WebSearch) continue;

        std::string query = call.arguments.is_object() ? call.arguments.value("query", "") : "";
        return AnchorPoint{
            .turn_index = index,
            .anchor_type = AnchorType::WebSearchMilestone,
            .weight = anchor_weight(AnchorType::WebSearchMilestone),
            .confidence = 0.9,
            .description = query.empty() ? "Web search" : "Web search: " + truncate(query, 60)
        };
    }

    return std::nullopt;
}

std::optional<AnchorPoint> AnchorDetector::find_natural(const std::vector<ConversationTurn>& turns) const {
    for (size_t i = turns.size(); i-- > 0;) {
        if (auto anchor = classify(turns, i)) {
            spdlog::debug("Anchor detected at turn {}: {}", i, anchor_type_to_string(anchor->anchor_type));
            return anchor;
        }
    }
    return std::nullopt;
}

AnchorPoint AnchorDetector::detect(const std::vector<ConversationTurn>& turns) const {
    if (auto natural = find_natural(turns)) {
        return *natural;
    }
    spdlog::debug("No natural anchor in {} turns, using synthetic fallback", turns.size());
    return synthetic(turns.size());
}

AnchorPoint AnchorDetector::synthetic(size_t turn_count) const {
    size_t index = turn_count > synthetic_offset_ ? turn_count - synthetic_offset_ : 0;
    return AnchorPoint{
        .turn_index = index,
        .anchor_type = AnchorType::Synthetic,
        .weight = anchor_weight(AnchorType::Synthetic),
        .confidence = 1.0,
        .description = "Synthetic checkpoint (no natural anchor detected)"
    };
}

}  // namespace agentctx::compaction
