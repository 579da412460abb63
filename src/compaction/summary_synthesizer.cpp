#include "agentctx/compaction/summary_synthesizer.hpp"

#include <algorithm>
#include <sstream>

namespace agentctx::compaction {

namespace {

std::string trim(std::string_view text) {
    auto start = text.find_first_not_of(" \t\r\n");
    if (start == std::string_view::npos) return "";
    auto end = text.find_last_not_of(" \t\r\n");
    return std::string(text.substr(start, end - start + 1));
}

std::string first_sentence(std::string_view text) {
    auto stop = text.find('.');
    return trim(stop == std::string_view::npos ? text : text.substr(0, stop));
}

template<typename Range>
std::string join(const Range& items, std::string_view sep) {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) out += sep;
        out += item;
    }
    return out;
}

}  // namespace

int64_t DiscardedRegionStats::time_span_seconds() const {
    if (!first_timestamp || !last_timestamp) return 0;
    auto span = std::chrono::duration_cast<std::chrono::seconds>(*last_timestamp - *first_timestamp);
    return span.count() < 0 ? 0 : span.count();
}

DiscardedRegionStats DiscardedRegionStats::collect(
    const std::vector<ConversationTurn>& turns, size_t end) {

    DiscardedRegionStats stats;
    end = std::min(end, turns.size());
    stats.turn_count = end;

    for (size_t i = 0; i < end; ++i) {
        const auto& turn = turns[i];
        for (const auto& call : turn.tool_calls) {
            stats.tool_counts[call.name]++;
        }
        if (!stats.first_timestamp || turn.timestamp < *stats.first_timestamp) {
            stats.first_timestamp = turn.timestamp;
        }
        if (!stats.last_timestamp || turn.timestamp > *stats.last_timestamp) {
            stats.last_timestamp = turn.timestamp;
        }
    }
    return stats;
}

void DiscardedRegionStats::absorb(const DiscardedRegionStats& earlier) {
    turn_count += earlier.turn_count;
    for (const auto& [name, count] : earlier.tool_counts) {
        tool_counts[name] += count;
    }
    if (earlier.first_timestamp &&
        (!first_timestamp || *earlier.first_timestamp < *first_timestamp)) {
        first_timestamp = earlier.first_timestamp;
    }
    if (earlier.last_timestamp &&
        (!last_timestamp || *earlier.last_timestamp > *last_timestamp)) {
        last_timestamp = earlier.last_timestamp;
    }
}

Json DiscardedRegionStats::to_json() const {
    return Json{
        {"turn_count", turn_count},
        {"tool_counts", tool_counts},
        {"time_span_seconds", time_span_seconds()}
    };
}

std::string turn_outcome(const ConversationTurn& turn, bool is_anchor) {
    if (is_anchor) {
        return "[ANCHOR] " + trim(turn.assistant_response);
    }

    std::vector<std::string> files;
    for (const auto& call : turn.tool_calls) {
        if (!is_modifying_tool(classify_tool(call.name))) continue;
        if (auto path = call.file_path()) {
            files.push_back(filename_of(*path));
        }
    }

    std::string line = turn.has_error() ? "✗ " : "✓ ";
    if (!files.empty()) {
        line += "Modified " + join(files, ", ") + ": ";
    }
    line += first_sentence(turn.assistant_response);
    return line;
}

std::string SummarySynthesizer::synthesize(const PreservationContext& context,
                                           const DiscardedRegionStats& stats,
                                           const std::vector<std::string>& outcomes,
                                           const SummaryCallback& /*legacy_callback*/) const {
    std::ostringstream ss;

    ss << "Summary of " << stats.turn_count << " prior turns: "
       << "goals {" << (context.goals.empty() ? "none" : join(context.goals, "; ")) << "}; "
       << "active files {" << (context.active_files.empty() ? "none" : join(context.active_files, ", ")) << "}; "
       << "last known error {" << context.error_state.value_or("none") << "}; "
       << "build status {"
       << (context.build_status ? std::string(build_status_to_string(*context.build_status)) : "unknown")
       << "}";

    if (!stats.tool_counts.empty()) {
        std::vector<std::string> counts;
        for (const auto& [name, count] : stats.tool_counts) {
            counts.push_back(name + " x" + std::to_string(count));
        }
        ss << "\nTool calls: " << join(counts, ", ");
    }
    ss << "\nTime span: " << stats.time_span_seconds() << "s";

    if (!outcomes.empty()) {
        ss << "\n\nKey outcomes:";
        for (const auto& outcome : outcomes) {
            ss << "\n" << outcome;
        }
    }

    return ss.str();
}

}  // namespace agentctx::compaction
