#include "agentctx/compaction/preservation.hpp"
#include "agentctx/compaction/anchor_detector.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <sstream>

namespace agentctx::compaction {

std::string_view build_status_to_string(BuildStatus status) {
    switch (status) {
        case BuildStatus::Passing: return "passing";
        case BuildStatus::Failing: return "failing";
        case BuildStatus::Unknown: return "unknown";
    }
    return "unknown";
}

namespace {

constexpr std::array<std::string_view, 9> kGoalPrefixes = {
    "please ", "can you ", "could you ", "let's ", "lets ",
    "i want to ", "i need to ", "we need to ", "help me "
};

constexpr std::array<std::string_view, 18> kGoalVerbs = {
    "fix", "implement", "add", "create", "refactor", "update", "write",
    "build", "deploy", "remove", "investigate", "make", "migrate",
    "optimize", "debug", "support", "rename", "change"
};

constexpr size_t kMaxGoalLength = 120;
constexpr size_t kMaxErrorLength = 200;

std::string first_line(std::string_view text) {
    auto start = text.find_first_not_of(" \t\r\n");
    if (start == std::string_view::npos) return "";
    auto end = text.find('\n', start);
    std::string line(text.substr(start, end == std::string_view::npos ? std::string_view::npos : end - start));
    while (!line.empty() && std::isspace(static_cast<unsigned char>(line.back()))) line.pop_back();
    return line;
}

std::string clip(std::string text, size_t max_len) {
    if (text.size() > max_len) {
        text.resize(max_len);
        text += "...";
    }
    return text;
}

bool is_build_or_test_output(const ToolCall* call, const ToolResult& result) {
    if (call && classify_tool(call->name) == ToolKind::Shell) {
        if (auto cmd = call->command(); cmd && is_milestone_command(*cmd)) {
            return true;
        }
    }
    return signals_success(result.content);
}

struct OpenError {
    std::string message;
    std::vector<std::string> files;
    std::vector<std::string> commands;
};

bool overlaps(const std::vector<std::string>& a, const std::vector<std::string>& b) {
    return std::any_of(a.begin(), a.end(), [&](const std::string& x) {
        return std::find(b.begin(), b.end(), x) != b.end();
    });
}

}  // namespace

std::string normalize_goal(std::string_view goal) {
    std::string out;
    bool pending_space = false;
    for (unsigned char c : goal) {
        if (std::isspace(c)) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) {
            out.push_back(' ');
            pending_space = false;
        }
        out.push_back(static_cast<char>(std::tolower(c)));
    }
    while (!out.empty() && std::ispunct(static_cast<unsigned char>(out.back()))) {
        out.pop_back();
    }
    return out;
}

std::optional<std::string> extract_goal(std::string_view user_message) {
    std::string line = first_line(user_message);
    if (line.empty()) return std::nullopt;

    // First sentence only
    auto stop = line.find_first_of(".!?");
    if (stop != std::string::npos) line.resize(stop);

    std::string lower = to_lower(line);
    size_t offset = 0;
    for (auto prefix : kGoalPrefixes) {
        if (lower.compare(0, prefix.size(), prefix) == 0) {
            offset = prefix.size();
            break;
        }
    }

    std::string_view rest = std::string_view(lower).substr(offset);
    for (auto verb : kGoalVerbs) {
        if (rest.compare(0, verb.size(), verb) == 0 &&
            (rest.size() == verb.size() || rest[verb.size()] == ' ')) {
            std::string goal = line.substr(offset);
            if (!goal.empty()) {
                goal[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(goal[0])));
            }
            return clip(std::move(goal), kMaxGoalLength);
        }
    }
    return std::nullopt;
}

std::string PreservationContext::format_for_summary() const {
    std::ostringstream ss;
    bool first = true;
    auto line = [&](const std::string& text) {
        if (!first) ss << "\n";
        ss << text;
        first = false;
    };

    if (!active_files.empty()) {
        std::string files;
        for (const auto& f : active_files) {
            if (!files.empty()) files += ", ";
            files += f;
        }
        line("Active files: " + files);
    }

    if (!goals.empty()) {
        std::string joined;
        for (const auto& g : goals) {
            if (!joined.empty()) joined += "; ";
            joined += g;
        }
        line("Goals: " + joined);
    }

    if (error_state) {
        line("Last error: " + *error_state);
    }

    if (build_status) {
        line("Build: " + std::string(build_status_to_string(*build_status)));
    }

    return ss.str();
}

Json PreservationContext::to_json() const {
    Json j{
        {"active_files", active_files},
        {"goals", goals}
    };
    if (error_state) j["error_state"] = *error_state;
    if (build_status) j["build_status"] = std::string(build_status_to_string(*build_status));
    return j;
}

PreservationExtractor::PreservationExtractor(size_t max_goals)
    : max_goals_(max_goals)
{
}

PreservationContext PreservationExtractor::extract(
    const std::vector<ConversationTurn>& turns, size_t end) const {

    PreservationContext ctx;
    std::vector<std::string> goal_keys;
    std::optional<OpenError> open_error;

    end = std::min(end, turns.size());
    for (size_t i = 0; i < end; ++i) {
        const auto& turn = turns[i];

        for (const auto& path : turn.file_paths()) {
            ctx.active_files.insert(path);
        }

        if (auto goal = extract_goal(turn.user_message)) {
            auto key = normalize_goal(*goal);
            if (std::find(goal_keys.begin(), goal_keys.end(), key) == goal_keys.end()) {
                goal_keys.push_back(std::move(key));
                ctx.goals.push_back(std::move(*goal));
            }
        }

        for (const auto& result : turn.tool_results) {
            const ToolCall* call = turn.find_call(result.tool_call_id);

            if (is_build_or_test_output(call, result)) {
                if (result.is_error || signals_failure(result.content)) {
                    ctx.build_status = BuildStatus::Failing;
                } else if (signals_success(result.content)) {
                    ctx.build_status = BuildStatus::Passing;
                } else {
                    ctx.build_status = BuildStatus::Unknown;
                }
            }

            std::vector<std::string> files;
            std::vector<std::string> commands;
            if (call) {
                if (auto path = call->file_path(); path && is_file_tool(classify_tool(call->name))) {
                    files.push_back(*path);
                }
                if (auto cmd = call->command(); cmd && classify_tool(call->name) == ToolKind::Shell) {
                    commands.push_back(command_key(*cmd));
                }
            }

            if (result.is_error) {
                std::string message = first_line(result.content);
                if (message.empty()) message = "Tool call failed";
                open_error = OpenError{clip(std::move(message), kMaxErrorLength), files, commands};
            } else if (open_error &&
                       (signals_success(result.content) ||
                        overlaps(open_error->files, files) ||
                        overlaps(open_error->commands, commands))) {
                open_error.reset();
            }
        }
    }

    if (ctx.goals.size() > max_goals_) {
        ctx.goals.erase(ctx.goals.begin(), ctx.goals.end() - static_cast<std::ptrdiff_t>(max_goals_));
    }

    if (open_error) {
        ctx.error_state = open_error->message;
    }

    return ctx;
}

PreservationContext PreservationExtractor::merge(const PreservationContext& earlier,
                                                 const PreservationContext& later) const {
    PreservationContext merged;
    merged.active_files = earlier.active_files;
    merged.active_files.insert(later.active_files.begin(), later.active_files.end());

    std::vector<std::string> keys;
    for (const auto* source : {&earlier.goals, &later.goals}) {
        for (const auto& goal : *source) {
            auto key = normalize_goal(goal);
            auto it = std::find(keys.begin(), keys.end(), key);
            if (it != keys.end()) {
                // Repeated goal moves to its most recent position
                merged.goals.erase(merged.goals.begin() + (it - keys.begin()));
                keys.erase(it);
            }
            keys.push_back(std::move(key));
            merged.goals.push_back(goal);
        }
    }
    if (merged.goals.size() > max_goals_) {
        merged.goals.erase(merged.goals.begin(), merged.goals.end() - static_cast<std::ptrdiff_t>(max_goals_));
    }

    merged.build_status = later.build_status ? later.build_status : earlier.build_status;

    if (later.error_state) {
        merged.error_state = later.error_state;
    } else if (later.build_status != BuildStatus::Passing) {
        merged.error_state = earlier.error_state;
    }

    return merged;
}

}  // namespace agentctx::compaction
