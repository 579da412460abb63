#include "agentctx/compaction/turn.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace agentctx::compaction {

std::string to_lower(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

namespace {

// Lowercase and drop separators so "file_edit", "File-Edit" and "FileEdit" compare equal
std::string normalize_tool_name(std::string_view name) {
    std::string out;
    out.reserve(name.size());
    for (unsigned char c : name) {
        if (c == '_' || c == '-' || c == ' ' || c == '.') continue;
        out.push_back(static_cast<char>(std::tolower(c)));
    }
    return out;
}

}  // namespace

ToolKind classify_tool(std::string_view name) {
    const std::string n = normalize_tool_name(name);

    if (n == "read" || n == "readfile" || n == "fileread" || n == "view" || n == "cat") {
        return ToolKind::Read;
    }
    if (n == "write" || n == "writefile" || n == "filewrite" || n == "createfile") {
        return ToolKind::Write;
    }
    if (n == "edit" || n == "editfile" || n == "fileedit" || n == "multiedit" ||
        n == "strreplace" || n == "applypatch") {
        return ToolKind::Edit;
    }
    if (n == "bash" || n == "shell" || n == "runcommand" || n == "executecommand" || n == "exec") {
        return ToolKind::Shell;
    }
    if (n == "websearch" || n == "searchweb" || n == "googlesearch") {
        return ToolKind::WebSearch;
    }
    return ToolKind::Other;
}

bool ConversationTurn::has_error() const {
    return std::any_of(tool_results.begin(), tool_results.end(),
                       [](const ToolResult& r) { return r.is_error; });
}

const ToolCall* ConversationTurn::find_call(std::string_view id) const {
    for (const auto& call : tool_calls) {
        if (call.id == id) return &call;
    }
    return nullptr;
}

const ToolResult* ConversationTurn::find_result(std::string_view call_id) const {
    for (const auto& result : tool_results) {
        if (result.tool_call_id == call_id) return &result;
    }
    return nullptr;
}

std::vector<std::string> ConversationTurn::file_paths() const {
    std::vector<std::string> paths;
    for (const auto& call : tool_calls) {
        if (!is_file_tool(classify_tool(call.name))) continue;
        if (auto path = call.file_path()) {
            paths.push_back(*path);
        }
    }
    return paths;
}

std::vector<std::string> ConversationTurn::command_keys() const {
    std::vector<std::string> keys;
    for (const auto& call : tool_calls) {
        if (classify_tool(call.name) != ToolKind::Shell) continue;
        if (auto cmd = call.command()) {
            auto key = command_key(*cmd);
            if (!key.empty()) keys.push_back(std::move(key));
        }
    }
    return keys;
}

Json ConversationTurn::to_json() const {
    Json j{
        {"index", index},
        {"user_message", user_message},
        {"assistant_response", assistant_response},
        {"timestamp", to_epoch_seconds(timestamp)},
        {"tool_calls", Json::array()},
        {"tool_results", Json::array()}
    };
    for (const auto& call : tool_calls) {
        j["tool_calls"].push_back(call.to_json());
    }
    for (const auto& result : tool_results) {
        j["tool_results"].push_back(result.to_json());
    }
    return j;
}

ConversationTurn TurnSequencer::create(std::string user_message,
                                       std::vector<ToolCall> tool_calls,
                                       std::vector<ToolResult> tool_results,
                                       std::string assistant_response,
                                       TimePoint timestamp) {
    return ConversationTurn{
        .index = next_index_++,
        .user_message = std::move(user_message),
        .tool_calls = std::move(tool_calls),
        .tool_results = std::move(tool_results),
        .assistant_response = std::move(assistant_response),
        .timestamp = timestamp
    };
}

Result<void, Error> validate_turn(const ConversationTurn& turn) {
    for (const auto& result : turn.tool_results) {
        if (turn.find_call(result.tool_call_id) == nullptr) {
            return Result<void, Error>::err(
                ErrorCode::InvalidToolResult,
                "Tool result has no matching tool call",
                "turn " + std::to_string(turn.index) + ", tool_call_id '" + result.tool_call_id + "'"
            );
        }
    }
    return Result<void, Error>::ok();
}

Result<void, Error> validate_history(const std::vector<ConversationTurn>& turns) {
    for (size_t i = 0; i < turns.size(); ++i) {
        if (i > 0 && turns[i].index <= turns[i - 1].index) {
            return Result<void, Error>::err(
                ErrorCode::InvalidTurnSequence,
                "Turn indices are not strictly increasing",
                "position " + std::to_string(i)
            );
        }
        auto valid = validate_turn(turns[i]);
        if (valid.is_err()) {
            return valid;
        }
    }
    return Result<void, Error>::ok();
}

std::vector<Message> turn_to_messages(const ConversationTurn& turn) {
    std::vector<Message> messages;

    if (!turn.user_message.empty()) {
        Message user = Message::user(turn.user_message);
        user.timestamp = turn.timestamp;
        messages.push_back(std::move(user));
    }

    if (!turn.tool_calls.empty()) {
        Message calls = Message::assistant("");
        calls.tool_calls = turn.tool_calls;
        calls.timestamp = turn.timestamp;
        messages.push_back(std::move(calls));

        for (const auto& result : turn.tool_results) {
            Message tool = Message::tool_result(result.tool_call_id, result.content);
            tool.timestamp = turn.timestamp;
            messages.push_back(std::move(tool));
        }
    }

    if (!turn.assistant_response.empty()) {
        Message reply = Message::assistant(turn.assistant_response);
        reply.timestamp = turn.timestamp;
        messages.push_back(std::move(reply));
    }

    return messages;
}

std::string command_key(std::string_view command) {
    // Only the last segment of a chain matters: "cd app && npm test" -> "npm test"
    std::string cmd(command);
    for (const char* sep : {"&&", "||", ";"}) {
        auto pos = cmd.rfind(sep);
        if (pos != std::string::npos) {
            cmd = cmd.substr(pos + std::string_view(sep).size());
        }
    }

    // Pipelines are keyed by their producer: "npm test | tee log" -> "npm test"
    if (auto pipe = cmd.find('|'); pipe != std::string::npos) {
        cmd.resize(pipe);
    }

    std::istringstream ss(cmd);
    std::string word;
    std::vector<std::string> words;
    while (ss >> word && words.size() < 2) {
        if (word.front() == '-') {
            if (words.empty()) continue;
            break;
        }
        words.push_back(to_lower(word));
    }

    if (words.empty()) return "";
    if (words.size() == 1) return words[0];
    return words[0] + " " + words[1];
}

std::string filename_of(std::string_view path) {
    auto pos = path.find_last_of("/\\");
    if (pos == std::string_view::npos) return std::string(path);
    return std::string(path.substr(pos + 1));
}

uint64_t TokenEstimator::estimate(std::string_view text) {
    // Rough estimate: ~3.5 characters per token
    return static_cast<uint64_t>(static_cast<double>(text.size()) / 3.5);
}

uint64_t TokenEstimator::estimate(const Message& msg) {
    uint64_t tokens = 3;  // Role overhead
    tokens += estimate(msg.content);

    for (const auto& tc : msg.tool_calls) {
        tokens += 10;
        tokens += estimate(tc.name);
        tokens += estimate(tc.arguments.dump());
    }

    return tokens;
}

uint64_t TokenEstimator::estimate(const ConversationTurn& turn) {
    uint64_t tokens = 0;
    for (const auto& msg : turn_to_messages(turn)) {
        tokens += estimate(msg);
    }
    return tokens;
}

uint64_t TokenEstimator::estimate(const std::vector<ConversationTurn>& turns) {
    uint64_t tokens = 0;
    for (const auto& turn : turns) {
        tokens += estimate(turn);
    }
    return tokens;
}

uint64_t TokenEstimator::estimate(const std::vector<Message>& messages) {
    uint64_t tokens = 0;
    for (const auto& msg : messages) {
        tokens += estimate(msg);
    }
    return tokens;
}

}  // namespace agentctx::compaction
