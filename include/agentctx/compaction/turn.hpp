#pragma once

#include "agentctx/core/result.hpp"
#include "agentctx/core/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace agentctx::compaction {

using namespace agentctx::core;

// Coarse tool categories the engine cares about
enum class ToolKind {
    Read,
    Write,
    Edit,
    Shell,
    WebSearch,
    Other
};

// Classify a tool by name ("Edit", "file_edit", "str-replace" ...), case-insensitive
ToolKind classify_tool(std::string_view name);

inline bool is_file_tool(ToolKind kind) {
    return kind == ToolKind::Read || kind == ToolKind::Write || kind == ToolKind::Edit;
}

inline bool is_modifying_tool(ToolKind kind) {
    return kind == ToolKind::Write || kind == ToolKind::Edit;
}

// One logical exchange: user message, tool activity and the assistant reply.
// Turns are never mutated once created; the engine only reads or copies them.
struct ConversationTurn {
    uint64_t index = 0;
    std::string user_message;
    std::vector<ToolCall> tool_calls;
    std::vector<ToolResult> tool_results;
    std::string assistant_response;
    TimePoint timestamp;

    bool has_error() const;

    // Lookup by id within the turn; nullptr if absent
    const ToolCall* find_call(std::string_view id) const;

    // Result joined to a call; nullptr if the call has no result yet
    const ToolResult* find_result(std::string_view call_id) const;

    // Paths referenced by read/write/edit calls, in call order
    std::vector<std::string> file_paths() const;

    // Normalized command keys ("cargo build") of shell calls
    std::vector<std::string> command_keys() const;

    Json to_json() const;
};

// Assigns monotonic sequence indices at creation
class TurnSequencer {
public:
    explicit TurnSequencer(uint64_t next_index = 0) : next_index_(next_index) {}

    ConversationTurn create(std::string user_message,
                            std::vector<ToolCall> tool_calls,
                            std::vector<ToolResult> tool_results,
                            std::string assistant_response,
                            TimePoint timestamp = Clock::now());

    uint64_t next_index() const { return next_index_; }

private:
    uint64_t next_index_;
};

// Every result must reference a call in the same turn
Result<void, Error> validate_turn(const ConversationTurn& turn);

// Indices strictly increasing and every turn valid
Result<void, Error> validate_history(const std::vector<ConversationTurn>& turns);

// Render a turn back into provider messages
std::vector<Message> turn_to_messages(const ConversationTurn& turn);

// "cargo build --release" -> "cargo build"; empty for blank commands
std::string command_key(std::string_view command);

// Last path component
std::string filename_of(std::string_view path);

std::string to_lower(std::string_view text);

// Character-based token estimation (~3.5 characters per token)
class TokenEstimator {
public:
    static uint64_t estimate(std::string_view text);
    static uint64_t estimate(const Message& msg);
    static uint64_t estimate(const ConversationTurn& turn);
    static uint64_t estimate(const std::vector<ConversationTurn>& turns);
    static uint64_t estimate(const std::vector<Message>& messages);
};

}  // namespace agentctx::compaction
