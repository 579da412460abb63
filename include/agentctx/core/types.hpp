#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace agentctx::core {

// JSON alias
using Json = nlohmann::json;

namespace fs = std::filesystem;

// Time types
using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using Duration = std::chrono::milliseconds;

using SessionId = std::string;
using ToolCallId = std::string;

// Message roles
enum class Role {
    System,
    User,
    Assistant,
    Tool
};

inline std::string_view role_to_string(Role role) {
    switch (role) {
        case Role::System: return "system";
        case Role::User: return "user";
        case Role::Assistant: return "assistant";
        case Role::Tool: return "tool";
    }
    return "unknown";
}

inline Role role_from_string(std::string_view str) {
    if (str == "system") return Role::System;
    if (str == "user") return Role::User;
    if (str == "assistant") return Role::Assistant;
    if (str == "tool") return Role::Tool;
    return Role::User;
}

inline int64_t to_epoch_seconds(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

inline TimePoint from_epoch_seconds(int64_t seconds) {
    return TimePoint{std::chrono::seconds{seconds}};
}

// Tool call issued by the assistant
struct ToolCall {
    ToolCallId id;
    std::string name;
    Json arguments = Json::object();

    // "file_path" (or "path") argument, if the call has one
    std::optional<std::string> file_path() const {
        for (const char* key : {"file_path", "path"}) {
            if (arguments.is_object() && arguments.contains(key) && arguments[key].is_string()) {
                return arguments[key].get<std::string>();
            }
        }
        return std::nullopt;
    }

    // "command" argument for shell-like tools
    std::optional<std::string> command() const {
        if (arguments.is_object() && arguments.contains("command") && arguments["command"].is_string()) {
            return arguments["command"].get<std::string>();
        }
        return std::nullopt;
    }

    Json to_json() const {
        return Json{
            {"id", id},
            {"name", name},
            {"arguments", arguments}
        };
    }

    static ToolCall from_json(const Json& j) {
        return ToolCall{
            .id = j.value("id", ""),
            .name = j.value("name", ""),
            .arguments = j.value("arguments", Json::object())
        };
    }
};

// Result of executing a tool call, joined to its call by id
struct ToolResult {
    ToolCallId tool_call_id;
    std::string content;
    bool is_error = false;

    Json to_json() const {
        return Json{
            {"tool_call_id", tool_call_id},
            {"content", content},
            {"is_error", is_error}
        };
    }

    static ToolResult from_json(const Json& j) {
        return ToolResult{
            .tool_call_id = j.value("tool_call_id", ""),
            .content = j.value("content", ""),
            .is_error = j.value("is_error", false)
        };
    }
};

// Provider-facing message
struct Message {
    Role role;
    std::string content;
    std::vector<ToolCall> tool_calls;
    std::optional<std::string> tool_call_id;  // For tool results
    TimePoint timestamp;

    Message() : role(Role::User), timestamp(Clock::now()) {}

    Message(Role r, std::string c)
        : role(r), content(std::move(c)), timestamp(Clock::now()) {}

    static Message user(std::string content) {
        return Message{Role::User, std::move(content)};
    }

    static Message assistant(std::string content) {
        return Message{Role::Assistant, std::move(content)};
    }

    static Message system(std::string content) {
        return Message{Role::System, std::move(content)};
    }

    static Message tool_result(std::string tool_call_id, std::string content) {
        Message m{Role::Tool, std::move(content)};
        m.tool_call_id = std::move(tool_call_id);
        return m;
    }

    Json to_json() const {
        Json j{
            {"role", std::string(role_to_string(role))},
            {"content", content},
            {"timestamp", to_epoch_seconds(timestamp)}
        };
        if (!tool_calls.empty()) {
            j["tool_calls"] = Json::array();
            for (const auto& tc : tool_calls) {
                j["tool_calls"].push_back(tc.to_json());
            }
        }
        if (tool_call_id) j["tool_call_id"] = *tool_call_id;
        return j;
    }

    static Message from_json(const Json& j) {
        Message m;
        m.role = role_from_string(j.value("role", "user"));
        m.content = j.value("content", "");
        if (j.contains("tool_call_id")) m.tool_call_id = j["tool_call_id"].get<std::string>();
        if (j.contains("tool_calls")) {
            for (const auto& tc : j["tool_calls"]) {
                m.tool_calls.push_back(ToolCall::from_json(tc));
            }
        }
        if (j.contains("timestamp")) {
            m.timestamp = from_epoch_seconds(j["timestamp"].get<int64_t>());
        }
        return m;
    }
};

// Token usage reported by a provider for one request.
// Fields are absent when the provider did not report them.
struct TokenUsage {
    std::optional<uint64_t> input_tokens;                 // fresh, uncached
    std::optional<uint64_t> output_tokens;
    std::optional<uint64_t> cache_read_input_tokens;
    std::optional<uint64_t> cache_creation_input_tokens;

    bool is_empty() const {
        return !input_tokens && !output_tokens &&
               !cache_read_input_tokens && !cache_creation_input_tokens;
    }

    // Full context size of the request: the three input sets are disjoint
    uint64_t total_input() const {
        return input_tokens.value_or(0) +
               cache_read_input_tokens.value_or(0) +
               cache_creation_input_tokens.value_or(0);
    }

    Json to_json() const {
        Json j = Json::object();
        if (input_tokens) j["input_tokens"] = *input_tokens;
        if (output_tokens) j["output_tokens"] = *output_tokens;
        if (cache_read_input_tokens) j["cache_read_input_tokens"] = *cache_read_input_tokens;
        if (cache_creation_input_tokens) j["cache_creation_input_tokens"] = *cache_creation_input_tokens;
        j["total_input"] = total_input();
        return j;
    }
};

}  // namespace agentctx::core
