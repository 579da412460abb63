#pragma once

#include "agentctx/compaction/compactor.hpp"
#include "agentctx/compaction/system_reminders.hpp"
#include "agentctx/compaction/token_tracker.hpp"
#include "agentctx/core/config.hpp"
#include "agentctx/session/event_recorder.hpp"
#include "agentctx/session/model_registry.hpp"
#include "agentctx/session/provider_usage.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace agentctx::session {

using compaction::CompactionOutcome;
using compaction::ConversationTurn;
using compaction::MessageStream;
using compaction::SystemReminderType;

// What started a compaction run; recorded with the compaction events
enum class CompactionTrigger {
    PostTurn,     // after a completed agent turn
    PrePrompt,    // resumed session, before its first request
    Manual        // explicit user command
};

std::string_view compaction_trigger_to_string(CompactionTrigger trigger);

// Receives every session event as it is recorded ("compaction.triggered", ...)
using SessionEventCallback = std::function<void(std::string_view event_type, const Json& data)>;

// One conversation's history, token accounting and compaction.
//
// The stream holds reminders interleaved with turns. Compaction replaces the
// turns before the retained tail with a summary and moves the latest live
// reminder of each type to the front. Usage events may arrive from a
// streaming thread; everything else is driven by the agent loop.
class Session {
public:
    Session(SessionId id, const Config& config, ProviderKind provider, std::string model);
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    const SessionId& id() const { return id_; }
    ProviderKind provider() const { return provider_; }
    const std::string& model() const { return model_; }
    const ModelLimits& limits() const { return limits_; }

    // Build a turn with the next sequence index
    ConversationTurn create_turn(std::string user_message,
                                 std::vector<ToolCall> tool_calls,
                                 std::vector<ToolResult> tool_results,
                                 std::string assistant_response);

    // Rejects orphan tool results and non-increasing indices
    Result<void, Error> append_turn(ConversationTurn turn);

    void add_reminder(SystemReminderType type, std::string content);

    // Final usage updates billing; intermediate usage only the display fields
    void record_usage(const TokenUsage& usage, bool is_final);

    // Raw provider usage object, normalized by this session's provider adapter
    Result<void, Error> record_usage(const Json& raw_usage, bool is_final);

    // After each completed turn
    Result<CompactionOutcome, Error> compact_if_needed();

    // Before the first request of a resumed session
    Result<CompactionOutcome, Error> check_before_first_request(std::string_view prompt);

    // Manual compaction, regardless of the threshold
    Result<CompactionOutcome, Error> force_compact();

    // Leading reminders, then the summary, then the rest of the stream in order
    std::vector<Message> build_messages() const;

    std::vector<ConversationTurn> turns() const;
    std::optional<std::string> summary() const;
    size_t reminder_count(SystemReminderType type) const;

    compaction::TokenTracker tokens() const { return tracker_.snapshot(); }
    compaction::SharedTokenTracker& tracker() { return tracker_; }

    bool is_compacting() const { return compacting_.load(); }

    EventRecorder& events() { return events_; }

    // Called synchronously on the thread that produced the event
    void set_event_callback(SessionEventCallback callback);

    Json status() const;

private:
    SessionId id_;
    ProviderKind provider_;
    std::string model_;
    ModelLimits limits_;

    std::unique_ptr<UsageAdapter> usage_adapter_;
    compaction::Compactor compactor_;
    compaction::SharedTokenTracker tracker_;
    EventRecorder events_;

    mutable std::mutex stream_mutex_;
    MessageStream stream_;
    std::optional<compaction::PriorSummary> summary_;
    SessionEventCallback event_callback_;
    std::optional<Json> last_compaction_;
    compaction::TurnSequencer sequencer_;

    std::atomic<bool> compacting_{false};

    template<typename Run>
    Result<CompactionOutcome, Error> run_compaction(CompactionTrigger trigger, Run&& run);

    // Swap in the compacted history; entries appended during the run are kept
    void apply(const compaction::CompactionResult& result, size_t snapshot_size);

    std::vector<Message> build_messages_locked() const;

    void emit(const std::string& event_type, const Json& data);
};

}  // namespace agentctx::session
