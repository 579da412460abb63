#include "agentctx/session/session.hpp"

#include <spdlog/spdlog.h>

namespace agentctx::session {

using compaction::CompactionStatus;
using compaction::SystemReminder;
using compaction::TokenEstimator;

std::string_view compaction_trigger_to_string(CompactionTrigger trigger) {
    switch (trigger) {
        case CompactionTrigger::PostTurn: return "post_turn";
        case CompactionTrigger::PrePrompt: return "pre_prompt";
        case CompactionTrigger::Manual: return "manual";
    }
    return "unknown";
}

namespace {

// Clears the busy flag on every exit path
class BusyFlagGuard {
public:
    explicit BusyFlagGuard(std::atomic<bool>& flag) : flag_(flag) {}
    ~BusyFlagGuard() { flag_.store(false); }

    BusyFlagGuard(const BusyFlagGuard&) = delete;
    BusyFlagGuard& operator=(const BusyFlagGuard&) = delete;

private:
    std::atomic<bool>& flag_;
};

Json warnings_json(const CompactionOutcome& outcome) {
    Json arr = Json::array();
    for (const auto& w : outcome.warnings) {
        arr.push_back(w.to_json());
    }
    return arr;
}

}  // namespace

Session::Session(SessionId id, const Config& config, ProviderKind provider, std::string model)
    : id_(std::move(id))
    , provider_(provider)
    , model_(std::move(model))
    , limits_(ModelRegistry(config.models).lookup(provider, model_))
    , usage_adapter_(make_usage_adapter(provider))
    , compactor_(config.compaction)
{
    if (config.observability.capture_enabled) {
        auto started = events_.start(config.observability.capture_dir);
        if (started.is_err()) {
            spdlog::warn("Event capture unavailable: {}", started.error().to_string());
        } else {
            emit("session.config", Json{
                {"session_id", id_},
                {"provider", std::string(provider_to_string(provider_))},
                {"model", model_},
                {"context_window", limits_.context_window},
                {"max_output_tokens", limits_.max_output_tokens}
            });
        }
    }

    spdlog::info("Session {} on {}/{} (context {}, max output {})",
                 id_, provider_to_string(provider_), model_,
                 limits_.context_window, limits_.max_output_tokens);
}

Session::~Session() {
    events_.stop();
}

ConversationTurn Session::create_turn(std::string user_message,
                                      std::vector<ToolCall> tool_calls,
                                      std::vector<ToolResult> tool_results,
                                      std::string assistant_response) {
    std::lock_guard lock(stream_mutex_);
    return sequencer_.create(std::move(user_message), std::move(tool_calls),
                             std::move(tool_results), std::move(assistant_response));
}

Result<void, Error> Session::append_turn(ConversationTurn turn) {
    if (auto valid = compaction::validate_turn(turn); valid.is_err()) {
        spdlog::error("Rejected turn {}: {}", turn.index, valid.error().to_string());
        return valid;
    }

    {
        std::lock_guard lock(stream_mutex_);

        for (auto it = stream_.rbegin(); it != stream_.rend(); ++it) {
            if (const auto* last = std::get_if<ConversationTurn>(&*it)) {
                if (turn.index <= last->index) {
                    return Result<void, Error>::err(
                        ErrorCode::InvalidTurnSequence,
                        "Turn index " + std::to_string(turn.index) +
                            " does not follow " + std::to_string(last->index),
                        id_
                    );
                }
                break;
            }
        }

        if (turn.index >= sequencer_.next_index()) {
            sequencer_ = compaction::TurnSequencer(turn.index + 1);
        }
        stream_.emplace_back(std::move(turn));
    }

    events_.increment_turn();
    return Result<void, Error>::ok();
}

void Session::add_reminder(SystemReminderType type, std::string content) {
    std::lock_guard lock(stream_mutex_);
    compaction::add_system_reminder(stream_, type, std::move(content));
}

void Session::record_usage(const TokenUsage& usage, bool is_final) {
    if (is_final) {
        tracker_.update_from_usage(usage);
        emit("token.usage", Json{
            {"usage", usage.to_json()},
            {"tracker", tracker_.snapshot().to_json()}
        });
    } else {
        tracker_.update_display_only(usage);
    }
}

Result<void, Error> Session::record_usage(const Json& raw_usage, bool is_final) {
    auto usage = usage_adapter_->normalize(raw_usage);
    if (usage.is_err()) {
        spdlog::warn("Ignoring usage event: {}", usage.error().to_string());
        return Result<void, Error>::err(usage.error());
    }
    record_usage(usage.value(), is_final);
    return Result<void, Error>::ok();
}

Result<CompactionOutcome, Error> Session::compact_if_needed() {
    return run_compaction(CompactionTrigger::PostTurn,
        [this](const std::vector<ConversationTurn>& turns,
               const std::optional<compaction::PriorSummary>& prior) {
            return compactor_.compact(turns, tracker_.total_input(), limits_, prior);
        });
}

Result<CompactionOutcome, Error> Session::check_before_first_request(std::string_view prompt) {
    return run_compaction(CompactionTrigger::PrePrompt,
        [this, prompt](const std::vector<ConversationTurn>& turns,
                       const std::optional<compaction::PriorSummary>& prior) {
            auto decision = compactor_.threshold().pre_prompt_check(tracker_.total_input(), prompt, limits_);
            return compactor_.compact(turns, decision.current_tokens, limits_, prior);
        });
}

Result<CompactionOutcome, Error> Session::force_compact() {
    return run_compaction(CompactionTrigger::Manual,
        [this](const std::vector<ConversationTurn>& turns,
               const std::optional<compaction::PriorSummary>& prior) {
            return compactor_.force(turns, limits_, prior);
        });
}

template<typename Run>
Result<CompactionOutcome, Error> Session::run_compaction(CompactionTrigger trigger, Run&& run) {
    bool expected = false;
    if (!compacting_.compare_exchange_strong(expected, true)) {
        return Result<CompactionOutcome, Error>::err(
            ErrorCode::CompactionInProgress,
            "Compaction already running for this session",
            id_
        );
    }
    BusyFlagGuard guard(compacting_);

    std::vector<ConversationTurn> turns;
    std::optional<compaction::PriorSummary> prior;
    size_t snapshot_size = 0;
    {
        std::lock_guard lock(stream_mutex_);
        turns = compaction::partition_for_compaction(stream_).compactable;
        prior = summary_;
        snapshot_size = stream_.size();
    }

    auto result = run(turns, prior);
    const std::string trigger_name(compaction_trigger_to_string(trigger));

    if (result.is_err()) {
        emit("compaction.failed", Json{
            {"trigger", trigger_name},
            {"error", result.error().to_string()}
        });
        return result;
    }

    const auto& outcome = result.value();
    if (outcome.status == CompactionStatus::NotNeeded && trigger != CompactionTrigger::Manual) {
        return result;
    }

    emit("compaction.triggered", Json{
        {"trigger", trigger_name},
        {"threshold", outcome.threshold.to_json()},
        {"turns", turns.size()}
    });

    switch (outcome.status) {
        case CompactionStatus::Completed: {
            const auto& compacted = *outcome.result;
            apply(compacted, snapshot_size);

            uint64_t estimate = TokenEstimator::estimate(build_messages());
            tracker_.reset_after_compaction(estimate);

            emit("compaction.completed", Json{
                {"trigger", trigger_name},
                {"metrics", compacted.metrics.to_json()},
                {"anchor", compacted.anchor.to_json()},
                {"preserved", compacted.preserved.format_for_summary()},
                {"warnings", warnings_json(outcome)}
            });
            emit("context.update", Json{
                {"estimated_input", estimate},
                {"retained_turns", compacted.retained_turns.size()}
            });
            break;
        }
        case CompactionStatus::Failed:
            emit("compaction.failed", Json{
                {"trigger", trigger_name},
                {"warnings", warnings_json(outcome)}
            });
            break;
        case CompactionStatus::NotNeeded:
            emit("compaction.completed", Json{
                {"trigger", trigger_name},
                {"status", "not_needed"},
                {"warnings", warnings_json(outcome)}
            });
            break;
    }

    {
        std::lock_guard lock(stream_mutex_);
        last_compaction_ = outcome.to_json();
    }
    return result;
}

void Session::apply(const compaction::CompactionResult& result, size_t snapshot_size) {
    std::lock_guard lock(stream_mutex_);

    auto parts = compaction::partition_for_compaction(
        MessageStream(stream_.begin(), stream_.begin() + static_cast<std::ptrdiff_t>(snapshot_size)));

    MessageStream rebuilt;
    rebuilt.reserve(parts.reminders.size() + result.retained_turns.size() + stream_.size() - snapshot_size);
    for (auto& reminder : parts.reminders) {
        rebuilt.emplace_back(std::move(reminder));
    }
    for (const auto& turn : result.retained_turns) {
        rebuilt.emplace_back(turn);
    }
    for (size_t i = snapshot_size; i < stream_.size(); ++i) {
        rebuilt.push_back(std::move(stream_[i]));
    }
    stream_ = std::move(rebuilt);

    // The new summary already folds in the previous one
    summary_ = result.carry_forward();
}

std::vector<Message> Session::build_messages() const {
    std::lock_guard lock(stream_mutex_);
    return build_messages_locked();
}

std::vector<Message> Session::build_messages_locked() const {
    std::vector<Message> messages;
    size_t i = 0;

    for (; i < stream_.size(); ++i) {
        const auto* reminder = std::get_if<SystemReminder>(&stream_[i]);
        if (!reminder) break;
        messages.push_back(reminder->to_message());
    }

    if (summary_) {
        messages.push_back(Message::user(summary_->text));
    }

    for (; i < stream_.size(); ++i) {
        if (const auto* reminder = std::get_if<SystemReminder>(&stream_[i])) {
            messages.push_back(reminder->to_message());
        } else {
            auto rendered = compaction::turn_to_messages(std::get<ConversationTurn>(stream_[i]));
            messages.insert(messages.end(), rendered.begin(), rendered.end());
        }
    }
    return messages;
}

std::vector<ConversationTurn> Session::turns() const {
    std::lock_guard lock(stream_mutex_);
    return compaction::partition_for_compaction(stream_).compactable;
}

std::optional<std::string> Session::summary() const {
    std::lock_guard lock(stream_mutex_);
    if (!summary_) return std::nullopt;
    return summary_->text;
}

size_t Session::reminder_count(SystemReminderType type) const {
    std::lock_guard lock(stream_mutex_);
    return compaction::count_system_reminders_by_type(stream_, type);
}

void Session::set_event_callback(SessionEventCallback callback) {
    std::lock_guard lock(stream_mutex_);
    event_callback_ = std::move(callback);
}

void Session::emit(const std::string& event_type, const Json& data) {
    events_.capture(event_type, data);

    SessionEventCallback callback;
    {
        std::lock_guard lock(stream_mutex_);
        callback = event_callback_;
    }
    if (callback) {
        callback(event_type, data);
    }
}

Json Session::status() const {
    auto tokens = tracker_.snapshot();
    auto decision = compactor_.threshold().evaluate(tokens.total_input(), limits_);

    Json j{
        {"session_id", id_},
        {"provider", std::string(provider_to_string(provider_))},
        {"model", model_},
        {"context_window", limits_.context_window},
        {"max_output_tokens", limits_.max_output_tokens},
        {"tokens", tokens.to_json()},
        {"threshold", decision.to_json()},
        {"compacting", compacting_.load()},
        {"compaction_state", std::string(compaction::compaction_state_to_string(compactor_.state()))}
    };

    std::lock_guard lock(stream_mutex_);
    size_t turn_count = 0;
    for (const auto& entry : stream_) {
        if (std::holds_alternative<ConversationTurn>(entry)) ++turn_count;
    }
    j["turn_count"] = turn_count;
    j["reminder_count"] = stream_.size() - turn_count;
    j["has_summary"] = summary_.has_value();
    if (last_compaction_) {
        j["last_compaction"] = *last_compaction_;
    }
    return j;
}

}  // namespace agentctx::session
