#pragma once

#include "agentctx/compaction/turn.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace agentctx::compaction {

enum class SystemReminderType {
    ClaudeMd,
    Environment,
    GitStatus,
    TokenStatus
};

std::string_view reminder_type_to_string(SystemReminderType type);
std::optional<SystemReminderType> reminder_type_from_string(std::string_view str);

// Out-of-band instruction that survives every compaction.
//
// Wire form:
//   <system-reminder>
//   <!-- type:gitStatus -->
//   <content>
//   This supersedes earlier gitStatus reminder     (only when replaces_earlier)
//   </system-reminder>
//
// `superseded` is local bookkeeping and never changes the rendered text, so a
// reminder already sent keeps its bytes and the provider cache prefix holds.
struct SystemReminder {
    SystemReminderType type = SystemReminderType::Environment;
    std::string content;
    bool replaces_earlier = false;
    bool superseded = false;

    std::string render() const;

    // Rendered as a user message
    Message to_message() const;
};

// Recover a reminder from a provider message; nullopt for ordinary messages
std::optional<SystemReminder> parse_system_reminder(const Message& msg);

// The session's ordered history: reminders interleaved with turns
using StreamEntry = std::variant<SystemReminder, ConversationTurn>;
using MessageStream = std::vector<StreamEntry>;

// Append a reminder. Earlier reminders of the same type stay where they are
// and are only marked superseded.
void add_system_reminder(MessageStream& stream, SystemReminderType type, std::string content);

size_t count_system_reminders_by_type(const MessageStream& stream, SystemReminderType type);

struct PartitionedStream {
    std::vector<SystemReminder> reminders;        // latest live reminder per type, in type order
    std::vector<ConversationTurn> compactable;    // turns in stream order
};

// Reminders never reach turn selection; superseded ones are dropped here
PartitionedStream partition_for_compaction(const MessageStream& stream);

}  // namespace agentctx::compaction
