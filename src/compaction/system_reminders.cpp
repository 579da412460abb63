#include "agentctx/compaction/system_reminders.hpp"

#include <array>
#include <map>

namespace agentctx::compaction {

namespace {

constexpr std::string_view kOpenTag = "<system-reminder>";
constexpr std::string_view kCloseTag = "</system-reminder>";
constexpr std::string_view kTypePrefix = "<!-- type:";
constexpr std::string_view kTypeSuffix = " -->";

constexpr std::array<SystemReminderType, 4> kAllTypes = {
    SystemReminderType::ClaudeMd,
    SystemReminderType::Environment,
    SystemReminderType::GitStatus,
    SystemReminderType::TokenStatus
};

std::string supersession_marker(SystemReminderType type) {
    return "This supersedes earlier " + std::string(reminder_type_to_string(type)) + " reminder";
}

}  // namespace

std::string_view reminder_type_to_string(SystemReminderType type) {
    switch (type) {
        case SystemReminderType::ClaudeMd: return "claudeMd";
        case SystemReminderType::Environment: return "environment";
        case SystemReminderType::GitStatus: return "gitStatus";
        case SystemReminderType::TokenStatus: return "tokenStatus";
    }
    return "unknown";
}

std::optional<SystemReminderType> reminder_type_from_string(std::string_view str) {
    for (auto type : kAllTypes) {
        if (reminder_type_to_string(type) == str) return type;
    }
    return std::nullopt;
}

std::string SystemReminder::render() const {
    std::string text;
    text += kOpenTag;
    text += "\n";
    text += kTypePrefix;
    text += reminder_type_to_string(type);
    text += kTypeSuffix;
    text += "\n";
    text += content;
    if (replaces_earlier) {
        text += "\n" + supersession_marker(type);
    }
    text += "\n";
    text += kCloseTag;
    return text;
}

Message SystemReminder::to_message() const {
    return Message::user(render());
}

std::optional<SystemReminder> parse_system_reminder(const Message& msg) {
    if (msg.role != Role::User) return std::nullopt;

    std::string_view text = msg.content;
    auto open = text.find(kOpenTag);
    auto marker = text.find(kTypePrefix);
    if (open == std::string_view::npos || marker == std::string_view::npos) {
        return std::nullopt;
    }

    auto type_start = marker + kTypePrefix.size();
    auto type_end = text.find(kTypeSuffix, type_start);
    if (type_end == std::string_view::npos) return std::nullopt;

    auto type = reminder_type_from_string(text.substr(type_start, type_end - type_start));
    if (!type) return std::nullopt;

    auto body_start = type_end + kTypeSuffix.size();
    if (body_start < text.size() && text[body_start] == '\n') ++body_start;
    auto close = text.rfind(kCloseTag);
    if (close == std::string_view::npos || close < body_start) close = text.size();

    std::string body(text.substr(body_start, close - body_start));
    if (!body.empty() && body.back() == '\n') body.pop_back();

    SystemReminder reminder;
    reminder.type = *type;

    std::string marker_line = "\n" + supersession_marker(*type);
    if (body.size() >= marker_line.size() &&
        body.compare(body.size() - marker_line.size(), marker_line.size(), marker_line) == 0) {
        body.resize(body.size() - marker_line.size());
        reminder.replaces_earlier = true;
    }
    reminder.content = std::move(body);
    return reminder;
}

void add_system_reminder(MessageStream& stream, SystemReminderType type, std::string content) {
    bool is_replacement = false;
    for (auto& entry : stream) {
        if (auto* reminder = std::get_if<SystemReminder>(&entry); reminder && reminder->type == type) {
            reminder->superseded = true;
            is_replacement = true;
        }
    }

    stream.emplace_back(SystemReminder{
        .type = type,
        .content = std::move(content),
        .replaces_earlier = is_replacement,
        .superseded = false
    });
}

size_t count_system_reminders_by_type(const MessageStream& stream, SystemReminderType type) {
    size_t count = 0;
    for (const auto& entry : stream) {
        if (const auto* reminder = std::get_if<SystemReminder>(&entry); reminder && reminder->type == type) {
            ++count;
        }
    }
    return count;
}

PartitionedStream partition_for_compaction(const MessageStream& stream) {
    PartitionedStream parts;
    std::map<SystemReminderType, const SystemReminder*> latest;

    for (const auto& entry : stream) {
        if (const auto* reminder = std::get_if<SystemReminder>(&entry)) {
            if (!reminder->superseded) {
                latest[reminder->type] = reminder;
            }
        } else {
            parts.compactable.push_back(std::get<ConversationTurn>(entry));
        }
    }

    for (const auto& [type, reminder] : latest) {
        parts.reminders.push_back(*reminder);
    }
    return parts;
}

}  // namespace agentctx::compaction
