#include "agentctx/session/event_recorder.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace agentctx::session {

namespace {

constexpr std::array<std::string_view, 5> kSensitiveHeaders = {
    "authorization",
    "x-api-key",
    "anthropic-api-key",
    "openai-api-key",
    "api-key"
};

std::string format_utc(TimePoint tp, const char* pattern) {
    std::time_t t = Clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream ss;
    ss << std::put_time(&tm, pattern);
    return ss.str();
}

bool is_sensitive(const std::string& key) {
    std::string lower(key);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return std::find(kSensitiveHeaders.begin(), kSensitiveHeaders.end(), lower) != kSensitiveHeaders.end();
}

}  // namespace

EventRecorder::~EventRecorder() {
    stop();
}

Json EventRecorder::redact_headers(const Json& headers) {
    if (!headers.is_object()) return headers;

    Json redacted = Json::object();
    for (auto it = headers.begin(); it != headers.end(); ++it) {
        redacted[it.key()] = is_sensitive(it.key()) ? Json("[REDACTED]") : it.value();
    }
    return redacted;
}

Result<fs::path, Error> EventRecorder::start(const fs::path& dir) {
    std::lock_guard lock(mutex_);

    if (enabled_) {
        return Result<fs::path, Error>::ok(*path_);
    }

    try {
        fs::create_directories(dir);
        fs::path path = dir / ("session-" + format_utc(Clock::now(), "%Y-%m-%dT%H-%M-%S") + ".jsonl");

        file_.open(path, std::ios::out | std::ios::trunc);
        if (!file_) {
            return Result<fs::path, Error>::err(
                ErrorCode::FileWriteFailed,
                "Failed to open event log",
                path.string()
            );
        }

        path_ = path;
        enabled_ = true;
        sequence_ = 0;
        turn_id_ = 0;
        event_count_ = 0;

        write_locked("session.start", Json{{"file", path.filename().string()}});
        spdlog::info("Event capture started: {}", path.string());
        return Result<fs::path, Error>::ok(path);

    } catch (const std::exception& e) {
        return Result<fs::path, Error>::err(
            ErrorCode::DirectoryNotFound,
            e.what(),
            dir.string()
        );
    }
}

std::optional<fs::path> EventRecorder::stop() {
    std::lock_guard lock(mutex_);

    if (!enabled_) {
        return std::nullopt;
    }

    write_locked("session.end", Json{{"event_count", event_count_}, {"turns", turn_id_}});
    file_.close();
    enabled_ = false;
    return path_;
}

void EventRecorder::capture(const std::string& event_type, Json data) {
    std::lock_guard lock(mutex_);
    if (!enabled_) return;

    if (data.is_object() && data.contains("headers")) {
        data["headers"] = redact_headers(data["headers"]);
    }
    write_locked(event_type, std::move(data));
}

void EventRecorder::increment_turn() {
    std::lock_guard lock(mutex_);
    ++turn_id_;
}

bool EventRecorder::is_enabled() const {
    std::lock_guard lock(mutex_);
    return enabled_;
}

std::optional<fs::path> EventRecorder::session_file() const {
    std::lock_guard lock(mutex_);
    return path_;
}

uint64_t EventRecorder::event_count() const {
    std::lock_guard lock(mutex_);
    return event_count_;
}

void EventRecorder::write_locked(const std::string& event_type, Json data) {
    Json event{
        {"timestamp", format_utc(Clock::now(), "%Y-%m-%dT%H:%M:%SZ")},
        {"sequence", sequence_++},
        {"eventType", event_type},
        {"turnId", turn_id_},
        {"data", std::move(data)}
    };

    file_ << event.dump(-1, ' ', false, Json::error_handler_t::replace) << "\n";
    file_.flush();
    if (!file_) {
        disable_locked("write failed for " + event_type);
        return;
    }
    ++event_count_;
}

void EventRecorder::disable_locked(const std::string& reason) {
    spdlog::warn("Event capture disabled: {}", reason);
    file_.close();
    enabled_ = false;
}

}  // namespace agentctx::session
