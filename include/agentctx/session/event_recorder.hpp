#pragma once

#include "agentctx/core/result.hpp"
#include "agentctx/core/types.hpp"

#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>

namespace agentctx::session {

using namespace agentctx::core;

// Session-scoped diagnostic event log, one JSON object per line:
//   {"timestamp", "sequence", "eventType", "turnId", "data"}
//
// Owned by the session that records into it; there is no process-wide
// instance. Recording is best-effort and lossy on crash: a write failure is
// logged once, the recorder disables itself, and callers are never told.
class EventRecorder {
public:
    EventRecorder() = default;
    ~EventRecorder();

    EventRecorder(const EventRecorder&) = delete;
    EventRecorder& operator=(const EventRecorder&) = delete;

    // Creates dir if needed and opens session-<timestamp>.jsonl
    Result<fs::path, Error> start(const fs::path& dir);

    // Writes session.end and closes; returns the file written, if any
    std::optional<fs::path> stop();

    void capture(const std::string& event_type, Json data);

    void increment_turn();

    bool is_enabled() const;
    std::optional<fs::path> session_file() const;
    uint64_t event_count() const;

    // Replaces values of credential-bearing headers with "[REDACTED]"
    static Json redact_headers(const Json& headers);

private:
    mutable std::mutex mutex_;
    std::ofstream file_;
    std::optional<fs::path> path_;
    bool enabled_ = false;
    uint64_t sequence_ = 0;
    uint64_t turn_id_ = 0;
    uint64_t event_count_ = 0;

    void write_locked(const std::string& event_type, Json data);
    void disable_locked(const std::string& reason);
};

}  // namespace agentctx::session
