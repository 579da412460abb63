#include <catch2/catch.hpp>
#include "agentctx/session/event_recorder.hpp"

#include <fstream>
#include <string>
#include <vector>

using namespace agentctx::session;

namespace {

fs::path fresh_dir(const std::string& name) {
    auto dir = fs::temp_directory_path() / "agentctx_event_tests" / name;
    fs::remove_all(dir);
    return dir;
}

std::vector<Json> read_lines(const fs::path& path) {
    std::vector<Json> events;
    std::ifstream in(path);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty()) events.push_back(Json::parse(line));
    }
    return events;
}

}  // namespace

TEST_CASE("Recorder writes one JSON object per line", "[events]") {
    auto dir = fresh_dir("lines");

    EventRecorder recorder;
    auto started = recorder.start(dir);
    REQUIRE(started.is_ok());
    REQUIRE(recorder.is_enabled());
    REQUIRE(fs::exists(started.value()));
    REQUIRE(started.value().filename().string().rfind("session-", 0) == 0);
    REQUIRE(started.value().extension() == ".jsonl");

    recorder.capture("token.usage", Json{{"input_tokens", 10}});
    recorder.increment_turn();
    recorder.capture("compaction.triggered", Json{{"trigger", "post_turn"}});

    auto file = recorder.stop();
    REQUIRE(file.has_value());
    REQUIRE_FALSE(recorder.is_enabled());

    auto events = read_lines(*file);
    REQUIRE(events.size() == 4);

    REQUIRE(events[0]["eventType"] == "session.start");
    REQUIRE(events[1]["eventType"] == "token.usage");
    REQUIRE(events[1]["data"]["input_tokens"] == 10);
    REQUIRE(events[1]["turnId"] == 0);
    REQUIRE(events[2]["turnId"] == 1);
    REQUIRE(events[3]["eventType"] == "session.end");
    REQUIRE(events[3]["data"]["event_count"] == 3);

    for (size_t i = 0; i < events.size(); ++i) {
        REQUIRE(events[i]["sequence"] == i);
        REQUIRE(events[i]["timestamp"].get<std::string>().back() == 'Z');
    }
}

TEST_CASE("Credential headers are redacted before writing", "[events]") {
    auto dir = fresh_dir("redact");

    EventRecorder recorder;
    REQUIRE(recorder.start(dir).is_ok());
    recorder.capture("api.request", Json{
        {"url", "https://api.example.com/v1/messages"},
        {"headers", {
            {"Authorization", "Bearer secret"},
            {"x-api-key", "sk-123"},
            {"content-type", "application/json"}
        }}
    });
    auto file = recorder.stop();

    auto events = read_lines(*file);
    const auto& headers = events[1]["data"]["headers"];
    REQUIRE(headers["Authorization"] == "[REDACTED]");
    REQUIRE(headers["x-api-key"] == "[REDACTED]");
    REQUIRE(headers["content-type"] == "application/json");
    REQUIRE(events[1]["data"]["url"] == "https://api.example.com/v1/messages");
}

TEST_CASE("Header redaction leaves non-objects alone", "[events]") {
    REQUIRE(EventRecorder::redact_headers(Json("plain")) == Json("plain"));
    REQUIRE(EventRecorder::redact_headers(Json{{"API-Key", "x"}})["API-Key"] == "[REDACTED]");
}

TEST_CASE("Capture without start is a no-op", "[events]") {
    EventRecorder recorder;
    recorder.capture("token.usage", Json::object());

    REQUIRE_FALSE(recorder.is_enabled());
    REQUIRE(recorder.event_count() == 0);
    REQUIRE_FALSE(recorder.session_file().has_value());
    REQUIRE_FALSE(recorder.stop().has_value());
}

TEST_CASE("Starting twice keeps the same file", "[events]") {
    auto dir = fresh_dir("twice");

    EventRecorder recorder;
    auto first = recorder.start(dir).value();
    auto second = recorder.start(dir).value();

    REQUIRE(first == second);
    REQUIRE(recorder.event_count() == 1);
}

TEST_CASE("Unusable capture directory is reported", "[events]") {
    auto dir = fresh_dir("blocked");
    fs::create_directories(dir.parent_path());
    std::ofstream(dir) << "not a directory";

    EventRecorder recorder;
    auto result = recorder.start(dir / "nested");

    REQUIRE(result.is_err());
    REQUIRE_FALSE(recorder.is_enabled());
}
