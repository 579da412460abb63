#include <catch2/catch.hpp>
#include "agentctx/session/session.hpp"
#include "turn_fixtures.hpp"

#include <fstream>

using namespace agentctx::session;
using namespace agentctx::testing;

namespace {

// 20000 window, 2000 output, no buffer, trigger at 9000
Config small_model_config() {
    Config config;
    config.compaction.autocompact_buffer = 0;
    config.compaction.threshold_ratio = 0.5;
    config.models.entries.push_back({"anthropic", "tiny", 20000, 2000});
    return config;
}

void append_plain_turns(Session& session, size_t count) {
    for (size_t i = 0; i < count; ++i) {
        auto turn = session.create_turn("Tell me about step " + std::to_string(i), {}, {},
                                        "Step " + std::to_string(i) + " explained.");
        REQUIRE(session.append_turn(std::move(turn)).is_ok());
    }
}

TokenUsage usage_of(uint64_t input, uint64_t cache_read, uint64_t output) {
    TokenUsage usage;
    usage.input_tokens = input;
    usage.cache_read_input_tokens = cache_read;
    usage.output_tokens = output;
    return usage;
}

}  // namespace

TEST_CASE("Session resolves model limits from the registry", "[session]") {
    Session tiny("s1", small_model_config(), ProviderKind::Anthropic, "tiny");
    REQUIRE(tiny.limits().context_window == 20000);
    REQUIRE(tiny.limits().max_output_tokens == 2000);

    Session other("s2", small_model_config(), ProviderKind::OpenAI, "tiny");
    REQUIRE(other.limits().context_window == 200000);
}

TEST_CASE("Appended turns are validated", "[session]") {
    Session session("s", Config{}, ProviderKind::Anthropic, "model");
    append_plain_turns(session, 2);
    REQUIRE(session.turns().size() == 2);
    REQUIRE(session.turns()[1].index == 1);

    auto orphan = tool_turn(5, "Run", {}, {ok_result("ghost", "ok")}, "Done");
    auto rejected = session.append_turn(orphan);
    REQUIRE(rejected.is_err());
    REQUIRE(rejected.error().code == ErrorCode::InvalidToolResult);

    auto stale = session.append_turn(chat_turn(1, "again", "no"));
    REQUIRE(stale.is_err());
    REQUIRE(stale.error().code == ErrorCode::InvalidTurnSequence);

    REQUIRE(session.append_turn(chat_turn(10, "jump", "fine")).is_ok());
    REQUIRE(session.create_turn("next", {}, {}, "ok").index == 11);
}

TEST_CASE("Final usage replaces input and accumulates output", "[session]") {
    Session session("s", Config{}, ProviderKind::Anthropic, "model");

    session.record_usage(usage_of(1000, 5000, 200), true);
    session.record_usage(usage_of(1500, 5000, 300), true);

    auto tokens = session.tokens();
    REQUIRE(tokens.input_tokens == 6500);
    REQUIRE(tokens.output_tokens == 500);
    REQUIRE(tokens.cumulative_billed_input == 2500);
    REQUIRE(tokens.cumulative_billed_output == 500);
}

TEST_CASE("Intermediate usage only moves the display fields", "[session]") {
    Session session("s", Config{}, ProviderKind::Anthropic, "model");
    session.record_usage(usage_of(1000, 0, 100), true);

    TokenUsage partial;
    partial.input_tokens = 4000;
    partial.output_tokens = 50;
    session.record_usage(partial, false);

    auto tokens = session.tokens();
    REQUIRE(tokens.input_tokens == 4000);
    REQUIRE(tokens.output_tokens == 100);
    REQUIRE(tokens.cumulative_billed_input == 1000);
    REQUIRE(tokens.cumulative_billed_output == 100);
}

TEST_CASE("Raw provider usage is normalized first", "[session]") {
    Session session("s", Config{}, ProviderKind::OpenAI, "gpt-4o");

    auto ok = session.record_usage(Json{
        {"prompt_tokens", 9000},
        {"completion_tokens", 100},
        {"prompt_tokens_details", {{"cached_tokens", 6000}}}
    }, true);
    REQUIRE(ok.is_ok());
    REQUIRE(session.tokens().input_tokens == 9000);
    REQUIRE(session.tokens().cumulative_billed_input == 3000);

    auto bad = session.record_usage(Json("oops"), true);
    REQUIRE(bad.is_err());
    REQUIRE(session.tokens().input_tokens == 9000);
}

TEST_CASE("Compaction after a turn runs only past the trigger", "[session]") {
    Session session("s", small_model_config(), ProviderKind::Anthropic, "tiny");
    append_plain_turns(session, 6);

    session.record_usage(usage_of(8000, 0, 100), true);
    auto idle = session.compact_if_needed();
    REQUIRE(idle.is_ok());
    REQUIRE(idle.value().status == CompactionStatus::NotNeeded);
    REQUIRE(session.turns().size() == 6);
    REQUIRE_FALSE(session.summary().has_value());

    session.record_usage(usage_of(9500, 0, 100), true);
    auto compacted = session.compact_if_needed();
    REQUIRE(compacted.is_ok());
    REQUIRE(compacted.value().completed());

    auto turns = session.turns();
    REQUIRE(turns.size() == 3);
    REQUIRE(turns.front().index == 3);
    REQUIRE(turns.back().index == 5);
    REQUIRE(session.summary().has_value());
    REQUIRE_FALSE(session.is_compacting());
}

TEST_CASE("Tracker is re-estimated after compaction and billing is kept", "[session]") {
    Session session("s", small_model_config(), ProviderKind::Anthropic, "tiny");
    append_plain_turns(session, 6);
    session.record_usage(usage_of(9500, 200, 700), true);

    REQUIRE(session.compact_if_needed().value().completed());

    auto tokens = session.tokens();
    REQUIRE(tokens.input_tokens == TokenEstimator::estimate(session.build_messages()));
    REQUIRE(tokens.cumulative_billed_input == 9500);
    REQUIRE(tokens.cumulative_billed_output == 700);
    REQUIRE(tokens.output_tokens == 700);
    REQUIRE_FALSE(tokens.cache_read_input_tokens.has_value());
}

TEST_CASE("Messages are reminders, then summary, then the tail", "[session]") {
    Session session("s", Config{}, ProviderKind::Anthropic, "model");
    session.add_reminder(SystemReminderType::TokenStatus, "10%");
    append_plain_turns(session, 2);
    session.add_reminder(SystemReminderType::GitStatus, "clean");
    session.add_reminder(SystemReminderType::TokenStatus, "30%");
    append_plain_turns(session, 4);

    REQUIRE(session.force_compact().value().completed());

    auto messages = session.build_messages();
    REQUIRE(messages.size() == 2 + 1 + 3 * 2);

    auto git = parse_system_reminder(messages[0]);
    REQUIRE(git.has_value());
    REQUIRE(git->type == SystemReminderType::GitStatus);

    auto token = parse_system_reminder(messages[1]);
    REQUIRE(token.has_value());
    REQUIRE(token->content == "30%");

    REQUIRE(messages[2].role == Role::User);
    REQUIRE(messages[2].content.rfind("Summary of 3 prior turns:", 0) == 0);

    REQUIRE(messages[3].content == "Tell me about step 1");
    REQUIRE(messages[4].role == Role::Assistant);

    REQUIRE(session.reminder_count(SystemReminderType::TokenStatus) == 1);
}

TEST_CASE("Repeated compactions keep one summary of bounded size", "[session]") {
    Session session("s", small_model_config(), ProviderKind::Anthropic, "tiny");
    REQUIRE(session.append_turn(session.create_turn("Fix the login bug", {}, {}, "Looking.")).is_ok());
    append_plain_turns(session, 6);
    REQUIRE(session.force_compact().value().completed());

    append_plain_turns(session, 6);
    REQUIRE(session.force_compact().value().completed());
    const size_t settled_size = session.summary()->size();

    for (int round = 0; round < 40; ++round) {
        append_plain_turns(session, 6);
        auto outcome = session.force_compact();
        REQUIRE(outcome.is_ok());
        REQUIRE(outcome.value().completed());
        REQUIRE_FALSE(outcome.value().has_warning(ErrorCode::CompactionFailed));

        auto summary = session.summary().value();
        REQUIRE(summary.rfind("Summary of ", 0) == 0);
        REQUIRE(summary.find("Summary of ", 1) == std::string::npos);
        REQUIRE(summary.size() <= settled_size + 8);
        REQUIRE(session.tokens().input_tokens < 9000);
    }

    auto summary = session.summary().value();
    REQUIRE(summary.rfind("Summary of 250 prior turns:", 0) == 0);
    REQUIRE(summary.find("Fix the login bug") != std::string::npos);
    REQUIRE(session.turns().size() == 3);
}

TEST_CASE("Earlier summary is counted in the compaction metrics", "[session]") {
    Session session("s", Config{}, ProviderKind::Anthropic, "model");
    append_plain_turns(session, 6);
    REQUIRE(session.force_compact().value().completed());
    auto first_summary = session.summary().value();

    append_plain_turns(session, 6);
    auto turns = session.turns();
    auto outcome = session.force_compact().value();
    REQUIRE(outcome.completed());

    const auto& metrics = outcome.result->metrics;
    REQUIRE(metrics.tokens_before ==
            TokenEstimator::estimate(turns) + TokenEstimator::estimate(first_summary));
    REQUIRE(metrics.turns_summarized == 6);
}

TEST_CASE("A compaction started during another one is refused", "[session]") {
    Session session("s", Config{}, ProviderKind::Anthropic, "model");
    append_plain_turns(session, 6);

    bool attempted = false;
    ErrorCode nested_code = ErrorCode::Ok;
    size_t turns_during_run = 0;
    bool busy_during_run = false;

    session.set_event_callback([&](std::string_view event_type, const Json&) {
        if (event_type != "compaction.triggered" || attempted) return;
        attempted = true;
        busy_during_run = session.is_compacting();

        auto nested = session.force_compact();
        REQUIRE(nested.is_err());
        nested_code = nested.error().code;
        turns_during_run = session.turns().size();
    });

    auto outcome = session.force_compact();

    REQUIRE(attempted);
    REQUIRE(busy_during_run);
    REQUIRE(nested_code == ErrorCode::CompactionInProgress);
    REQUIRE(turns_during_run == 6);

    REQUIRE(outcome.is_ok());
    REQUIRE(outcome.value().completed());
    REQUIRE(session.turns().size() == 3);
    REQUIRE_FALSE(session.is_compacting());
    REQUIRE(session.summary()->rfind("Summary of 3 prior turns:", 0) == 0);
}

TEST_CASE("Resumed session compacts before its first request", "[session]") {
    Session session("s", small_model_config(), ProviderKind::Anthropic, "tiny");
    append_plain_turns(session, 6);
    session.record_usage(usage_of(8950, 0, 0), true);

    REQUIRE(session.compact_if_needed().value().status == CompactionStatus::NotNeeded);

    auto outcome = session.check_before_first_request(std::string(350, 'p'));
    REQUIRE(outcome.is_ok());
    REQUIRE(outcome.value().threshold.current_tokens == 9050);
    REQUIRE(outcome.value().completed());
}

TEST_CASE("Manual compaction of a short history reports why nothing changed", "[session]") {
    Session session("s", Config{}, ProviderKind::Anthropic, "model");
    append_plain_turns(session, 2);

    auto outcome = session.force_compact();
    REQUIRE(outcome.is_ok());
    REQUIRE(outcome.value().status == CompactionStatus::NotNeeded);
    REQUIRE(outcome.value().has_warning(ErrorCode::InsufficientData));
    REQUIRE(session.status()["last_compaction"]["status"] == "not_needed");
}

TEST_CASE("Status reports limits, tokens and compaction state", "[session]") {
    Session session("abc", small_model_config(), ProviderKind::Anthropic, "tiny");
    session.add_reminder(SystemReminderType::Environment, "cwd: /repo");
    append_plain_turns(session, 4);
    session.record_usage(usage_of(500, 0, 20), true);

    auto status = session.status();
    REQUIRE(status["session_id"] == "abc");
    REQUIRE(status["provider"] == "anthropic");
    REQUIRE(status["model"] == "tiny");
    REQUIRE(status["context_window"] == 20000);
    REQUIRE(status["tokens"]["input_tokens"] == 500);
    REQUIRE(status["threshold"]["trigger"] == 9000);
    REQUIRE(status["turn_count"] == 4);
    REQUIRE(status["reminder_count"] == 1);
    REQUIRE(status["has_summary"] == false);
    REQUIRE(status["compacting"] == false);
    REQUIRE_FALSE(status.contains("last_compaction"));
}

TEST_CASE("Compaction events are captured when enabled", "[session]") {
    auto dir = fs::temp_directory_path() / "agentctx_session_events";
    fs::remove_all(dir);

    Config config;
    config.observability.capture_enabled = true;
    config.observability.capture_dir = dir;

    fs::path file;
    {
        Session session("s", config, ProviderKind::Anthropic, "model");
        REQUIRE(session.events().is_enabled());
        file = session.events().session_file().value();

        append_plain_turns(session, 6);
        REQUIRE(session.force_compact().value().completed());
    }

    std::vector<std::string> types;
    std::ifstream in(file);
    std::string line;
    while (std::getline(in, line)) {
        types.push_back(Json::parse(line)["eventType"].get<std::string>());
    }

    REQUIRE(types == std::vector<std::string>{
        "session.start",
        "session.config",
        "compaction.triggered",
        "compaction.completed",
        "context.update",
        "session.end"
    });
}
