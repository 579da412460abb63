#include <catch2/catch.hpp>
#include "agentctx/compaction/preservation.hpp"
#include "turn_fixtures.hpp"

using namespace agentctx::compaction;
using namespace agentctx::testing;

TEST_CASE("Goals come from objective-style user messages", "[preservation]") {
    REQUIRE(extract_goal("Fix the login bug. It crashes on submit.") == "Fix the login bug");
    REQUIRE(extract_goal("please implement retry logic") == "Implement retry logic");
    REQUIRE(extract_goal("Can you add a --verbose flag?") == "Add a --verbose flag");
    REQUIRE_FALSE(extract_goal("What does this function do?").has_value());
    REQUIRE_FALSE(extract_goal("fixture files look odd").has_value());
    REQUIRE_FALSE(extract_goal("").has_value());
}

TEST_CASE("Goal normalization ignores case, spacing and trailing punctuation", "[preservation]") {
    REQUIRE(normalize_goal("Fix  the Login bug!") == "fix the login bug");
    REQUIRE(normalize_goal("fix the login bug") == normalize_goal("FIX THE LOGIN BUG."));
}

TEST_CASE("Active files collect read, write and edit paths", "[preservation]") {
    std::vector<ConversationTurn> turns;
    turns.push_back(tool_turn(0, "Look around",
                              {file_call("r", "Read", "src/main.cpp"),
                               bash_call("b", "ls src")},
                              {ok_result("r", "..."), ok_result("b", "main.cpp")},
                              "Read it."));
    turns.push_back(tool_turn(1, "Change it",
                              {file_call("w", "Write", "src/util.cpp"),
                               file_call("e", "Edit", "src/main.cpp")},
                              {ok_result("w", "written"), ok_result("e", "edited")},
                              "Changed."));

    PreservationExtractor extractor;
    auto ctx = extractor.extract(turns);

    REQUIRE(ctx.active_files == std::set<std::string>{"src/main.cpp", "src/util.cpp"});
}

TEST_CASE("Goals are ordered, de-duplicated and capped to the most recent", "[preservation]") {
    std::vector<ConversationTurn> turns;
    turns.push_back(chat_turn(0, "Fix the parser", "ok"));
    turns.push_back(chat_turn(1, "fix the parser.", "ok"));
    turns.push_back(chat_turn(2, "Add tests for the lexer", "ok"));
    turns.push_back(chat_turn(3, "Refactor the CLI", "ok"));

    PreservationExtractor extractor(2);
    auto ctx = extractor.extract(turns);

    REQUIRE(ctx.goals == std::vector<std::string>{"Add tests for the lexer", "Refactor the CLI"});

    PreservationExtractor wide(5);
    auto all = wide.extract(turns);
    REQUIRE(all.goals == std::vector<std::string>{"Fix the parser", "Add tests for the lexer", "Refactor the CLI"});
}

TEST_CASE("Unresolved error becomes the error state", "[preservation]") {
    std::vector<ConversationTurn> turns;
    turns.push_back(tool_turn(0, "Run it",
                              {bash_call("a", "./run.sh --fast")},
                              {err_result("a", "segmentation fault (core dumped)\nmore output")},
                              "It crashed."));

    PreservationExtractor extractor;
    auto ctx = extractor.extract(turns);

    REQUIRE(ctx.error_state == "segmentation fault (core dumped)");
}

TEST_CASE("Error resolved by a later clean run is cleared", "[preservation]") {
    std::vector<ConversationTurn> turns;
    turns.push_back(tool_turn(0, "Run it",
                              {bash_call("a", "./run.sh --fast")},
                              {err_result("a", "segmentation fault")},
                              "It crashed."));
    turns.push_back(tool_turn(1, "Again",
                              {bash_call("b", "./run.sh --fast")},
                              {ok_result("b", "done")},
                              "It ran."));

    PreservationExtractor extractor;
    REQUIRE_FALSE(extractor.extract(turns).error_state.has_value());
}

TEST_CASE("Build status follows the most recent build or test result", "[preservation]") {
    std::vector<ConversationTurn> turns;
    turns.push_back(tool_turn(0, "Test",
                              {bash_call("a", "cargo test")},
                              {err_result("a", "test result: FAILED. 2 failed; 5 passed")},
                              "Failures."));

    PreservationExtractor extractor;
    REQUIRE(extractor.extract(turns).build_status == BuildStatus::Failing);

    turns.push_back(tool_turn(1, "Test again",
                              {bash_call("b", "cargo test")},
                              {ok_result("b", "test result: ok. 7 passed; 0 failed")},
                              "Green."));
    auto ctx = extractor.extract(turns);
    REQUIRE(ctx.build_status == BuildStatus::Passing);
    REQUIRE_FALSE(ctx.error_state.has_value());
}

TEST_CASE("Build status stays unset without build or test activity", "[preservation]") {
    PreservationExtractor extractor;
    auto ctx = extractor.extract(plain_history(4));

    REQUIRE_FALSE(ctx.build_status.has_value());
    REQUIRE(ctx.empty());
    REQUIRE(ctx.format_for_summary().empty());
}

TEST_CASE("Extraction honours the end bound", "[preservation]") {
    std::vector<ConversationTurn> turns;
    turns.push_back(tool_turn(0, "Read", {file_call("r", "Read", "a.txt")}, {ok_result("r", "x")}, "ok"));
    turns.push_back(tool_turn(1, "Read", {file_call("s", "Read", "b.txt")}, {ok_result("s", "y")}, "ok"));

    PreservationExtractor extractor;
    REQUIRE(extractor.extract(turns, 1).active_files == std::set<std::string>{"a.txt"});
}

TEST_CASE("Summary formatting omits empty lines", "[preservation]") {
    PreservationContext ctx;
    ctx.active_files = {"b.rs", "a.rs"};
    ctx.goals = {"Fix the parser", "Add tests"};
    ctx.build_status = BuildStatus::Passing;

    REQUIRE(ctx.format_for_summary() ==
            "Active files: a.rs, b.rs\n"
            "Goals: Fix the parser; Add tests\n"
            "Build: passing");

    ctx.error_state = "linker error";
    ctx.active_files.clear();
    REQUIRE(ctx.format_for_summary() ==
            "Goals: Fix the parser; Add tests\n"
            "Last error: linker error\n"
            "Build: passing");
}

TEST_CASE("Merging keeps earlier facts under newer ones", "[preservation]") {
    PreservationExtractor extractor(2);

    PreservationContext earlier;
    earlier.active_files = {"src/a.cpp"};
    earlier.goals = {"Fix the login bug", "Add a cache"};
    earlier.error_state = "link error";
    earlier.build_status = BuildStatus::Failing;

    PreservationContext quiet;
    quiet.goals = {"fix the login bug"};

    auto merged = extractor.merge(earlier, quiet);
    REQUIRE(merged.active_files == std::set<std::string>{"src/a.cpp"});
    REQUIRE(merged.goals == std::vector<std::string>{"Add a cache", "fix the login bug"});
    REQUIRE(merged.error_state == "link error");
    REQUIRE(merged.build_status == BuildStatus::Failing);

    PreservationContext fixed;
    fixed.active_files = {"src/b.cpp"};
    fixed.goals = {"Write docs"};
    fixed.build_status = BuildStatus::Passing;

    merged = extractor.merge(earlier, fixed);
    REQUIRE(merged.active_files == std::set<std::string>{"src/a.cpp", "src/b.cpp"});
    REQUIRE(merged.goals == std::vector<std::string>{"Add a cache", "Write docs"});
    REQUIRE_FALSE(merged.error_state.has_value());
    REQUIRE(merged.build_status == BuildStatus::Passing);

    PreservationContext broken;
    broken.error_state = "segfault";
    REQUIRE(extractor.merge(earlier, broken).error_state == "segfault");
}
