#include <catch2/catch.hpp>
#include "agentctx/compaction/anchor_detector.hpp"
#include "turn_fixtures.hpp"

using namespace agentctx::compaction;
using namespace agentctx::testing;

TEST_CASE("Success signals require a test or build context", "[anchor]") {
    REQUIRE(signals_success("test result: ok. 12 passed; 0 failed"));
    REQUIRE(signals_success("Build succeeded in 3.2s"));
    REQUIRE(signals_success("Compiled successfully"));
    REQUIRE_FALSE(signals_success("ok"));
    REQUIRE_FALSE(signals_success("3 tests failed"));
    REQUIRE_FALSE(signals_success("error: build failed"));
}

TEST_CASE("Failure signals", "[anchor]") {
    REQUIRE(signals_failure("error[E0308]: mismatched types"));
    REQUIRE(signals_failure("2 failed, 10 passed"));
    REQUIRE_FALSE(signals_failure("10 passed, 0 failed"));
}

TEST_CASE("Milestone commands", "[anchor]") {
    REQUIRE(is_milestone_command("cargo test --all"));
    REQUIRE(is_milestone_command("cd web && npm install"));
    REQUIRE(is_milestone_command("cmake --build build -j8"));
    REQUIRE(is_milestone_command("python -m pytest tests/"));
    REQUIRE_FALSE(is_milestone_command("ls -la"));
    REQUIRE_FALSE(is_milestone_command("git status"));
}

TEST_CASE("Passing test result is a TaskCompletion anchor", "[anchor]") {
    std::vector<ConversationTurn> turns = plain_history(3);
    turns.push_back(tool_turn(3, "Run the tests",
                              {bash_call("t1", "cargo test")},
                              {ok_result("t1", "test result: ok. 8 passed; 0 failed")},
                              "All tests pass."));
    turns.push_back(chat_turn(4, "Thanks", "You're welcome."));

    AnchorDetector detector;
    auto anchor = detector.detect(turns);

    REQUIRE(anchor.anchor_type == AnchorType::TaskCompletion);
    REQUIRE(anchor.turn_index == 3);
    REQUIRE(anchor.weight == 0.8);
    REQUIRE_FALSE(anchor.is_synthetic());
}

TEST_CASE("Error followed by a clean turn on the same file is ErrorResolution", "[anchor]") {
    std::vector<ConversationTurn> turns = plain_history(2);
    turns.push_back(tool_turn(2, "Update the parser",
                              {file_call("e1", "Edit", "src/parser.cpp")},
                              {err_result("e1", "old_string not found in file")},
                              "The edit failed."));
    turns.push_back(tool_turn(3, "Try again",
                              {file_call("e2", "Edit", "src/parser.cpp")},
                              {ok_result("e2", "Edited src/parser.cpp")},
                              "Edit applied."));

    AnchorDetector detector;
    auto anchor = detector.detect(turns);

    REQUIRE(anchor.anchor_type == AnchorType::ErrorResolution);
    REQUIRE(anchor.turn_index == 3);
    REQUIRE(anchor.weight == 0.9);
}

TEST_CASE("Clean turn on unrelated files does not resolve an error", "[anchor]") {
    std::vector<ConversationTurn> turns;
    turns.push_back(tool_turn(0, "Update the parser",
                              {file_call("e1", "Edit", "src/parser.cpp")},
                              {err_result("e1", "permission denied")},
                              "The edit failed."));
    turns.push_back(tool_turn(1, "Look at the lexer",
                              {file_call("r1", "Read", "src/lexer.cpp")},
                              {ok_result("r1", "int main() {}")},
                              "Here is the lexer."));

    AnchorDetector detector;
    REQUIRE_FALSE(detector.classify(turns, 1).has_value());
}

TEST_CASE("Install command is a BashMilestone", "[anchor]") {
    std::vector<ConversationTurn> turns;
    turns.push_back(tool_turn(0, "Set up deps",
                              {bash_call("b1", "npm install")},
                              {ok_result("b1", "added 312 packages in 4s")},
                              "Dependencies installed."));

    AnchorDetector detector;
    auto anchor = detector.detect(turns);

    REQUIRE(anchor.anchor_type == AnchorType::BashMilestone);
    REQUIRE(anchor.description == "Bash milestone: npm install");
}

TEST_CASE("Failed milestone command is not an anchor", "[anchor]") {
    std::vector<ConversationTurn> turns;
    turns.push_back(tool_turn(0, "Install",
                              {bash_call("b1", "npm install")},
                              {err_result("b1", "npm ERR! network timeout")},
                              "Install failed."));

    AnchorDetector detector;
    REQUIRE_FALSE(detector.find_natural(turns).has_value());
}

TEST_CASE("Web search is a WebSearchMilestone", "[anchor]") {
    std::vector<ConversationTurn> turns;
    turns.push_back(tool_turn(0, "Look it up",
                              {search_call("w1", "tokio select macro")},
                              {ok_result("w1", "results...")},
                              "Found docs."));

    AnchorDetector detector;
    auto anchor = detector.detect(turns);

    REQUIRE(anchor.anchor_type == AnchorType::WebSearchMilestone);
    REQUIRE(anchor.description == "Web search: tokio select macro");
}

TEST_CASE("Most recent qualifying turn wins", "[anchor]") {
    std::vector<ConversationTurn> turns;
    turns.push_back(tool_turn(0, "Run tests",
                              {bash_call("a", "cargo test")},
                              {ok_result("a", "test result: ok. 3 passed")},
                              "Pass."));
    turns.push_back(chat_turn(1, "Next", "Okay."));
    turns.push_back(tool_turn(2, "Search",
                              {search_call("b", "serde rename")},
                              {ok_result("b", "docs")},
                              "Found."));
    turns.push_back(chat_turn(3, "Hmm", "Sure."));

    AnchorDetector detector;
    auto anchor = detector.detect(turns);

    REQUIRE(anchor.turn_index == 2);
    REQUIRE(anchor.anchor_type == AnchorType::WebSearchMilestone);
}

TEST_CASE("TaskCompletion outranks BashMilestone within one turn", "[anchor]") {
    std::vector<ConversationTurn> turns;
    turns.push_back(tool_turn(0, "Build it",
                              {bash_call("a", "cargo build")},
                              {ok_result("a", "Finished dev build successfully")},
                              "Built."));

    AnchorDetector detector;
    REQUIRE(detector.detect(turns).anchor_type == AnchorType::TaskCompletion);
}

TEST_CASE("No natural anchor falls back to a synthetic checkpoint", "[anchor]") {
    auto turns = plain_history(5);

    AnchorDetector detector(3);
    REQUIRE_FALSE(detector.find_natural(turns).has_value());

    auto anchor = detector.detect(turns);
    REQUIRE(anchor.is_synthetic());
    REQUIRE(anchor.turn_index == 2);
    REQUIRE(anchor.confidence == 1.0);
    REQUIRE(anchor.weight == 0.7);
}

TEST_CASE("Synthetic anchor on a short history starts at the first turn", "[anchor]") {
    auto turns = plain_history(2);

    AnchorDetector detector(3);
    REQUIRE(detector.detect(turns).turn_index == 0);
}

TEST_CASE("Anchor detection is idempotent", "[anchor]") {
    auto turns = plain_history(4);
    turns.push_back(tool_turn(4, "Search",
                              {search_call("s", "x")},
                              {ok_result("s", "y")},
                              "Done."));

    AnchorDetector detector;
    auto first = detector.detect(turns);
    auto second = detector.detect(turns);

    REQUIRE(first == second);
    REQUIRE(first.description == second.description);
}

TEST_CASE("Command keys ignore flags, chains and pipe consumers", "[anchor]") {
    REQUIRE(command_key("cargo build --release") == "cargo build");
    REQUIRE(command_key("cd app && npm test") == "npm test");
    REQUIRE(command_key("npm test | tee build.log") == "npm test");
    REQUIRE(command_key("make || echo failed") == "echo failed");
    REQUIRE(command_key("cd web; pytest -x | grep FAIL") == "pytest");
    REQUIRE(command_key("   ").empty());
}

TEST_CASE("Rerun of a piped command resolves its error", "[anchor]") {
    std::vector<ConversationTurn> turns;
    turns.push_back(tool_turn(0, "Run the suite",
                              {bash_call("a", "npm test | tee build.log")},
                              {err_result("a", "1 failing")},
                              "One test fails."));
    turns.push_back(tool_turn(1, "Run it again",
                              {bash_call("b", "npm test")},
                              {ok_result("b", "all green")},
                              "Fixed."));

    AnchorDetector detector;
    auto anchor = detector.classify(turns, 1);
    REQUIRE(anchor.has_value());
    REQUIRE(anchor->anchor_type == AnchorType::ErrorResolution);

    // Different producers on the same log file are not a resolution
    turns[1] = tool_turn(1, "Show the log",
                         {bash_call("b", "cat build.log | tee build.log")},
                         {ok_result("b", "1 failing")},
                         "Here it is.");
    REQUIRE_FALSE(detector.classify(turns, 1).has_value());
}

TEST_CASE("Success text outside a shell result is not a TaskCompletion", "[anchor]") {
    std::vector<ConversationTurn> turns;
    turns.push_back(tool_turn(0, "Read the readme",
                              {file_call("r", "Read", "README.md")},
                              {ok_result("r", "Run cargo test; expect test result: ok. 12 passed")},
                              "It explains the test setup."));

    AnchorDetector detector;
    REQUIRE_FALSE(detector.classify(turns, 0).has_value());
    REQUIRE(detector.detect(turns).is_synthetic());
}
