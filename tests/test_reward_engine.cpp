#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "grading/RewardEngine.hpp"
#include "support/SessionFixtures.hpp"

namespace evalbox {
namespace {

using json = nlohmann::json;
using testing_support::ScriptedState;
using testing_support::scripted_session;

const char* const SUMMARY_ALL_PASS =
    "============================= test session starts ==============================\n"
    "=========================== short test summary info ============================\n"
    "PASSED r2e_tests/test_1.py::TestTokenizer::test_last\n"
    "PASSED r2e_tests/test_1.py::TestTokenizer::test_first\n";

// ========== pure scoring ==========

TEST(RewardScoringTest, ExpectedOutputRequiresExactAgreement) {
    TestStatusMap parsed = {{"a", "PASSED"}, {"b", "FAILED"}};
    EXPECT_EQ(RewardEngine::score_expected_output(parsed, {{"a", "PASSED"}, {"b", "FAILED"}}), 1.0);
    EXPECT_EQ(RewardEngine::score_expected_output(parsed, {{"a", "PASSED"}, {"b", "PASSED"}}), 0.0);
    EXPECT_EQ(RewardEngine::score_expected_output(parsed, {{"a", "PASSED"}, {"c", "FAILED"}}), 0.0);
}

TEST(RewardScoringTest, SizeMismatchScoresZero) {
    EXPECT_EQ(RewardEngine::score_expected_output({{"a", "PASSED"}}, {{"a", "PASSED"}, {"b", "PASSED"}}), 0.0);
    EXPECT_EQ(RewardEngine::score_expected_output({{"a", "PASSED"}, {"b", "PASSED"}}, {{"a", "PASSED"}}), 0.0);
}

TEST(RewardScoringTest, KeysAreTruncatedAtDash) {
    TestStatusMap parsed = {{"TestA.test_x - AssertionError", "FAILED"}};
    TestStatusMap expected = {{"TestA.test_x", "FAILED"}};
    EXPECT_EQ(RewardEngine::score_expected_output(parsed, expected), 1.0);
}

TEST(RewardScoringTest, SmithRequiresEveryIdPassed) {
    TestStatusMap parsed = {{"TestLib.test_fixed", "PASSED"}, {"test_kept", "PASSED"}};
    EXPECT_EQ(RewardEngine::score_smith(parsed, {"tests/a.py::TestLib::test_fixed"}, {"tests/a.py::test_kept"}), 1.0);

    parsed["test_kept"] = "FAILED";
    EXPECT_EQ(RewardEngine::score_smith(parsed, {"tests/a.py::TestLib::test_fixed"}, {"tests/a.py::test_kept"}), 0.0);
}

TEST(RewardScoringTest, SmithSubstringFallback) {
    EXPECT_EQ(RewardEngine::score_smith({{"mod.t1", "FAILED"}}, {"t1"}, {}), 0.0);
    EXPECT_EQ(RewardEngine::score_smith({{"mod.t1", "PASSED"}}, {"t1"}, {}), 1.0);
    EXPECT_EQ(RewardEngine::score_smith({{"mod.t1", "PASSED"}}, {"t2"}, {}), 0.0);
    EXPECT_EQ(RewardEngine::score_smith({}, {}, {}), 0.0);
}

TEST(RewardScoringTest, SmithTestFilesAndResetCommand) {
    auto files = RewardEngine::smith_test_files(
        {"tests/test_a.py::T::x", "tests/b_test.py::y", "tests/test_a.py::T::z"},
        {"tests/helpers.py::check", "src/test_data.json::k"});
    EXPECT_EQ(files, (std::vector<std::string>{"tests/b_test.py", "tests/test_a.py"}));

    std::string cmd = RewardEngine::reset_tests_command(files, "deadbeef");
    EXPECT_NE(cmd.find("'tests/b_test.py' 'tests/test_a.py'"), std::string::npos);
    EXPECT_NE(cmd.find("git checkout deadbeef -- \"{}\""), std::string::npos);
}

// ========== strategies through a session ==========

TEST(RewardEngineTest, DefaultModeMatchesExpectedOutputFromRow) {
    auto state = std::make_shared<ScriptedState>();
    state->on("run_tests.sh", SUMMARY_ALL_PASS);
    json row = testing_support::default_row();
    row["expected_output_json"] = json{{"TestTokenizer.test_last", "PASSED"}, {"TestTokenizer.test_first", "PASSED"}}.dump();

    auto session = scripted_session(row, state);
    auto outcome = session->calculate_reward_with_output();
    EXPECT_EQ(outcome.reward, 1.0);
    EXPECT_NE(outcome.output.find("short test summary info"), std::string::npos);
    EXPECT_FALSE(state->ran("cat "));
}

TEST(RewardEngineTest, DefaultModeReadsExpectedFileWhenRowHasNone) {
    auto state = std::make_shared<ScriptedState>();
    state->on("run_tests.sh", SUMMARY_ALL_PASS);
    state->on("cat /root/expected_test_output.json",
              R"({"TestTokenizer.test_last": "PASSED", "TestTokenizer.test_first": "FAILED"})");

    auto session = scripted_session(testing_support::default_row(), state);
    EXPECT_EQ(session->calculate_reward(), 0.0);
    EXPECT_TRUE(state->ran("cat /root/expected_test_output.json"));
}

TEST(RewardEngineTest, DefaultModeUnparsableExpectationScoresZero) {
    auto state = std::make_shared<ScriptedState>();
    state->on("run_tests.sh", SUMMARY_ALL_PASS);
    state->on("cat ", "cat: expected_test_output.json: No such file or directory", "Error: Exit code 1");

    auto session = scripted_session(testing_support::default_row(), state);
    EXPECT_EQ(session->calculate_reward(), 0.0);
}

TEST(RewardEngineTest, VerifiedModeNeedsFullResolution) {
    auto state = std::make_shared<ScriptedState>();
    state->on("/run_tests.sh",
              "+ pytest -rA tests/test_lib.py\n"
              "tests/test_lib.py::test_fixed PASSED\n"
              "tests/test_lib.py::test_kept PASSED\n");
    auto session = scripted_session(testing_support::verified_row(), state);
    EXPECT_EQ(session->calculate_reward(), 1.0);

    auto failing = std::make_shared<ScriptedState>();
    failing->on("/run_tests.sh",
                "+ pytest -rA tests/test_lib.py\n"
                "tests/test_lib.py::test_fixed FAILED\n"
                "tests/test_lib.py::test_kept PASSED\n");
    auto second = scripted_session(testing_support::verified_row(), failing);
    EXPECT_EQ(second->calculate_reward(), 0.0);
}

TEST(RewardEngineTest, VerifiedModeFailureMarkerScoresZero) {
    auto state = std::make_shared<ScriptedState>();
    state->on("/run_tests.sh", std::string(">>>>> Patch Apply Failed\n") +
                               "tests/test_lib.py::test_fixed PASSED\ntests/test_lib.py::test_kept PASSED\n");
    auto session = scripted_session(testing_support::verified_row(), state);
    EXPECT_EQ(session->calculate_reward(), 0.0);
}

TEST(RewardEngineTest, SmithModeResetsTestFilesBeforeRunning) {
    auto state = std::make_shared<ScriptedState>();
    state->on("/run_tests.sh",
              "tests/test_lib.py::TestLib::test_fixed PASSED [ 50%]\n"
              "tests/test_lib.py::test_kept PASSED [ 75%]\n"
              "tests/helpers.py::check PASSED [100%]\n");
    auto session = scripted_session(testing_support::smith_row(), state);

    EXPECT_EQ(session->calculate_reward(), 1.0);
    int reset = state->index_of("git checkout deadbeef --");
    int tests = state->index_of("/run_tests.sh");
    ASSERT_GE(reset, 0);
    EXPECT_LT(reset, tests);
    EXPECT_EQ(state->commands[reset].find("helpers.py"), std::string::npos);
}

TEST(RewardEngineTest, SmithModeSingleFailureScoresZero) {
    auto state = std::make_shared<ScriptedState>();
    state->on("/run_tests.sh",
              "tests/test_lib.py::TestLib::test_fixed PASSED\n"
              "tests/test_lib.py::test_kept FAILED\n"
              "tests/helpers.py::check PASSED\n");
    auto session = scripted_session(testing_support::smith_row(), state);
    EXPECT_EQ(session->calculate_reward(), 0.0);
}

} // namespace
} // namespace evalbox
