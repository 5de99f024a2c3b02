#pragma once

namespace evalbox {

// Command execution
constexpr int CMD_TIMEOUT_SECONDS = 120;             // Default per-command bound
constexpr int TEST_TIMEOUT_SECONDS = 300;            // Default bound for a test run
constexpr int OUTER_DEADLINE_MARGIN_SECONDS = 5;     // Outer guard = inner timeout + margin
constexpr int INNER_TIMEOUT_EXIT_CODE = 124;         // Exit status of coreutils `timeout`
constexpr int EXEC_POLL_TICK_MS = 1000;              // Stream polling interval

// PATH exported into every sandbox
inline constexpr char SANDBOX_PATH[] =
    "/root/.venv/bin:/root/.local/bin:/root/.cargo/bin:/usr/local/sbin:/usr/local/bin:/usr/sbin:/usr/bin:/sbin:/bin";

// Test harness markers
inline constexpr char START_TEST_OUTPUT[] = ">>>>> Start Test Output";
inline constexpr char END_TEST_OUTPUT[] = ">>>>> End Test Output";
inline constexpr char APPLY_PATCH_FAIL[] = ">>>>> Patch Apply Failed";
inline constexpr char RESET_FAILED[] = ">>>>> Reset Failed";
inline constexpr char TESTS_ERROR[] = ">>>>> Tests Errored";
inline constexpr char TESTS_TIMEOUT[] = ">>>>> Tests Timed Out";

// Test status tags
inline constexpr char STATUS_PASSED[] = "PASSED";
inline constexpr char STATUS_FAILED[] = "FAILED";
inline constexpr char STATUS_ERROR[] = "ERROR";
inline constexpr char STATUS_SKIPPED[] = "SKIPPED";
inline constexpr char STATUS_XFAIL[] = "XFAIL";

} // namespace evalbox
