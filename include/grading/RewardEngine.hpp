#pragma once
#include <string>
#include <vector>
#include <memory>
#include <spdlog/spdlog.h>
#include "grading/LogParser.hpp"
#include "task/TaskMode.hpp"

namespace evalbox {

class SandboxSession;

struct RewardOutcome {
    double reward = 0.0;
    std::string output;   // raw test output the reward was computed from
};

// Turns a test run into 0.0 or 1.0. Ambiguous or unparsable output scores 0.0.
class RewardEngine {
public:
    explicit RewardEngine(std::shared_ptr<spdlog::logger> logger);

    RewardOutcome evaluate(SandboxSession& session, int timeout_seconds) const;

    // 1.0 iff both maps agree key for key after truncating keys at " - ".
    static double score_expected_output(const TestStatusMap& parsed, const TestStatusMap& expected);
    // 1.0 iff every expected id resolves (exactly, else by substring) to PASSED.
    static double score_smith(const TestStatusMap& parsed, const std::vector<std::string>& fail_to_pass,
                              const std::vector<std::string>& pass_to_pass);

    // Test files among the expected ids that must be restored before grading.
    static std::vector<std::string> smith_test_files(const std::vector<std::string>& fail_to_pass,
                                                     const std::vector<std::string>& pass_to_pass);
    static std::string reset_tests_command(const std::vector<std::string>& files, const std::string& base_commit);

    static TestStatusMap truncate_keys(const TestStatusMap& map);

private:
    RewardOutcome evaluate_verified(SandboxSession& session, const VerifiedMode& mode, int timeout_seconds) const;
    RewardOutcome evaluate_smith(SandboxSession& session, const SmithMode& mode, int timeout_seconds) const;
    RewardOutcome evaluate_default(SandboxSession& session, const DefaultMode& mode, int timeout_seconds) const;

    std::shared_ptr<spdlog::logger> logger_;
};

}
