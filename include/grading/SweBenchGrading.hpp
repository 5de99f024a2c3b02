#pragma once
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include "grading/LogParser.hpp"

namespace evalbox {

class TaskDescriptor;

// Everything grading needs to know about one benchmark instance.
struct GradingSpec {
    std::string instance_id;
    std::string repo;
    std::string version;
    std::vector<std::string> fail_to_pass;
    std::vector<std::string> pass_to_pass;
    std::string test_cmd;

    // test_cmd comes from the row when present, else from the per-repo table.
    static GradingSpec from_descriptor(const TaskDescriptor& task);
};

enum class EvalType { PassAndFail, FailOnly };
enum class ResolvedStatus { Full, Partial, No };

struct TestBucket {
    std::vector<std::string> success;
    std::vector<std::string> failure;
};

struct EvalReport {
    TestBucket fail_to_pass;
    TestBucket pass_to_pass;
};

// Default test command of a benchmark repository.
std::string default_test_command(const std::string& repo);
EvalType eval_type_for(const GradingSpec& spec);

// Parsed statuses of the test section of `log`, or an empty map when the log
// carries one of the harness failure markers. `found` reports which.
TestStatusMap get_logs_eval(const GradingSpec& spec, const std::string& log, bool& found,
                            spdlog::logger& logger);

EvalReport get_eval_tests_report(const TestStatusMap& status, const GradingSpec& spec, EvalType type);
ResolvedStatus get_resolution_status(const EvalReport& report);

std::string to_string(ResolvedStatus status);

}
