#include "grading/SweBenchGrading.hpp"
#include "task/TaskDescriptor.hpp"
#include "constants.hpp"
#include <map>

namespace evalbox {

namespace {

const std::map<std::string, std::string>& repo_test_commands() {
    static const std::map<std::string, std::string> commands = {
        {"django/django", "./tests/runtests.py --verbosity 2 --settings=test_sqlite --parallel 1"},
        {"sympy/sympy", "PYTHONWARNINGS='ignore::UserWarning,ignore::SyntaxWarning' bin/test -C --verbose"},
        {"sphinx-doc/sphinx", "tox --current-env -epy39 -v --"},
        {"astropy/astropy", "pytest -rA -vv -o console_output_style=classic --tb=no"},
        {"matplotlib/matplotlib", "pytest -rA"},
    };
    return commands;
}

bool is_passing(const TestStatusMap& status, const std::string& test) {
    auto it = status.find(test);
    return it != status.end() && (it->second == STATUS_PASSED || it->second == STATUS_XFAIL);
}

bool is_failing(const TestStatusMap& status, const std::string& test) {
    auto it = status.find(test);
    return it == status.end() || it->second == STATUS_FAILED || it->second == STATUS_ERROR;
}

void grade(const std::vector<std::string>& tests, const TestStatusMap& status, EvalType type, TestBucket& bucket) {
    for (const auto& test : tests) {
        bool ok = type == EvalType::FailOnly ? !is_failing(status, test) : is_passing(status, test);
        (ok ? bucket.success : bucket.failure).push_back(test);
    }
}

// Share of successes; an empty bucket counts as fully successful.
double ratio(const TestBucket& bucket) {
    size_t total = bucket.success.size() + bucket.failure.size();
    if (total == 0) return 1.0;
    return static_cast<double>(bucket.success.size()) / static_cast<double>(total);
}

} // namespace

GradingSpec GradingSpec::from_descriptor(const TaskDescriptor& task) {
    GradingSpec spec;
    spec.instance_id = task.instance_id();
    spec.repo = task.repo();
    spec.version = task.get_string_or("version", "");
    spec.fail_to_pass = task.fail_to_pass();
    spec.pass_to_pass = task.pass_to_pass();
    spec.test_cmd = task.get_string_or("test_cmd", default_test_command(spec.repo));
    return spec;
}

std::string default_test_command(const std::string& repo) {
    auto it = repo_test_commands().find(repo);
    return it == repo_test_commands().end() ? "pytest -rA" : it->second;
}

EvalType eval_type_for(const GradingSpec& spec) {
    // JS harnesses only report failures
    if (spec.repo == "chartjs/Chart.js" || spec.repo == "processing/p5.js" || spec.repo == "markedjs/marked") {
        return EvalType::FailOnly;
    }
    return EvalType::PassAndFail;
}

TestStatusMap get_logs_eval(const GradingSpec& spec, const std::string& log, bool& found,
                            spdlog::logger& logger) {
    std::vector<std::string> bad_codes;
    for (const char* marker : {APPLY_PATCH_FAIL, RESET_FAILED, TESTS_ERROR, TESTS_TIMEOUT}) {
        if (log.find(marker) != std::string::npos) bad_codes.emplace_back(marker);
    }
    if (!bad_codes.empty()) {
        std::string joined;
        for (const auto& code : bad_codes) joined += (joined.empty() ? "" : ", ") + code;
        logger.error("Bad code found in log: {}", joined);
        found = false;
        return {};
    }

    // Everything after the last echo of the test command, else after the start marker.
    std::string content = log;
    auto pos = spec.test_cmd.empty() ? std::string::npos : log.rfind(spec.test_cmd);
    if (pos != std::string::npos) {
        content = log.substr(pos + spec.test_cmd.size());
    } else if ((pos = log.rfind(START_TEST_OUTPUT)) != std::string::npos) {
        content = log.substr(pos + std::char_traits<char>::length(START_TEST_OUTPUT));
    }

    const auto& parser = LogParserRegistry::instance().find(spec.repo, LogFormat::PytestVerbose);
    logger.info("using benchmark log parser for repo: {}", spec.repo);
    found = true;
    return parser.parse(content);
}

EvalReport get_eval_tests_report(const TestStatusMap& status, const GradingSpec& spec, EvalType type) {
    EvalReport report;
    grade(spec.fail_to_pass, status, type, report.fail_to_pass);
    grade(spec.pass_to_pass, status, type, report.pass_to_pass);
    return report;
}

ResolvedStatus get_resolution_status(const EvalReport& report) {
    double f2p = ratio(report.fail_to_pass);
    double p2p = ratio(report.pass_to_pass);
    if (f2p == 1.0 && p2p == 1.0) return ResolvedStatus::Full;
    if (f2p < 1.0 && f2p > 0.0 && p2p == 1.0) return ResolvedStatus::Partial;
    return ResolvedStatus::No;
}

std::string to_string(ResolvedStatus status) {
    switch (status) {
        case ResolvedStatus::Full: return "RESOLVED_FULL";
        case ResolvedStatus::Partial: return "RESOLVED_PARTIAL";
        case ResolvedStatus::No: return "RESOLVED_NO";
    }
    return "RESOLVED_NO";
}

}
