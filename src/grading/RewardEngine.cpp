#include "grading/RewardEngine.hpp"
#include "grading/SweBenchGrading.hpp"
#include "session/SandboxSession.hpp"
#include "utils/Identifiers.hpp"
#include "constants.hpp"
#include <set>
#include <filesystem>
#include <nlohmann/json.hpp>

namespace evalbox {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

bool is_test_file(const std::string& path) {
    std::string base = fs::path(path).filename().string();
    auto ends_with = [&base](const std::string& suffix) {
        return base.size() >= suffix.size() && base.compare(base.size() - suffix.size(), suffix.size(), suffix) == 0;
    };
    return (base.rfind("test_", 0) == 0 && ends_with(".py")) || ends_with("_test.py");
}

// Exact key, else the first key containing the id.
const std::string* resolve_status(const TestStatusMap& parsed, const std::string& id) {
    auto it = parsed.find(id);
    if (it != parsed.end()) return &it->second;
    for (const auto& [key, status] : parsed) {
        if (key.find(id) != std::string::npos) return &status;
    }
    return nullptr;
}

} // namespace

RewardEngine::RewardEngine(std::shared_ptr<spdlog::logger> logger) : logger_(std::move(logger)) {}

TestStatusMap RewardEngine::truncate_keys(const TestStatusMap& map) {
    // std::map iterates in sorted order, so later keys overwrite earlier ones
    TestStatusMap out;
    for (const auto& [key, status] : map) {
        auto pos = key.find(" - ");
        out[pos == std::string::npos ? key : key.substr(0, pos)] = status;
    }
    return out;
}

double RewardEngine::score_expected_output(const TestStatusMap& parsed, const TestStatusMap& expected) {
    auto p = truncate_keys(parsed);
    auto e = truncate_keys(expected);
    if (p.size() != e.size()) return 0.0;
    for (const auto& [key, status] : p) {
        if (key.empty()) continue;
        auto it = e.find(key);
        if (it == e.end() || it->second != status) return 0.0;
    }
    return 1.0;
}

double RewardEngine::score_smith(const TestStatusMap& parsed, const std::vector<std::string>& fail_to_pass,
                                 const std::vector<std::string>& pass_to_pass) {
    if (parsed.empty()) return 0.0;
    for (const auto* group : {&fail_to_pass, &pass_to_pass}) {
        for (const auto& raw_id : *group) {
            const std::string* status = resolve_status(parsed, dotted_test_id(raw_id));
            if (!status || *status != STATUS_PASSED) return 0.0;
        }
    }
    return 1.0;
}

std::vector<std::string> RewardEngine::smith_test_files(const std::vector<std::string>& fail_to_pass,
                                                        const std::vector<std::string>& pass_to_pass) {
    std::set<std::string> files;
    for (const auto* group : {&fail_to_pass, &pass_to_pass}) {
        for (const auto& id : *group) {
            std::string file = id.substr(0, id.find("::"));
            if (is_test_file(file)) files.insert(file);
        }
    }
    return {files.begin(), files.end()};
}

std::string RewardEngine::reset_tests_command(const std::vector<std::string>& files, const std::string& base_commit) {
    std::string cmd = "printf \"%s\\n\"";
    for (const auto& f : files) cmd += " " + shell_quote(f);
    cmd += " | xargs -n1 -I{} git checkout " + base_commit + " -- \"{}\" 2>/dev/null";
    return cmd;
}

RewardOutcome RewardEngine::evaluate_verified(SandboxSession& session, const VerifiedMode& mode,
                                              int timeout_seconds) const {
    RewardOutcome outcome;
    outcome.output = session.run("/run_tests.sh", timeout_seconds).output;

    bool found = false;
    auto status_map = get_logs_eval(mode.grading, outcome.output, found, *logger_);
    auto report = get_eval_tests_report(status_map, mode.grading, eval_type_for(mode.grading));
    auto resolution = get_resolution_status(report);
    logger_->info("🧪 {}: {} ({} f2p ok, {} p2p ok)", mode.grading.instance_id, to_string(resolution),
                  report.fail_to_pass.success.size(), report.pass_to_pass.success.size());
    outcome.reward = resolution == ResolvedStatus::Full ? 1.0 : 0.0;
    return outcome;
}

RewardOutcome RewardEngine::evaluate_smith(SandboxSession& session, const SmithMode& mode,
                                           int timeout_seconds) const {
    auto files = smith_test_files(mode.fail_to_pass, mode.pass_to_pass);
    if (!files.empty()) session.run(reset_tests_command(files, mode.base_commit));

    RewardOutcome outcome;
    outcome.output = session.run("/run_tests.sh", timeout_seconds).output;

    const auto& parser = LogParserRegistry::instance().find(session.repo_name(), LogFormat::PytestVerbose);
    TestStatusMap parsed;
    for (const auto& [key, status] : parser.parse(outcome.output)) parsed[dotted_test_id(key)] = status;

    outcome.reward = score_smith(parsed, mode.fail_to_pass, mode.pass_to_pass);
    return outcome;
}

RewardOutcome RewardEngine::evaluate_default(SandboxSession& session, const DefaultMode& mode,
                                             int timeout_seconds) const {
    RewardOutcome outcome;
    outcome.output = session.run_tests(timeout_seconds).output;

    const auto& parser = LogParserRegistry::instance().find(session.repo_name(), LogFormat::PytestSummary);
    auto parsed = decolor_keys(parser.parse(outcome.output));

    std::string expected_text = mode.expected_output_json ? *mode.expected_output_json
                                                          : session.read_file("expected_test_output.json");
    TestStatusMap expected;
    try {
        auto j = json::parse(expected_text);
        if (!j.is_object()) {
            logger_->error("Expected test output is not a JSON object");
            return outcome;
        }
        for (const auto& [key, value] : j.items()) {
            expected[key] = value.is_string() ? value.get<std::string>() : value.dump();
        }
    } catch (const json::exception& e) {
        logger_->error("Unparsable expected test output: {}", e.what());
        outcome.reward = 0.0;
        return outcome;
    }

    outcome.reward = score_expected_output(parsed, decolor_keys(expected));
    return outcome;
}

RewardOutcome RewardEngine::evaluate(SandboxSession& session, int timeout_seconds) const {
    return std::visit(overloaded{
        [&](const VerifiedMode& m) { return evaluate_verified(session, m, timeout_seconds); },
        [&](const SmithMode& m) { return evaluate_smith(session, m, timeout_seconds); },
        [&](const DefaultMode& m) { return evaluate_default(session, m, timeout_seconds); },
    }, session.mode());
}

}
