#pragma once
#include <string>
#include <vector>
#include <variant>
#include <optional>
#include "grading/SweBenchGrading.hpp"
#include "task/TaskDescriptor.hpp"

namespace evalbox {

struct FileDiff {
    std::string header;
    std::string old_file_path;
    std::string new_file_path;
    std::string patch;
};

// Reference commit of a default-mode task.
struct ParsedCommit {
    std::string old_commit_hash;
    std::string new_commit_hash;
    std::string commit_message;
    std::string commit_date;
    std::vector<FileDiff> file_diffs;

    // Throws ConfigError when the required fields are missing or mistyped.
    static ParsedCommit from_json_text(const std::string& text);
};

// Benchmark image with a staged /run_tests.sh and a grading spec.
struct VerifiedMode {
    GradingSpec grading;
};

// Synthesized task: the run script is generated from test_cmd at setup.
struct SmithMode {
    std::string base_commit;
    std::vector<std::string> fail_to_pass;
    std::vector<std::string> pass_to_pass;
    std::string test_cmd;
};

struct DefaultMode {
    ParsedCommit commit;
    std::optional<std::string> expected_output_json;
};

using TaskMode = std::variant<VerifiedMode, SmithMode, DefaultMode>;

struct ResolvedTask {
    std::string image;
    TaskMode mode;
};

// Picks the mode from the image reference and extracts its payload. An
// explicit image override takes part in the mode decision. Throws ConfigError.
ResolvedTask resolve_task(const TaskDescriptor& task, const std::string& image_override,
                          const std::string& default_smith_test_cmd);

// "org__repo.abc123" -> "jyangballin/org_1776_repo.abc123:latest"
std::string smith_image_reference(const std::string& image_name);

std::string mode_name(const TaskMode& mode);

}
