#include "task/TaskMode.hpp"
#include "Errors.hpp"
#include <nlohmann/json.hpp>

namespace evalbox {

using json = nlohmann::json;

namespace {

std::string string_field(const json& j, const char* key, bool required) {
    if (!j.contains(key) || j[key].is_null()) {
        if (required) throw ConfigError(std::string("parsed commit is missing ") + key);
        return "";
    }
    if (!j[key].is_string()) throw ConfigError(std::string("parsed commit field ") + key + " must be a string");
    return j[key].get<std::string>();
}

} // namespace

ParsedCommit ParsedCommit::from_json_text(const std::string& text) {
    auto j = json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object()) throw ConfigError("parsed commit is not a JSON object");

    ParsedCommit commit;
    commit.old_commit_hash = string_field(j, "old_commit_hash", true);
    commit.new_commit_hash = string_field(j, "new_commit_hash", true);
    commit.commit_message = string_field(j, "commit_message", false);
    commit.commit_date = string_field(j, "commit_date", false);

    if (!j.contains("file_diffs") || !j["file_diffs"].is_array()) {
        throw ConfigError("parsed commit is missing the file_diffs list");
    }
    for (const auto& d : j["file_diffs"]) {
        if (!d.is_object()) throw ConfigError("parsed commit file_diffs entries must be objects");
        FileDiff diff;
        // header is an object in some dumps; keep it as text
        if (d.contains("header")) diff.header = d["header"].is_string() ? d["header"].get<std::string>() : d["header"].dump();
        diff.old_file_path = d.value("old_file_path", "");
        diff.new_file_path = d.value("new_file_path", "");
        if (d.contains("patch")) diff.patch = d["patch"].is_string() ? d["patch"].get<std::string>() : d["patch"].dump();
        commit.file_diffs.push_back(std::move(diff));
    }
    return commit;
}

std::string smith_image_reference(const std::string& image_name) {
    std::string name = image_name;
    size_t pos = 0;
    while ((pos = name.find("__", pos)) != std::string::npos) {
        name.replace(pos, 2, "_1776_");
        pos += 6;
    }
    return "jyangballin/" + name + ":latest";
}

ResolvedTask resolve_task(const TaskDescriptor& task, const std::string& image_override,
                          const std::string& default_smith_test_cmd) {
    ResolvedTask resolved;
    resolved.image = image_override.empty() ? task.image() : image_override;

    if (resolved.image.find("swebench") != std::string::npos) {
        resolved.mode = VerifiedMode{GradingSpec::from_descriptor(task)};
        return resolved;
    }

    if (resolved.image.find("swesmith") != std::string::npos) {
        auto image_name = task.get_string("image_name");
        if (!image_name) throw ConfigError("smith task is missing image_name");
        resolved.image = smith_image_reference(*image_name);

        SmithMode mode;
        mode.base_commit = task.get_string_or("base_commit", "");
        if (mode.base_commit.empty()) throw ConfigError("smith task is missing base_commit");
        mode.fail_to_pass = task.fail_to_pass();
        mode.pass_to_pass = task.pass_to_pass();
        mode.test_cmd = task.get_string_or("test_cmd", default_smith_test_cmd);
        resolved.mode = std::move(mode);
        return resolved;
    }

    auto commit_text = task.get_string("parsed_commit_content");
    if (!commit_text) commit_text = task.get_string("parsed_commit");
    if (!commit_text) throw ConfigError("task is missing parsed_commit_content");

    DefaultMode mode;
    mode.commit = ParsedCommit::from_json_text(*commit_text);
    mode.expected_output_json = task.get_string("expected_output_json");
    resolved.mode = std::move(mode);
    return resolved;
}

std::string mode_name(const TaskMode& mode) {
    if (std::holds_alternative<VerifiedMode>(mode)) return "verified";
    if (std::holds_alternative<SmithMode>(mode)) return "smith";
    return "default";
}

}
