#pragma once
#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>

namespace evalbox {

// Read-only view of one dataset row. Field lookups never mutate the row.
class TaskDescriptor {
public:
    // Throws ConfigError for an empty or non-object row.
    explicit TaskDescriptor(nlohmann::json row);

    static TaskDescriptor from_file(const std::string& path);

    const nlohmann::json& raw() const { return row_; }
    bool has(const std::string& key) const;

    // docker_image, else image_name. Throws ConfigError when neither is present.
    std::string image() const;

    // String field or nullopt; non-string values are dumped as JSON.
    std::optional<std::string> get_string(const std::string& key) const;
    std::string get_string_or(const std::string& key, const std::string& fallback) const;

    // Sequence of strings stored either as a JSON array or as a JSON-encoded string.
    std::vector<std::string> get_string_list(const std::string& key) const;

    std::string repo() const;            // repo, else repo_name
    std::string repo_name() const;       // repo_name, else repo
    std::string instance_id() const { return get_string_or("instance_id", ""); }
    std::string problem_statement() const { return get_string_or("problem_statement", ""); }
    std::vector<std::string> fail_to_pass() const { return get_string_list("FAIL_TO_PASS"); }
    std::vector<std::string> pass_to_pass() const { return get_string_list("PASS_TO_PASS"); }

private:
    nlohmann::json row_;
};

}
