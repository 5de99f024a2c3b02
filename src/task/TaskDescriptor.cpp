#include "task/TaskDescriptor.hpp"
#include "Errors.hpp"
#include <fstream>

namespace evalbox {

using json = nlohmann::json;

TaskDescriptor::TaskDescriptor(json row) : row_(std::move(row)) {
    if (!row_.is_object() || row_.empty()) {
        throw ConfigError("task descriptor must be a non-empty JSON object");
    }
}

TaskDescriptor TaskDescriptor::from_file(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) throw ConfigError("cannot open task file: " + path);
    try {
        return TaskDescriptor(json::parse(f));
    } catch (const json::parse_error& e) {
        throw ConfigError("cannot parse task file " + path + ": " + e.what());
    }
}

bool TaskDescriptor::has(const std::string& key) const {
    return row_.contains(key) && !row_[key].is_null();
}

std::string TaskDescriptor::image() const {
    for (const char* key : {"docker_image", "image_name"}) {
        auto value = get_string(key);
        if (value && !value->empty()) return *value;
    }
    throw ConfigError("No image found in task descriptor (expected docker_image or image_name)");
}

std::optional<std::string> TaskDescriptor::get_string(const std::string& key) const {
    if (!has(key)) return std::nullopt;
    const auto& value = row_[key];
    if (value.is_string()) return value.get<std::string>();
    return value.dump();
}

std::string TaskDescriptor::get_string_or(const std::string& key, const std::string& fallback) const {
    auto value = get_string(key);
    return value ? *value : fallback;
}

std::vector<std::string> TaskDescriptor::get_string_list(const std::string& key) const {
    if (!has(key)) return {};
    json value = row_[key];
    if (value.is_string()) {
        auto decoded = json::parse(value.get<std::string>(), nullptr, false);
        if (decoded.is_discarded() || !decoded.is_array()) {
            throw ConfigError("field " + key + " is neither a list nor a JSON-encoded list");
        }
        value = std::move(decoded);
    }
    if (!value.is_array()) throw ConfigError("field " + key + " must be a list");

    std::vector<std::string> out;
    out.reserve(value.size());
    for (const auto& item : value) {
        if (!item.is_string()) throw ConfigError("field " + key + " must contain strings");
        out.push_back(item.get<std::string>());
    }
    return out;
}

std::string TaskDescriptor::repo() const {
    auto value = get_string("repo");
    return value ? *value : get_string_or("repo_name", "");
}

std::string TaskDescriptor::repo_name() const {
    auto value = get_string("repo_name");
    return value ? *value : get_string_or("repo", "");
}

}
