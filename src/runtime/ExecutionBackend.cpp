#include "runtime/ExecutionBackend.hpp"
#include "utils/Identifiers.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <cctype>

namespace evalbox {

BackendKind parse_backend_kind(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "docker") return BackendKind::Docker;
    if (lower == "kubernetes" || lower == "k8s") return BackendKind::Kubernetes;
    if (lower == "apptainer" || lower == "singularity") return BackendKind::Apptainer;
    throw ConfigError("unknown backend: " + name);
}

std::string to_string(BackendKind kind) {
    switch (kind) {
        case BackendKind::Docker: return "docker";
        case BackendKind::Kubernetes: return "kubernetes";
        case BackendKind::Apptainer: return "apptainer";
    }
    return "unknown";
}

std::string substitute_paths(std::string templ, const std::string& alt_path, const std::string& repo_path) {
    auto replace_all = [&templ](const std::string& key, const std::string& value) {
        size_t pos = 0;
        while ((pos = templ.find(key, pos)) != std::string::npos) {
            templ.replace(pos, key.size(), value);
            pos += value.size();
        }
    };
    // "{alt}/x" with alt "/" must not become "//x"
    std::string alt = alt_path == "/" ? "" : alt_path;
    std::string repo = repo_path == "/" ? "" : repo_path;
    replace_all("{alt}", alt);
    replace_all("{repo}", repo);
    return templ;
}

std::string ExecutionBackend::make_session_name(const std::string& image) const {
    return evalbox::make_session_name(image);
}

ScriptLookup ExecutionBackend::run_script_lookup(const std::string& alt_path, const std::string& repo_path) const {
    ScriptLookup lookup;
    lookup.mode = ScriptDiscovery::Fixed;
    lookup.candidates.push_back(substitute_paths("{alt}/run_tests.sh", alt_path, repo_path));
    return lookup;
}

}
