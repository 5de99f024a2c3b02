#include "RuntimeConfig.hpp"
#include "Errors.hpp"
#include <cstdlib>
#include <fstream>
#include <filesystem>
#include <spdlog/spdlog.h>

namespace evalbox {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

template <typename T>
void read_into(const json& section, const char* key, T& target) {
    if (section.contains(key) && !section[key].is_null()) {
        target = section[key].get<T>();
    }
}

void override_from_env(const char* name, std::string& target) {
    const char* value = std::getenv(name);
    if (value && *value) target = value;
}

} // namespace

RuntimeConfig RuntimeConfig::from_json(const json& j) {
    RuntimeConfig config;
    if (!j.is_object()) throw ConfigError("evalbox config must be a JSON object");

    try {
        if (j.contains("docker")) {
            const auto& d = j["docker"];
            read_into(d, "binary", config.docker.binary);
            read_into(d, "path_env", config.docker.path_env);
            read_into(d, "start_timeout_seconds", config.docker.start_timeout_seconds);
            read_into(d, "control_timeout_seconds", config.docker.control_timeout_seconds);
        }
        if (j.contains("kubernetes")) {
            const auto& k = j["kubernetes"];
            auto& ks = config.kubernetes;
            read_into(k, "namespace", ks.namespace_name);
            read_into(k, "kubectl_binary", ks.kubectl_binary);
            read_into(k, "kubeconfig", ks.kubeconfig);
            read_into(k, "path_env", ks.path_env);
            read_into(k, "cpu_request", ks.cpu_request);
            read_into(k, "memory_request", ks.memory_request);
            read_into(k, "image_pull_secrets", ks.image_pull_secrets);
            read_into(k, "node_selector", ks.node_selector);
            if (k.contains("tolerations")) ks.tolerations = k["tolerations"];
            read_into(k, "request_timeout_seconds", ks.request_timeout_seconds);
            read_into(k, "create_max_retries", ks.create_max_retries);
            read_into(k, "create_backoff_seconds", ks.create_backoff_seconds);
            read_into(k, "copy_max_retries", ks.copy_max_retries);
            read_into(k, "copy_backoff_seconds", ks.copy_backoff_seconds);
            read_into(k, "max_backoff_seconds", ks.max_backoff_seconds);
            read_into(k, "start_timeout_seconds", ks.start_timeout_seconds);
            read_into(k, "delete_timeout_seconds", ks.delete_timeout_seconds);
        }
        if (j.contains("apptainer")) {
            const auto& a = j["apptainer"];
            auto& as = config.apptainer;
            read_into(a, "binary", as.binary);
            read_into(a, "pull_timeout_seconds", as.pull_timeout_seconds);
            read_into(a, "control_timeout_seconds", as.control_timeout_seconds);
            read_into(a, "writable_tmpfs", as.writable_tmpfs);
            read_into(a, "bind_mounts", as.bind_mounts);
            read_into(a, "venv_path", as.venv_path);
            read_into(a, "extra_path", as.extra_path);
            read_into(a, "script_candidates", as.script_candidates);
        }
        if (j.contains("session")) {
            const auto& s = j["session"];
            read_into(s, "helper_package", config.session.helper_package);
            read_into(s, "skip_files", config.session.skip_files);
            read_into(s, "held_out_tests_dir", config.session.held_out_tests_dir);
            read_into(s, "smith_test_command", config.session.smith_test_command);
        }
    } catch (const json::exception& e) {
        throw ConfigError(std::string("invalid evalbox config: ") + e.what());
    }

    if (config.kubernetes.create_max_retries < 1 || config.kubernetes.copy_max_retries < 1) {
        throw ConfigError("kubernetes retry budgets must be at least 1");
    }
    return config;
}

RuntimeConfig RuntimeConfig::from_file(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) throw ConfigError("cannot open evalbox config: " + path);
    try {
        return from_json(json::parse(f));
    } catch (const json::parse_error& e) {
        throw ConfigError("cannot parse " + path + ": " + e.what());
    }
}

RuntimeConfig RuntimeConfig::load() {
    std::vector<std::string> search_paths;
    if (const char* explicit_path = std::getenv("EVALBOX_CONFIG")) {
        if (*explicit_path) search_paths.emplace_back(explicit_path);
    }
    for (const char* p : {"evalbox.json", "../evalbox.json", "config/evalbox.json"}) {
        search_paths.emplace_back(p);
    }

    RuntimeConfig config;
    bool found = false;
    for (const auto& path : search_paths) {
        if (fs::exists(path)) {
            config = from_file(path);
            spdlog::info("🛠️ Loaded evalbox config from {}", path);
            found = true;
            break;
        }
    }
    if (!found) spdlog::debug("No evalbox.json found, using built-in defaults");

    config.apply_env_overrides();
    return config;
}

void RuntimeConfig::apply_env_overrides() {
    override_from_env("EVALBOX_NAMESPACE", kubernetes.namespace_name);
    override_from_env("EVALBOX_DOCKER_BIN", docker.binary);
    override_from_env("EVALBOX_KUBECTL_BIN", kubernetes.kubectl_binary);
    override_from_env("EVALBOX_APPTAINER_BIN", apptainer.binary);
    override_from_env("KUBECONFIG", kubernetes.kubeconfig);
}

}
