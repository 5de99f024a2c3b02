#pragma once
#include <string>
#include <vector>
#include <map>
#include <nlohmann/json.hpp>

namespace evalbox {

struct DockerSettings {
    std::string binary = "docker";
    std::string path_env;                 // PATH inside the container; empty = SANDBOX_PATH
    int start_timeout_seconds = 1800;     // `docker run` may pull the image
    int control_timeout_seconds = 120;    // ps / start / stop / rm / cp
};

struct KubernetesSettings {
    std::string namespace_name = "default";
    std::string kubectl_binary = "kubectl";
    std::string kubeconfig;               // empty = $KUBECONFIG or ~/.kube/config
    std::string path_env;
    std::string cpu_request = "1";
    std::string memory_request = "1Gi";
    std::vector<std::string> image_pull_secrets = {"dockerhub-pro"};
    std::map<std::string, std::string> node_selector = {{"karpenter.sh/nodepool", "bigcpu-standby"}};
    nlohmann::json tolerations = nlohmann::json::array({
        {{"key", "node.kubernetes.io/disk-pressure"},
         {"operator", "Exists"},
         {"effect", "NoExecute"},
         {"tolerationSeconds", 10800}}
    });
    int request_timeout_seconds = 120;
    int create_max_retries = 5;
    int create_backoff_seconds = 5;
    int copy_max_retries = 5;
    int copy_backoff_seconds = 5;
    int max_backoff_seconds = 60;
    int start_timeout_seconds = 1200;
    int delete_timeout_seconds = 60;
};

struct ApptainerSettings {
    std::string binary = "apptainer";
    int pull_timeout_seconds = 1800;      // first use transfers the whole image
    int control_timeout_seconds = 60;
    bool writable_tmpfs = true;
    std::vector<std::string> bind_mounts = {"/tmp:/tmp", "/var/tmp:/var/tmp"};
    std::string venv_path = "/root/.venv";
    std::string extra_path = "/root/.local/bin:/root/.cargo/bin:/usr/local/sbin:/usr/local/bin:/usr/sbin:/usr/bin:/sbin:/bin";
    // {alt} and {repo} are replaced by the session's paths
    std::vector<std::string> script_candidates = {
        "{alt}/run_tests.sh",
        "/run_tests.sh",
        "/tmp/run_tests.sh",
        "/var/tmp/evalbox/run_tests.sh",
        "{repo}/run_tests.sh",
    };
};

struct SessionSettings {
    std::string helper_package = "chardet";
    std::vector<std::string> skip_files = {"run_tests.sh", "r2e_tests"};
    std::string held_out_tests_dir = "/r2e_tests";
    std::string smith_test_command = "pytest --disable-warnings --color=no --tb=no --verbose";
};

struct RuntimeConfig {
    DockerSettings docker;
    KubernetesSettings kubernetes;
    ApptainerSettings apptainer;
    SessionSettings session;

    // First file found among $EVALBOX_CONFIG, ./evalbox.json, ../evalbox.json,
    // config/evalbox.json, then environment overrides. Defaults when no file exists.
    static RuntimeConfig load();
    static RuntimeConfig from_json(const nlohmann::json& j);
    static RuntimeConfig from_file(const std::string& path);

    void apply_env_overrides();
};

}
