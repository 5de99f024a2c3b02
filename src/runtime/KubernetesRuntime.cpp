#include "runtime/KubernetesRuntime.hpp"
#include "utils/Identifiers.hpp"
#include "utils/TarArchive.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <filesystem>
#include <thread>

namespace evalbox {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

bool is_transient(int status) {
    return status == 409 || status == 429 || status == 500 || status == 503;
}

bool is_terminal_phase(const std::string& phase) {
    return phase == "Failed" || phase == "Succeeded" || phase == "Unknown";
}

std::string field_selector_for(const std::string& name) {
    return "metadata.name=" + name;
}

// Pumps an exec stream until it closes or the hard budget runs out.
RawExecResult drain_exec(ExecStream& stream, std::chrono::seconds budget) {
    RawExecResult raw;
    auto deadline = std::chrono::steady_clock::now() + budget;
    auto collect = [&]() {
        if (stream.peek_stdout()) {
            std::string chunk = stream.read_stdout();
            raw.stdout_data += chunk;
            raw.combined += chunk;
        }
        if (stream.peek_stderr()) {
            std::string chunk = stream.read_stderr();
            raw.stderr_data += chunk;
            raw.combined += chunk;
        }
    };

    while (stream.is_open()) {
        stream.update(std::chrono::milliseconds(EXEC_POLL_TICK_MS));
        collect();
        if (std::chrono::steady_clock::now() >= deadline) {
            stream.terminate();
            return raw;  // no exit code: the transport gave up
        }
    }
    collect();
    stream.close();
    raw.exit_code = stream.returncode();
    return raw;
}

} // namespace

KubernetesRuntime::KubernetesRuntime(KubernetesSettings settings, std::shared_ptr<KubeClient> client,
                                     std::shared_ptr<spdlog::logger> logger, SleepFn sleep)
    : settings_(std::move(settings)), client_(std::move(client)), sleep_(std::move(sleep)),
      executor_("Kubernetes", logger) {
    logger_ = std::move(logger);
    if (!client_) throw ConfigError("KubernetesRuntime requires a client");
}

KubernetesRuntime::~KubernetesRuntime() {
    close();
}

std::string KubernetesRuntime::make_session_name(const std::string&) const {
    return make_uuid4();
}

void KubernetesRuntime::sleep_for(std::chrono::seconds delay) const {
    if (sleep_) sleep_(delay);
    else std::this_thread::sleep_for(delay);
}

json KubernetesRuntime::build_pod_body(const ContainerSpec& spec) const {
    json env = json::array();
    env.push_back({{"name", "PATH"},
                   {"value", settings_.path_env.empty() ? std::string(SANDBOX_PATH) : settings_.path_env}});
    for (const auto& [key, value] : spec.environment) {
        if (key == "PATH") continue;
        env.push_back({{"name", key}, {"value", value}});
    }

    json pull_secrets = json::array();
    for (const auto& secret : settings_.image_pull_secrets) pull_secrets.push_back({{"name", secret}});

    json container = {
        {"name", spec.name},
        {"image", spec.image},
        {"command", json::array({"/bin/sh", "-c"})},
        {"args", json::array({spec.command})},
        {"stdin", true},
        {"tty", true},
        {"env", env},
        {"resources", {{"requests", {{"cpu", settings_.cpu_request}, {"memory", settings_.memory_request}}}}},
    };

    json body = {
        {"apiVersion", "v1"},
        {"kind", "Pod"},
        {"metadata", {{"name", spec.name}}},
        {"spec", {
            {"restartPolicy", "Never"},
            {"containers", json::array({container})},
            {"imagePullSecrets", pull_secrets},
            {"nodeSelector", settings_.node_selector},
            {"tolerations", settings_.tolerations},
        }},
    };
    // PATH from the environment map wins over the default
    auto path_override = spec.environment.find("PATH");
    if (path_override != spec.environment.end()) {
        body["spec"]["containers"][0]["env"][0]["value"] = path_override->second;
    }
    return body;
}

PodInfo KubernetesRuntime::create_with_retry(const json& body) {
    std::string name = body["metadata"].value("name", "");
    int backoff = settings_.create_backoff_seconds;
    const int max_retries = settings_.create_max_retries;

    for (int attempt = 1; attempt <= max_retries; ++attempt) {
        try {
            return client_->create_pod(settings_.namespace_name, body);
        } catch (const KubeApiError& e) {
            if (!is_transient(e.status())) {
                logger_->error("Failed to create Kubernetes pod '{}': {}", name, e.what());
                throw InfraError("Failed to create pod '" + name + "': " + e.what());
            }
            if (attempt == max_retries) break;
            logger_->warn("Transient Kubernetes error {} while creating pod '{}' (attempt {}/{}); retrying in {}s",
                          e.status(), name, attempt, max_retries, backoff);
            sleep_for(std::chrono::seconds(backoff));
            backoff = std::min(backoff * 2, settings_.max_backoff_seconds);
        }
    }
    throw InfraError("Exceeded retry limit (" + std::to_string(max_retries) +
                     ") while creating pod '" + name + "'.");
}

void KubernetesRuntime::wait_until_running(const std::string& name, const std::string& resource_version) {
    const int limit = settings_.start_timeout_seconds;
    const auto started = std::chrono::steady_clock::now();
    bool running = false;
    std::string terminal_phase;
    bool timed_out = false;

    WatchOptions options;
    options.field_selector = field_selector_for(name);
    options.resource_version = resource_version;
    options.timeout_seconds = limit;

    try {
        client_->watch_pods(settings_.namespace_name, options, [&](const WatchEvent& event) {
            auto elapsed = std::chrono::steady_clock::now() - started;
            if (elapsed > std::chrono::seconds(limit)) {
                timed_out = true;
                return false;
            }
            if (event.pod.phase == "Running") {
                running = true;
                return false;
            }
            if (is_terminal_phase(event.pod.phase)) {
                terminal_phase = event.pod.phase;
                return false;
            }
            return true;
        });
    } catch (const std::exception& e) {
        logger_->error("Error waiting for pod '{}' to start: {}", name, e.what());
    }

    if (running) {
        logger_->info("☸️ Kubernetes pod '{}' is Running.", name);
        return;
    }
    if (!terminal_phase.empty()) {
        throw InfraError("Kubernetes pod '" + name + "' entered terminal phase '" + terminal_phase + "'.");
    }
    if (timed_out) {
        logger_->error("Kubernetes pod '{}' timed out after {} seconds, checking once more", name, limit);
    }

    // Watch failed, timed out or ended early: one direct read decides.
    PodInfo current;
    try {
        current = client_->read_pod(settings_.namespace_name, name);
    } catch (const KubeApiError& e) {
        logger_->error("Failed to check pod status after watch error: {}", e.what());
        throw InfraError("Failed to verify status of pod '" + name + "': " + e.what());
    }
    if (current.phase == "Running") {
        logger_->info("☸️ Pod '{}' is running (verified after watch)", name);
        return;
    }
    throw InfraError("Pod '" + name + "' failed to reach Running state: " +
                     (current.phase.empty() ? std::string("<none>") : current.phase));
}

void KubernetesRuntime::start(const ContainerSpec& spec) {
    closed_ = false;
    try {
        pod_ = client_->read_pod(settings_.namespace_name, spec.name);
        logger_->info("☸️ Found existing Kubernetes pod: {}", spec.name);
        return;
    } catch (const KubeApiError& e) {
        if (e.status() != 404) {
            logger_->error("Error checking Kubernetes pod '{}' status: {}. Check Kubernetes configuration and permissions.",
                           spec.name, e.what());
            throw InfraError("Cannot read pod '" + spec.name + "': " + e.what());
        }
    }

    PodInfo created = create_with_retry(build_pod_body(spec));
    if (created.name.empty()) created.name = spec.name;
    // set before waiting so close() still deletes a pod that never came up
    pod_ = created;
    wait_until_running(created.name, created.resource_version);
    pod_.phase = "Running";
}

void KubernetesRuntime::delete_pod_and_wait(const std::string& name) {
    const std::string& ns = settings_.namespace_name;
    try {
        client_->delete_pod(ns, name, 0, false);
    } catch (const KubeApiError& e) {
        if (e.status() == 404) {
            logger_->info("Kubernetes pod '{}' not found, likely already deleted.", name);
            return;
        }
        throw InfraError("Error deleting pod '" + name + "': " + e.what());
    }

    bool deleted = false;
    WatchOptions options;
    options.field_selector = field_selector_for(name);
    options.timeout_seconds = settings_.delete_timeout_seconds;
    const auto started = std::chrono::steady_clock::now();
    try {
        client_->watch_pods(ns, options, [&](const WatchEvent& event) {
            if (event.type == "DELETED") {
                deleted = true;
                return false;
            }
            return std::chrono::steady_clock::now() - started <=
                   std::chrono::seconds(settings_.delete_timeout_seconds);
        });
    } catch (const std::exception& e) {
        logger_->warn("Watch for deletion of pod '{}' failed: {}", name, e.what());
    }

    if (deleted) {
        logger_->info("🧹 Kubernetes pod {} deleted.", name);
        return;
    }

    try {
        client_->read_pod(ns, name);
        logger_->warn("Watch timed out but pod {} still exists. Forcing deletion.", name);
        client_->delete_pod(ns, name, 0, true);
    } catch (const KubeApiError& e) {
        if (e.status() == 404) {
            logger_->info("Confirmed pod {} is deleted.", name);
        } else {
            logger_->error("Error checking pod status after timeout: {}", e.what());
        }
    }
}

void KubernetesRuntime::stop() {
    if (pod_.name.empty()) return;
    try {
        delete_pod_and_wait(pod_.name);
    } catch (const std::exception& e) {
        logger_->error("Pod stop/delete error for {}: {}", pod_.name, e.what());
    }
    pod_ = PodInfo{};
}

void KubernetesRuntime::close() {
    if (closed_) return;
    closed_ = true;
    stop();
}

CommandExecutor::Call KubernetesRuntime::make_exec_call(const std::string& code, int timeout_seconds,
                                                        const std::string& args, const std::string& workdir) const {
    std::vector<std::string> command = {
        "/bin/sh", "-c", CommandExecutor::build_shell_command(workdir, timeout_seconds, code, args)
    };
    // Captures the shared client, never `this`: the worker may outlive the runtime.
    auto client = client_;
    auto ns = settings_.namespace_name;
    auto pod = pod_.name;
    auto budget = std::chrono::seconds(timeout_seconds + 2 * OUTER_DEADLINE_MARGIN_SECONDS);
    return [client, ns, pod, command, budget]() {
        auto stream = client->open_exec(ns, pod, pod, command, false);
        return drain_exec(*stream, budget);
    };
}

ExecResult KubernetesRuntime::run(const std::string& code, int timeout_seconds,
                                  const std::string& args, const std::string& workdir) {
    if (pod_.name.empty()) return {"Error: pod is not running", "-1"};
    return executor_.run(timeout_seconds, make_exec_call(code, timeout_seconds, args, workdir));
}

DemuxResult KubernetesRuntime::demux_run(const std::string& code, int timeout_seconds,
                                         const std::string& args, const std::string& workdir) {
    if (pod_.name.empty()) return {"", "Error: pod is not running", "-1"};
    return executor_.demux_run(timeout_seconds, make_exec_call(code, timeout_seconds, args, workdir));
}

void KubernetesRuntime::copy_to_container(const std::string& src_path, const std::string& dest_path) {
    fs::path dest(dest_path);
    std::string dest_dir = dest.parent_path().string();
    if (dest_dir.empty()) dest_dir = "/";

    std::string archive;
    try {
        archive = TarArchive::pack(src_path, dest.filename().string());
    } catch (const std::exception& e) {
        throw InfraError("Failed to archive " + src_path + ": " + e.what());
    }

    const int max_retries = settings_.copy_max_retries;
    int delay = settings_.copy_backoff_seconds;
    for (int attempt = 0; attempt < max_retries; ++attempt) {
        try {
            auto stream = client_->open_exec(settings_.namespace_name, pod_.name, pod_.name,
                                             {"tar", "xmf", "-", "-C", dest_dir}, true);
            // whole archive from the first byte on every attempt
            stream->write_stdin(archive);
            stream->close();
            auto rc = stream->returncode();
            if (rc && *rc != 0) {
                std::string err = stream->peek_stderr() ? stream->read_stderr() : "";
                throw std::runtime_error("tar exited with " + std::to_string(*rc) + (err.empty() ? "" : ": " + err));
            }
            logger_->debug("Copied {} to {}:{}", src_path, pod_.name, dest_path);
            return;
        } catch (const std::exception& e) {
            if (attempt < max_retries - 1) {
                logger_->warn("Copy to container failed (attempt {}/{}): {}", attempt + 1, max_retries, e.what());
                sleep_for(std::chrono::seconds(delay));
                delay = std::min(delay * 2, settings_.max_backoff_seconds);
            } else {
                logger_->error("Copy to container failed after {} attempts: {}", max_retries, e.what());
                throw InfraError("Failed to copy " + src_path + " to pod " + pod_.name + ": " + e.what());
            }
        }
    }
}

}
