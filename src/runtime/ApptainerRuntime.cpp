#include "runtime/ApptainerRuntime.hpp"
#include "utils/SubProcess.hpp"
#include "utils/TarArchive.hpp"
#include "utils/Identifiers.hpp"
#include "Errors.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>

namespace evalbox {

namespace fs = std::filesystem;

namespace {

constexpr char DOCKER_SCHEME[] = "docker://";

bool has_scheme(const std::string& image) {
    return image.find("://") != std::string::npos;
}

ProcessOptions with_timeout(int seconds, std::string stdin_data = "") {
    ProcessOptions options;
    options.timeout = std::chrono::seconds(seconds);
    options.stdin_data = std::move(stdin_data);
    return options;
}

std::string last_lines(const std::string& text, size_t max_chars = 2000) {
    return text.size() <= max_chars ? text : text.substr(text.size() - max_chars);
}

} // namespace

ApptainerRuntime::ApptainerRuntime(ApptainerSettings settings, std::shared_ptr<spdlog::logger> logger)
    : settings_(std::move(settings)), executor_("Apptainer", logger) {
    logger_ = std::move(logger);
}

ApptainerRuntime::~ApptainerRuntime() {
    close();
}

std::string ApptainerRuntime::resolve_image(const std::string& image) const {
    if (image.rfind(DOCKER_SCHEME, 0) == 0 || has_scheme(image)) return image;
    // local SIF files are used as they are
    if (image.size() > 4 && image.compare(image.size() - 4, 4, ".sif") == 0) return image;
    return DOCKER_SCHEME + image;
}

ScriptLookup ApptainerRuntime::run_script_lookup(const std::string& alt_path, const std::string& repo_path) const {
    ScriptLookup lookup;
    lookup.mode = ScriptDiscovery::Probe;
    for (const auto& templ : settings_.script_candidates) {
        lookup.candidates.push_back(substitute_paths(templ, alt_path, repo_path));
    }
    return lookup;
}

std::string ApptainerRuntime::env_prefix() const {
    return "export VIRTUAL_ENV=" + settings_.venv_path + "; export PATH=" + settings_.venv_path + "/bin:" +
           settings_.extra_path + ":$PATH; ";
}

void ApptainerRuntime::log_cache_state(const std::string& uri) const {
    try {
        auto res = SubProcess::run(std::vector<std::string>{settings_.binary, "cache", "list"},
                                   with_timeout(settings_.control_timeout_seconds));
        if (!res.success) {
            logger_->warn("apptainer cache list failed (exit {}), continuing", res.exit_code);
            return;
        }
        logger_->info("📦 Apptainer cache before pulling {}:\n{}", uri, last_lines(res.stdout_data));
    } catch (const std::exception& e) {
        logger_->warn("Could not inspect apptainer cache: {}", e.what());
    }
}

void ApptainerRuntime::start(const ContainerSpec& spec) {
    closed_ = false;
    std::string uri = resolve_image(spec.image);
    log_cache_state(uri);

    std::vector<std::string> argv = {settings_.binary, "instance", "start"};
    if (settings_.writable_tmpfs) argv.push_back("--writable-tmpfs");
    for (const auto& bind : settings_.bind_mounts) {
        argv.push_back("--bind");
        argv.push_back(bind);
    }
    for (const auto& [key, value] : spec.environment) {
        argv.push_back("--env");
        argv.push_back(key + "=" + value);
    }
    argv.push_back(uri);
    argv.push_back(spec.name);

    logger_->info("🚀 Starting Apptainer instance {} from {}", spec.name, uri);
    auto res = SubProcess::run(argv, with_timeout(settings_.pull_timeout_seconds));
    if (res.timed_out) {
        logger_->error("Apptainer instance start timed out after {}s", settings_.pull_timeout_seconds);
        throw InfraError("Timed out after " + std::to_string(settings_.pull_timeout_seconds) +
                         "s starting Apptainer instance from " + uri +
                         ". The image is probably still being pulled; pre-pull it with `" + settings_.binary +
                         " pull " + uri + "` so it is served from the cache, then retry.");
    }
    if (!res.success) {
        logger_->error("Failed to start Apptainer instance: {}", res.stderr_data);
        throw InfraError("Failed to start Apptainer instance: " + res.stderr_data);
    }
    instance_name_ = spec.name;
    logger_->info("Started Apptainer instance: {}", spec.name);
}

void ApptainerRuntime::stop() {
    if (instance_name_.empty()) return;
    try {
        auto res = SubProcess::run(std::vector<std::string>{settings_.binary, "instance", "stop", instance_name_},
                                   with_timeout(settings_.control_timeout_seconds));
        if (res.success) {
            logger_->info("🧹 Stopped Apptainer instance: {}", instance_name_);
        } else {
            logger_->warn("Error stopping Apptainer instance {}: {}", instance_name_, res.stderr_data);
        }
    } catch (const std::exception& e) {
        logger_->warn("Unexpected error stopping Apptainer instance {}: {}", instance_name_, e.what());
    }
    instance_name_.clear();
}

void ApptainerRuntime::close() {
    if (closed_) return;
    closed_ = true;
    stop();
}

std::vector<std::string> ApptainerRuntime::exec_argv(const std::string& line) const {
    return {settings_.binary, "exec", "instance://" + instance_name_, "/bin/sh", "-c", env_prefix() + line};
}

CommandExecutor::Call ApptainerRuntime::make_exec_call(const std::string& code, int timeout_seconds,
                                                       const std::string& args, const std::string& workdir) const {
    auto argv = exec_argv(CommandExecutor::build_shell_command(workdir, timeout_seconds, code, args));
    auto kill_after = std::chrono::seconds(timeout_seconds + 2 * OUTER_DEADLINE_MARGIN_SECONDS);
    return [argv, kill_after]() {
        ProcessOptions options;
        options.timeout = kill_after;
        auto res = SubProcess::run(argv, options);
        RawExecResult raw;
        raw.combined = res.stdout_data + res.stderr_data;
        raw.stdout_data = std::move(res.stdout_data);
        raw.stderr_data = std::move(res.stderr_data);
        if (!res.timed_out) raw.exit_code = res.exit_code;
        return raw;
    };
}

ExecResult ApptainerRuntime::run(const std::string& code, int timeout_seconds,
                                 const std::string& args, const std::string& workdir) {
    if (instance_name_.empty()) return {"Error: instance is not running", "-1"};
    return executor_.run(timeout_seconds, make_exec_call(code, timeout_seconds, args, workdir));
}

DemuxResult ApptainerRuntime::demux_run(const std::string& code, int timeout_seconds,
                                        const std::string& args, const std::string& workdir) {
    if (instance_name_.empty()) return {"", "Error: instance is not running", "-1"};
    return executor_.demux_run(timeout_seconds, make_exec_call(code, timeout_seconds, args, workdir));
}

void ApptainerRuntime::copy_to_container(const std::string& src_path, const std::string& dest_path) {
    if (instance_name_.empty()) throw InfraError("Apptainer instance is not running");

    std::string parent = fs::path(dest_path).parent_path().string();
    if (!parent.empty()) {
        auto mk = run("mkdir -p " + shell_quote(parent));
        if (!mk.ok()) logger_->warn("mkdir -p {} failed: {}", parent, mk.output);
    }

    std::string payload;
    std::string line;
    if (fs::is_directory(src_path)) {
        payload = TarArchive::pack(src_path, fs::path(dest_path).filename().string());
        line = "tar xf - -C " + shell_quote(parent.empty() ? "/" : parent);
    } else {
        std::ifstream in(src_path, std::ios::binary);
        if (!in.is_open()) throw InfraError("Cannot read " + src_path);
        std::stringstream buffer;
        buffer << in.rdbuf();
        payload = buffer.str();
        line = "cat > " + shell_quote(dest_path);
    }

    auto res = SubProcess::run(exec_argv(line), with_timeout(settings_.control_timeout_seconds, std::move(payload)));
    if (!res.success) {
        logger_->error("Failed to copy {} to container: {}", src_path, res.output);
        throw InfraError("Failed to copy " + src_path + " to " + instance_name_ + ":" + dest_path +
                         (res.timed_out ? std::string(" (timed out)") : ": " + res.output));
    }
    logger_->debug("Copied {} to container:{}", src_path, dest_path);
}

}
