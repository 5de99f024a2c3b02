#include "runtime/DockerRuntime.hpp"
#include "utils/SubProcess.hpp"
#include "utils/TarArchive.hpp"
#include "Errors.hpp"
#include <filesystem>

namespace evalbox {

namespace fs = std::filesystem;

namespace {

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    auto begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) return "";
    auto end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

ProcessOptions control_options(int timeout_seconds, std::string stdin_data = "") {
    ProcessOptions options;
    options.timeout = std::chrono::seconds(timeout_seconds);
    options.stdin_data = std::move(stdin_data);
    return options;
}

} // namespace

DockerRuntime::DockerRuntime(DockerSettings settings, std::shared_ptr<spdlog::logger> logger)
    : settings_(std::move(settings)), executor_("Docker", logger) {
    logger_ = std::move(logger);
}

DockerRuntime::~DockerRuntime() {
    close();
}

std::string DockerRuntime::container_state(const std::string& name) const {
    auto res = SubProcess::run(std::vector<std::string>{
        settings_.binary, "ps", "-a",
        "--filter", "name=^/" + name + "$",
        "--format", "{{.State}}"
    }, control_options(settings_.control_timeout_seconds));

    if (!res.success) {
        throw InfraError("docker ps failed for " + name + ": " + trim(res.stderr_data));
    }
    // one line per match; the anchored filter yields at most one
    std::string out = trim(res.stdout_data);
    auto nl = out.find('\n');
    return nl == std::string::npos ? out : out.substr(0, nl);
}

void DockerRuntime::start(const ContainerSpec& spec) {
    container_name_ = spec.name;
    closed_ = false;

    std::string state = container_state(spec.name);
    if (state == "running") {
        logger_->info("🐳 Reusing running container {}", spec.name);
        return;
    }

    if (!state.empty()) {
        logger_->info("🐳 Starting stopped container {} (state: {})", spec.name, state);
        auto res = SubProcess::run(std::vector<std::string>{settings_.binary, "start", spec.name},
                                   control_options(settings_.control_timeout_seconds));
        if (!res.success) {
            throw InfraError("Failed to start container " + spec.name + ": " + trim(res.output));
        }
        return;
    }

    std::vector<std::string> argv = {settings_.binary, "run", "-d", "-t", "-i", "--name", spec.name};
    for (const auto& [key, value] : spec.environment) {
        argv.push_back("-e");
        argv.push_back(key + "=" + value);
    }
    argv.push_back(spec.image);
    argv.push_back("/bin/sh");
    argv.push_back("-c");
    argv.push_back(spec.command);

    logger_->info("🐳 Creating container {} from {}", spec.name, spec.image);
    auto res = SubProcess::run(argv, control_options(settings_.start_timeout_seconds));
    if (res.timed_out) {
        throw InfraError("Timed out after " + std::to_string(settings_.start_timeout_seconds) +
                         "s creating container " + spec.name + " from " + spec.image);
    }
    if (!res.success) {
        throw InfraError("Failed to create container " + spec.name + ": " + trim(res.output));
    }
}

void DockerRuntime::stop() {
    if (container_name_.empty()) return;
    auto stopped = SubProcess::run(std::vector<std::string>{settings_.binary, "stop", container_name_},
                                   control_options(settings_.control_timeout_seconds));
    if (!stopped.success) {
        logger_->warn("docker stop {} failed: {}", container_name_, trim(stopped.output));
    }
    auto removed = SubProcess::run(std::vector<std::string>{settings_.binary, "rm", "-f", container_name_},
                                   control_options(settings_.control_timeout_seconds));
    if (!removed.success) {
        logger_->warn("docker rm {} failed: {}", container_name_, trim(removed.output));
    } else {
        logger_->info("🧹 Removed container {}", container_name_);
    }
}

void DockerRuntime::close() {
    if (closed_) return;
    closed_ = true;
    try {
        stop();
    } catch (const std::exception& e) {
        logger_->error("Error closing container {}: {}", container_name_, e.what());
    }
    container_name_.clear();
}

std::vector<std::string> DockerRuntime::exec_argv(const std::string& line, const std::string& workdir) const {
    std::vector<std::string> argv = {settings_.binary, "exec"};
    if (!workdir.empty()) {
        argv.push_back("-w");
        argv.push_back(workdir);
    }
    argv.push_back("-e");
    argv.push_back("PATH=" + (settings_.path_env.empty() ? std::string(SANDBOX_PATH) : settings_.path_env));
    argv.push_back(container_name_);
    argv.push_back("/bin/sh");
    argv.push_back("-c");
    argv.push_back(line);
    return argv;
}

CommandExecutor::Call DockerRuntime::make_exec_call(const std::string& code, int timeout_seconds,
                                                    const std::string& args, const std::string& workdir) const {
    // Everything is captured by value: the worker may outlive this runtime.
    auto argv = exec_argv(CommandExecutor::build_shell_command(workdir, timeout_seconds, code, args), workdir);
    auto kill_after = std::chrono::seconds(timeout_seconds + 2 * OUTER_DEADLINE_MARGIN_SECONDS);
    return [argv, kill_after]() {
        ProcessOptions options;
        options.timeout = kill_after;
        auto res = SubProcess::run(argv, options);
        RawExecResult raw;
        raw.combined = std::move(res.output);
        raw.stdout_data = std::move(res.stdout_data);
        raw.stderr_data = std::move(res.stderr_data);
        if (!res.timed_out) raw.exit_code = res.exit_code;
        return raw;
    };
}

ExecResult DockerRuntime::run(const std::string& code, int timeout_seconds,
                              const std::string& args, const std::string& workdir) {
    if (container_name_.empty()) return {"Error: container is not running", "-1"};
    return executor_.run(timeout_seconds, make_exec_call(code, timeout_seconds, args, workdir));
}

DemuxResult DockerRuntime::demux_run(const std::string& code, int timeout_seconds,
                                     const std::string& args, const std::string& workdir) {
    if (container_name_.empty()) return {"", "Error: container is not running", "-1"};
    return executor_.demux_run(timeout_seconds, make_exec_call(code, timeout_seconds, args, workdir));
}

void DockerRuntime::copy_to_container(const std::string& src_path, const std::string& dest_path) {
    fs::path dest(dest_path);
    std::string dest_dir = dest.parent_path().string();
    if (dest_dir.empty()) dest_dir = "/";

    std::string archive;
    try {
        archive = TarArchive::pack(src_path, dest.filename().string());
    } catch (const std::exception& e) {
        throw InfraError("Failed to archive " + src_path + ": " + e.what());
    }

    auto res = SubProcess::run(std::vector<std::string>{
        settings_.binary, "cp", "-", container_name_ + ":" + dest_dir
    }, control_options(settings_.control_timeout_seconds, std::move(archive)));

    if (!res.success) {
        throw InfraError("Failed to copy " + src_path + " to " + container_name_ + ":" + dest_path +
                         ": " + trim(res.output));
    }
    logger_->debug("Copied {} to {}:{}", src_path, container_name_, dest_path);
}

}
