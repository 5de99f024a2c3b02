#pragma once
#include <string>
#include <map>
#include <memory>
#include <optional>
#include <spdlog/spdlog.h>
#include "runtime/ExecutionBackend.hpp"
#include "task/TaskDescriptor.hpp"
#include "task/TaskMode.hpp"
#include "grading/RewardEngine.hpp"
#include "RuntimeConfig.hpp"
#include "constants.hpp"

namespace evalbox {

struct SessionOptions {
    std::string docker_image;                    // overrides the descriptor's image
    std::string repo_path = "/testbed";
    std::string alt_path = "/root";
    std::string command = "/bin/bash";
    std::map<std::string, std::string> environment;
    std::shared_ptr<spdlog::logger> logger;      // default: the "SandboxSession" logger
    bool auto_start = true;                      // start() and setup() in the constructor
};

// One task attempt in one sandbox. Operations on a session must be issued
// sequentially; separate sessions share nothing.
class SandboxSession {
public:
    // Throws ConfigError for a bad descriptor, InfraError when auto_start fails.
    SandboxSession(TaskDescriptor task, BackendKind kind, SessionOptions options = {},
                   RuntimeConfig config = RuntimeConfig::load());
    SandboxSession(TaskDescriptor task, std::unique_ptr<ExecutionBackend> backend,
                   SessionOptions options = {}, RuntimeConfig config = {});
    ~SandboxSession();

    SandboxSession(const SandboxSession&) = delete;
    SandboxSession& operator=(const SandboxSession&) = delete;

    // Brings the sandbox up under session_name(). Throws InfraError.
    void start();
    // Mode-specific bootstrap. Logs failures, never throws.
    void setup();

    // workdir defaults to repo_path().
    ExecResult run(const std::string& code, int timeout_seconds = CMD_TIMEOUT_SECONDS,
                   const std::string& args = "", const std::optional<std::string>& workdir = std::nullopt);
    DemuxResult demux_run(const std::string& code, int timeout_seconds = CMD_TIMEOUT_SECONDS,
                          const std::string& args = "", const std::optional<std::string>& workdir = std::nullopt);

    ExecResult checkout(const std::string& commit_hash);
    ExecResult apply_patch(const std::string& patch);
    ExecResult reverse_patch(const std::string& patch);
    std::string get_patch();

    // Stages the content next to `path` and renames it into place.
    ExecResult create_file(const std::string& path, const std::string& content);
    std::string read_file(const std::string& rel_path);

    ExecResult run_tests(int timeout_seconds = TEST_TIMEOUT_SECONDS);
    DemuxResult demux_run_tests(int timeout_seconds = TEST_TIMEOUT_SECONDS);
    std::string run_swebv_regression(const std::optional<std::string>& script = std::nullopt,
                                     int timeout_seconds = TEST_TIMEOUT_SECONDS);

    std::string get_task_instruction() const;

    double calculate_reward(int timeout_seconds = TEST_TIMEOUT_SECONDS);
    RewardOutcome calculate_reward_with_output(int timeout_seconds = TEST_TIMEOUT_SECONDS);

    ExecResult start_new_branch();
    ExecResult commit_after_step(int step_idx);
    ExecResult undo_last_commit();
    std::string get_current_commit_hash();
    ExecResult soft_git_reset();

    // Destroys the sandbox and brings up a fresh one with the same name.
    void reset();
    // Idempotent; also called by the destructor.
    void close();

    const TaskDescriptor& task() const { return task_; }
    const TaskMode& mode() const { return resolved_.mode; }
    const std::string& image() const { return resolved_.image; }
    const std::string& session_name() const { return session_name_; }
    const std::string& repo_path() const { return repo_path_; }
    const std::string& alt_path() const { return alt_path_; }
    std::string repo_name() const;
    ExecutionBackend& backend() { return *backend_; }
    std::shared_ptr<spdlog::logger> logger() const { return logger_; }
    bool is_closed() const { return closed_; }

private:
    void initialize(std::unique_ptr<ExecutionBackend> backend);

    void setup_default();
    void setup_verified();
    void setup_smith(const SmithMode& mode);
    void install_helper_package();
    std::string smith_run_script(const SmithMode& mode) const;
    // Fixed location, else the first probed candidate that exists.
    std::optional<std::string> locate_run_script();

    // Writes `content` to a host temp file and copies it to `dest`. Throws InfraError.
    void stage_file(const std::string& content, const std::string& host_name, const std::string& dest);
    ExecResult stage_and_apply(const std::string& patch, const std::string& git_args);
    std::string alt_join(const std::string& rel) const;

    TaskDescriptor task_;
    SessionOptions options_;
    RuntimeConfig config_;
    std::shared_ptr<spdlog::logger> logger_;
    ResolvedTask resolved_;
    std::unique_ptr<ExecutionBackend> backend_;
    ContainerSpec spec_;
    std::string session_name_;
    std::string repo_path_;
    std::string alt_path_;
    std::string current_commit_;
    bool closed_ = false;
};

}
