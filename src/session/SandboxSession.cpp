#include "session/SandboxSession.hpp"
#include "runtime/BackendFactory.hpp"
#include "utils/FallbackChain.hpp"
#include "utils/Identifiers.hpp"
#include "utils/Logging.hpp"
#include "utils/OutputScrubber.hpp"
#include "Errors.hpp"
#include <filesystem>
#include <fstream>

namespace evalbox {

namespace fs = std::filesystem;

namespace {

template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

// Host-side temp file, removed when it goes out of scope.
class HostTempFile {
public:
    HostTempFile(const std::string& name, const std::string& content)
        : path_(fs::temp_directory_path() / name) {
        std::ofstream out(path_, std::ios::binary | std::ios::trunc);
        if (!out) throw InfraError("Cannot write host temp file: " + path_.string());
        out << content;
        if (!out.flush()) throw InfraError("Cannot write host temp file: " + path_.string());
    }
    ~HostTempFile() {
        std::error_code ec;
        fs::remove(path_, ec);
    }
    HostTempFile(const HostTempFile&) = delete;
    HostTempFile& operator=(const HostTempFile&) = delete;

    std::string path() const { return path_.string(); }

private:
    fs::path path_;
};

std::string join_path(const std::string& dir, const std::string& rel) {
    if (dir.empty() || dir == "/") return "/" + rel;
    return dir + "/" + rel;
}

} // namespace

SandboxSession::SandboxSession(TaskDescriptor task, BackendKind kind, SessionOptions options, RuntimeConfig config)
    : task_(std::move(task)),
      options_(std::move(options)),
      config_(std::move(config)),
      logger_(options_.logger ? options_.logger : get_logger("SandboxSession")),
      resolved_(resolve_task(task_, options_.docker_image, config_.session.smith_test_command)) {
    initialize(BackendFactory::create(kind, config_, logger_));
}

SandboxSession::SandboxSession(TaskDescriptor task, std::unique_ptr<ExecutionBackend> backend,
                               SessionOptions options, RuntimeConfig config)
    : task_(std::move(task)),
      options_(std::move(options)),
      config_(std::move(config)),
      logger_(options_.logger ? options_.logger : get_logger("SandboxSession")),
      resolved_(resolve_task(task_, options_.docker_image, config_.session.smith_test_command)) {
    if (!backend) throw ConfigError("SandboxSession requires an execution backend");
    initialize(std::move(backend));
}

void SandboxSession::initialize(std::unique_ptr<ExecutionBackend> backend) {
    backend_ = std::move(backend);
    backend_->set_logger(logger_);
    repo_path_ = options_.repo_path;
    alt_path_ = options_.alt_path;
    session_name_ = backend_->make_session_name(resolved_.image);

    spec_.image = resolved_.image;
    spec_.name = session_name_;
    spec_.command = options_.command;
    spec_.environment = options_.environment;

    logger_->info("📦 Session {} ({} mode, {} backend) for {}", session_name_, mode_name(resolved_.mode),
                  backend_->backend_name(), resolved_.image);

    if (options_.auto_start) {
        start();
        setup();
    }
}

SandboxSession::~SandboxSession() {
    close();
}

void SandboxSession::start() {
    backend_->start(spec_);
    closed_ = false;
    logger_->info("🚀 Sandbox ready: {}", backend_->describe());
}

// ========== setup ==========

void SandboxSession::setup() {
    try {
        std::visit(overloaded{
            [this](const VerifiedMode&) { setup_verified(); },
            [this](const SmithMode& m) { setup_smith(m); },
            [this](const DefaultMode&) { setup_default(); },
        }, resolved_.mode);
    } catch (const std::exception& e) {
        logger_->error("❌ Setup failed for {}: {}", session_name_, e.what());
    }
}

void SandboxSession::install_helper_package() {
    const std::string& pkg = config_.session.helper_package;
    if (pkg.empty()) return;

    FallbackChain chain("install " + pkg, logger_);
    for (const std::string cmd : {"uv pip install ", "python -m pip install ", "python3 -m pip install ",
                                  "pip install ", "pip install --user "}) {
        std::string line = cmd + pkg;
        chain.then(line, [this, line] { return run(line).ok(); });
    }
    if (chain.run()) logger_->debug("Installed helper package {}", pkg);
}

void SandboxSession::setup_default() {
    const std::string venv = repo_path_ + "/.venv";
    const std::string local_bin = alt_join(".local/bin");

    run("ln -s " + venv + " " + alt_join(".venv"));
    run("mkdir -p " + local_bin);
    run("ln -sf " + venv + "/bin/python " + local_bin + "/python");
    run("ln -sf " + venv + "/bin/python3 " + local_bin + "/python3");
    run("find " + venv + "/bin -type f -executable -exec ln -sf {} " + local_bin + "/ \\;");

    install_helper_package();

    const std::string& held_out = config_.session.held_out_tests_dir;
    run("find . -name '*.pyc' -delete");
    run("find . -name '__pycache__' -exec rm -rf {} +");
    run("find " + held_out + " -name '*.pyc' -delete");
    run("find " + held_out + " -name '__pycache__' -exec rm -rf {} +");

    for (const auto& skip : config_.session.skip_files) {
        run("mv " + join_path(repo_path_, skip) + " " + alt_join(skip));
    }

    const std::string held_out_name = fs::path(held_out).filename().string();
    run("mv " + held_out + " " + alt_join(held_out_name));
    run("ln -s " + alt_join(held_out_name) + " " + join_path(repo_path_, held_out_name));
    logger_->debug("Default-mode setup done for {}", session_name_);
}

void SandboxSession::setup_verified() {
    run("chmod +x /run_tests.sh");
    alt_path_ = "/";
    run("ln -s /opt/miniconda3/envs/testbed /root/.venv");
    install_helper_package();
}

std::string SandboxSession::smith_run_script(const SmithMode& mode) const {
    std::string script;
    script += "#!/bin/bash\n";
    script += "set -uxo pipefail\n";
    script += "source /opt/miniconda3/bin/activate\n";
    script += "conda activate testbed\n";
    script += "cd testbed/\n";
    script += ": '" + std::string(START_TEST_OUTPUT) + "'\n";
    script += mode.test_cmd + "\n";
    script += ": '" + std::string(END_TEST_OUTPUT) + "'\n";
    return script;
}

void SandboxSession::setup_smith(const SmithMode& mode) {
    auto fetched = run("git fetch");
    if (!fetched.ok()) logger_->warn("git fetch failed: {}", fetched.output);
    auto checked_out = checkout(mode.base_commit);
    if (!checked_out.ok()) logger_->error("❌ Cannot check out {}: {}", mode.base_commit, checked_out.output);

    stage_file(smith_run_script(mode), session_name_ + "_run_tests.sh", "/run_tests.sh");
    run("chmod +x /run_tests.sh");
    run("ln -s /opt/miniconda3/envs/testbed /root/.venv");
    run("echo 'export PATH=\"/usr/local/bin:$PATH\"' >> ~/.bashrc");
    install_helper_package();
}

// ========== commands ==========

ExecResult SandboxSession::run(const std::string& code, int timeout_seconds, const std::string& args,
                               const std::optional<std::string>& workdir) {
    return backend_->run(code, timeout_seconds, args, workdir.value_or(repo_path_));
}

DemuxResult SandboxSession::demux_run(const std::string& code, int timeout_seconds, const std::string& args,
                                      const std::optional<std::string>& workdir) {
    return backend_->demux_run(code, timeout_seconds, args, workdir.value_or(repo_path_));
}

ExecResult SandboxSession::checkout(const std::string& commit_hash) {
    return run("git checkout " + commit_hash);
}

void SandboxSession::stage_file(const std::string& content, const std::string& host_name, const std::string& dest) {
    HostTempFile tmp(host_name, content);
    backend_->copy_to_container(tmp.path(), dest);
}

ExecResult SandboxSession::stage_and_apply(const std::string& patch, const std::string& git_args) {
    const std::string name = session_name_ + "_" + make_uuid4() + ".patch";
    const std::string dest = "/tmp/" + name;
    try {
        stage_file(patch, name, dest);
    } catch (const std::exception& e) {
        logger_->error("❌ Cannot stage patch in {}: {}", session_name_, e.what());
        return {std::string("Error: ") + e.what(), "-1"};
    }
    return run("git apply " + git_args + " " + dest);
}

ExecResult SandboxSession::apply_patch(const std::string& patch) {
    return stage_and_apply(patch, "--whitespace=fix");
}

ExecResult SandboxSession::reverse_patch(const std::string& patch) {
    return stage_and_apply(patch, "--reverse --whitespace=fix");
}

std::string SandboxSession::get_patch() {
    return run("git add -A && git diff --cached").output;
}

ExecResult SandboxSession::create_file(const std::string& path, const std::string& content) {
    fs::path target = fs::path(path).is_absolute() ? fs::path(path) : fs::path(repo_path_) / path;
    const std::string dir = target.parent_path().string();
    const std::string staged = (target.parent_path() / ("." + target.filename().string() + "_" + make_uuid4())).string();

    auto made = run("mkdir -p " + shell_quote(dir));
    if (!made.ok()) return made;
    try {
        stage_file(content, fs::path(staged).filename().string(), staged);
    } catch (const std::exception& e) {
        logger_->error("❌ Cannot stage {} in {}: {}", target.string(), session_name_, e.what());
        return {std::string("Error: ") + e.what(), "-1"};
    }
    return run("mv -f " + shell_quote(staged) + " " + shell_quote(target.string()));
}

std::string SandboxSession::alt_join(const std::string& rel) const {
    return join_path(alt_path_, rel);
}

std::string SandboxSession::read_file(const std::string& rel_path) {
    return run("cat " + alt_join(rel_path)).output;
}

// ========== tests ==========

std::optional<std::string> SandboxSession::locate_run_script() {
    ScriptLookup lookup = backend_->run_script_lookup(alt_path_, repo_path_);
    if (lookup.mode == ScriptDiscovery::Fixed) {
        return lookup.candidates.empty() ? alt_join("run_tests.sh") : lookup.candidates.front();
    }

    FallbackChain probe("locate run_tests.sh", logger_);
    for (const auto& candidate : lookup.candidates) {
        probe.then("test -f " + candidate, [this, candidate] {
            return run("test -f " + shell_quote(candidate)).ok();
        });
    }
    auto found = probe.run();
    if (!found) return std::nullopt;
    return lookup.candidates[*found];
}

ExecResult SandboxSession::run_tests(int timeout_seconds) {
    auto script = locate_run_script();
    if (!script) return {"Error: run_tests.sh not found in any candidate location", "-1"};

    logger_->info("🧪 Running {} in {}", *script, session_name_);
    auto result = run("bash " + shell_quote(*script), timeout_seconds);
    result.output = strip_ansi(result.output);
    return result;
}

DemuxResult SandboxSession::demux_run_tests(int timeout_seconds) {
    auto script = locate_run_script();
    if (!script) return {"", "Error: run_tests.sh not found in any candidate location", "-1"};

    auto result = demux_run("bash " + shell_quote(*script), timeout_seconds);
    result.stdout_data = strip_ansi(result.stdout_data);
    result.stderr_data = strip_ansi(result.stderr_data);
    return result;
}

std::string SandboxSession::run_swebv_regression(const std::optional<std::string>& script, int timeout_seconds) {
    std::string body;
    if (script) {
        body = *script;
    } else {
        auto from_row = task_.get_string("run_tests_regression");
        if (!from_row) throw ConfigError("Task row has no run_tests_regression script");
        body = *from_row;
    }

    stage_file(body, session_name_ + "_run_tests_regression.sh", "/run_tests_regression.sh");
    run("chmod +x /run_tests_regression.sh");
    return run("/run_tests_regression.sh", timeout_seconds).output;
}

std::string SandboxSession::get_task_instruction() const {
    const std::string statement = task_.problem_statement();
    const std::string open = "[ISSUE]";
    const std::string close_tag = "[/ISSUE]";
    auto begin = statement.find(open);
    if (begin == std::string::npos) return statement;
    begin += open.size();
    // greedy: runs to the last closing marker, whitespace kept
    auto end = statement.rfind(close_tag);
    if (end == std::string::npos || end < begin) return statement;
    return statement.substr(begin, end - begin);
}

// ========== reward ==========

RewardOutcome SandboxSession::calculate_reward_with_output(int timeout_seconds) {
    RewardEngine engine(logger_);
    auto outcome = engine.evaluate(*this, timeout_seconds);
    logger_->info("🏁 Reward for {}: {}", session_name_, outcome.reward);
    return outcome;
}

double SandboxSession::calculate_reward(int timeout_seconds) {
    return calculate_reward_with_output(timeout_seconds).reward;
}

std::string SandboxSession::repo_name() const {
    if (std::holds_alternative<DefaultMode>(resolved_.mode)) return task_.repo_name();
    return task_.repo();
}

// ========== git helpers ==========

ExecResult SandboxSession::start_new_branch() {
    run("git config --global user.email 'you@example.com'");
    run("git config --global user.name 'Your Name'");
    auto head = run("git rev-parse HEAD");
    if (head.ok()) {
        const char* ws = " \t\r\n";
        auto last = head.output.find_last_not_of(ws);
        current_commit_ = last == std::string::npos ? "" : head.output.substr(0, last + 1);
    }
    return head;
}

ExecResult SandboxSession::commit_after_step(int step_idx) {
    run("git add .");
    return run("git commit -m '" + std::to_string(step_idx) + "'");
}

ExecResult SandboxSession::undo_last_commit() {
    return run("git reset --hard HEAD~1");
}

std::string SandboxSession::get_current_commit_hash() {
    std::string out = run("git rev-parse HEAD").output;
    const char* ws = " \t\r\n";
    auto first = out.find_first_not_of(ws);
    if (first == std::string::npos) return "";
    return out.substr(first, out.find_last_not_of(ws) - first + 1);
}

ExecResult SandboxSession::soft_git_reset() {
    if (current_commit_.empty()) return {"Error: no commit recorded by start_new_branch", "-1"};
    return run("git reset --soft " + current_commit_);
}

// ========== lifecycle ==========

void SandboxSession::reset() {
    logger_->info("🔄 Resetting sandbox {}", session_name_);
    backend_->stop();
    start();
}

void SandboxSession::close() {
    if (closed_ || !backend_) return;
    closed_ = true;
    try {
        backend_->close();
        logger_->info("🧹 Session {} closed", session_name_);
    } catch (const std::exception& e) {
        logger_->error("❌ Error closing session {}: {}", session_name_, e.what());
    }
}

}
