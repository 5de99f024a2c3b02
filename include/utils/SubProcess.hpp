#pragma once
#include <string>
#include <vector>
#include <chrono>
#include <optional>
#include <map>
#include <sys/types.h>

namespace evalbox {

struct ProcessResult {
    std::string output;        // stdout and stderr in arrival order
    std::string stdout_data;
    std::string stderr_data;
    int exit_code = -1;
    bool success = false;
    bool timed_out = false;
};

struct ProcessOptions {
    std::string stdin_data;
    std::chrono::milliseconds timeout{0};           // 0 = no deadline
    std::map<std::string, std::string> environment; // added to the inherited environment
};

// A spawned child with three pipes. The child runs in its own process group so
// kill() also reaches anything it forked. Pipes are pumped by poll(); stdin is
// written without blocking so a chatty child can never deadlock the writer.
class ChildProcess {
public:
    explicit ChildProcess(const std::vector<std::string>& argv,
                          const std::map<std::string, std::string>& environment = {});
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    // Queues data for the child's stdin; flushed by poll().
    void write_stdin(const std::string& data);
    // Closes stdin once everything queued has been written.
    void close_stdin();

    // Waits up to `tick` for pipe activity and moves available data into the
    // internal buffers. Returns is_open().
    bool poll(std::chrono::milliseconds tick);

    // True while stdout or stderr can still produce data.
    bool is_open() const { return stdout_fd_ >= 0 || stderr_fd_ >= 0; }

    bool has_stdout() const { return !stdout_buf_.empty(); }
    bool has_stderr() const { return !stderr_buf_.empty(); }
    std::string read_stdout();
    std::string read_stderr();

    // Non-blocking reap; true once the child has exited.
    bool try_wait();
    // Blocking reap; returns the exit code (128 + signal for signalled children).
    int wait();
    void kill();

    std::optional<int> exit_code() const { return exit_code_; }
    pid_t pid() const { return pid_; }

private:
    void flush_stdin();
    void drain(int& fd, std::string& buffer);
    void close_fd(int& fd);
    void record_status(int status);

    pid_t pid_ = -1;
    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
    int stderr_fd_ = -1;
    std::string pending_stdin_;
    bool stdin_close_requested_ = false;
    std::string stdout_buf_;
    std::string stderr_buf_;
    std::optional<int> exit_code_;
};

class SubProcess {
public:
    // Runs argv to completion (or until the deadline, which kills the process group).
    static ProcessResult run(const std::vector<std::string>& argv, const ProcessOptions& options = {});

    // Shell form: /bin/sh -c cmd
    static ProcessResult run(const std::string& cmd, const ProcessOptions& options = {});
};

}
