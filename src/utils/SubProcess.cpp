#include "utils/SubProcess.hpp"
#include <mutex>
#include <algorithm>
#include <stdexcept>
#include <thread>
#include <cerrno>
#include <cstring>
#include <csignal>
#include <system_error>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <sys/wait.h>

extern char** environ;

namespace evalbox {

namespace {

constexpr size_t READ_CHUNK = 64 * 1024;
constexpr auto RUN_TICK = std::chrono::milliseconds(50);

void ignore_sigpipe_once() {
    static std::once_flag flag;
    std::call_once(flag, []() { std::signal(SIGPIPE, SIG_IGN); });
}

void set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags >= 0) fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

std::vector<std::string> build_environment(const std::map<std::string, std::string>& overrides) {
    std::vector<std::string> env;
    for (char** e = environ; e && *e; ++e) {
        std::string entry(*e);
        auto eq = entry.find('=');
        std::string key = eq == std::string::npos ? entry : entry.substr(0, eq);
        if (overrides.count(key)) continue;
        env.push_back(std::move(entry));
    }
    for (const auto& [key, value] : overrides) {
        env.push_back(key + "=" + value);
    }
    return env;
}

} // namespace

ChildProcess::ChildProcess(const std::vector<std::string>& argv,
                           const std::map<std::string, std::string>& environment) {
    if (argv.empty()) throw std::invalid_argument("ChildProcess: empty argv");
    ignore_sigpipe_once();

    int in_pipe[2], out_pipe[2], err_pipe[2];
    if (pipe2(in_pipe, O_CLOEXEC) == -1) {
        throw std::system_error(errno, std::generic_category(), "pipe2(stdin)");
    }
    if (pipe2(out_pipe, O_CLOEXEC) == -1) {
        int err = errno;
        ::close(in_pipe[0]); ::close(in_pipe[1]);
        throw std::system_error(err, std::generic_category(), "pipe2(stdout)");
    }
    if (pipe2(err_pipe, O_CLOEXEC) == -1) {
        int err = errno;
        ::close(in_pipe[0]); ::close(in_pipe[1]);
        ::close(out_pipe[0]); ::close(out_pipe[1]);
        throw std::system_error(err, std::generic_category(), "pipe2(stderr)");
    }

    // Everything the child needs is prepared before fork().
    std::vector<char*> c_argv;
    for (const auto& a : argv) c_argv.push_back(const_cast<char*>(a.c_str()));
    c_argv.push_back(nullptr);

    std::vector<std::string> env = build_environment(environment);
    std::vector<char*> c_env;
    for (auto& e : env) c_env.push_back(const_cast<char*>(e.c_str()));
    c_env.push_back(nullptr);

    pid_ = fork();
    if (pid_ == -1) {
        int err = errno;
        for (int fd : {in_pipe[0], in_pipe[1], out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1]}) ::close(fd);
        throw std::system_error(err, std::generic_category(), "fork");
    }

    if (pid_ == 0) {
        setpgid(0, 0);
        std::signal(SIGPIPE, SIG_DFL);
        dup2(in_pipe[0], STDIN_FILENO);
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        execvpe(c_argv[0], c_argv.data(), c_env.data());
        const char msg[] = "exec failed: ";
        (void)!write(STDERR_FILENO, msg, sizeof(msg) - 1);
        (void)!write(STDERR_FILENO, c_argv[0], strlen(c_argv[0]));
        (void)!write(STDERR_FILENO, "\n", 1);
        _exit(127);
    }

    setpgid(pid_, pid_);
    ::close(in_pipe[0]);
    ::close(out_pipe[1]);
    ::close(err_pipe[1]);
    stdin_fd_ = in_pipe[1];
    stdout_fd_ = out_pipe[0];
    stderr_fd_ = err_pipe[0];
    set_nonblocking(stdin_fd_);
    set_nonblocking(stdout_fd_);
    set_nonblocking(stderr_fd_);
}

ChildProcess::~ChildProcess() {
    if (!exit_code_ && pid_ > 0) {
        kill();
        wait();
    }
    close_fd(stdin_fd_);
    close_fd(stdout_fd_);
    close_fd(stderr_fd_);
}

void ChildProcess::write_stdin(const std::string& data) {
    if (stdin_fd_ < 0) throw std::runtime_error("ChildProcess: stdin already closed");
    pending_stdin_ += data;
    flush_stdin();
}

void ChildProcess::close_stdin() {
    stdin_close_requested_ = true;
    if (pending_stdin_.empty()) close_fd(stdin_fd_);
}

void ChildProcess::flush_stdin() {
    while (stdin_fd_ >= 0 && !pending_stdin_.empty()) {
        ssize_t n = ::write(stdin_fd_, pending_stdin_.data(), pending_stdin_.size());
        if (n > 0) {
            pending_stdin_.erase(0, static_cast<size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return;
        // EPIPE: the child stopped reading, nothing more can be delivered
        pending_stdin_.clear();
        close_fd(stdin_fd_);
    }
    if (stdin_close_requested_ && pending_stdin_.empty()) close_fd(stdin_fd_);
}

void ChildProcess::drain(int& fd, std::string& buffer) {
    char chunk[READ_CHUNK];
    while (fd >= 0) {
        ssize_t n = ::read(fd, chunk, sizeof(chunk));
        if (n > 0) {
            buffer.append(chunk, static_cast<size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return;
        close_fd(fd);
    }
}

bool ChildProcess::poll(std::chrono::milliseconds tick) {
    std::vector<pollfd> fds;
    if (stdout_fd_ >= 0) fds.push_back({stdout_fd_, POLLIN, 0});
    if (stderr_fd_ >= 0) fds.push_back({stderr_fd_, POLLIN, 0});
    if (stdin_fd_ >= 0 && !pending_stdin_.empty()) fds.push_back({stdin_fd_, POLLOUT, 0});

    if (fds.empty()) {
        std::this_thread::sleep_for(std::min(tick, RUN_TICK));
        return is_open();
    }

    int rc = ::poll(fds.data(), fds.size(), static_cast<int>(tick.count()));
    if (rc < 0) {
        if (errno == EINTR) return is_open();
        throw std::system_error(errno, std::generic_category(), "poll");
    }

    for (const auto& p : fds) {
        if (p.revents == 0) continue;
        if (p.fd == stdin_fd_) {
            if (p.revents & (POLLERR | POLLHUP)) {
                pending_stdin_.clear();
                close_fd(stdin_fd_);
            } else {
                flush_stdin();
            }
        } else if (p.fd == stdout_fd_) {
            drain(stdout_fd_, stdout_buf_);
        } else if (p.fd == stderr_fd_) {
            drain(stderr_fd_, stderr_buf_);
        }
    }
    return is_open();
}

std::string ChildProcess::read_stdout() {
    std::string out;
    out.swap(stdout_buf_);
    return out;
}

std::string ChildProcess::read_stderr() {
    std::string out;
    out.swap(stderr_buf_);
    return out;
}

void ChildProcess::record_status(int status) {
    if (WIFEXITED(status)) {
        exit_code_ = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        exit_code_ = 128 + WTERMSIG(status);
    } else {
        exit_code_ = -1;
    }
}

bool ChildProcess::try_wait() {
    if (exit_code_) return true;
    int status = 0;
    pid_t r = waitpid(pid_, &status, WNOHANG);
    if (r == pid_) {
        record_status(status);
        return true;
    }
    if (r == -1 && errno != EINTR) {
        exit_code_ = -1;
        return true;
    }
    return false;
}

int ChildProcess::wait() {
    while (!exit_code_) {
        int status = 0;
        pid_t r = waitpid(pid_, &status, 0);
        if (r == pid_) {
            record_status(status);
        } else if (r == -1 && errno != EINTR) {
            exit_code_ = -1;
        }
    }
    return *exit_code_;
}

void ChildProcess::kill() {
    if (pid_ > 0 && !exit_code_) {
        ::kill(-pid_, SIGKILL);
        ::kill(pid_, SIGKILL);
    }
}

void ChildProcess::close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

ProcessResult SubProcess::run(const std::vector<std::string>& argv, const ProcessOptions& options) {
    ProcessResult result;
    ChildProcess child(argv, options.environment);

    if (!options.stdin_data.empty()) child.write_stdin(options.stdin_data);
    child.close_stdin();

    const bool bounded = options.timeout.count() > 0;
    const auto deadline = std::chrono::steady_clock::now() + options.timeout;

    auto collect = [&]() {
        if (child.has_stdout()) {
            std::string chunk = child.read_stdout();
            result.stdout_data += chunk;
            result.output += chunk;
        }
        if (child.has_stderr()) {
            std::string chunk = child.read_stderr();
            result.stderr_data += chunk;
            result.output += chunk;
        }
    };

    while (true) {
        bool open = child.poll(RUN_TICK);
        collect();
        if (!open && child.try_wait()) break;
        if (bounded && std::chrono::steady_clock::now() >= deadline) {
            child.kill();
            child.wait();
            // whatever was already buffered in the pipes
            child.poll(std::chrono::milliseconds(0));
            collect();
            result.timed_out = true;
            break;
        }
    }

    result.exit_code = child.wait();
    result.success = !result.timed_out && result.exit_code == 0;
    return result;
}

ProcessResult SubProcess::run(const std::string& cmd, const ProcessOptions& options) {
    return run(std::vector<std::string>{"/bin/sh", "-c", cmd}, options);
}

}
