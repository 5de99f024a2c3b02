#include "runtime/KubectlExecStream.hpp"

namespace evalbox {

KubectlExecStream::KubectlExecStream(const std::vector<std::string>& argv,
                                     std::chrono::seconds close_timeout,
                                     const std::map<std::string, std::string>& environment)
    : child_(argv, environment), close_timeout_(close_timeout) {}

std::vector<std::string> KubectlExecStream::build_argv(const std::string& kubectl, const std::string& kubeconfig,
                                                       const std::string& ns, const std::string& pod,
                                                       const std::string& container,
                                                       const std::vector<std::string>& command, bool with_stdin) {
    std::vector<std::string> argv = {kubectl};
    if (!kubeconfig.empty()) {
        argv.push_back("--kubeconfig");
        argv.push_back(kubeconfig);
    }
    argv.insert(argv.end(), {"-n", ns, "exec"});
    if (with_stdin) argv.push_back("-i");
    argv.insert(argv.end(), {pod, "-c", container, "--"});
    argv.insert(argv.end(), command.begin(), command.end());
    return argv;
}

bool KubectlExecStream::is_open() const {
    return child_.is_open();
}

void KubectlExecStream::update(std::chrono::milliseconds timeout) {
    if (!child_.poll(timeout)) {
        // pipes are closed; reap so returncode() becomes available
        child_.wait();
    }
}

void KubectlExecStream::write_stdin(const std::string& data) {
    child_.write_stdin(data);
}

void KubectlExecStream::close() {
    child_.close_stdin();
    auto deadline = std::chrono::steady_clock::now() + close_timeout_;
    while (child_.poll(std::chrono::milliseconds(100))) {
        if (std::chrono::steady_clock::now() >= deadline) {
            child_.kill();
            break;
        }
    }
    child_.wait();
}

void KubectlExecStream::terminate() {
    child_.kill();
    child_.wait();
}

}
