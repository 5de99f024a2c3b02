#pragma once
#include <string>
#include <vector>
#include <map>
#include <memory>
#include <chrono>
#include "runtime/KubeClient.hpp"
#include "utils/SubProcess.hpp"

namespace evalbox {

// ExecStream over a `kubectl exec` child. The exec subresource needs a
// websocket/SPDY upgrade, so the stream rides on kubectl instead of cpr.
class KubectlExecStream : public ExecStream {
public:
    // `close_timeout` bounds close(); the child is killed when it passes.
    KubectlExecStream(const std::vector<std::string>& argv,
                      std::chrono::seconds close_timeout,
                      const std::map<std::string, std::string>& environment = {});

    // kubectl [--kubeconfig K] -n NS exec [-i] POD -c CONTAINER -- COMMAND...
    static std::vector<std::string> build_argv(const std::string& kubectl, const std::string& kubeconfig,
                                               const std::string& ns, const std::string& pod,
                                               const std::string& container,
                                               const std::vector<std::string>& command, bool with_stdin);

    bool is_open() const override;
    void update(std::chrono::milliseconds timeout) override;

    bool peek_stdout() const override { return child_.has_stdout(); }
    bool peek_stderr() const override { return child_.has_stderr(); }
    std::string read_stdout() override { return child_.read_stdout(); }
    std::string read_stderr() override { return child_.read_stderr(); }

    void write_stdin(const std::string& data) override;
    void close() override;
    void terminate() override;

    std::optional<int> returncode() const override { return child_.exit_code(); }

private:
    ChildProcess child_;
    std::chrono::seconds close_timeout_;
};

}
