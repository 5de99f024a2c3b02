#pragma once
#include <string>
#include <vector>
#include "runtime/ExecutionBackend.hpp"
#include "runtime/CommandExecutor.hpp"
#include "RuntimeConfig.hpp"

namespace evalbox {

// Local container engine driven through the docker CLI. The session name is
// the container name; start() reuses a container that already carries it.
class DockerRuntime : public ExecutionBackend {
public:
    DockerRuntime(DockerSettings settings, std::shared_ptr<spdlog::logger> logger);
    ~DockerRuntime() override;

    void start(const ContainerSpec& spec) override;
    void stop() override;
    void close() override;

    ExecResult run(const std::string& code, int timeout_seconds = CMD_TIMEOUT_SECONDS,
                   const std::string& args = "", const std::string& workdir = "") override;
    DemuxResult demux_run(const std::string& code, int timeout_seconds = CMD_TIMEOUT_SECONDS,
                          const std::string& args = "", const std::string& workdir = "") override;

    void copy_to_container(const std::string& src_path, const std::string& dest_path) override;

    std::string backend_name() const override { return "docker"; }
    std::string describe() const override { return container_name_; }

    // State reported by `docker ps -a` for this name; empty when no such container exists.
    std::string container_state(const std::string& name) const;

private:
    std::vector<std::string> exec_argv(const std::string& line, const std::string& workdir) const;
    CommandExecutor::Call make_exec_call(const std::string& code, int timeout_seconds,
                                         const std::string& args, const std::string& workdir) const;

    DockerSettings settings_;
    CommandExecutor executor_;
    std::string container_name_;
    bool closed_ = false;
};

}
