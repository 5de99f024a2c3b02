#pragma once
#include <string>
#include <vector>
#include "runtime/ExecutionBackend.hpp"
#include "runtime/CommandExecutor.hpp"
#include "RuntimeConfig.hpp"

namespace evalbox {

// Unprivileged HPC sandbox: a named apptainer instance with a writable tmpfs
// overlay. The image filesystem is often read-only, so the run script is
// probed for across several locations.
class ApptainerRuntime : public ExecutionBackend {
public:
    ApptainerRuntime(ApptainerSettings settings, std::shared_ptr<spdlog::logger> logger);
    ~ApptainerRuntime() override;

    void start(const ContainerSpec& spec) override;
    void stop() override;
    void close() override;

    ExecResult run(const std::string& code, int timeout_seconds = CMD_TIMEOUT_SECONDS,
                   const std::string& args = "", const std::string& workdir = "") override;
    DemuxResult demux_run(const std::string& code, int timeout_seconds = CMD_TIMEOUT_SECONDS,
                          const std::string& args = "", const std::string& workdir = "") override;

    void copy_to_container(const std::string& src_path, const std::string& dest_path) override;

    std::string backend_name() const override { return "apptainer"; }
    std::string resolve_image(const std::string& image) const override;
    ScriptLookup run_script_lookup(const std::string& alt_path, const std::string& repo_path) const override;
    std::string describe() const override { return instance_name_; }

    // Environment exports prepended to every command.
    std::string env_prefix() const;

private:
    std::vector<std::string> exec_argv(const std::string& line) const;
    CommandExecutor::Call make_exec_call(const std::string& code, int timeout_seconds,
                                         const std::string& args, const std::string& workdir) const;
    void log_cache_state(const std::string& uri) const;

    ApptainerSettings settings_;
    CommandExecutor executor_;
    std::string instance_name_;
    bool closed_ = false;
};

}
