#pragma once
#include <string>
#include <vector>
#include <map>
#include <memory>
#include <spdlog/spdlog.h>
#include "runtime/ExecTypes.hpp"
#include "constants.hpp"

namespace evalbox {

enum class BackendKind { Docker, Kubernetes, Apptainer };

BackendKind parse_backend_kind(const std::string& name);
std::string to_string(BackendKind kind);

// What a backend needs to bring a sandbox up.
struct ContainerSpec {
    std::string image;
    std::string name;
    std::string command = "/bin/bash";
    std::map<std::string, std::string> environment;
};

// How run_tests locates the staged run script.
enum class ScriptDiscovery { Fixed, Probe };

struct ScriptLookup {
    ScriptDiscovery mode = ScriptDiscovery::Fixed;
    std::vector<std::string> candidates;  // only for Probe, in priority order
};

// One control plane. A session owns exactly one backend and never branches on
// which one it is, except through the hooks below.
class ExecutionBackend {
public:
    virtual ~ExecutionBackend() = default;

    // Brings the sandbox up or reuses one with the same name. Throws InfraError.
    virtual void start(const ContainerSpec& spec) = 0;
    // Tears the sandbox down. Best effort, never throws.
    virtual void stop() = 0;
    // stop() plus releasing the client handle. Idempotent.
    virtual void close() = 0;

    // Exit-code contract of CommandExecutor; never throws.
    virtual ExecResult run(const std::string& code, int timeout_seconds = CMD_TIMEOUT_SECONDS,
                           const std::string& args = "", const std::string& workdir = "") = 0;
    virtual DemuxResult demux_run(const std::string& code, int timeout_seconds = CMD_TIMEOUT_SECONDS,
                                  const std::string& args = "", const std::string& workdir = "") = 0;

    // Copies a host file or directory to `dest` (absolute) in the sandbox. Throws InfraError.
    virtual void copy_to_container(const std::string& src_path, const std::string& dest_path) = 0;

    virtual std::string backend_name() const = 0;

    // Name for a new sandbox running `image`.
    virtual std::string make_session_name(const std::string& image) const;
    // Image reference in the form the control plane expects.
    virtual std::string resolve_image(const std::string& image) const { return image; }
    // Where run_tests looks for the run script. {alt} and {repo} are substituted.
    virtual ScriptLookup run_script_lookup(const std::string& alt_path, const std::string& repo_path) const;

    // Handle of the live sandbox for logs; empty when stopped.
    virtual std::string describe() const = 0;

    void set_logger(std::shared_ptr<spdlog::logger> logger) { logger_ = std::move(logger); }

protected:
    std::shared_ptr<spdlog::logger> logger_;
};

std::string substitute_paths(std::string templ, const std::string& alt_path, const std::string& repo_path);

}
