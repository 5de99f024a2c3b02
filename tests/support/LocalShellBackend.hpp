#pragma once
#include <string>
#include <vector>
#include <filesystem>
#include "runtime/ExecutionBackend.hpp"
#include "runtime/CommandExecutor.hpp"
#include "utils/SubProcess.hpp"
#include "Errors.hpp"

namespace evalbox {
namespace testing_support {

// Runs sandbox commands directly on the host through /bin/sh. Paths inside the
// "sandbox" are host paths, so tests point repo/alt at scratch directories.
class LocalShellBackend : public ExecutionBackend {
public:
    explicit LocalShellBackend(std::shared_ptr<spdlog::logger> logger)
        : executor_("LocalShell", logger) {
        logger_ = std::move(logger);
    }

    void start(const ContainerSpec& spec) override { name_ = spec.name; }
    void stop() override { name_.clear(); }
    void close() override { stop(); }

    ExecResult run(const std::string& code, int timeout_seconds, const std::string& args,
                   const std::string& workdir) override {
        return executor_.run(timeout_seconds, make_call(code, timeout_seconds, args, workdir));
    }

    DemuxResult demux_run(const std::string& code, int timeout_seconds, const std::string& args,
                          const std::string& workdir) override {
        return executor_.demux_run(timeout_seconds, make_call(code, timeout_seconds, args, workdir));
    }

    void copy_to_container(const std::string& src_path, const std::string& dest_path) override {
        namespace fs = std::filesystem;
        std::error_code ec;
        fs::create_directories(fs::path(dest_path).parent_path(), ec);
        fs::copy(src_path, dest_path,
                 fs::copy_options::overwrite_existing | fs::copy_options::recursive, ec);
        if (ec) throw InfraError("local copy failed: " + ec.message());
    }

    std::string backend_name() const override { return "local"; }
    std::string describe() const override { return name_; }

private:
    static CommandExecutor::Call make_call(const std::string& code, int timeout_seconds,
                                           const std::string& args, const std::string& workdir) {
        std::vector<std::string> argv = {
            "/bin/sh", "-c", CommandExecutor::build_shell_command(workdir, timeout_seconds, code, args)
        };
        return [argv]() {
            auto res = SubProcess::run(argv);
            RawExecResult raw;
            raw.combined = res.output;
            raw.stdout_data = res.stdout_data;
            raw.stderr_data = res.stderr_data;
            raw.exit_code = res.exit_code;
            return raw;
        };
    }

    CommandExecutor executor_;
    std::string name_;
};

} // namespace testing_support
} // namespace evalbox
