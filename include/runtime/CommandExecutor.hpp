#pragma once
#include <string>
#include <memory>
#include <optional>
#include <functional>
#include <spdlog/spdlog.h>
#include "runtime/ExecTypes.hpp"

namespace evalbox {

// Runs one blocking backend call on a dedicated worker with an outer deadline
// of timeout + OUTER_DEADLINE_MARGIN_SECONDS and maps the outcome onto the
// exit code contract. Never throws.
class CommandExecutor {
public:
    using Call = std::function<RawExecResult()>;

    CommandExecutor(std::string backend_label, std::shared_ptr<spdlog::logger> logger);

    ExecResult run(int timeout_seconds, Call call) const;
    DemuxResult demux_run(int timeout_seconds, Call call) const;

    // cd <workdir> && timeout <timeout> <code> <args>
    static std::string build_shell_command(const std::string& workdir, int timeout_seconds,
                                           const std::string& code, const std::string& args);
    static std::string timeout_message(int timeout_seconds);

private:
    // nullopt when the outer deadline expired; rethrows anything the call threw.
    std::optional<RawExecResult> invoke_with_deadline(int timeout_seconds, Call call) const;

    std::string label_;
    std::shared_ptr<spdlog::logger> logger_;
};

}
