#include "runtime/CommandExecutor.hpp"
#include "utils/OutputScrubber.hpp"
#include "constants.hpp"
#include <chrono>
#include <future>
#include <thread>

namespace evalbox {

CommandExecutor::CommandExecutor(std::string backend_label, std::shared_ptr<spdlog::logger> logger)
    : label_(std::move(backend_label)), logger_(std::move(logger)) {}

std::string CommandExecutor::build_shell_command(const std::string& workdir, int timeout_seconds,
                                                 const std::string& code, const std::string& args) {
    std::string command;
    if (!workdir.empty()) command += "cd " + workdir + " && ";
    command += "timeout " + std::to_string(timeout_seconds) + " " + code;
    if (!args.empty()) command += " " + args;
    return command;
}

std::string CommandExecutor::timeout_message(int timeout_seconds) {
    return "The command took too long to execute (>" + std::to_string(timeout_seconds) + "s)";
}

std::optional<RawExecResult> CommandExecutor::invoke_with_deadline(int timeout_seconds, Call call) const {
    // The worker owns the task; if the deadline passes it is detached and
    // finishes on its own without touching this executor.
    auto task = std::make_shared<std::packaged_task<RawExecResult()>>(std::move(call));
    auto future = task->get_future();
    std::thread worker([task]() { (*task)(); });

    auto deadline = std::chrono::seconds(timeout_seconds + OUTER_DEADLINE_MARGIN_SECONDS);
    if (future.wait_for(deadline) == std::future_status::timeout) {
        worker.detach();
        return std::nullopt;
    }
    worker.join();
    return future.get();
}

ExecResult CommandExecutor::run(int timeout_seconds, Call call) const {
    try {
        auto raw = invoke_with_deadline(timeout_seconds, std::move(call));
        if (!raw) {
            logger_->error("{} exec overall timeout: {}s", label_, timeout_seconds + OUTER_DEADLINE_MARGIN_SECONDS);
            return {timeout_message(timeout_seconds), "-1"};
        }
        if (!raw->exit_code) {
            logger_->error("{} exec: exit code not found", label_);
            return {raw->combined, "-1"};
        }

        int code = *raw->exit_code;
        if (code == INNER_TIMEOUT_EXIT_CODE) {
            logger_->error("{} internal timeout via 'timeout' command: {}s", label_, timeout_seconds);
            return {timeout_message(timeout_seconds), "-1"};
        }
        if (code != 0) {
            logger_->error("{} exec error: exit code {}\nError Message: {}", label_, code, raw->combined);
            return {raw->combined, "Error: Exit code " + std::to_string(code)};
        }
        return {strip_ansi(raw->combined), std::to_string(code)};
    } catch (const std::exception& e) {
        logger_->error("{} exec failed: {}", label_, e.what());
        return {std::string("Error: ") + e.what(), "-1"};
    }
}

DemuxResult CommandExecutor::demux_run(int timeout_seconds, Call call) const {
    try {
        auto raw = invoke_with_deadline(timeout_seconds, std::move(call));
        if (!raw) {
            logger_->error("{} demux exec overall timeout: {}s", label_, timeout_seconds + OUTER_DEADLINE_MARGIN_SECONDS);
            return {timeout_message(timeout_seconds), "", "-1"};
        }
        std::string out = strip_ansi(raw->stdout_data);
        std::string err = strip_ansi(raw->stderr_data);
        if (!raw->exit_code) {
            logger_->error("{} demux exec: exit code not found", label_);
            return {out, err, "-1"};
        }

        int code = *raw->exit_code;
        if (code == INNER_TIMEOUT_EXIT_CODE) {
            logger_->error("{} internal timeout via 'timeout' command: {}s", label_, timeout_seconds);
            return {timeout_message(timeout_seconds), "", "-1"};
        }
        if (code != 0) {
            logger_->error("{} exec error: exit code {}\nStdout: {}\nStderr: {}", label_, code, out, err);
            return {out, err, "Error: Exit code " + std::to_string(code)};
        }
        return {out, err, std::to_string(code)};
    } catch (const std::exception& e) {
        logger_->error("{} demux exec failed: {}", label_, e.what());
        std::string message = std::string("Error: ") + e.what();
        return {message, message, "-1"};
    }
}

}
