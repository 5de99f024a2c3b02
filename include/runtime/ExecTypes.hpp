#pragma once
#include <string>
#include <optional>

namespace evalbox {

// What a backend transport produced for one exec call, before classification.
struct RawExecResult {
    std::string combined;      // stdout and stderr in arrival order
    std::string stdout_data;
    std::string stderr_data;
    std::optional<int> exit_code;
};

// Exit code contract: "0".."255" on clean exit, "-1" on timeout or transport
// failure, "Error: Exit code <n>" on non-zero exit.
struct ExecResult {
    std::string output;
    std::string exit_code;

    bool ok() const { return exit_code == "0"; }
};

struct DemuxResult {
    std::string stdout_data;
    std::string stderr_data;
    std::string exit_code;

    bool ok() const { return exit_code == "0"; }
};

}
