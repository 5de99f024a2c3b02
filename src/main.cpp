#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <memory>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iomanip>
#include <chrono>
#include <vector>
#include <optional>
#include <algorithm>

#include "session/SandboxSession.hpp"
#include "runtime/ExecutionBackend.hpp"
#include "task/TaskDescriptor.hpp"
#include "utils/Logging.hpp"
#include "Errors.hpp"

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

struct DriverArgs {
    std::string task_file;
    std::string backend = "docker";
    std::string output_dir = "timing_results";
};

void print_usage() {
    std::cerr << "Usage: evalbox_golden --task <file.json> [--backend docker|kubernetes|apptainer]"
                 " [--output <dir>]\n";
}

bool parse_args(int argc, char** argv, DriverArgs& args) {
    for (int i = 1; i < argc; ++i) {
        std::string flag = argv[i];
        if (flag == "-h" || flag == "--help") return false;
        if (i + 1 >= argc) {
            std::cerr << "Missing value for " << flag << "\n";
            return false;
        }
        std::string value = argv[++i];
        if (flag == "--task") args.task_file = value;
        else if (flag == "--backend") args.backend = value;
        else if (flag == "--output") args.output_dir = value;
        else {
            std::cerr << "Unknown option " << flag << "\n";
            return false;
        }
    }
    return !args.task_file.empty();
}

class TimingResults {
public:
    explicit TimingResults(std::string task_file) : task_file_(std::move(task_file)) {}

    void add(const std::string& operation, double seconds) { timings_.push_back({operation, seconds}); }

    double total() const {
        double sum = 0.0;
        for (const auto& [_, seconds] : timings_) sum += seconds;
        return sum;
    }

    void print_summary() const {
        const std::string rule(80, '=');
        const std::string thin(80, '-');
        std::cout << "\n" << rule << "\nTiming Results for " << task_file_ << "\n" << rule << "\n";
        std::cout << "Image: " << (image.empty() ? "Unknown" : image) << "\n" << thin << "\n";

        auto sorted = timings_;
        std::sort(sorted.begin(), sorted.end(), [](const auto& a, const auto& b) { return a.second > b.second; });
        std::cout << std::fixed << std::setprecision(2);
        for (const auto& [operation, seconds] : sorted) {
            std::cout << std::left << std::setw(40) << operation << ": " << std::right << std::setw(8) << seconds << "s\n";
        }
        std::cout << thin << "\n" << std::left << std::setw(40) << "TOTAL TIME" << ": " << std::right
                  << std::setw(8) << total() << "s\n";
        if (reward) {
            std::cout << std::left << std::setw(40) << "REWARD" << ": " << *reward << "\n";
            std::cout << std::left << std::setw(40) << "SUCCESS" << ": " << (success ? "YES" : "NO") << "\n";
        }
        std::cout << rule << "\n" << std::endl;
    }

    json to_json() const {
        json timings = json::object();
        for (const auto& [operation, seconds] : timings_) timings[operation] = seconds;
        return {
            {"task_file", task_file_},
            {"docker_image", image},
            {"timings", timings},
            {"reward", reward ? json(*reward) : json(nullptr)},
            {"success", success},
            {"total_time", total()},
        };
    }

    std::string image;
    std::optional<double> reward;
    bool success = false;

private:
    std::string task_file_;
    std::vector<std::pair<std::string, double>> timings_;
};

template <typename Fn>
auto timed(TimingResults& results, const std::string& operation, Fn&& fn) {
    auto t_start = std::chrono::high_resolution_clock::now();
    auto value = fn();
    auto t_end = std::chrono::high_resolution_clock::now();
    double seconds = std::chrono::duration<double>(t_end - t_start).count();
    results.add(operation, seconds);
    spdlog::info("⏱️ {} took {:.2f}s", operation, seconds);
    return value;
}

void write_results(const TimingResults& results, const std::string& output_dir) {
    std::error_code ec;
    fs::create_directories(output_dir, ec);
    if (ec) {
        spdlog::error("❌ Cannot create {}: {}", output_dir, ec.message());
        return;
    }
    auto stamp = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    fs::path file = fs::path(output_dir) / ("golden_patch_" + std::to_string(stamp) + ".json");
    std::ofstream out(file);
    if (!out) {
        spdlog::error("❌ Cannot write {}", file.string());
        return;
    }
    out << results.to_json().dump(2) << "\n";
    spdlog::info("💾 Results written to {}", file.string());
}

} // namespace

int main(int argc, char** argv) {
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
    spdlog::set_level(evalbox::level_from_env());

    DriverArgs args;
    if (!parse_args(argc, argv, args)) {
        print_usage();
        return 2;
    }

    TimingResults results(args.task_file);
    try {
        auto kind = evalbox::parse_backend_kind(args.backend);

        auto task = timed(results, "Load task", [&] { return evalbox::TaskDescriptor::from_file(args.task_file); });
        auto patch = task.get_string("patch");
        if (!patch) throw evalbox::ConfigError("Task has no 'patch' field");
        spdlog::info("📄 Golden patch length: {} characters", patch->size());

        auto session = timed(results, "Initialize environment", [&] {
            evalbox::SessionOptions options;
            options.logger = evalbox::get_logger("evalbox_golden");
            return std::make_unique<evalbox::SandboxSession>(task, kind, options);
        });
        results.image = session->image();

        auto applied = timed(results, "Apply golden patch", [&] { return session->apply_patch(*patch); });
        spdlog::info("Apply exit code: {}", applied.exit_code);
        if (!applied.ok()) spdlog::warn("⚠️ Patch application failed: {}", applied.output);

        auto outcome = timed(results, "Calculate reward (run tests)", [&] {
            return session->calculate_reward_with_output(evalbox::TEST_TIMEOUT_SECONDS);
        });
        results.reward = outcome.reward;
        results.success = outcome.reward == 1.0;

        timed(results, "Close environment", [&] {
            session->close();
            return true;
        });
    } catch (const std::exception& e) {
        spdlog::error("❌ Golden patch run failed: {}", e.what());
        results.success = false;
    }

    results.print_summary();
    write_results(results, args.output_dir);
    return results.success ? 0 : 1;
}
