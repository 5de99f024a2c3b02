#pragma once
#include <memory>
#include <string>
#include <cstdlib>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace evalbox {

inline spdlog::level::level_enum level_from_env() {
    const char* level = std::getenv("EVALBOX_LOG_LEVEL");
    if (!level || !*level) return spdlog::level::info;
    return spdlog::level::from_str(level);
}

// Returns the registered logger with this name, creating a colour console
// logger on first use.
inline std::shared_ptr<spdlog::logger> get_logger(const std::string& name) {
    if (auto existing = spdlog::get(name)) return existing;
    try {
        auto logger = spdlog::stdout_color_mt(name);
        logger->set_level(level_from_env());
        logger->set_pattern("[%H:%M:%S] [%n] [%^%l%$] %v");
        return logger;
    } catch (const spdlog::spdlog_ex&) {
        // registered by another thread between get() and creation
        return spdlog::get(name);
    }
}

}
