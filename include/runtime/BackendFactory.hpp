#pragma once
#include <memory>
#include "runtime/ExecutionBackend.hpp"
#include "RuntimeConfig.hpp"

namespace evalbox {

class BackendFactory {
public:
    // Throws ConfigError when the control plane cannot be configured (e.g. no kubeconfig).
    static std::unique_ptr<ExecutionBackend> create(BackendKind kind, const RuntimeConfig& config,
                                                    std::shared_ptr<spdlog::logger> logger);
};

}
