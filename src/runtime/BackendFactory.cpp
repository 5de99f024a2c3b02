#include "runtime/BackendFactory.hpp"
#include "runtime/DockerRuntime.hpp"
#include "runtime/KubernetesRuntime.hpp"
#include "runtime/CprKubeClient.hpp"
#include "runtime/ApptainerRuntime.hpp"
#include "Errors.hpp"

namespace evalbox {

std::unique_ptr<ExecutionBackend> BackendFactory::create(BackendKind kind, const RuntimeConfig& config,
                                                         std::shared_ptr<spdlog::logger> logger) {
    switch (kind) {
        case BackendKind::Docker:
            return std::make_unique<DockerRuntime>(config.docker, logger);
        case BackendKind::Kubernetes: {
            auto client = std::make_shared<CprKubeClient>(config.kubernetes);
            return std::make_unique<KubernetesRuntime>(config.kubernetes, client, logger);
        }
        case BackendKind::Apptainer:
            return std::make_unique<ApptainerRuntime>(config.apptainer, logger);
    }
    throw ConfigError("unsupported backend kind");
}

}
