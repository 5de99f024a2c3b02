#pragma once
#include <string>
#include <memory>
#include <chrono>
#include <functional>
#include "runtime/ExecutionBackend.hpp"
#include "runtime/CommandExecutor.hpp"
#include "runtime/KubeClient.hpp"
#include "RuntimeConfig.hpp"

namespace evalbox {

// One pod per session on a shared cluster. Pod names are fresh UUIDs so
// concurrent sandboxes of the same image never collide.
class KubernetesRuntime : public ExecutionBackend {
public:
    using SleepFn = std::function<void(std::chrono::seconds)>;

    KubernetesRuntime(KubernetesSettings settings, std::shared_ptr<KubeClient> client,
                      std::shared_ptr<spdlog::logger> logger, SleepFn sleep = nullptr);
    ~KubernetesRuntime() override;

    void start(const ContainerSpec& spec) override;
    void stop() override;
    void close() override;

    ExecResult run(const std::string& code, int timeout_seconds = CMD_TIMEOUT_SECONDS,
                   const std::string& args = "", const std::string& workdir = "") override;
    DemuxResult demux_run(const std::string& code, int timeout_seconds = CMD_TIMEOUT_SECONDS,
                          const std::string& args = "", const std::string& workdir = "") override;

    void copy_to_container(const std::string& src_path, const std::string& dest_path) override;

    std::string backend_name() const override { return "kubernetes"; }
    std::string make_session_name(const std::string& image) const override;
    std::string describe() const override { return pod_.name; }

    nlohmann::json build_pod_body(const ContainerSpec& spec) const;

    // Creates the pod, retrying transient API errors. Returns the created pod.
    PodInfo create_with_retry(const nlohmann::json& body);
    // Blocks until the pod is Running. Throws InfraError.
    void wait_until_running(const std::string& name, const std::string& resource_version);
    // Deletes the pod and waits for the deletion to be observed.
    void delete_pod_and_wait(const std::string& name);

private:
    CommandExecutor::Call make_exec_call(const std::string& code, int timeout_seconds,
                                         const std::string& args, const std::string& workdir) const;
    void sleep_for(std::chrono::seconds delay) const;

    KubernetesSettings settings_;
    std::shared_ptr<KubeClient> client_;
    SleepFn sleep_;
    CommandExecutor executor_;
    PodInfo pod_;
    bool closed_ = false;
};

}
