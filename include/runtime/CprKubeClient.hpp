#pragma once
#include <string>
#include <vector>
#include <optional>
#include "runtime/KubeClient.hpp"
#include "RuntimeConfig.hpp"

namespace evalbox {

// Where the API server lives and how to authenticate against it.
struct KubeConnection {
    std::string server;        // https://host:port
    std::string token;
    std::string ca_file;
    std::string cert_file;
    std::string key_file;
    bool insecure_skip_tls_verify = false;
    std::string kubeconfig;    // handed to kubectl for exec; empty in-cluster
};

// REST client for pods over cpr. Exec goes through KubectlExecStream.
class CprKubeClient : public KubeClient {
public:
    // In-cluster service account when available, kubeconfig otherwise. Throws ConfigError.
    explicit CprKubeClient(KubernetesSettings settings);
    CprKubeClient(KubernetesSettings settings, KubeConnection connection);
    ~CprKubeClient() override;

    CprKubeClient(const CprKubeClient&) = delete;
    CprKubeClient& operator=(const CprKubeClient&) = delete;

    static std::optional<KubeConnection> in_cluster_connection();
    // Current context of a kubeconfig file. Inline *-data fields are written to temp files.
    static KubeConnection kubeconfig_connection(const std::string& path, std::vector<std::string>& temp_files);

    PodInfo read_pod(const std::string& ns, const std::string& name) override;
    PodInfo create_pod(const std::string& ns, const nlohmann::json& body) override;
    void delete_pod(const std::string& ns, const std::string& name,
                    int grace_period_seconds, bool force) override;
    void watch_pods(const std::string& ns, const WatchOptions& options,
                    const WatchCallback& callback) override;
    std::unique_ptr<ExecStream> open_exec(const std::string& ns, const std::string& pod,
                                          const std::string& container,
                                          const std::vector<std::string>& command,
                                          bool with_stdin) override;

    const KubeConnection& connection() const { return connection_; }

private:
    std::string pods_url(const std::string& ns) const;

    KubernetesSettings settings_;
    KubeConnection connection_;
    std::vector<std::string> temp_files_;
};

std::string base64_decode(const std::string& in);

}
