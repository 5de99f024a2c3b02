#pragma once
#include <string>
#include <vector>
#include <memory>
#include <chrono>
#include <optional>
#include <functional>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace evalbox {

// Non-2xx answer from the API server, or a transport failure (status 0).
class KubeApiError : public std::runtime_error {
public:
    KubeApiError(int status, const std::string& what)
        : std::runtime_error("(" + std::to_string(status) + ") " + what), status_(status) {}

    int status() const { return status_; }

private:
    int status_;
};

struct PodInfo {
    std::string name;
    std::string phase;
    std::string resource_version;

    static PodInfo from_json(const nlohmann::json& pod);
};

struct WatchEvent {
    std::string type;   // ADDED, MODIFIED, DELETED, ERROR
    PodInfo pod;
};

struct WatchOptions {
    std::string field_selector;
    std::string resource_version;
    int timeout_seconds = 0;
};

// Bidirectional exec channel into a container.
class ExecStream {
public:
    virtual ~ExecStream() = default;

    virtual bool is_open() const = 0;
    // Waits up to `timeout` for new data.
    virtual void update(std::chrono::milliseconds timeout) = 0;

    virtual bool peek_stdout() const = 0;
    virtual bool peek_stderr() const = 0;
    virtual std::string read_stdout() = 0;
    virtual std::string read_stderr() = 0;

    virtual void write_stdin(const std::string& data) = 0;
    // Signals end of input and waits for the remote process to finish.
    virtual void close() = 0;
    // Abandons the remote process.
    virtual void terminate() = 0;

    // Exit status once the stream has closed.
    virtual std::optional<int> returncode() const = 0;
};

// The subset of the core/v1 API a sandbox needs.
class KubeClient {
public:
    // Return false to stop watching.
    using WatchCallback = std::function<bool(const WatchEvent&)>;

    virtual ~KubeClient() = default;

    // Throws KubeApiError (404 when the pod does not exist).
    virtual PodInfo read_pod(const std::string& ns, const std::string& name) = 0;
    virtual PodInfo create_pod(const std::string& ns, const nlohmann::json& body) = 0;
    virtual void delete_pod(const std::string& ns, const std::string& name,
                            int grace_period_seconds, bool force) = 0;

    // Blocks until the callback returns false or the server ends the watch.
    virtual void watch_pods(const std::string& ns, const WatchOptions& options,
                            const WatchCallback& callback) = 0;

    virtual std::unique_ptr<ExecStream> open_exec(const std::string& ns, const std::string& pod,
                                                  const std::string& container,
                                                  const std::vector<std::string>& command,
                                                  bool with_stdin) = 0;
};

}
