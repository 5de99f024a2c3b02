#include <gtest/gtest.h>
#include <cstdint>
#include <deque>
#include <mutex>
#include <utility>
#include "runtime/KubernetesRuntime.hpp"
#include "runtime/CprKubeClient.hpp"
#include "utils/TarArchive.hpp"
#include "Errors.hpp"
#include "support/TestHelpers.hpp"

namespace evalbox {
namespace {

using json = nlohmann::json;
using testing_support::TempDir;
using testing_support::quiet_logger;
using testing_support::read_text;
using testing_support::write_text;

// Exec channel with canned output; closes after the first update.
class FakeExecStream : public ExecStream {
public:
    FakeExecStream(std::string out, std::string err, std::optional<int> rc, std::string* stdin_sink)
        : out_(std::move(out)), err_(std::move(err)), rc_(rc), stdin_sink_(stdin_sink) {}

    bool is_open() const override { return open_; }
    void update(std::chrono::milliseconds) override { open_ = false; }
    bool peek_stdout() const override { return !out_.empty(); }
    bool peek_stderr() const override { return !err_.empty(); }
    std::string read_stdout() override { return std::exchange(out_, ""); }
    std::string read_stderr() override { return std::exchange(err_, ""); }
    void write_stdin(const std::string& data) override {
        if (stdin_sink_) *stdin_sink_ += data;
    }
    void close() override { open_ = false; }
    void terminate() override { open_ = false; }
    std::optional<int> returncode() const override { return rc_; }

private:
    bool open_ = true;
    std::string out_;
    std::string err_;
    std::optional<int> rc_;
    std::string* stdin_sink_;
};

struct ExecReply {
    std::string out;
    std::string err;
    std::optional<int> rc;
};

class FakeKubeClient : public KubeClient {
public:
    // Scripted behaviour. A status of 0 in create_errors means "succeed".
    std::deque<int> read_errors;             // consumed per read_pod; empty = phase below
    std::string read_phase = "Running";
    std::deque<int> create_errors;
    std::deque<std::vector<WatchEvent>> watches;
    bool watch_throws = false;
    std::deque<ExecReply> exec_replies;
    int delete_error = 0;

    // Observations.
    std::vector<json> created;
    std::vector<std::pair<std::string, bool>> deletes;   // name, force
    std::vector<WatchOptions> watch_options;
    std::vector<std::vector<std::string>> exec_commands;
    std::deque<std::string> stdin_payloads;

    PodInfo read_pod(const std::string&, const std::string& name) override {
        if (!read_errors.empty()) {
            int status = read_errors.front();
            read_errors.pop_front();
            if (status != 0) throw KubeApiError(status, "read failed");
        }
        return {name, read_phase, "7"};
    }

    PodInfo create_pod(const std::string&, const json& body) override {
        created.push_back(body);
        if (!create_errors.empty()) {
            int status = create_errors.front();
            create_errors.pop_front();
            if (status != 0) throw KubeApiError(status, "create failed");
        }
        return {body["metadata"]["name"].get<std::string>(), "Pending", "42"};
    }

    void delete_pod(const std::string&, const std::string& name, int, bool force) override {
        deletes.emplace_back(name, force);
        if (delete_error != 0) throw KubeApiError(delete_error, "delete failed");
    }

    void watch_pods(const std::string&, const WatchOptions& options, const WatchCallback& callback) override {
        watch_options.push_back(options);
        if (watch_throws) throw KubeApiError(0, "watch connection reset");
        if (watches.empty()) return;
        auto events = watches.front();
        watches.pop_front();
        for (const auto& event : events) {
            if (!callback(event)) return;
        }
    }

    std::unique_ptr<ExecStream> open_exec(const std::string&, const std::string&, const std::string&,
                                          const std::vector<std::string>& command, bool with_stdin) override {
        std::lock_guard<std::mutex> lock(mutex_);
        exec_commands.push_back(command);
        ExecReply reply{"", "", 0};
        if (!exec_replies.empty()) {
            reply = exec_replies.front();
            exec_replies.pop_front();
        }
        std::string* sink = nullptr;
        if (with_stdin) {
            stdin_payloads.emplace_back();
            sink = &stdin_payloads.back();
        }
        return std::make_unique<FakeExecStream>(reply.out, reply.err, reply.rc, sink);
    }

private:
    std::mutex mutex_;
};

WatchEvent event(const std::string& type, const std::string& phase) {
    return {type, {"pod-1", phase, "8"}};
}

class KubernetesRuntimeTest : public ::testing::Test {
protected:
    KubernetesRuntime make_runtime() {
        return KubernetesRuntime(settings_, client_, quiet_logger(),
                                 [this](std::chrono::seconds s) { sleeps_.push_back(static_cast<int>(s.count())); });
    }

    ContainerSpec spec(const std::string& name = "pod-1") const {
        ContainerSpec s;
        s.image = "org/image:tag";
        s.name = name;
        s.command = "/bin/bash";
        s.environment["LANG"] = "C.UTF-8";
        return s;
    }

    // Starts a runtime against a pod that already exists.
    void attach(KubernetesRuntime& runtime) {
        runtime.start(spec());
    }

    KubernetesSettings settings_;
    std::shared_ptr<FakeKubeClient> client_ = std::make_shared<FakeKubeClient>();
    std::vector<int> sleeps_;
};

// ========== pod body ==========

TEST_F(KubernetesRuntimeTest, PodBodyCarriesSchedulingFields) {
    auto runtime = make_runtime();
    json body = runtime.build_pod_body(spec());

    EXPECT_EQ(body["metadata"]["name"], "pod-1");
    EXPECT_EQ(body["spec"]["restartPolicy"], "Never");
    const json& container = body["spec"]["containers"][0];
    EXPECT_EQ(container["image"], "org/image:tag");
    EXPECT_EQ(container["command"], json::array({"/bin/sh", "-c"}));
    EXPECT_EQ(container["args"], json::array({"/bin/bash"}));
    EXPECT_TRUE(container["stdin"].get<bool>());
    EXPECT_TRUE(container["tty"].get<bool>());
    EXPECT_EQ(container["resources"]["requests"]["cpu"], "1");
    EXPECT_EQ(container["resources"]["requests"]["memory"], "1Gi");
    EXPECT_EQ(container["env"][0]["name"], "PATH");
    EXPECT_EQ(container["env"][1], json({{"name", "LANG"}, {"value", "C.UTF-8"}}));
    EXPECT_EQ(body["spec"]["imagePullSecrets"][0]["name"], "dockerhub-pro");
    EXPECT_EQ(body["spec"]["nodeSelector"]["karpenter.sh/nodepool"], "bigcpu-standby");
    EXPECT_EQ(body["spec"]["tolerations"][0]["tolerationSeconds"], 10800);
}

TEST_F(KubernetesRuntimeTest, PathFromEnvironmentWins) {
    auto runtime = make_runtime();
    auto s = spec();
    s.environment["PATH"] = "/custom/bin";
    json env = runtime.build_pod_body(s)["spec"]["containers"][0]["env"];
    EXPECT_EQ(env.size(), 2u);
    EXPECT_EQ(env[0]["value"], "/custom/bin");
}

TEST_F(KubernetesRuntimeTest, SessionNamesAreUuids) {
    auto runtime = make_runtime();
    std::string a = runtime.make_session_name("org/image:tag");
    std::string b = runtime.make_session_name("org/image:tag");
    EXPECT_EQ(a.size(), 36u);
    EXPECT_NE(a, b);
}

// ========== create ==========

TEST_F(KubernetesRuntimeTest, NonTransientCreateErrorRaisesWithoutSleeping) {
    client_->create_errors = {400};
    auto runtime = make_runtime();
    EXPECT_THROW(runtime.create_with_retry(runtime.build_pod_body(spec())), InfraError);
    EXPECT_EQ(client_->created.size(), 1u);
    EXPECT_TRUE(sleeps_.empty());
}

TEST_F(KubernetesRuntimeTest, TransientCreateErrorsExhaustRetries) {
    client_->create_errors = {503, 503, 503, 503, 503};
    auto runtime = make_runtime();
    try {
        runtime.create_with_retry(runtime.build_pod_body(spec()));
        FAIL() << "expected InfraError";
    } catch (const InfraError& e) {
        EXPECT_NE(std::string(e.what()).find("Exceeded retry limit (5)"), std::string::npos);
    }
    EXPECT_EQ(client_->created.size(), 5u);
    EXPECT_EQ(sleeps_, (std::vector<int>{5, 10, 20, 40}));
}

TEST_F(KubernetesRuntimeTest, BackoffIsCapped) {
    settings_.create_max_retries = 8;
    client_->create_errors = {429, 429, 429, 429, 429, 429, 429, 429};
    auto runtime = make_runtime();
    EXPECT_THROW(runtime.create_with_retry(runtime.build_pod_body(spec())), InfraError);
    EXPECT_EQ(sleeps_, (std::vector<int>{5, 10, 20, 40, 60, 60, 60}));
}

TEST_F(KubernetesRuntimeTest, CreateSucceedsAfterTransientErrors) {
    client_->create_errors = {409, 500, 0};
    auto runtime = make_runtime();
    PodInfo pod = runtime.create_with_retry(runtime.build_pod_body(spec()));
    EXPECT_EQ(pod.name, "pod-1");
    EXPECT_EQ(pod.resource_version, "42");
    EXPECT_EQ(sleeps_, (std::vector<int>{5, 10}));
}

// ========== start and wait ==========

TEST_F(KubernetesRuntimeTest, StartReusesExistingPod) {
    auto runtime = make_runtime();
    runtime.start(spec());
    EXPECT_TRUE(client_->created.empty());
    EXPECT_EQ(runtime.describe(), "pod-1");
}

TEST_F(KubernetesRuntimeTest, StartCreatesAndWatchesUntilRunning) {
    client_->read_errors = {404};
    client_->watches = {{event("ADDED", "Pending"), event("MODIFIED", "Pending"), event("MODIFIED", "Running")}};
    auto runtime = make_runtime();
    runtime.start(spec());

    ASSERT_EQ(client_->created.size(), 1u);
    ASSERT_EQ(client_->watch_options.size(), 1u);
    EXPECT_EQ(client_->watch_options[0].field_selector, "metadata.name=pod-1");
    EXPECT_EQ(client_->watch_options[0].resource_version, "42");
    EXPECT_EQ(client_->watch_options[0].timeout_seconds, 1200);
}

TEST_F(KubernetesRuntimeTest, ReadErrorOtherThanNotFoundRaises) {
    client_->read_errors = {403};
    auto runtime = make_runtime();
    EXPECT_THROW(runtime.start(spec()), InfraError);
    EXPECT_TRUE(client_->created.empty());
}

TEST_F(KubernetesRuntimeTest, TerminalPhaseRaisesImmediately) {
    client_->watches = {{event("ADDED", "Pending"), event("MODIFIED", "Failed"), event("MODIFIED", "Running")}};
    auto runtime = make_runtime();
    try {
        runtime.wait_until_running("pod-1", "42");
        FAIL() << "expected InfraError";
    } catch (const InfraError& e) {
        EXPECT_NE(std::string(e.what()).find("terminal phase 'Failed'"), std::string::npos);
    }
}

TEST_F(KubernetesRuntimeTest, WatchFailureFallsBackToDirectRead) {
    client_->watch_throws = true;
    auto runtime = make_runtime();
    EXPECT_NO_THROW(runtime.wait_until_running("pod-1", "42"));

    client_->read_phase = "Pending";
    EXPECT_THROW(runtime.wait_until_running("pod-1", "42"), InfraError);
}

TEST_F(KubernetesRuntimeTest, WatchEndingEarlyChecksOnce) {
    client_->watches = {{event("ADDED", "Pending")}};
    client_->read_phase = "Pending";
    auto runtime = make_runtime();
    EXPECT_THROW(runtime.wait_until_running("pod-1", "42"), InfraError);
}

// ========== delete ==========

TEST_F(KubernetesRuntimeTest, DeleteWaitsForDeletedEvent) {
    client_->watches = {{event("MODIFIED", "Running"), event("DELETED", "Running")}};
    auto runtime = make_runtime();
    runtime.delete_pod_and_wait("pod-1");
    ASSERT_EQ(client_->deletes.size(), 1u);
    EXPECT_FALSE(client_->deletes[0].second);
}

TEST_F(KubernetesRuntimeTest, DeleteConfirmedByNotFound) {
    client_->watches = {{event("MODIFIED", "Running")}};
    client_->read_errors = {404};
    auto runtime = make_runtime();
    runtime.delete_pod_and_wait("pod-1");
    EXPECT_EQ(client_->deletes.size(), 1u);
}

TEST_F(KubernetesRuntimeTest, LingeringPodIsForceDeleted) {
    client_->watches = {{event("MODIFIED", "Running")}};
    auto runtime = make_runtime();
    runtime.delete_pod_and_wait("pod-1");
    ASSERT_EQ(client_->deletes.size(), 2u);
    EXPECT_TRUE(client_->deletes[1].second);
}

TEST_F(KubernetesRuntimeTest, DeleteOfMissingPodIsNoOp) {
    client_->delete_error = 404;
    auto runtime = make_runtime();
    EXPECT_NO_THROW(runtime.delete_pod_and_wait("pod-1"));
    EXPECT_TRUE(client_->watch_options.empty());
}

TEST_F(KubernetesRuntimeTest, CloseDeletesOnce) {
    client_->watches = {{event("DELETED", "Running")}};
    {
        auto runtime = make_runtime();
        attach(runtime);
        runtime.close();
        runtime.close();
    }
    EXPECT_EQ(client_->deletes.size(), 1u);
}

// ========== exec and copy ==========

TEST_F(KubernetesRuntimeTest, RunBeforeStartIsRejected) {
    auto runtime = make_runtime();
    EXPECT_EQ(runtime.run("ls").exit_code, "-1");
}

TEST_F(KubernetesRuntimeTest, ExecMapsReturnCodes) {
    client_->exec_replies = {
        {"hello\n", "", 0},
        {"", "boom\n", 2},
        {"", "", INNER_TIMEOUT_EXIT_CODE},
        {"partial", "", std::nullopt},
    };
    auto runtime = make_runtime();
    attach(runtime);

    auto ok = runtime.run("echo", 30, "hello", "/testbed");
    EXPECT_EQ(ok.exit_code, "0");
    EXPECT_EQ(ok.output, "hello\n");
    ASSERT_EQ(client_->exec_commands.size(), 1u);
    EXPECT_EQ(client_->exec_commands[0],
              (std::vector<std::string>{"/bin/sh", "-c", "cd /testbed && timeout 30 echo hello"}));

    auto failed = runtime.run("false");
    EXPECT_EQ(failed.exit_code, "Error: Exit code 2");
    EXPECT_EQ(failed.output, "boom\n");

    auto timed_out = runtime.run("sleep 100", 3);
    EXPECT_EQ(timed_out.exit_code, "-1");
    EXPECT_EQ(timed_out.output, CommandExecutor::timeout_message(3));

    EXPECT_EQ(runtime.run("lost").exit_code, "-1");
}

TEST_F(KubernetesRuntimeTest, DemuxKeepsStreamsApart) {
    client_->exec_replies = {{"out", "err", 0}};
    auto runtime = make_runtime();
    attach(runtime);
    auto res = runtime.demux_run("cmd");
    EXPECT_EQ(res.stdout_data, "out");
    EXPECT_EQ(res.stderr_data, "err");
    EXPECT_EQ(res.exit_code, "0");
}

TEST_F(KubernetesRuntimeTest, CopyStreamsTarIntoParentDirectory) {
    TempDir src("evalbox_kube_src");
    write_text(src / "fix.patch", "diff\n");
    auto runtime = make_runtime();
    attach(runtime);

    runtime.copy_to_container((src / "fix.patch").string(), "/tmp/session.patch");
    ASSERT_EQ(client_->exec_commands.size(), 1u);
    EXPECT_EQ(client_->exec_commands[0], (std::vector<std::string>{"tar", "xmf", "-", "-C", "/tmp"}));
    ASSERT_EQ(client_->stdin_payloads.size(), 1u);
    const std::string& archive = client_->stdin_payloads[0];
    EXPECT_EQ(archive.size() % TarArchive::BLOCK_SIZE, 0u);
    EXPECT_EQ(archive.compare(0, 13, "session.patch"), 0);
}

TEST_F(KubernetesRuntimeTest, CopyRetriesWithFullArchive) {
    TempDir src("evalbox_kube_src");
    write_text(src / "f.txt", "payload");
    client_->exec_replies = {{"", "tar: short read", 2}, {"", "", 0}};
    auto runtime = make_runtime();
    attach(runtime);

    runtime.copy_to_container((src / "f.txt").string(), "/work/f.txt");
    ASSERT_EQ(client_->stdin_payloads.size(), 2u);
    EXPECT_EQ(client_->stdin_payloads[0], client_->stdin_payloads[1]);
    EXPECT_EQ(sleeps_, (std::vector<int>{5}));
}

TEST_F(KubernetesRuntimeTest, CopyGivesUpAfterRetries) {
    TempDir src("evalbox_kube_src");
    write_text(src / "f.txt", "payload");
    settings_.copy_max_retries = 3;
    client_->exec_replies = {{"", "", 1}, {"", "", 1}, {"", "", 1}};
    auto runtime = make_runtime();
    attach(runtime);

    EXPECT_THROW(runtime.copy_to_container((src / "f.txt").string(), "/work/f.txt"), InfraError);
    EXPECT_EQ(client_->stdin_payloads.size(), 3u);
    EXPECT_EQ(sleeps_, (std::vector<int>{5, 10}));
}

// ========== kubeconfig ==========

TEST(KubeconfigTest, CurrentContextSelectsClusterAndUser) {
    TempDir dir("evalbox_kubeconfig");
    write_text(dir / "token.txt", "file-token\n");
    write_text(dir / "config",
               "apiVersion: v1\n"
               "current-context: work\n"
               "contexts:\n"
               "- name: home\n"
               "  context: {cluster: other, user: nobody}\n"
               "- name: work\n"
               "  context: {cluster: prod, user: ci}\n"
               "clusters:\n"
               "- name: prod\n"
               "  cluster:\n"
               "    server: https://10.0.0.1:6443\n"
               "    certificate-authority-data: Q0EtQlVORExF\n"
               "users:\n"
               "- name: ci\n"
               "  user:\n"
               "    tokenFile: token.txt\n");

    std::vector<std::string> temp_files;
    auto conn = CprKubeClient::kubeconfig_connection((dir / "config").string(), temp_files);
    EXPECT_EQ(conn.server, "https://10.0.0.1:6443");
    EXPECT_EQ(conn.token, "file-token");
    ASSERT_EQ(temp_files.size(), 1u);
    EXPECT_EQ(conn.ca_file, temp_files[0]);
    EXPECT_EQ(read_text(conn.ca_file), "CA-BUNDLE");
    for (const auto& f : temp_files) std::filesystem::remove(f);
}

TEST(KubeconfigTest, MissingContextIsConfigError) {
    TempDir dir("evalbox_kubeconfig");
    write_text(dir / "config", "apiVersion: v1\ncurrent-context: absent\ncontexts: []\n");
    std::vector<std::string> temp_files;
    EXPECT_THROW(CprKubeClient::kubeconfig_connection((dir / "config").string(), temp_files), ConfigError);
    EXPECT_THROW(CprKubeClient::kubeconfig_connection((dir / "nope").string(), temp_files), ConfigError);
}

TEST(KubeconfigTest, Base64Decode) {
    EXPECT_EQ(base64_decode("aGVsbG8gd29ybGQ="), "hello world");
    EXPECT_EQ(base64_decode("aGVs\nbG8="), "hello");
}

TEST(KubeconfigTest, Base64DecodeLongCertificateBody) {
    // Every byte value, repeated: long enough to cover a PEM bundle.
    std::string raw;
    for (int round = 0; round < 8; ++round) {
        for (int b = 0; b < 256; ++b) raw.push_back(static_cast<char>(b));
    }
    static const char* alphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    std::string encoded;
    for (size_t i = 0; i < raw.size(); i += 3) {
        uint32_t n = static_cast<uint32_t>(static_cast<unsigned char>(raw[i])) << 16;
        if (i + 1 < raw.size()) n |= static_cast<uint32_t>(static_cast<unsigned char>(raw[i + 1])) << 8;
        if (i + 2 < raw.size()) n |= static_cast<unsigned char>(raw[i + 2]);
        encoded.push_back(alphabet[(n >> 18) & 63]);
        encoded.push_back(alphabet[(n >> 12) & 63]);
        encoded.push_back(i + 1 < raw.size() ? alphabet[(n >> 6) & 63] : '=');
        encoded.push_back(i + 2 < raw.size() ? alphabet[n & 63] : '=');
        if (encoded.size() % 65 == 64) encoded.push_back('\n');
    }
    ASSERT_GT(encoded.size(), 2000u);
    EXPECT_EQ(base64_decode(encoded), raw);
    EXPECT_EQ(base64_decode("TG9yZW0gaXBzdW0gZG9sb3Igc2l0IGFtZXQ="), "Lorem ipsum dolor sit amet");
}

} // namespace
} // namespace evalbox
