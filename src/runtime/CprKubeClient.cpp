#include "runtime/CprKubeClient.hpp"
#include "runtime/KubectlExecStream.hpp"
#include "utils/Identifiers.hpp"
#include "Errors.hpp"
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <filesystem>
#include <exception>
#include <string_view>
#include <cpr/cpr.h>
#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>

namespace evalbox {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

constexpr char SERVICE_ACCOUNT_DIR[] = "/var/run/secrets/kubernetes.io/serviceaccount";

std::string read_text_file(const fs::path& path) {
    std::ifstream f(path, std::ios::binary);
    std::stringstream buffer;
    buffer << f.rdbuf();
    return buffer.str();
}

std::string trim_newlines(std::string s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' ')) s.pop_back();
    return s;
}

std::string write_temp_file(const std::string& data, const std::string& suffix,
                            std::vector<std::string>& temp_files) {
    fs::path path = fs::temp_directory_path() / ("evalbox-kube-" + unique_suffix() + suffix);
    {
        std::ofstream out(path, std::ios::binary);
        if (!out.is_open()) throw ConfigError("cannot write " + path.string());
        out << data;
    }
    fs::permissions(path, fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::replace);
    temp_files.push_back(path.string());
    return path.string();
}

// Relative paths in a kubeconfig are relative to the file itself.
std::string resolve_relative(const std::string& value, const fs::path& base_dir) {
    if (value.empty()) return value;
    fs::path p(value);
    return p.is_absolute() ? value : (base_dir / p).string();
}

YAML::Node find_named(const YAML::Node& list, const std::string& name, const char* inner) {
    if (!list || !list.IsSequence()) return YAML::Node();
    for (const auto& entry : list) {
        if (entry["name"] && entry["name"].as<std::string>() == name) return entry[inner];
    }
    return YAML::Node();
}

std::string yaml_string(const YAML::Node& node, const char* key) {
    if (!node || !node[key]) return "";
    return node[key].as<std::string>();
}

// Either a path field or its inline base64 *-data twin.
std::string credential_file(const YAML::Node& node, const char* path_key, const char* data_key,
                            const std::string& suffix, const fs::path& base_dir,
                            std::vector<std::string>& temp_files) {
    std::string path = yaml_string(node, path_key);
    if (!path.empty()) return resolve_relative(path, base_dir);
    std::string data = yaml_string(node, data_key);
    if (!data.empty()) return write_temp_file(base64_decode(data), suffix, temp_files);
    return "";
}

std::string default_kubeconfig_path(const KubernetesSettings& settings) {
    if (!settings.kubeconfig.empty()) {
        // $KUBECONFIG may list several files; the first one wins
        auto colon = settings.kubeconfig.find(':');
        return colon == std::string::npos ? settings.kubeconfig : settings.kubeconfig.substr(0, colon);
    }
    const char* home = std::getenv("HOME");
    return (fs::path(home ? home : "/root") / ".kube" / "config").string();
}

void configure(cpr::Session& session, const KubeConnection& conn, const std::string& url,
               int timeout_seconds) {
    session.SetUrl(cpr::Url{url});

    cpr::Header header{{"Accept", "application/json"}, {"Content-Type", "application/json"}};
    if (!conn.token.empty()) header["Authorization"] = "Bearer " + conn.token;
    session.SetHeader(header);

    if (timeout_seconds > 0) session.SetTimeout(cpr::Timeout{std::chrono::seconds(timeout_seconds)});

    if (conn.insecure_skip_tls_verify) {
        session.SetVerifySsl(cpr::VerifySsl{false});
        return;
    }
    cpr::SslOptions ssl;
    if (!conn.ca_file.empty()) ssl.SetOption(cpr::ssl::CaInfo{std::string(conn.ca_file)});
    if (!conn.cert_file.empty()) ssl.SetOption(cpr::ssl::CertFile{std::string(conn.cert_file)});
    if (!conn.key_file.empty()) ssl.SetOption(cpr::ssl::KeyFile{std::string(conn.key_file)});
    session.SetSslOptions(ssl);
}

std::string status_message(const std::string& body) {
    auto j = json::parse(body, nullptr, false);
    if (!j.is_discarded() && j.is_object() && j.contains("message") && j["message"].is_string()) {
        return j["message"].get<std::string>();
    }
    return body;
}

void check_response(const cpr::Response& r, const std::string& what) {
    if (r.error.code != cpr::ErrorCode::OK) {
        throw KubeApiError(0, what + ": " + r.error.message);
    }
    if (r.status_code < 200 || r.status_code >= 300) {
        throw KubeApiError(static_cast<int>(r.status_code), what + ": " + status_message(r.text));
    }
}

json parse_body(const cpr::Response& r, const std::string& what) {
    auto j = json::parse(r.text, nullptr, false);
    if (j.is_discarded()) throw KubeApiError(static_cast<int>(r.status_code), what + ": invalid JSON response");
    return j;
}

} // namespace

std::string base64_decode(const std::string& in) {
    std::string out;
    std::vector<int> T(256, -1);
    static const char* code = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    for (int i = 0; i < 64; i++) T[static_cast<unsigned char>(code[i])] = i;

    // only the low 24 bits are ever consumed
    uint32_t val = 0;
    int valb = -8;
    for (unsigned char c : in) {
        if (c == '\n' || c == '\r' || c == ' ') continue;
        if (T[c] == -1) break;
        val = ((val << 6) | static_cast<uint32_t>(T[c])) & 0xFFFFFF;
        valb += 6;
        if (valb >= 0) {
            out.push_back(char((val >> valb) & 0xFF));
            valb -= 8;
        }
    }
    return out;
}

PodInfo PodInfo::from_json(const json& pod) {
    PodInfo info;
    if (!pod.is_object()) return info;
    if (pod.contains("metadata")) {
        const auto& meta = pod["metadata"];
        info.name = meta.value("name", "");
        info.resource_version = meta.value("resourceVersion", "");
    }
    if (pod.contains("status") && pod["status"].is_object()) {
        info.phase = pod["status"].value("phase", "");
    }
    return info;
}

std::optional<KubeConnection> CprKubeClient::in_cluster_connection() {
    const char* host = std::getenv("KUBERNETES_SERVICE_HOST");
    const char* port = std::getenv("KUBERNETES_SERVICE_PORT");
    fs::path token_path = fs::path(SERVICE_ACCOUNT_DIR) / "token";
    if (!host || !port || !*host || !fs::exists(token_path)) return std::nullopt;

    KubeConnection conn;
    std::string h(host);
    if (h.find(':') != std::string::npos) h = "[" + h + "]";  // IPv6
    conn.server = "https://" + h + ":" + port;
    conn.token = trim_newlines(read_text_file(token_path));
    fs::path ca = fs::path(SERVICE_ACCOUNT_DIR) / "ca.crt";
    if (fs::exists(ca)) conn.ca_file = ca.string();
    return conn;
}

KubeConnection CprKubeClient::kubeconfig_connection(const std::string& path, std::vector<std::string>& temp_files) {
    if (!fs::exists(path)) throw ConfigError("kubeconfig not found: " + path);

    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw ConfigError("cannot parse kubeconfig " + path + ": " + e.what());
    }

    try {
        std::string context_name = yaml_string(root, "current-context");
        YAML::Node context = find_named(root["contexts"], context_name, "context");
        if (!context) throw ConfigError("kubeconfig " + path + " has no context '" + context_name + "'");

        YAML::Node cluster = find_named(root["clusters"], yaml_string(context, "cluster"), "cluster");
        if (!cluster) throw ConfigError("kubeconfig " + path + ": cluster of context '" + context_name + "' not found");
        YAML::Node user = find_named(root["users"], yaml_string(context, "user"), "user");

        fs::path base_dir = fs::path(path).parent_path();
        KubeConnection conn;
        conn.kubeconfig = path;
        conn.server = yaml_string(cluster, "server");
        if (conn.server.empty()) throw ConfigError("kubeconfig " + path + ": cluster has no server");
        conn.insecure_skip_tls_verify = cluster["insecure-skip-tls-verify"] &&
                                        cluster["insecure-skip-tls-verify"].as<bool>();
        conn.ca_file = credential_file(cluster, "certificate-authority", "certificate-authority-data",
                                       ".ca.crt", base_dir, temp_files);
        if (user) {
            conn.token = yaml_string(user, "token");
            std::string token_file = yaml_string(user, "tokenFile");
            if (conn.token.empty() && !token_file.empty()) {
                conn.token = trim_newlines(read_text_file(resolve_relative(token_file, base_dir)));
            }
            conn.cert_file = credential_file(user, "client-certificate", "client-certificate-data",
                                             ".crt", base_dir, temp_files);
            conn.key_file = credential_file(user, "client-key", "client-key-data",
                                            ".key", base_dir, temp_files);
        }
        return conn;
    } catch (const YAML::Exception& e) {
        throw ConfigError("invalid kubeconfig " + path + ": " + e.what());
    }
}

CprKubeClient::CprKubeClient(KubernetesSettings settings)
    : settings_(std::move(settings)) {
    if (auto in_cluster = in_cluster_connection()) {
        connection_ = *in_cluster;
        spdlog::info("☸️ Using in-cluster service account for {}", connection_.server);
    } else {
        connection_ = kubeconfig_connection(default_kubeconfig_path(settings_), temp_files_);
        spdlog::info("☸️ Using kubeconfig {} for {}", connection_.kubeconfig, connection_.server);
    }
}

CprKubeClient::CprKubeClient(KubernetesSettings settings, KubeConnection connection)
    : settings_(std::move(settings)), connection_(std::move(connection)) {}

CprKubeClient::~CprKubeClient() {
    for (const auto& path : temp_files_) {
        std::error_code ec;
        fs::remove(path, ec);
    }
}

std::string CprKubeClient::pods_url(const std::string& ns) const {
    return connection_.server + "/api/v1/namespaces/" + ns + "/pods";
}

PodInfo CprKubeClient::read_pod(const std::string& ns, const std::string& name) {
    cpr::Session session;
    configure(session, connection_, pods_url(ns) + "/" + name, settings_.request_timeout_seconds);
    auto r = session.Get();
    check_response(r, "read pod " + name);
    return PodInfo::from_json(parse_body(r, "read pod " + name));
}

PodInfo CprKubeClient::create_pod(const std::string& ns, const json& body) {
    std::string name = body.contains("metadata") ? body["metadata"].value("name", "") : "";
    cpr::Session session;
    configure(session, connection_, pods_url(ns), settings_.request_timeout_seconds);
    session.SetBody(cpr::Body{body.dump()});
    auto r = session.Post();
    check_response(r, "create pod " + name);
    return PodInfo::from_json(parse_body(r, "create pod " + name));
}

void CprKubeClient::delete_pod(const std::string& ns, const std::string& name,
                               int grace_period_seconds, bool force) {
    json options = {
        {"kind", "DeleteOptions"},
        {"apiVersion", "v1"},
        {"gracePeriodSeconds", grace_period_seconds},
    };
    if (force) options["propagationPolicy"] = "Background";

    cpr::Session session;
    configure(session, connection_, pods_url(ns) + "/" + name, settings_.request_timeout_seconds);
    session.SetBody(cpr::Body{options.dump()});
    auto r = session.Delete();
    check_response(r, "delete pod " + name);
}

void CprKubeClient::watch_pods(const std::string& ns, const WatchOptions& options,
                               const WatchCallback& callback) {
    cpr::Parameters params{{"watch", "true"}};
    if (!options.field_selector.empty()) params.Add({"fieldSelector", options.field_selector});
    if (!options.resource_version.empty()) params.Add({"resourceVersion", options.resource_version});
    if (options.timeout_seconds > 0) params.Add({"timeoutSeconds", std::to_string(options.timeout_seconds)});

    cpr::Session session;
    // The server ends the watch at timeoutSeconds; the client bound is a backstop.
    int client_timeout = options.timeout_seconds > 0 ? options.timeout_seconds + 30 : 0;
    configure(session, connection_, pods_url(ns), client_timeout);
    session.SetParameters(params);

    std::string pending;
    bool stopped = false;
    std::optional<KubeApiError> stream_error;
    std::exception_ptr callback_error;

    // One JSON event per line. Returning false from the write callback aborts the transfer.
    session.SetWriteCallback(cpr::WriteCallback{[&](std::string_view data, intptr_t) -> bool {
        pending.append(data.data(), data.size());
        size_t nl;
        while ((nl = pending.find('\n')) != std::string::npos) {
            std::string line = pending.substr(0, nl);
            pending.erase(0, nl + 1);
            if (line.empty()) continue;

            auto event = json::parse(line, nullptr, false);
            if (event.is_discarded() || !event.is_object()) continue;

            std::string type = event.value("type", "");
            const json object = event.contains("object") ? event["object"] : json::object();
            if (type == "ERROR") {
                int code = object.is_object() ? object.value("code", 500) : 500;
                std::string message = object.is_object() ? object.value("message", "watch error") : "watch error";
                stream_error.emplace(code, "watch pods: " + message);
                return false;
            }

            try {
                if (!callback(WatchEvent{type, PodInfo::from_json(object)})) {
                    stopped = true;
                    return false;
                }
            } catch (...) {
                // rethrown below, outside of curl
                callback_error = std::current_exception();
                return false;
            }
        }
        return true;
    }});

    auto r = session.Get();

    if (callback_error) std::rethrow_exception(callback_error);
    if (stream_error) throw *stream_error;
    if (stopped) return;

    if (r.error.code != cpr::ErrorCode::OK) {
        throw KubeApiError(0, "watch pods: " + r.error.message);
    }
    if (r.status_code < 200 || r.status_code >= 300) {
        throw KubeApiError(static_cast<int>(r.status_code), "watch pods: " + status_message(pending));
    }
}

std::unique_ptr<ExecStream> CprKubeClient::open_exec(const std::string& ns, const std::string& pod,
                                                     const std::string& container,
                                                     const std::vector<std::string>& command,
                                                     bool with_stdin) {
    auto argv = KubectlExecStream::build_argv(settings_.kubectl_binary, connection_.kubeconfig,
                                              ns, pod, container, command, with_stdin);
    return std::make_unique<KubectlExecStream>(argv, std::chrono::seconds(settings_.request_timeout_seconds));
}

}
