// Copyright (C) 2025 Simon Quigley <tsimonq2@ubuntu.com>
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <https://www.gnu.org/licenses/>.

#include "kube_client.h"
#include "utilities.h"

#include <cstdlib>
#include <format>
#include <fstream>
#include <sstream>

#include <QByteArray>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QUrl>

#include <yaml-cpp/yaml.h>

namespace {

const fs::path service_account_dir = "/var/run/secrets/kubernetes.io/serviceaccount";

std::string read_file(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) throw ClusterError("Unable to read " + path.string());
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

std::string decode_base64(const std::string& data) {
    auto decoded = QByteArray::fromBase64Encoding(QByteArray::fromStdString(data));
    if (!decoded) throw ClusterError("Invalid base64 data in kubeconfig");
    return decoded.decoded.toStdString();
}

std::string encode(const std::string& value) {
    return QUrl::toPercentEncoding(QString::fromStdString(value)).toStdString();
}

// Finds the entry called `name` in a kubeconfig list such as clusters or users
YAML::Node find_named(const YAML::Node& list, const std::string& name, const std::string& section) {
    if (list && list.IsSequence()) {
        for (const auto& entry : list) {
            if (entry["name"] && entry["name"].as<std::string>() == name) return entry[section];
        }
    }
    throw ClusterError(std::format("kubeconfig has no {} named {}", section, name));
}

std::string resolve_path(const fs::path& base, const std::string& value) {
    fs::path p(value);
    return p.is_absolute() ? p.string() : (base / p).string();
}

} // namespace

KubeConnection load_kubeconfig(const fs::path& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw ClusterError(std::format("Unable to load kubeconfig {}: {}", path.string(), e.what()));
    }

    const fs::path base = path.parent_path();
    const std::string current = root["current-context"] ? root["current-context"].as<std::string>() : "";
    if (current.empty()) throw ClusterError("kubeconfig has no current-context");

    YAML::Node context = find_named(root["contexts"], current, "context");
    YAML::Node cluster = find_named(root["clusters"], context["cluster"].as<std::string>(""), "cluster");
    KubeConnection conn;
    conn.server = cluster["server"].as<std::string>("");
    if (conn.server.empty()) throw ClusterError("kubeconfig cluster has no server");
    if (cluster["certificate-authority-data"]) {
        conn.ca_data = decode_base64(cluster["certificate-authority-data"].as<std::string>());
    } else if (cluster["certificate-authority"]) {
        conn.ca_file = resolve_path(base, cluster["certificate-authority"].as<std::string>());
    }
    conn.insecure = cluster["insecure-skip-tls-verify"].as<bool>(false);

    if (context["user"]) {
        YAML::Node user = find_named(root["users"], context["user"].as<std::string>(), "user");
        if (user["token"]) conn.token = user["token"].as<std::string>();
        else if (user["tokenFile"]) conn.token = read_file(resolve_path(base, user["tokenFile"].as<std::string>()));
        if (user["client-certificate-data"]) {
            conn.client_cert_data = decode_base64(user["client-certificate-data"].as<std::string>());
        } else if (user["client-certificate"]) {
            conn.client_cert_file = resolve_path(base, user["client-certificate"].as<std::string>());
        }
        if (user["client-key-data"]) {
            conn.client_key_data = decode_base64(user["client-key-data"].as<std::string>());
        } else if (user["client-key"]) {
            conn.client_key_file = resolve_path(base, user["client-key"].as<std::string>());
        }
    }

    while (!conn.server.empty() && conn.server.back() == '/') conn.server.pop_back();
    return conn;
}

KubeConnection in_cluster_connection() {
    const char* host = std::getenv("KUBERNETES_SERVICE_HOST");
    const char* port = std::getenv("KUBERNETES_SERVICE_PORT");
    if (!host || !port) {
        throw ClusterError("Not running inside a cluster: KUBERNETES_SERVICE_HOST/PORT are unset");
    }
    KubeConnection conn;
    std::string h = host;
    // IPv6 service addresses need brackets
    if (h.find(':') != std::string::npos) h = "[" + h + "]";
    conn.server = std::format("https://{}:{}", h, port);
    conn.token = read_file(service_account_dir / "token");
    while (!conn.token.empty() && (conn.token.back() == '\n' || conn.token.back() == ' ')) conn.token.pop_back();
    conn.ca_file = (service_account_dir / "ca.crt").string();
    return conn;
}

KubeClient::KubeClient(KubeConnection connection, std::shared_ptr<HttpClient> http)
    : connection_(std::move(connection)), http_(std::move(http)) {}

HttpRequest KubeClient::make_request(const std::string& method, const std::string& path) const {
    HttpRequest request;
    request.method = method;
    request.url = connection_.server + path;
    request.headers.push_back("Accept: application/json");
    request.bearer_token = connection_.token;
    request.ca_file = connection_.ca_file;
    request.ca_data = connection_.ca_data;
    request.client_cert_file = connection_.client_cert_file;
    request.client_cert_data = connection_.client_cert_data;
    request.client_key_file = connection_.client_key_file;
    request.client_key_data = connection_.client_key_data;
    request.insecure = connection_.insecure;
    return request;
}

void KubeClient::raise_api_error(const HttpResponse& response, const std::string& what) const {
    std::string message;
    QJsonDocument doc = QJsonDocument::fromJson(QByteArray::fromStdString(response.body));
    if (doc.isObject()) message = doc.object()["message"].toString().toStdString();
    if (message.empty()) message = response.body.empty() ? "no response body" : response.body;
    throw ClusterError(std::format("{}: HTTP {}: {}", what, response.status, message));
}

void KubeClient::create_job(const ClusterJobSpec& spec, const CancelToken& token) {
    HttpRequest request = make_request("POST", std::format("/apis/batch/v1/namespaces/{}/jobs", encode(spec.ns)));
    request.headers.push_back("Content-Type: application/json");
    request.body = QJsonDocument(spec.to_manifest()).toJson(QJsonDocument::Compact).toStdString();
    request.timeout = std::chrono::seconds(30);

    HttpResponse response = http_->perform(request, token);
    if (!response.ok()) raise_api_error(response, "Failed to create job " + spec.name);
    log_verbose(std::format("Created job {}/{}", spec.ns, spec.name));
}

void KubeClient::watch_job(const std::string& ns, const std::string& name, const CancelToken& token,
                           const EventHandler& on_event) {
    HttpRequest request = make_request("GET", std::format(
        "/apis/batch/v1/namespaces/{}/jobs?watch=true&fieldSelector={}",
        encode(ns), encode("metadata.name=" + name)));

    std::optional<ClusterError> parse_error;
    HttpResponse response = http_->stream_lines(request, token, [&](const std::string& line) {
        if (line.empty()) return true;
        try {
            return on_event(parse_watch_event(line));
        } catch (const ClusterError& e) {
            parse_error = e;
            return false;
        }
    });
    if (parse_error) throw *parse_error;
    if (!response.ok()) raise_api_error(response, "Failed to watch job " + name);
}

std::string KubeClient::find_job_pod(const std::string& ns, const std::string& job_name,
                                     const CancelToken& token) {
    HttpRequest request = make_request("GET", std::format(
        "/api/v1/namespaces/{}/pods?labelSelector={}", encode(ns), encode("job-name=" + job_name)));
    request.timeout = std::chrono::seconds(30);

    HttpResponse response = http_->perform(request, token);
    if (!response.ok()) raise_api_error(response, "Failed to list pods of job " + job_name);

    QJsonArray items = QJsonDocument::fromJson(QByteArray::fromStdString(response.body)).object()["items"].toArray();
    if (items.isEmpty()) throw ClusterError("Could not find a pod for job " + job_name);
    return items.first().toObject()["metadata"].toObject()["name"].toString().toStdString();
}

void KubeClient::stream_pod_logs(const std::string& ns, const std::string& pod, const std::string& container,
                                 const CancelToken& token, const LineHandler& on_line) {
    HttpRequest request = make_request("GET", std::format(
        "/api/v1/namespaces/{}/pods/{}/log?container={}", encode(ns), encode(pod), encode(container)));
    request.headers = {"Accept: */*"};
    HttpResponse response = http_->stream_lines(request, token, on_line);
    if (!response.ok()) raise_api_error(response, std::format("Failed to read logs of {}/{}", pod, container));
}
