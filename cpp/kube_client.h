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

#ifndef KUBE_CLIENT_H
#define KUBE_CLIENT_H

#include "cluster_client.h"
#include "http_client.h"

#include <filesystem>
#include <memory>
#include <string>

namespace fs = std::filesystem;

// Where the API server is and how to authenticate against it
struct KubeConnection {
    std::string server;
    std::string token;
    std::string ca_file;
    std::string ca_data;
    std::string client_cert_file;
    std::string client_cert_data;
    std::string client_key_file;
    std::string client_key_data;
    bool insecure = false;
};

// Reads the current context of a kubeconfig file. Throws ClusterError.
KubeConnection load_kubeconfig(const fs::path& path);

// Uses the pod's service account. Throws ClusterError outside a cluster.
KubeConnection in_cluster_connection();

// ClusterClient over the Kubernetes REST API
class KubeClient : public ClusterClient {
public:
    explicit KubeClient(KubeConnection connection,
                        std::shared_ptr<HttpClient> http = std::make_shared<HttpClient>());

    void create_job(const ClusterJobSpec& spec, const CancelToken& token) override;
    void watch_job(const std::string& ns, const std::string& name, const CancelToken& token,
                   const EventHandler& on_event) override;
    std::string find_job_pod(const std::string& ns, const std::string& job_name,
                             const CancelToken& token) override;
    void stream_pod_logs(const std::string& ns, const std::string& pod, const std::string& container,
                         const CancelToken& token, const LineHandler& on_line) override;

    const KubeConnection& connection() const { return connection_; }

private:
    HttpRequest make_request(const std::string& method, const std::string& path) const;
    [[noreturn]] void raise_api_error(const HttpResponse& response, const std::string& what) const;

    KubeConnection connection_;
    std::shared_ptr<HttpClient> http_;
};

#endif // KUBE_CLIENT_H
