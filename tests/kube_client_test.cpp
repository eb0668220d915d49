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

#include "fakes.h"
#include "kube_client.h"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include <QByteArray>
#include <QJsonDocument>

namespace {

KubeConnection test_connection() {
    KubeConnection conn;
    conn.server = "https://10.0.0.1:6443";
    conn.token = "sa-token";
    conn.ca_data = "-----BEGIN CERTIFICATE-----";
    return conn;
}

ClusterJobSpec small_spec() {
    ClusterJobSpec spec;
    spec.name = "build-1b4e28ba";
    spec.ns = "builds";
    spec.container_name = "kaniko";
    spec.image = "gcr.io/kaniko-project/executor:v1.19.0";
    return spec;
}

} // namespace

TEST(KubeClient, CreateJobPostsManifest) {
    auto http = std::make_shared<FakeHttp>();
    http->push(201, "{}");
    KubeClient client(test_connection(), http);

    client.create_job(small_spec(), CancelToken());

    ASSERT_EQ(http->requests().size(), 1u);
    HttpRequest request = http->requests()[0];
    EXPECT_EQ(request.method, "POST");
    EXPECT_EQ(request.url, "https://10.0.0.1:6443/apis/batch/v1/namespaces/builds/jobs");
    EXPECT_EQ(request.bearer_token, "sa-token");
    EXPECT_EQ(request.ca_data, "-----BEGIN CERTIFICATE-----");
    QJsonObject body = QJsonDocument::fromJson(QByteArray::fromStdString(request.body)).object();
    EXPECT_EQ(body["metadata"].toObject()["name"].toString(), "build-1b4e28ba");
}

TEST(KubeClient, ApiErrorsCarryServerMessage) {
    auto http = std::make_shared<FakeHttp>();
    http->push(409, R"({"kind":"Status","message":"jobs.batch \"build-1b4e28ba\" already exists"})");
    KubeClient client(test_connection(), http);

    try {
        client.create_job(small_spec(), CancelToken());
        FAIL() << "expected ClusterError";
    } catch (const ClusterError& e) {
        std::string what = e.what();
        EXPECT_NE(what.find("HTTP 409"), std::string::npos);
        EXPECT_NE(what.find("already exists"), std::string::npos);
    }
}

TEST(KubeClient, WatchSelectsJobByNameAndDeliversEvents) {
    auto http = std::make_shared<FakeHttp>();
    http->push_stream({
        R"({"type":"ADDED","object":{"metadata":{"name":"build-1"},"status":{}}})",
        "",
        R"({"type":"MODIFIED","object":{"metadata":{"name":"build-1"},"status":{"conditions":[{"type":"Complete","status":"True"}]}}})",
        R"({"type":"MODIFIED","object":{"metadata":{"name":"build-1"},"status":{}}})",
    });
    KubeClient client(test_connection(), http);

    std::vector<std::string> seen;
    client.watch_job("builds", "build-1", CancelToken(), [&](const WatchEvent& event) {
        seen.push_back(event.type);
        return !event.terminal_condition();
    });

    EXPECT_EQ(seen, (std::vector<std::string>{"ADDED", "MODIFIED"}));
    EXPECT_EQ(http->requests()[0].url,
              "https://10.0.0.1:6443/apis/batch/v1/namespaces/builds/jobs?watch=true&fieldSelector=metadata.name%3Dbuild-1");
}

TEST(KubeClient, WatchRejectsMalformedEvents) {
    auto http = std::make_shared<FakeHttp>();
    http->push_stream({"not json"});
    KubeClient client(test_connection(), http);
    EXPECT_THROW(client.watch_job("builds", "build-1", CancelToken(), [](const WatchEvent&) { return true; }),
                 ClusterError);
}

TEST(KubeClient, FindsPodByJobNameLabel) {
    auto http = std::make_shared<FakeHttp>();
    http->push(200, R"({"items":[{"metadata":{"name":"build-1-x7k2p"}}]})");
    http->push(200, R"({"items":[]})");
    KubeClient client(test_connection(), http);

    EXPECT_EQ(client.find_job_pod("builds", "build-1", CancelToken()), "build-1-x7k2p");
    EXPECT_EQ(http->requests()[0].url,
              "https://10.0.0.1:6443/api/v1/namespaces/builds/pods?labelSelector=job-name%3Dbuild-1");
    EXPECT_THROW(client.find_job_pod("builds", "build-1", CancelToken()), ClusterError);
}

TEST(KubeClient, StreamsContainerLogs) {
    auto http = std::make_shared<FakeHttp>();
    http->push_stream({"INFO[0000] Retrieving image manifest alpine", "INFO[0004] Pushing image"});
    KubeClient client(test_connection(), http);

    std::vector<std::string> lines;
    client.stream_pod_logs("builds", "build-1-x7k2p", "kaniko", CancelToken(), [&](const std::string& line) {
        lines.push_back(line);
        return true;
    });
    EXPECT_EQ(lines.size(), 2u);
    HttpRequest request = http->requests()[0];
    EXPECT_EQ(request.url, "https://10.0.0.1:6443/api/v1/namespaces/builds/pods/build-1-x7k2p/log?container=kaniko");
    EXPECT_EQ(request.headers, (std::vector<std::string>{"Accept: */*"}));
}

TEST(Kubeconfig, ReadsCurrentContext) {
    auto dir = std::filesystem::temp_directory_path() / "buildyard-kubeconfig-test";
    std::filesystem::create_directories(dir);
    auto path = dir / "config";
    const std::string ca = QByteArray("fake-ca-pem").toBase64().toStdString();
    {
        std::ofstream out(path);
        out << "apiVersion: v1\n"
               "kind: Config\n"
               "current-context: staging\n"
               "contexts:\n"
               "- name: prod\n"
               "  context: {cluster: prod, user: prod-admin}\n"
               "- name: staging\n"
               "  context: {cluster: staging, user: builder}\n"
               "clusters:\n"
               "- name: prod\n"
               "  cluster: {server: 'https://prod.example.com'}\n"
               "- name: staging\n"
               "  cluster:\n"
               "    server: https://staging.example.com:6443/\n"
               "    certificate-authority-data: " << ca << "\n"
               "users:\n"
               "- name: builder\n"
               "  user:\n"
               "    token: staging-token\n"
               "    client-key: keys/builder.key\n";
    }

    KubeConnection conn = load_kubeconfig(path);
    EXPECT_EQ(conn.server, "https://staging.example.com:6443");
    EXPECT_EQ(conn.ca_data, "fake-ca-pem");
    EXPECT_EQ(conn.token, "staging-token");
    EXPECT_EQ(conn.client_key_file, (dir / "keys/builder.key").string());
    EXPECT_FALSE(conn.insecure);

    std::filesystem::remove_all(dir);
}

TEST(Kubeconfig, MissingContextIsAnError) {
    auto path = std::filesystem::temp_directory_path() / "buildyard-kubeconfig-empty";
    {
        std::ofstream out(path);
        out << "apiVersion: v1\nkind: Config\nclusters: []\n";
    }
    EXPECT_THROW(load_kubeconfig(path), ClusterError);
    std::filesystem::remove(path);
}
