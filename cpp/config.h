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

#ifndef CONFIG_H
#define CONFIG_H

#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

#include <yaml-cpp/yaml.h>

namespace fs = std::filesystem;

struct WorkerConfig {
    // Worker
    std::string worker_id;
    int max_concurrent_builds = 3;
    std::chrono::milliseconds poll_interval{std::chrono::seconds(5)};
    std::chrono::milliseconds build_timeout{std::chrono::minutes(30)};
    std::chrono::milliseconds shutdown_timeout{std::chrono::minutes(5)};
    std::chrono::milliseconds unregister_timeout{std::chrono::seconds(5)};
    std::chrono::milliseconds dequeue_backoff{std::chrono::seconds(1)};

    // Queue database
    std::string queue_driver = "QSQLITE";
    std::string queue_database = "/var/lib/buildyard/queue.db";
    std::string queue_host;
    int queue_port = 0;
    std::string queue_user;
    std::string queue_password;

    // Registry
    std::string registry = "ghcr.io";
    std::string registry_user;
    std::string registry_password;
    std::string registry_secret = "regcred";

    // Cluster
    std::string kubeconfig;
    std::string build_namespace = "buildyard-builds";
    std::string kaniko_cache_repo;
    std::string kaniko_git_credentials = "git-credentials";

    // Supply chain
    bool generate_sbom = true;
    bool sign_images = true;
    std::string cosign_key;
    bool cosign_keyless = false;

    // Callbacks
    std::string callback_api_key;
    std::chrono::milliseconds callback_timeout{std::chrono::seconds(30)};

    // Status endpoint, 0 disables it
    int status_port = 8081;

    bool verbose = false;

    // Registry path used for the layer cache
    std::string cache_repo() const;
};

using EnvLookup = std::function<std::optional<std::string>(const std::string& name)>;

// Reads the process environment
std::optional<std::string> process_env(const std::string& name);

// Loads YAML (if the file exists) and applies environment overrides.
// Throws std::runtime_error naming the offending key on invalid values.
WorkerConfig load_worker_config(const std::optional<fs::path>& config_path,
                                const EnvLookup& env = process_env);

// Same, from an already parsed YAML document
WorkerConfig worker_config_from_yaml(const YAML::Node& root, const EnvLookup& env = process_env);

#endif // CONFIG_H
