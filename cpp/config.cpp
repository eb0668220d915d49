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

#include "config.h"
#include "utilities.h"

#include <cstdlib>
#include <format>
#include <stdexcept>

#include <QSysInfo>

std::string WorkerConfig::cache_repo() const {
    if (!kaniko_cache_repo.empty()) return kaniko_cache_repo;
    return registry + "/cache";
}

std::optional<std::string> process_env(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (!value) return std::nullopt;
    return std::string(value);
}

namespace {

// One setting: YAML scalar first, environment variable wins
class Setting {
public:
    Setting(const YAML::Node& root, const EnvLookup& env, std::string key)
        : key_(std::move(key)) {
        if (auto from_env = env(key_)) {
            value_ = *from_env;
        } else if (root && root.IsMap() && root[key_] && root[key_].IsScalar()) {
            value_ = root[key_].as<std::string>();
        }
    }

    void apply(std::string& target) const {
        if (value_) target = *value_;
    }

    void apply(int& target) const {
        if (!value_) return;
        try {
            size_t used = 0;
            int parsed = std::stoi(*value_, &used);
            if (used != value_->size()) throw std::invalid_argument(*value_);
            target = parsed;
        } catch (const std::exception&) {
            throw std::runtime_error(std::format("Invalid integer for {}: '{}'", key_, *value_));
        }
    }

    void apply(bool& target) const {
        if (!value_) return;
        std::string v = to_lower(*value_);
        if (v == "1" || v == "true" || v == "yes" || v == "on") target = true;
        else if (v == "0" || v == "false" || v == "no" || v == "off") target = false;
        else throw std::runtime_error(std::format("Invalid boolean for {}: '{}'", key_, *value_));
    }

    void apply(std::chrono::milliseconds& target) const {
        if (!value_) return;
        try {
            target = parse_duration(*value_);
        } catch (const std::exception&) {
            throw std::runtime_error(std::format("Invalid duration for {}: '{}'", key_, *value_));
        }
    }

private:
    std::string key_;
    std::optional<std::string> value_;
};

std::string default_worker_id() {
    std::string host = QSysInfo::machineHostName().toStdString();
    if (host.empty()) host = "worker";
    return host + "-" + generate_random_string(8);
}

} // namespace

WorkerConfig worker_config_from_yaml(const YAML::Node& root, const EnvLookup& env) {
    WorkerConfig cfg;
    auto set = [&](const char* key, auto& target) { Setting(root, env, key).apply(target); };

    set("WORKER_ID", cfg.worker_id);
    set("MAX_CONCURRENT_BUILDS", cfg.max_concurrent_builds);
    set("POLL_INTERVAL", cfg.poll_interval);
    set("BUILD_TIMEOUT", cfg.build_timeout);
    set("SHUTDOWN_TIMEOUT", cfg.shutdown_timeout);
    set("UNREGISTER_TIMEOUT", cfg.unregister_timeout);
    set("DEQUEUE_BACKOFF", cfg.dequeue_backoff);

    set("QUEUE_DRIVER", cfg.queue_driver);
    set("QUEUE_DATABASE", cfg.queue_database);
    set("QUEUE_HOST", cfg.queue_host);
    set("QUEUE_PORT", cfg.queue_port);
    set("QUEUE_USER", cfg.queue_user);
    set("QUEUE_PASSWORD", cfg.queue_password);

    set("REGISTRY", cfg.registry);
    set("REGISTRY_USER", cfg.registry_user);
    set("REGISTRY_PASSWORD", cfg.registry_password);
    set("REGISTRY_SECRET", cfg.registry_secret);

    set("KUBECONFIG", cfg.kubeconfig);
    set("BUILD_NAMESPACE", cfg.build_namespace);
    set("KANIKO_CACHE_REPO", cfg.kaniko_cache_repo);
    set("KANIKO_GIT_CREDENTIALS", cfg.kaniko_git_credentials);

    set("GENERATE_SBOM", cfg.generate_sbom);
    set("SIGN_IMAGES", cfg.sign_images);
    set("COSIGN_KEY", cfg.cosign_key);
    set("COSIGN_KEYLESS", cfg.cosign_keyless);

    set("CALLBACK_API_KEY", cfg.callback_api_key);
    set("CALLBACK_TIMEOUT", cfg.callback_timeout);
    set("STATUS_PORT", cfg.status_port);
    set("VERBOSE", cfg.verbose);

    if (cfg.max_concurrent_builds < 1) {
        throw std::runtime_error("MAX_CONCURRENT_BUILDS must be at least 1");
    }
    if (cfg.build_timeout.count() <= 0) {
        throw std::runtime_error("BUILD_TIMEOUT must be positive");
    }
    if (cfg.registry.empty()) {
        throw std::runtime_error("REGISTRY must not be empty");
    }
    if (cfg.worker_id.empty()) cfg.worker_id = default_worker_id();

    return cfg;
}

WorkerConfig load_worker_config(const std::optional<fs::path>& config_path, const EnvLookup& env) {
    YAML::Node root;
    if (config_path) {
        if (!fs::exists(*config_path)) {
            log_warning("Config file not found: " + config_path->string() + ", using defaults and environment");
        } else {
            try {
                root = YAML::LoadFile(config_path->string());
            } catch (const YAML::ParserException& e) {
                throw std::runtime_error("Failed to parse config file " + config_path->string() + ": " + e.what());
            }
            log_info("Loaded configuration from " + config_path->string());
        }
    }
    return worker_config_from_yaml(root, env);
}
