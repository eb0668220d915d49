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

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <map>
#include <stdexcept>

#include <yaml-cpp/yaml.h>

namespace {

EnvLookup env_from(std::map<std::string, std::string> values) {
    return [values = std::move(values)](const std::string& name) -> std::optional<std::string> {
        auto it = values.find(name);
        if (it == values.end()) return std::nullopt;
        return it->second;
    };
}

} // namespace

TEST(Config, DefaultsWithoutFileOrEnvironment) {
    WorkerConfig cfg = worker_config_from_yaml(YAML::Node(), env_from({}));
    EXPECT_EQ(cfg.max_concurrent_builds, 3);
    EXPECT_EQ(cfg.build_timeout, std::chrono::minutes(30));
    EXPECT_EQ(cfg.poll_interval, std::chrono::seconds(5));
    EXPECT_EQ(cfg.shutdown_timeout, std::chrono::minutes(5));
    EXPECT_EQ(cfg.registry, "ghcr.io");
    EXPECT_EQ(cfg.cache_repo(), "ghcr.io/cache");
    EXPECT_EQ(cfg.build_namespace, "buildyard-builds");
    EXPECT_TRUE(cfg.generate_sbom);
    EXPECT_TRUE(cfg.sign_images);
    EXPECT_FALSE(cfg.cosign_keyless);
    EXPECT_EQ(cfg.status_port, 8081);
    EXPECT_FALSE(cfg.worker_id.empty());
}

TEST(Config, EnvironmentOverridesYaml) {
    YAML::Node root = YAML::Load(R"(
REGISTRY: registry.example.com
MAX_CONCURRENT_BUILDS: 2
BUILD_TIMEOUT: 45m
SIGN_IMAGES: false
)");
    WorkerConfig cfg = worker_config_from_yaml(root, env_from({{"MAX_CONCURRENT_BUILDS", "6"},
                                                               {"WORKER_ID", "worker-a"}}));
    EXPECT_EQ(cfg.registry, "registry.example.com");
    EXPECT_EQ(cfg.max_concurrent_builds, 6);
    EXPECT_EQ(cfg.build_timeout, std::chrono::minutes(45));
    EXPECT_FALSE(cfg.sign_images);
    EXPECT_EQ(cfg.worker_id, "worker-a");
    EXPECT_EQ(cfg.cache_repo(), "registry.example.com/cache");
}

TEST(Config, InvalidValuesNameTheKey) {
    try {
        worker_config_from_yaml(YAML::Node(), env_from({{"POLL_INTERVAL", "soon"}}));
        FAIL() << "expected an error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("POLL_INTERVAL"), std::string::npos);
    }

    EXPECT_THROW(worker_config_from_yaml(YAML::Node(), env_from({{"MAX_CONCURRENT_BUILDS", "0"}})),
                 std::runtime_error);
    EXPECT_THROW(worker_config_from_yaml(YAML::Node(), env_from({{"MAX_CONCURRENT_BUILDS", "3x"}})),
                 std::runtime_error);
    EXPECT_THROW(worker_config_from_yaml(YAML::Node(), env_from({{"GENERATE_SBOM", "maybe"}})),
                 std::runtime_error);
}

TEST(Config, LoadsFileAndToleratesMissingOne) {
    auto path = std::filesystem::temp_directory_path() / "buildyard-config-test.yaml";
    {
        std::ofstream out(path);
        out << "BUILD_NAMESPACE: ci-builds\nKANIKO_CACHE_REPO: ghcr.io/acme/cache\nCOSIGN_KEYLESS: yes\n";
    }
    WorkerConfig cfg = load_worker_config(path, env_from({}));
    EXPECT_EQ(cfg.build_namespace, "ci-builds");
    EXPECT_EQ(cfg.cache_repo(), "ghcr.io/acme/cache");
    EXPECT_TRUE(cfg.cosign_keyless);
    std::filesystem::remove(path);

    WorkerConfig fallback = load_worker_config(path, env_from({{"REGISTRY", "quay.io"}}));
    EXPECT_EQ(fallback.registry, "quay.io");
}

TEST(Config, DurationsAcceptUnitsAndBareSeconds) {
    EXPECT_EQ(parse_duration("250ms"), std::chrono::milliseconds(250));
    EXPECT_EQ(parse_duration("5s"), std::chrono::seconds(5));
    EXPECT_EQ(parse_duration("30m"), std::chrono::minutes(30));
    EXPECT_EQ(parse_duration("1h"), std::chrono::hours(1));
    EXPECT_EQ(parse_duration("90"), std::chrono::seconds(90));
    EXPECT_THROW(parse_duration("5d"), std::invalid_argument);
    EXPECT_THROW(parse_duration(""), std::invalid_argument);
}

TEST(Config, DurationsRejectMalformedAndOverflowingValues) {
    EXPECT_EQ(parse_duration("1.5s"), std::chrono::milliseconds(1500));
    EXPECT_THROW(parse_duration("1.5.3s"), std::invalid_argument);
    EXPECT_THROW(parse_duration(".s"), std::invalid_argument);
    EXPECT_THROW(parse_duration("99999999999999999999999h"), std::out_of_range);
    EXPECT_THROW(parse_duration("9223372036854775808ms"), std::out_of_range);
}
