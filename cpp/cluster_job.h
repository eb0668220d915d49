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

#ifndef CLUSTER_JOB_H
#define CLUSTER_JOB_H

#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include <QJsonObject>

struct EnvVar {
    std::string name;
    std::string value;

    // When set, the value comes from a secret key instead
    std::string secret_name;
    std::string secret_key;
    bool optional = false;

    static EnvVar literal(std::string name, std::string value) {
        EnvVar var;
        var.name = std::move(name);
        var.value = std::move(value);
        return var;
    }

    static EnvVar from_secret(std::string name, std::string secret, std::string key, bool optional = true) {
        EnvVar var;
        var.name = std::move(name);
        var.secret_name = std::move(secret);
        var.secret_key = std::move(key);
        var.optional = optional;
        return var;
    }
};

struct ResourceList {
    std::string cpu;
    std::string memory;
};

struct Volume {
    std::string name;
    std::string secret_name;  // empty means emptyDir
    std::vector<std::pair<std::string, std::string>> items;  // key -> path
};

struct VolumeMount {
    std::string name;
    std::string mount_path;
    bool read_only = false;
};

// One ephemeral, non-retrying batch/v1 Job with a single container
class ClusterJobSpec {
public:
    std::string name;
    std::string ns;
    std::map<std::string, std::string> labels;
    std::map<std::string, std::string> annotations;
    std::map<std::string, std::string> pod_labels;  // defaults to labels

    std::string container_name;
    std::string image;
    std::vector<std::string> args;
    std::vector<EnvVar> env;
    ResourceList requests;
    ResourceList limits;

    // Root inside the container; otherwise runs as run_as_user with runAsNonRoot
    bool run_as_root = false;
    std::int64_t run_as_user = 1000;
    bool read_only_root_fs = true;

    std::vector<Volume> volumes;
    std::vector<VolumeMount> mounts;

    // Node label the scheduler should prefer to avoid (e.g. GPU nodes)
    std::string avoid_node_label;

    std::int64_t active_deadline_secs = 0;
    std::int32_t ttl_after_finished_secs = 0;

    QJsonObject to_manifest() const;
};

#endif // CLUSTER_JOB_H
