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

#include "cluster_job.h"

#include <QJsonArray>
#include <QString>

namespace {

QString qs(const std::string& s) { return QString::fromStdString(s); }

QJsonObject string_map(const std::map<std::string, std::string>& values) {
    QJsonObject obj;
    for (const auto& [key, value] : values) obj[qs(key)] = qs(value);
    return obj;
}

QJsonObject resource_list(const ResourceList& resources) {
    QJsonObject obj;
    if (!resources.cpu.empty()) obj["cpu"] = qs(resources.cpu);
    if (!resources.memory.empty()) obj["memory"] = qs(resources.memory);
    return obj;
}

QJsonObject env_entry(const EnvVar& var) {
    QJsonObject obj;
    obj["name"] = qs(var.name);
    if (var.secret_name.empty()) {
        obj["value"] = qs(var.value);
        return obj;
    }
    QJsonObject key_ref;
    key_ref["name"] = qs(var.secret_name);
    key_ref["key"] = qs(var.secret_key);
    key_ref["optional"] = var.optional;
    QJsonObject value_from;
    value_from["secretKeyRef"] = key_ref;
    obj["valueFrom"] = value_from;
    return obj;
}

QJsonObject volume_entry(const Volume& volume) {
    QJsonObject obj;
    obj["name"] = qs(volume.name);
    if (volume.secret_name.empty()) {
        obj["emptyDir"] = QJsonObject();
        return obj;
    }
    QJsonObject secret;
    secret["secretName"] = qs(volume.secret_name);
    if (!volume.items.empty()) {
        QJsonArray items;
        for (const auto& [key, path] : volume.items) {
            QJsonObject item;
            item["key"] = qs(key);
            item["path"] = qs(path);
            items.append(item);
        }
        secret["items"] = items;
    }
    obj["secret"] = secret;
    return obj;
}

} // namespace

QJsonObject ClusterJobSpec::to_manifest() const {
    // Container
    QJsonObject container;
    container["name"] = qs(container_name);
    container["image"] = qs(image);
    QJsonArray arg_array;
    for (const auto& arg : args) arg_array.append(qs(arg));
    container["args"] = arg_array;
    if (!env.empty()) {
        QJsonArray env_array;
        for (const auto& var : env) env_array.append(env_entry(var));
        container["env"] = env_array;
    }
    QJsonObject resources;
    resources["requests"] = resource_list(requests);
    resources["limits"] = resource_list(limits);
    container["resources"] = resources;

    QJsonObject capabilities;
    capabilities["drop"] = QJsonArray{"ALL"};
    QJsonObject container_security;
    container_security["allowPrivilegeEscalation"] = false;
    container_security["readOnlyRootFilesystem"] = read_only_root_fs;
    container_security["capabilities"] = capabilities;
    container["securityContext"] = container_security;

    if (!mounts.empty()) {
        QJsonArray mount_array;
        for (const auto& mount : mounts) {
            QJsonObject m;
            m["name"] = qs(mount.name);
            m["mountPath"] = qs(mount.mount_path);
            if (mount.read_only) m["readOnly"] = true;
            mount_array.append(m);
        }
        container["volumeMounts"] = mount_array;
    }

    // Pod
    const qint64 uid = run_as_root ? 0 : run_as_user;
    QJsonObject pod_security;
    pod_security["runAsNonRoot"] = !run_as_root;
    pod_security["runAsUser"] = uid;
    pod_security["runAsGroup"] = uid;
    pod_security["fsGroup"] = uid;
    pod_security["seccompProfile"] = QJsonObject{{"type", "RuntimeDefault"}};

    QJsonObject pod_spec;
    pod_spec["restartPolicy"] = "Never";
    pod_spec["securityContext"] = pod_security;
    pod_spec["containers"] = QJsonArray{container};
    if (!volumes.empty()) {
        QJsonArray volume_array;
        for (const auto& volume : volumes) volume_array.append(volume_entry(volume));
        pod_spec["volumes"] = volume_array;
    }
    if (!avoid_node_label.empty()) {
        QJsonObject expression;
        expression["key"] = qs(avoid_node_label);
        expression["operator"] = "DoesNotExist";
        QJsonObject preference;
        preference["matchExpressions"] = QJsonArray{expression};
        QJsonObject term;
        term["weight"] = 100;
        term["preference"] = preference;
        QJsonObject node_affinity;
        node_affinity["preferredDuringSchedulingIgnoredDuringExecution"] = QJsonArray{term};
        pod_spec["affinity"] = QJsonObject{{"nodeAffinity", node_affinity}};
    }

    QJsonObject template_metadata;
    template_metadata["labels"] = string_map(pod_labels.empty() ? labels : pod_labels);
    QJsonObject pod_template;
    pod_template["metadata"] = template_metadata;
    pod_template["spec"] = pod_spec;

    // Job
    QJsonObject job_spec;
    job_spec["backoffLimit"] = 0;
    if (ttl_after_finished_secs > 0) job_spec["ttlSecondsAfterFinished"] = ttl_after_finished_secs;
    if (active_deadline_secs > 0) job_spec["activeDeadlineSeconds"] = static_cast<qint64>(active_deadline_secs);
    job_spec["template"] = pod_template;

    QJsonObject metadata;
    metadata["name"] = qs(name);
    metadata["namespace"] = qs(ns);
    metadata["labels"] = string_map(labels);
    if (!annotations.empty()) metadata["annotations"] = string_map(annotations);

    QJsonObject manifest;
    manifest["apiVersion"] = "batch/v1";
    manifest["kind"] = "Job";
    manifest["metadata"] = metadata;
    manifest["spec"] = job_spec;
    return manifest;
}
