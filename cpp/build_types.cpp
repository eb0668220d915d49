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

#include "build_types.h"

#include <stdexcept>

#include <QDateTime>
#include <QJsonDocument>
#include <QTimeZone>

std::string job_status_to_string(JobStatus status) {
    switch (status) {
        case JobStatus::Queued: return "queued";
        case JobStatus::Building: return "building";
        case JobStatus::Completed: return "completed";
        case JobStatus::Failed: return "failed";
        case JobStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

JobStatus job_status_from_string(const std::string& status) {
    if (status == "queued") return JobStatus::Queued;
    if (status == "building") return JobStatus::Building;
    if (status == "completed") return JobStatus::Completed;
    if (status == "failed") return JobStatus::Failed;
    if (status == "cancelled") return JobStatus::Cancelled;
    throw std::invalid_argument("unknown job status: " + status);
}

bool is_terminal(JobStatus status) {
    return status == JobStatus::Completed || status == JobStatus::Failed || status == JobStatus::Cancelled;
}

std::string uuid_string(const QUuid& id) {
    return id.toString(QUuid::WithoutBraces).toStdString();
}

std::string short_id(const QUuid& id) {
    return uuid_string(id).substr(0, 8);
}

std::string short_sha(const std::string& sha) {
    return sha.size() > 8 ? sha.substr(0, 8) : sha;
}

static QString qs(const std::string& s) { return QString::fromStdString(s); }
static std::string ss(const QJsonValue& v) { return v.toString().toStdString(); }

QJsonObject BuildConfig::to_json() const {
    QJsonObject args;
    for (const auto& [key, value] : build_args) args.insert(qs(key), qs(value));

    QJsonObject obj;
    obj["type"] = qs(type);
    obj["dockerfile"] = qs(dockerfile);
    obj["context"] = qs(context);
    obj["build_args"] = args;
    obj["target"] = qs(target);
    return obj;
}

BuildConfig BuildConfig::from_json(const QJsonObject& obj) {
    BuildConfig cfg;
    if (!obj["type"].toString().isEmpty()) cfg.type = ss(obj["type"]);
    if (!obj["dockerfile"].toString().isEmpty()) cfg.dockerfile = ss(obj["dockerfile"]);
    if (!obj["context"].toString().isEmpty()) cfg.context = ss(obj["context"]);
    cfg.target = ss(obj["target"]);
    const QJsonObject args = obj["build_args"].toObject();
    for (auto it = args.begin(); it != args.end(); ++it) {
        cfg.build_args[it.key().toStdString()] = it.value().toString().toStdString();
    }
    return cfg;
}

void BuildJob::validate() const {
    if (git_repo.empty()) throw std::invalid_argument("build job has no git repository");
    if (git_sha.empty()) throw std::invalid_argument("build job has no git SHA");
}

QJsonObject BuildJob::to_json() const {
    QJsonObject obj;
    obj["id"] = qs(uuid_string(id));
    obj["release_id"] = qs(uuid_string(release_id));
    obj["service_id"] = qs(uuid_string(service_id));
    obj["project_id"] = qs(uuid_string(project_id));
    obj["service_name"] = qs(service_name);
    obj["git_repo"] = qs(git_repo);
    obj["git_sha"] = qs(git_sha);
    obj["git_branch"] = qs(git_branch);
    obj["build_config"] = build_config.to_json();
    obj["callback_url"] = qs(callback_url);
    obj["created_at"] = QDateTime::fromSecsSinceEpoch(
        std::chrono::duration_cast<std::chrono::seconds>(created_at.time_since_epoch()).count(),
        QTimeZone::UTC).toString(Qt::ISODate);
    obj["priority"] = priority;
    return obj;
}

BuildJob BuildJob::from_json(const QJsonObject& obj) {
    BuildJob job;
    job.id = QUuid::fromString(obj["id"].toString());
    job.release_id = QUuid::fromString(obj["release_id"].toString());
    job.service_id = QUuid::fromString(obj["service_id"].toString());
    job.project_id = QUuid::fromString(obj["project_id"].toString());
    job.service_name = ss(obj["service_name"]);
    job.git_repo = ss(obj["git_repo"]);
    job.git_sha = ss(obj["git_sha"]);
    job.git_branch = ss(obj["git_branch"]);
    job.build_config = BuildConfig::from_json(obj["build_config"].toObject());
    job.callback_url = ss(obj["callback_url"]);
    QDateTime created = QDateTime::fromString(obj["created_at"].toString(), Qt::ISODate);
    if (created.isValid()) {
        job.created_at = std::chrono::system_clock::time_point(std::chrono::seconds(created.toSecsSinceEpoch()));
    }
    job.priority = obj["priority"].toInt();
    return job;
}

QJsonObject BuildResult::to_json() const {
    QJsonObject obj;
    obj["job_id"] = qs(uuid_string(job_id));
    obj["release_id"] = qs(uuid_string(release_id));
    obj["success"] = success;
    obj["image_uri"] = qs(image_uri);
    obj["image_digest"] = qs(image_digest);
    obj["image_size_mb"] = image_size_mb;
    obj["sbom"] = qs(sbom);
    obj["sbom_format"] = qs(sbom_format);
    obj["image_signature"] = qs(image_signature);
    obj["duration_secs"] = duration_secs;
    if (!error_message.empty()) obj["error_message"] = qs(error_message);
    obj["logs_url"] = qs(logs_url);
    return obj;
}

BuildResult BuildResult::from_json(const QJsonObject& obj) {
    BuildResult result;
    result.job_id = QUuid::fromString(obj["job_id"].toString());
    result.release_id = QUuid::fromString(obj["release_id"].toString());
    result.success = obj["success"].toBool();
    result.image_uri = ss(obj["image_uri"]);
    result.image_digest = ss(obj["image_digest"]);
    result.image_size_mb = obj["image_size_mb"].toDouble();
    result.sbom = ss(obj["sbom"]);
    result.sbom_format = ss(obj["sbom_format"]);
    result.image_signature = ss(obj["image_signature"]);
    result.duration_secs = obj["duration_secs"].toDouble();
    result.error_message = ss(obj["error_message"]);
    result.logs_url = ss(obj["logs_url"]);
    return result;
}

std::string BuildResult::to_json_string() const {
    return QJsonDocument(to_json()).toJson(QJsonDocument::Compact).toStdString();
}
