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

#ifndef BUILD_TYPES_H
#define BUILD_TYPES_H

#include <chrono>
#include <map>
#include <string>

#include <QJsonObject>
#include <QUuid>

enum class JobStatus {
    Queued,
    Building,
    Completed,
    Failed,
    Cancelled
};

std::string job_status_to_string(JobStatus status);
JobStatus job_status_from_string(const std::string& status);
bool is_terminal(JobStatus status);

class BuildConfig {
public:
    std::string type = "dockerfile";
    std::string dockerfile = "Dockerfile";
    std::string context = ".";
    std::map<std::string, std::string> build_args;
    std::string target;

    QJsonObject to_json() const;
    static BuildConfig from_json(const QJsonObject& obj);
};

class BuildJob {
public:
    QUuid id;
    QUuid release_id;
    QUuid service_id;
    QUuid project_id;
    std::string service_name;
    std::string git_repo;
    std::string git_sha;
    std::string git_branch;
    BuildConfig build_config;
    std::string callback_url;
    std::chrono::system_clock::time_point created_at{};
    int priority = 0;

    // Throws std::invalid_argument when the source reference is unusable
    void validate() const;

    QJsonObject to_json() const;
    static BuildJob from_json(const QJsonObject& obj);
};

class BuildResult {
public:
    QUuid job_id;
    QUuid release_id;
    bool success = false;
    std::string image_uri;
    std::string image_digest;
    double image_size_mb = 0.0;
    std::string sbom;
    std::string sbom_format;
    std::string image_signature;
    double duration_secs = 0.0;
    std::string error_message;
    std::string logs_url;

    QJsonObject to_json() const;
    static BuildResult from_json(const QJsonObject& obj);
    std::string to_json_string() const;
};

// The first eight characters of a commit SHA
std::string short_sha(const std::string& sha);

// The first eight hex digits of a UUID
std::string short_id(const QUuid& id);

std::string uuid_string(const QUuid& id);

#endif // BUILD_TYPES_H
