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

#include "cluster_client.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>

std::optional<JobCondition> WatchEvent::terminal_condition() const {
    for (const auto& condition : conditions) {
        if (condition.status != "True") continue;
        if (condition.type == "Complete" || condition.type == "Failed") return condition;
    }
    return std::nullopt;
}

WatchEvent parse_watch_event(const std::string& line) {
    QJsonParseError error;
    QJsonDocument doc = QJsonDocument::fromJson(QByteArray::fromStdString(line), &error);
    if (error.error != QJsonParseError::NoError || !doc.isObject()) {
        throw ClusterError("Malformed watch event: " + error.errorString().toStdString());
    }

    QJsonObject root = doc.object();
    WatchEvent event;
    event.type = root["type"].toString().toStdString();
    if (event.type.empty()) throw ClusterError("Watch event without a type");

    QJsonObject object = root["object"].toObject();
    if (event.type == "ERROR") {
        // The object is a metav1.Status
        event.error_message = object["message"].toString().toStdString();
        if (event.error_message.empty()) event.error_message = object["reason"].toString().toStdString();
        return event;
    }

    event.job_name = object["metadata"].toObject()["name"].toString().toStdString();
    for (const QJsonValue& value : object["status"].toObject()["conditions"].toArray()) {
        QJsonObject c = value.toObject();
        event.conditions.push_back({c["type"].toString().toStdString(),
                                    c["status"].toString().toStdString(),
                                    c["reason"].toString().toStdString(),
                                    c["message"].toString().toStdString()});
    }
    return event;
}
