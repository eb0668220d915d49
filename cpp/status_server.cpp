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

#include "status_server.h"
#include "utilities.h"

#include <format>

#include <QHttpServerRequest>
#include <QHttpServerResponse>
#include <QJsonObject>

StatusServer::StatusServer(std::shared_ptr<JobProcessor> processor, QObject *parent)
    : QObject(parent), processor_(std::move(processor)) {}

bool StatusServer::start_server(quint16 port) {
    http_server_.route("/healthz", QHttpServerRequest::Method::Get, [this]() {
        ProcessorStats stats = processor_->stats();
        QJsonObject body;
        body["worker_id"] = QString::fromStdString(stats.worker_id);
        if (stats.shutting_down) {
            body["status"] = "draining";
            return QHttpServerResponse(body, QHttpServerResponder::StatusCode::ServiceUnavailable);
        }
        body["status"] = "ok";
        return QHttpServerResponse(body);
    });

    http_server_.route("/stats", QHttpServerRequest::Method::Get, [this]() {
        return QHttpServerResponse(processor_->stats().to_json());
    });

    if (!tcp_server_.listen(QHostAddress::Any, port) || !http_server_.bind(&tcp_server_)) {
        log_error(std::format("Could not bind status server to port {}", port));
        return false;
    }

    log_info(std::format("Status server running on port {}", tcp_server_.serverPort()));
    return true;
}
