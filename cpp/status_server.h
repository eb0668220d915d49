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

#ifndef STATUS_SERVER_H
#define STATUS_SERVER_H

#include "job_processor.h"

#include <memory>

#include <QHttpServer>
#include <QObject>
#include <QTcpServer>

// Liveness and counters of one worker, served over plain HTTP
class StatusServer : public QObject {
    Q_OBJECT
public:
    explicit StatusServer(std::shared_ptr<JobProcessor> processor, QObject *parent = nullptr);
    bool start_server(quint16 port);
    quint16 port() const { return tcp_server_.serverPort(); }

private:
    std::shared_ptr<JobProcessor> processor_;
    QHttpServer http_server_;
    // Declared after http_server_ so it is destroyed first
    QTcpServer tcp_server_;
};

#endif // STATUS_SERVER_H
