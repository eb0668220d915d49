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

#ifndef SQL_QUEUE_H
#define SQL_QUEUE_H

#include "build_queue.h"

#include <atomic>
#include <mutex>
#include <string>

#include <QSqlDatabase>
#include <QSqlQuery>
#include <QString>

struct SqlQueueOptions {
    std::string driver = "QSQLITE";  // QSQLITE or QPSQL
    std::string database;            // file path for SQLite, database name for PostgreSQL
    std::string host;
    int port = 0;
    std::string user;
    std::string password;
};

// BuildQueue on top of QtSql. Each thread gets its own connection; SQLite
// claims rows inside BEGIN IMMEDIATE, PostgreSQL with FOR UPDATE SKIP LOCKED.
class SqlBuildQueue : public BuildQueue {
public:
    explicit SqlBuildQueue(SqlQueueOptions options);

    QUuid enqueue(BuildJob job) override;
    std::optional<BuildJob> dequeue(std::chrono::milliseconds timeout, const CancelToken& token) override;

    void update_status(const QUuid& job_id, JobStatus status, const std::string& worker_id) override;
    void set_result(const QUuid& job_id, const BuildResult& result) override;
    void append_log(const QUuid& job_id, const std::string& line) override;

    void register_worker(const std::string& worker_id) override;
    void unregister_worker(const std::string& worker_id) override;

    std::optional<BuildJob> get_job(const QUuid& job_id) override;
    std::optional<JobStatus> get_status(const QUuid& job_id) override;
    std::optional<BuildResult> get_result(const QUuid& job_id) override;
    bool cancel(const QUuid& job_id) override;

    std::int64_t queue_length() override;
    std::vector<std::string> active_workers() override;
    std::vector<std::string> logs(const QUuid& job_id) override;

    void release_thread_resources() override;

private:
    QSqlDatabase get_thread_connection();
    QString thread_connection_name() const;
    void init_schema();
    bool is_sqlite() const { return options_.driver == "QSQLITE"; }

    // One non-blocking attempt at claiming the next queued job
    std::optional<BuildJob> try_claim();
    std::optional<BuildJob> try_claim_sqlite(QSqlDatabase& db);
    std::optional<BuildJob> try_claim_postgres(QSqlDatabase& db);

    SqlQueueOptions options_;
    QString connection_prefix_;
    std::mutex connection_mutex_;
};

#endif // SQL_QUEUE_H
