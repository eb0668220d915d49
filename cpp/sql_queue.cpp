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

#include "sql_queue.h"
#include "utilities.h"

#include <atomic>
#include <cmath>
#include <format>
#include <thread>

#include <QDateTime>
#include <QJsonDocument>
#include <QSqlError>
#include <QStringList>
#include <QVariant>

static std::atomic<unsigned int> thread_id_counter{1};
static std::atomic<unsigned int> instance_counter{1};

static constexpr int max_attempts = 20;
static constexpr auto claim_poll_interval = std::chrono::milliseconds(250);

static int get_delay(int attempt) {
    return 10 * static_cast<int>(std::pow(1.5, attempt - 1));
}

static bool is_transient(const QString& error) {
    return error.contains("database is locked") || error.contains("unable to open database file") ||
           error.contains("could not serialize access");
}

// Runs a prepared (or literal) statement, retrying while the database is busy
static bool exec_query(QSqlQuery& query, const QString& query_string = QString()) {
    for (int attempt = 1; attempt <= max_attempts; ++attempt) {
        bool passed = query_string.isEmpty() ? query.exec() : query.exec(query_string);
        if (passed) return true;
        if (!is_transient(query.lastError().text())) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(get_delay(attempt)));
    }
    return false;
}

static void require(bool ok, const QSqlQuery& query, const std::string& what) {
    if (!ok) {
        throw QueueError(std::format("{}: {}", what, query.lastError().text().toStdString()));
    }
}

static QString now_iso() {
    return QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs);
}

static QString id_str(const QUuid& id) {
    return id.toString(QUuid::WithoutBraces);
}

static BuildJob job_from_data(const QString& data) {
    QJsonParseError parse_error;
    QJsonDocument doc = QJsonDocument::fromJson(data.toUtf8(), &parse_error);
    if (doc.isNull() || !doc.isObject()) {
        throw QueueError("Failed to decode stored job: " + parse_error.errorString().toStdString());
    }
    return BuildJob::from_json(doc.object());
}

SqlBuildQueue::SqlBuildQueue(SqlQueueOptions options)
    : options_(std::move(options)),
      connection_prefix_(QString("BuildyardQueue_%1_").arg(instance_counter.fetch_add(1))) {
    if (options_.driver != "QSQLITE" && options_.driver != "QPSQL") {
        throw QueueError("Unsupported queue driver: " + options_.driver);
    }
    if (!QSqlDatabase::isDriverAvailable(QString::fromStdString(options_.driver))) {
        throw QueueError("Qt SQL driver not available: " + options_.driver);
    }
    init_schema();
}

static unsigned int thread_unique_id() {
    thread_local unsigned int id = thread_id_counter.fetch_add(1);
    return id;
}

QString SqlBuildQueue::thread_connection_name() const {
    return connection_prefix_ + QString::number(thread_unique_id());
}

void SqlBuildQueue::release_thread_resources() {
    const QString connection_name = thread_connection_name();
    std::lock_guard<std::mutex> lock(connection_mutex_);
    if (!QSqlDatabase::contains(connection_name)) return;
    {
        QSqlDatabase db = QSqlDatabase::database(connection_name, false);
        if (db.isOpen()) db.close();
    }
    QSqlDatabase::removeDatabase(connection_name);
}

QSqlDatabase SqlBuildQueue::get_thread_connection() {
    const QString connection_name = thread_connection_name();

    for (int attempt = 1; attempt <= max_attempts; ++attempt) {
        QSqlDatabase db;
        {
            std::lock_guard<std::mutex> lock(connection_mutex_);
            if (QSqlDatabase::contains(connection_name)) {
                db = QSqlDatabase::database(connection_name, false);
            } else {
                db = QSqlDatabase::addDatabase(QString::fromStdString(options_.driver), connection_name);
                db.setDatabaseName(QString::fromStdString(options_.database));
                if (!is_sqlite()) {
                    if (!options_.host.empty()) db.setHostName(QString::fromStdString(options_.host));
                    if (options_.port > 0) db.setPort(options_.port);
                    if (!options_.user.empty()) db.setUserName(QString::fromStdString(options_.user));
                    if (!options_.password.empty()) db.setPassword(QString::fromStdString(options_.password));
                } else {
                    db.setConnectOptions(QStringLiteral("QSQLITE_BUSY_TIMEOUT=5000"));
                }
            }
        }

        if (db.isOpen() || db.open()) return db;

        const QString err = db.lastError().text();
        if (!is_transient(err)) {
            throw QueueError("Failed to open queue database connection: " + err.toStdString());
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(get_delay(attempt)));
    }
    throw QueueError("Failed to open queue database connection: database stayed locked");
}

void SqlBuildQueue::init_schema() {
    QSqlDatabase db = get_thread_connection();
    QSqlQuery query(db);

    if (is_sqlite()) {
        for (const char* pragma : {"PRAGMA journal_mode = WAL;", "PRAGMA synchronous = NORMAL;"}) {
            if (!exec_query(query, pragma)) {
                log_warning(std::format("{} failed: {}", pragma, query.lastError().text().toStdString()));
            }
        }
    }

    const QString log_id_column = is_sqlite() ? "id INTEGER PRIMARY KEY AUTOINCREMENT" : "id BIGSERIAL PRIMARY KEY";
    QStringList sql_statements = {
        R"(CREATE TABLE IF NOT EXISTS build_jobs (
            id TEXT PRIMARY KEY,
            data TEXT NOT NULL,
            status TEXT NOT NULL,
            priority INTEGER NOT NULL DEFAULT 0,
            created_at BIGINT NOT NULL,
            worker_id TEXT,
            started_at TEXT,
            completed_at TEXT,
            result TEXT,
            success INTEGER
        ))",
        "CREATE INDEX IF NOT EXISTS idx_build_jobs_status ON build_jobs (status, priority, created_at)",
        QString(R"(CREATE TABLE IF NOT EXISTS build_logs (
            %1,
            job_id TEXT NOT NULL,
            line TEXT NOT NULL,
            logged_at TEXT NOT NULL
        ))").arg(log_id_column),
        "CREATE INDEX IF NOT EXISTS idx_build_logs_job ON build_logs (job_id)",
        R"(CREATE TABLE IF NOT EXISTS active_workers (
            worker_id TEXT PRIMARY KEY,
            registered_at TEXT NOT NULL
        ))"
    };

    for (const QString& statement : sql_statements) {
        require(exec_query(query, statement), query, "Failed to create queue schema");
    }
}

QUuid SqlBuildQueue::enqueue(BuildJob job) {
    job.validate();
    job.id = QUuid::createUuid();
    job.created_at = std::chrono::system_clock::now();

    const QByteArray data = QJsonDocument(job.to_json()).toJson(QJsonDocument::Compact);
    const auto created_us = std::chrono::duration_cast<std::chrono::microseconds>(
        job.created_at.time_since_epoch()).count();

    QSqlQuery query(get_thread_connection());
    query.prepare("INSERT INTO build_jobs (id, data, status, priority, created_at) "
                  "VALUES (:id, :data, :status, :priority, :created_at)");
    query.bindValue(":id", id_str(job.id));
    query.bindValue(":data", QString::fromUtf8(data));
    query.bindValue(":status", QString::fromStdString(job_status_to_string(JobStatus::Queued)));
    query.bindValue(":priority", job.priority);
    query.bindValue(":created_at", QVariant::fromValue<qlonglong>(created_us));
    require(exec_query(query), query, "Failed to enqueue job");

    log_verbose(std::format("Enqueued job {} ({} @ {})", uuid_string(job.id), job.git_repo, short_sha(job.git_sha)));
    return job.id;
}

// Closes out a claimed row whose payload no longer decodes, so it still
// reaches a terminal status with a result attached
static void fail_undecodable(QSqlDatabase& db, const QString& id, const std::string& reason) {
    log_error(std::format("Dropping job {}: {}", id.toStdString(), reason));

    BuildResult result;
    result.job_id = QUuid::fromString(id);
    result.success = false;
    result.error_message = reason;

    QSqlQuery query(db);
    query.prepare("UPDATE build_jobs SET status = 'failed', completed_at = :ts, result = :result, success = 0 "
                  "WHERE id = :id");
    query.bindValue(":ts", now_iso());
    query.bindValue(":result", QString::fromStdString(result.to_json_string()));
    query.bindValue(":id", id);
    require(exec_query(query), query, "Failed to mark undecodable job failed");
}

std::optional<BuildJob> SqlBuildQueue::try_claim_sqlite(QSqlDatabase& db) {
    QSqlQuery query(db);
    require(exec_query(query, "BEGIN IMMEDIATE"), query, "Failed to begin dequeue transaction");

    try {
        std::optional<BuildJob> job;
        while (!job) {
            QSqlQuery select(db);
            select.prepare("SELECT id, data FROM build_jobs WHERE status = 'queued' "
                           "ORDER BY priority DESC, created_at ASC, id ASC LIMIT 1");
            require(exec_query(select), select, "Failed to select next job");
            if (!select.next()) break;
            const QString id = select.value(0).toString();
            const QString data = select.value(1).toString();
            select.finish();

            try {
                job = job_from_data(data);
            } catch (const QueueError& e) {
                fail_undecodable(db, id, e.what());
                continue;
            }

            QSqlQuery claim(db);
            claim.prepare("UPDATE build_jobs SET status = 'building', started_at = :started "
                          "WHERE id = :id AND status = 'queued'");
            claim.bindValue(":started", now_iso());
            claim.bindValue(":id", id);
            require(exec_query(claim), claim, "Failed to claim job");
            if (claim.numRowsAffected() != 1) job.reset();
            break;
        }
        require(exec_query(query, "COMMIT"), query, "Failed to commit dequeue transaction");
        return job;
    } catch (const std::exception&) {
        QSqlQuery rollback(db);
        if (!exec_query(rollback, "ROLLBACK")) {
            log_error("Failed to roll back dequeue transaction: " + rollback.lastError().text().toStdString());
        }
        throw;
    }
}

std::optional<BuildJob> SqlBuildQueue::try_claim_postgres(QSqlDatabase& db) {
    while (true) {
        QSqlQuery claim(db);
        claim.prepare(R"(UPDATE build_jobs SET status = 'building', started_at = :started
            WHERE id = (
                SELECT id FROM build_jobs WHERE status = 'queued'
                ORDER BY priority DESC, created_at ASC, id ASC
                LIMIT 1 FOR UPDATE SKIP LOCKED
            )
            RETURNING id, data)");
        claim.bindValue(":started", now_iso());
        require(exec_query(claim), claim, "Failed to dequeue job");
        if (!claim.next()) return std::nullopt;

        const QString id = claim.value(0).toString();
        try {
            return job_from_data(claim.value(1).toString());
        } catch (const QueueError& e) {
            fail_undecodable(db, id, e.what());
        }
    }
}

std::optional<BuildJob> SqlBuildQueue::try_claim() {
    QSqlDatabase db = get_thread_connection();
    return is_sqlite() ? try_claim_sqlite(db) : try_claim_postgres(db);
}

std::optional<BuildJob> SqlBuildQueue::dequeue(std::chrono::milliseconds timeout, const CancelToken& token) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        if (auto job = try_claim()) return job;

        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline || token.done()) return std::nullopt;

        auto wait = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        if (wait > claim_poll_interval) wait = claim_poll_interval;
        if (!token.sleep_for(wait)) return std::nullopt;
    }
}

void SqlBuildQueue::update_status(const QUuid& job_id, JobStatus status, const std::string& worker_id) {
    QString statement = "UPDATE build_jobs SET status = :status, worker_id = :worker";
    if (status == JobStatus::Building) statement += ", started_at = :ts";
    else if (is_terminal(status)) statement += ", completed_at = :ts";
    statement += " WHERE id = :id";

    QSqlQuery query(get_thread_connection());
    query.prepare(statement);
    query.bindValue(":status", QString::fromStdString(job_status_to_string(status)));
    query.bindValue(":worker", QString::fromStdString(worker_id));
    if (status == JobStatus::Building || is_terminal(status)) query.bindValue(":ts", now_iso());
    query.bindValue(":id", id_str(job_id));
    require(exec_query(query), query, "Failed to update job status");
    if (query.numRowsAffected() == 0) {
        throw QueueError("Job not found: " + uuid_string(job_id));
    }
}

void SqlBuildQueue::set_result(const QUuid& job_id, const BuildResult& result) {
    QSqlQuery query(get_thread_connection());
    query.prepare("UPDATE build_jobs SET result = :result, success = :success "
                  "WHERE id = :id AND (success IS NULL OR success = :success_check)");
    query.bindValue(":result", QString::fromStdString(result.to_json_string()));
    query.bindValue(":success", result.success ? 1 : 0);
    query.bindValue(":success_check", result.success ? 1 : 0);
    query.bindValue(":id", id_str(job_id));
    require(exec_query(query), query, "Failed to store build result");

    if (query.numRowsAffected() == 0) {
        if (!get_status(job_id)) throw QueueError("Job not found: " + uuid_string(job_id));
        throw QueueError(std::format("Result for job {} already recorded with success={}",
                                     uuid_string(job_id), !result.success));
    }
}

void SqlBuildQueue::append_log(const QUuid& job_id, const std::string& line) {
    QSqlQuery query(get_thread_connection());
    query.prepare("INSERT INTO build_logs (job_id, line, logged_at) VALUES (:id, :line, :ts)");
    query.bindValue(":id", id_str(job_id));
    query.bindValue(":line", QString::fromStdString(line));
    query.bindValue(":ts", now_iso());
    require(exec_query(query), query, "Failed to append log");
}

void SqlBuildQueue::register_worker(const std::string& worker_id) {
    QSqlQuery query(get_thread_connection());
    query.prepare("INSERT INTO active_workers (worker_id, registered_at) VALUES (:worker, :ts) "
                  "ON CONFLICT (worker_id) DO UPDATE SET registered_at = excluded.registered_at");
    query.bindValue(":worker", QString::fromStdString(worker_id));
    query.bindValue(":ts", now_iso());
    require(exec_query(query), query, "Failed to register worker");
}

void SqlBuildQueue::unregister_worker(const std::string& worker_id) {
    QSqlQuery query(get_thread_connection());
    query.prepare("DELETE FROM active_workers WHERE worker_id = :worker");
    query.bindValue(":worker", QString::fromStdString(worker_id));
    require(exec_query(query), query, "Failed to unregister worker");
}

std::optional<BuildJob> SqlBuildQueue::get_job(const QUuid& job_id) {
    QSqlQuery query(get_thread_connection());
    query.prepare("SELECT data FROM build_jobs WHERE id = :id");
    query.bindValue(":id", id_str(job_id));
    require(exec_query(query), query, "Failed to load job");
    if (!query.next()) return std::nullopt;
    return job_from_data(query.value(0).toString());
}

std::optional<JobStatus> SqlBuildQueue::get_status(const QUuid& job_id) {
    QSqlQuery query(get_thread_connection());
    query.prepare("SELECT status FROM build_jobs WHERE id = :id");
    query.bindValue(":id", id_str(job_id));
    require(exec_query(query), query, "Failed to load job status");
    if (!query.next()) return std::nullopt;
    return job_status_from_string(query.value(0).toString().toStdString());
}

std::optional<BuildResult> SqlBuildQueue::get_result(const QUuid& job_id) {
    QSqlQuery query(get_thread_connection());
    query.prepare("SELECT result FROM build_jobs WHERE id = :id");
    query.bindValue(":id", id_str(job_id));
    require(exec_query(query), query, "Failed to load build result");
    if (!query.next() || query.value(0).isNull()) return std::nullopt;

    QJsonDocument doc = QJsonDocument::fromJson(query.value(0).toString().toUtf8());
    if (!doc.isObject()) throw QueueError("Stored build result is not a JSON object");
    return BuildResult::from_json(doc.object());
}

bool SqlBuildQueue::cancel(const QUuid& job_id) {
    QSqlQuery query(get_thread_connection());
    query.prepare("UPDATE build_jobs SET status = 'cancelled', completed_at = :ts "
                  "WHERE id = :id AND status = 'queued'");
    query.bindValue(":ts", now_iso());
    query.bindValue(":id", id_str(job_id));
    require(exec_query(query), query, "Failed to cancel job");
    return query.numRowsAffected() == 1;
}

std::int64_t SqlBuildQueue::queue_length() {
    QSqlQuery query(get_thread_connection());
    require(exec_query(query, "SELECT COUNT(*) FROM build_jobs WHERE status = 'queued'"), query,
            "Failed to count queued jobs");
    return query.next() ? query.value(0).toLongLong() : 0;
}

std::vector<std::string> SqlBuildQueue::active_workers() {
    QSqlQuery query(get_thread_connection());
    require(exec_query(query, "SELECT worker_id FROM active_workers ORDER BY worker_id"), query,
            "Failed to list workers");
    std::vector<std::string> workers;
    while (query.next()) workers.emplace_back(query.value(0).toString().toStdString());
    return workers;
}

std::vector<std::string> SqlBuildQueue::logs(const QUuid& job_id) {
    QSqlQuery query(get_thread_connection());
    query.prepare("SELECT line FROM build_logs WHERE job_id = :id ORDER BY id");
    query.bindValue(":id", id_str(job_id));
    require(exec_query(query), query, "Failed to read logs");
    std::vector<std::string> lines;
    while (query.next()) lines.emplace_back(query.value(0).toString().toStdString());
    return lines;
}
