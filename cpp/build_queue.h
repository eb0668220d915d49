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

#ifndef BUILD_QUEUE_H
#define BUILD_QUEUE_H

#include "build_types.h"
#include "cancel_token.h"

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

class QueueError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Shared, multi-worker job queue. Implementations must make dequeue atomic:
// no two callers, in this process or another, ever receive the same job.
class BuildQueue {
public:
    virtual ~BuildQueue() = default;

    // Assigns id and created_at, stores the job as queued, returns the id
    virtual QUuid enqueue(BuildJob job) = 0;

    // Waits up to `timeout` for a job; the returned job is already `building`
    virtual std::optional<BuildJob> dequeue(std::chrono::milliseconds timeout, const CancelToken& token) = 0;

    virtual void update_status(const QUuid& job_id, JobStatus status, const std::string& worker_id) = 0;
    virtual void set_result(const QUuid& job_id, const BuildResult& result) = 0;
    virtual void append_log(const QUuid& job_id, const std::string& line) = 0;

    virtual void register_worker(const std::string& worker_id) = 0;
    virtual void unregister_worker(const std::string& worker_id) = 0;

    virtual std::optional<BuildJob> get_job(const QUuid& job_id) = 0;
    virtual std::optional<JobStatus> get_status(const QUuid& job_id) = 0;
    virtual std::optional<BuildResult> get_result(const QUuid& job_id) = 0;

    // Only a queued job can be cancelled; returns false otherwise
    virtual bool cancel(const QUuid& job_id) = 0;

    virtual std::int64_t queue_length() = 0;
    virtual std::vector<std::string> active_workers() = 0;
    virtual std::vector<std::string> logs(const QUuid& job_id) = 0;

    // Called by short-lived threads before they exit
    virtual void release_thread_resources() {}
};

#endif // BUILD_QUEUE_H
