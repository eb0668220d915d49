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

#ifndef BUILDYARD_TESTS_FAKES_H
#define BUILDYARD_TESTS_FAKES_H

#include "build_executor.h"
#include "build_queue.h"
#include "callback_notifier.h"
#include "cluster_client.h"
#include "http_client.h"
#include "registry_client.h"

#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

inline BuildJob sample_job(const std::string& sha = "abc123def456") {
    BuildJob job;
    job.id = QUuid::createUuid();
    job.release_id = QUuid::createUuid();
    job.service_id = QUuid::createUuid();
    job.project_id = QUuid::createUuid();
    job.service_name = "api";
    job.git_repo = "https://github.com/example/api";
    job.git_sha = sha;
    job.git_branch = "main";
    return job;
}

// In-memory queue with hooks for injecting failures and delays
class FakeQueue : public BuildQueue {
public:
    QUuid enqueue(BuildJob job) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (job.id.isNull()) job.id = QUuid::createUuid();
        job.created_at = std::chrono::system_clock::now();
        jobs_[job.id] = job;
        statuses_[job.id] = JobStatus::Queued;
        pending_.push_back(job.id);
        return job.id;
    }

    std::optional<BuildJob> dequeue(std::chrono::milliseconds timeout, const CancelToken& token) override {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (true) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (dequeue_failures > 0) {
                    --dequeue_failures;
                    throw QueueError("queue unavailable");
                }
                if (!pending_.empty()) {
                    QUuid id = pending_.front();
                    pending_.pop_front();
                    statuses_[id] = JobStatus::Building;
                    return jobs_[id];
                }
            }
            if (std::chrono::steady_clock::now() >= deadline) return std::nullopt;
            if (!token.sleep_for(std::chrono::milliseconds(5))) return std::nullopt;
        }
    }

    void update_status(const QUuid& job_id, JobStatus status, const std::string& worker_id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!statuses_.contains(job_id)) throw QueueError("Job not found");
        statuses_[job_id] = status;
        workers_of_[job_id] = worker_id;
        if (is_terminal(status)) ++terminal_count_;
    }

    void set_result(const QUuid& job_id, const BuildResult& result) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = results_.find(job_id);
        if (it != results_.end() && it->second.success != result.success) {
            throw QueueError("Result already recorded");
        }
        results_[job_id] = result;
    }

    void append_log(const QUuid& job_id, const std::string& line) override {
        std::lock_guard<std::mutex> lock(mutex_);
        logs_[job_id].push_back(line);
    }

    void register_worker(const std::string& worker_id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        workers_.push_back(worker_id);
    }

    void unregister_worker(const std::string& worker_id) override {
        if (unregister_delay.count() > 0) std::this_thread::sleep_for(unregister_delay);
        std::lock_guard<std::mutex> lock(mutex_);
        std::erase(workers_, worker_id);
        ++unregister_calls_;
        terminal_at_unregister_ = terminal_count_;
    }

    std::optional<BuildJob> get_job(const QUuid& job_id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = jobs_.find(job_id);
        if (it == jobs_.end()) return std::nullopt;
        return it->second;
    }

    std::optional<JobStatus> get_status(const QUuid& job_id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = statuses_.find(job_id);
        if (it == statuses_.end()) return std::nullopt;
        return it->second;
    }

    std::optional<BuildResult> get_result(const QUuid& job_id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = results_.find(job_id);
        if (it == results_.end()) return std::nullopt;
        return it->second;
    }

    bool cancel(const QUuid& job_id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (statuses_[job_id] != JobStatus::Queued) return false;
        statuses_[job_id] = JobStatus::Cancelled;
        std::erase(pending_, job_id);
        return true;
    }

    std::int64_t queue_length() override {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<std::int64_t>(pending_.size());
    }

    std::vector<std::string> active_workers() override {
        std::lock_guard<std::mutex> lock(mutex_);
        return workers_;
    }

    std::vector<std::string> logs(const QUuid& job_id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        return logs_[job_id];
    }

    int unregister_calls() {
        std::lock_guard<std::mutex> lock(mutex_);
        return unregister_calls_;
    }

    int terminal_at_unregister() {
        std::lock_guard<std::mutex> lock(mutex_);
        return terminal_at_unregister_;
    }

    int terminal_count() {
        std::lock_guard<std::mutex> lock(mutex_);
        return terminal_count_;
    }

    int dequeue_failures = 0;
    std::chrono::milliseconds unregister_delay{0};

private:
    std::mutex mutex_;
    std::deque<QUuid> pending_;
    std::map<QUuid, BuildJob> jobs_;
    std::map<QUuid, JobStatus> statuses_;
    std::map<QUuid, std::string> workers_of_;
    std::map<QUuid, BuildResult> results_;
    std::map<QUuid, std::vector<std::string>> logs_;
    std::vector<std::string> workers_;
    int unregister_calls_ = 0;
    int terminal_count_ = 0;
    int terminal_at_unregister_ = -1;
};

// How one stage's cluster job behaves
struct StageScript {
    enum class Outcome { Complete, Failed, StreamClosed, WatchError, Deleted, Hang };

    bool create_fails = false;
    Outcome outcome = Outcome::Complete;
    std::string failure_reason = "BackoffLimitExceeded";
    std::string failure_message = "Job has reached the specified backoff limit";
    std::vector<std::string> logs;
    bool logs_fail = false;
};

// Cluster whose jobs finish the way their stage script says. The stage is
// the job name's prefix: build, sbom or sign.
class ScriptedCluster : public ClusterClient {
public:
    std::map<std::string, StageScript> stages;

    void create_job(const ClusterJobSpec& spec, const CancelToken& token) override {
        token.check();
        std::lock_guard<std::mutex> lock(mutex_);
        if (script(spec.name).create_fails) throw ClusterError("connection refused");
        created_.push_back(spec);
    }

    void watch_job(const std::string&, const std::string& name, const CancelToken& token,
                   const EventHandler& on_event) override {
        const StageScript stage = script(name);
        WatchEvent added;
        added.type = "ADDED";
        added.job_name = name;
        if (!on_event(added)) return;

        WatchEvent event;
        event.type = "MODIFIED";
        event.job_name = name;
        switch (stage.outcome) {
            case StageScript::Outcome::Complete:
                event.conditions.push_back({"Complete", "True", "", ""});
                break;
            case StageScript::Outcome::Failed:
                event.conditions.push_back({"Failed", "True", stage.failure_reason, stage.failure_message});
                break;
            case StageScript::Outcome::StreamClosed:
                return;
            case StageScript::Outcome::WatchError:
                event.type = "ERROR";
                event.error_message = "too old resource version";
                break;
            case StageScript::Outcome::Deleted:
                event.type = "DELETED";
                break;
            case StageScript::Outcome::Hang:
                while (token.sleep_for(std::chrono::milliseconds(10))) {}
                token.check();
                return;
        }
        on_event(event);
    }

    std::string find_job_pod(const std::string&, const std::string& job_name, const CancelToken&) override {
        return job_name + "-x7k2p";
    }

    void stream_pod_logs(const std::string&, const std::string& pod, const std::string&,
                         const CancelToken&, const LineHandler& on_line) override {
        const StageScript stage = script(pod);
        if (stage.logs_fail) throw ClusterError("pod logs unavailable");
        for (const auto& line : stage.logs) {
            if (!on_line(line)) return;
        }
    }

    std::vector<ClusterJobSpec> created() {
        std::lock_guard<std::mutex> lock(mutex_);
        return created_;
    }

private:
    StageScript script(const std::string& name) {
        std::string prefix = name.substr(0, name.find('-'));
        auto it = stages.find(prefix);
        return it == stages.end() ? StageScript() : it->second;
    }

    std::mutex mutex_;
    std::vector<ClusterJobSpec> created_;
};

class FakeRegistry : public RegistryClient {
public:
    FakeRegistry() : RegistryClient("", "", nullptr) {}

    std::string resolve_digest(const std::string& image, const CancelToken&) const override {
        if (fail) throw HttpError("manifest unknown: " + image, 404);
        return digest;
    }

    std::string digest = "sha256:4f6a1c9d7e2b8a3f5c0e1d9b7a6f4e3d2c1b0a9f8e7d6c5b4a3f2e1d0c9b8a7f";
    bool fail = false;
};

// Builder driven by a test-provided function
class ScriptedBuilder : public Builder {
public:
    using Script = std::function<BuildResult(const BuildJob&, const CancelToken&, Log&)>;

    explicit ScriptedBuilder(Script script) : script_(std::move(script)) {}

    BuildResult execute(const BuildJob& job, const CancelToken& token, Log& log) override {
        return script_(job, token, log);
    }

private:
    Script script_;
};

class RecordingNotifier : public CallbackNotifier {
public:
    RecordingNotifier() : CallbackNotifier("", std::chrono::seconds(1), nullptr) {}

    void notify(const std::string& url, const BuildResult& result, const CancelToken&) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            calls_.emplace_back(url, result);
        }
        if (fail) throw HttpError("callback endpoint unreachable", 502);
    }

    std::vector<std::pair<std::string, BuildResult>> calls() {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

    std::atomic<bool> fail{false};

private:
    std::mutex mutex_;
    std::vector<std::pair<std::string, BuildResult>> calls_;
};

// HTTP transport answering from a queue of canned responses
class FakeHttp : public HttpClient {
public:
    struct Canned {
        HttpResponse response;
        std::vector<std::string> lines;  // streamed body for stream_lines
    };

    void push(long status, std::string body = "", std::map<std::string, std::string> headers = {}) {
        Canned canned;
        canned.response.status = status;
        canned.response.body = std::move(body);
        canned.response.headers = std::move(headers);
        responses_.push_back(std::move(canned));
    }

    void push_stream(std::vector<std::string> lines) {
        Canned canned;
        canned.response.status = 200;
        canned.lines = std::move(lines);
        responses_.push_back(std::move(canned));
    }

    HttpResponse perform(const HttpRequest& request, const CancelToken&) const override {
        return next(request).response;
    }

    HttpResponse stream_lines(const HttpRequest& request, const CancelToken&,
                              const std::function<bool(const std::string&)>& on_line) const override {
        Canned canned = next(request);
        if (canned.response.ok()) {
            for (const auto& line : canned.lines) {
                if (!on_line(line)) break;
            }
        }
        return canned.response;
    }

    std::vector<HttpRequest> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

private:
    Canned next(const HttpRequest& request) const {
        std::lock_guard<std::mutex> lock(mutex_);
        requests_.push_back(request);
        if (responses_.empty()) throw HttpError("no canned response for " + request.url);
        Canned canned = responses_.front();
        responses_.pop_front();
        return canned;
    }

    mutable std::mutex mutex_;
    mutable std::deque<Canned> responses_;
    mutable std::vector<HttpRequest> requests_;
};

#endif // BUILDYARD_TESTS_FAKES_H
