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

#include "job_processor.h"
#include "utilities.h"

#include <algorithm>
#include <format>
#include <functional>
#include <future>
#include <stdexcept>
#include <system_error>
#include <thread>

SlotGuard& SlotGuard::operator=(SlotGuard&& other) noexcept {
    if (this != &other) {
        release();
        slots_ = std::exchange(other.slots_, nullptr);
    }
    return *this;
}

void SlotGuard::release() {
    if (slots_) std::exchange(slots_, nullptr)->release();
}

AdmissionSlots::AdmissionSlots(int capacity)
    : capacity_(capacity), semaphore_(std::max(capacity, 0)) {
    if (capacity < 1) throw std::invalid_argument("At least one build slot is required");
}

std::optional<SlotGuard> AdmissionSlots::try_acquire() {
    if (!semaphore_.try_acquire()) return std::nullopt;
    ++held_;
    return SlotGuard(this);
}

void AdmissionSlots::release() {
    --held_;
    semaphore_.release();
}

ProcessorOptions ProcessorOptions::from_config(const WorkerConfig& config) {
    ProcessorOptions options;
    options.worker_id = config.worker_id;
    options.max_concurrent_builds = config.max_concurrent_builds;
    options.poll_interval = config.poll_interval;
    options.build_timeout = config.build_timeout;
    options.shutdown_timeout = config.shutdown_timeout;
    options.unregister_timeout = config.unregister_timeout;
    options.dequeue_backoff = config.dequeue_backoff;
    return options;
}

QJsonObject ProcessorStats::to_json() const {
    QJsonObject obj;
    obj["worker_id"] = QString::fromStdString(worker_id);
    obj["max_concurrent"] = max_concurrent;
    obj["active_builds"] = active_builds;
    obj["available_slots"] = available_slots;
    obj["processed"] = static_cast<qint64>(processed);
    obj["succeeded"] = static_cast<qint64>(succeeded);
    obj["failed"] = static_cast<qint64>(failed);
    obj["shutting_down"] = shutting_down;
    return obj;
}

std::shared_ptr<JobProcessor> JobProcessor::create(ProcessorOptions options,
                                                   std::shared_ptr<BuildQueue> queue,
                                                   std::shared_ptr<Builder> builder,
                                                   std::shared_ptr<CallbackNotifier> notifier) {
    return std::shared_ptr<JobProcessor>(
        new JobProcessor(std::move(options), std::move(queue), std::move(builder), std::move(notifier)));
}

JobProcessor::JobProcessor(ProcessorOptions options, std::shared_ptr<BuildQueue> queue,
                           std::shared_ptr<Builder> builder, std::shared_ptr<CallbackNotifier> notifier)
    : options_(std::move(options)),
      queue_(std::move(queue)),
      builder_(std::move(builder)),
      notifier_(std::move(notifier)),
      slots_(options_.max_concurrent_builds) {
    if (!queue_ || !builder_) throw std::invalid_argument("JobProcessor needs a queue and a builder");
}

void JobProcessor::request_shutdown() {
    if (admission_stop_.request_stop()) {
        log_info("Shutdown requested, no longer accepting jobs");
    }
    state_cv_.notify_all();
}

ProcessorStats JobProcessor::stats() const {
    ProcessorStats stats;
    stats.worker_id = options_.worker_id;
    stats.max_concurrent = slots_.capacity();
    stats.available_slots = slots_.available();
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        stats.active_builds = in_flight_;
    }
    stats.processed = processed_.load();
    stats.succeeded = succeeded_.load();
    stats.failed = failed_.load();
    stats.shutting_down = admission_stop_.stop_requested();
    return stats;
}

int JobProcessor::run(std::stop_token stop) {
    std::stop_callback on_stop(stop, [this] {
        admission_stop_.request_stop();
        build_stop_.request_stop();
        state_cv_.notify_all();
    });

    try {
        queue_->register_worker(options_.worker_id);
    } catch (const std::exception& e) {
        log_error(std::format("Failed to register worker {}: {}", options_.worker_id, e.what()));
    }
    log_info(std::format("Worker {} started with {} build slots", options_.worker_id, slots_.capacity()));

    const std::stop_token admission = admission_stop_.get_token();
    while (!admission.stop_requested()) {
        std::optional<SlotGuard> slot = slots_.try_acquire();
        if (!slot) {
            std::unique_lock<std::mutex> lock(state_mutex_);
            state_cv_.wait_for(lock, admission, std::chrono::milliseconds(200),
                               [this] { return slots_.available() > 0; });
            continue;
        }

        std::optional<BuildJob> job;
        try {
            job = queue_->dequeue(options_.poll_interval, CancelToken(admission));
        } catch (const std::exception& e) {
            log_error(std::format("Failed to dequeue job: {}", e.what()));
            slot->release();
            CancelToken(admission).sleep_for(options_.dequeue_backoff);
            continue;
        }
        if (!job) continue;

        dispatch(std::move(*job), std::move(*slot));
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        log_info(std::format("Waiting for {} in-flight builds to finish", in_flight_));
    }
    const bool drained = drain(options_.shutdown_timeout);
    if (!drained) {
        log_warning("Shutdown timeout reached, some builds may have been interrupted");
        build_stop_.request_stop();
    }

    unregister();
    queue_->release_thread_resources();
    log_info(std::format("Worker {} stopped", options_.worker_id));
    return drained ? 0 : 1;
}

namespace {

BuildResult failed_result(const QUuid& job_id, const QUuid& release_id, std::string message,
                          std::chrono::steady_clock::time_point start) {
    BuildResult result;
    result.job_id = job_id;
    result.release_id = release_id;
    result.success = false;
    result.error_message = std::move(message);
    std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start;
    result.duration_secs = std::max(elapsed.count(), 1e-6);
    return result;
}

} // namespace

void JobProcessor::dispatch(BuildJob job, SlotGuard slot) {
    const QUuid job_id = job.id;
    const QUuid release_id = job.release_id;
    const CancelToken token = CancelToken(build_stop_.get_token()).with_timeout(options_.build_timeout);
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        ++in_flight_;
    }

    std::move_only_function<void()> task =
        [self = shared_from_this(), job = std::move(job), token, slot = std::move(slot)]() mutable {
            {
                SlotGuard held = std::move(slot);
                self->process_job(job, token);
            }
            self->queue_->release_thread_resources();
            self->task_finished();
        };

    try {
        if (options_.launch_build) options_.launch_build(std::move(task));
        else std::thread(std::move(task)).detach();
    } catch (const std::system_error& e) {
        // The slot went down with the unstarted closure
        log_error(std::format("Could not start a thread for job {}: {}", short_id(job_id), e.what()));
        fail_unstarted(job_id, release_id, std::format("could not start build thread: {}", e.what()));
        task_finished();
    }
}

void JobProcessor::fail_unstarted(const QUuid& job_id, const QUuid& release_id, const std::string& reason) {
    const auto start = std::chrono::steady_clock::now();
    try {
        queue_->set_result(job_id, failed_result(job_id, release_id, reason, start));
    } catch (const std::exception& e) {
        log_error(std::format("Failed to store result of {}: {}", short_id(job_id), e.what()));
    }
    try {
        queue_->update_status(job_id, JobStatus::Failed, options_.worker_id);
    } catch (const std::exception& e) {
        log_error(std::format("Failed to mark job {} failed: {}", short_id(job_id), e.what()));
    }
    ++processed_;
    ++failed_;
}

void JobProcessor::task_finished() {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        --in_flight_;
    }
    state_cv_.notify_all();
}

void JobProcessor::process_job(const BuildJob& job, const CancelToken& token) {
    const std::string id = short_id(job.id);
    const auto start = std::chrono::steady_clock::now();
    log_info(std::format("Processing build {} ({} @ {})", id, job.git_repo, short_sha(job.git_sha)));

    try {
        queue_->update_status(job.id, JobStatus::Building, options_.worker_id);
    } catch (const std::exception& e) {
        log_error(std::format("Failed to mark job {} building: {}", id, e.what()));
    }

    Log log([this, job_id = job.id](const std::string& line) {
        try {
            queue_->append_log(job_id, line);
        } catch (const std::exception& e) {
            log_warning(std::format("Failed to append log line for {}: {}", short_id(job_id), e.what()));
        }
    });

    BuildResult result;
    try {
        result = builder_->execute(job, token, log);
    } catch (const std::exception& e) {
        result = failed_result(job.id, job.release_id, std::format("internal error: {}", e.what()), start);
        log.append(result.error_message);
    }

    try {
        queue_->set_result(job.id, result);
    } catch (const std::exception& e) {
        log_error(std::format("Failed to store result of {}: {}", id, e.what()));
    }
    try {
        queue_->update_status(job.id, result.success ? JobStatus::Completed : JobStatus::Failed, options_.worker_id);
    } catch (const std::exception& e) {
        log_error(std::format("Failed to store final status of {}: {}", id, e.what()));
    }

    ++processed_;
    if (result.success) {
        ++succeeded_;
        log_info(std::format("Build {} completed in {:.1f}s", id, result.duration_secs));
    } else {
        ++failed_;
        log_error(std::format("Build {} failed: {}", id, result.error_message));
    }

    if (!job.callback_url.empty() && notifier_) {
        try {
            notifier_->notify(job.callback_url, result, CancelToken(build_stop_.get_token()));
        } catch (const std::exception& e) {
            log_warning(std::format("Callback for {} failed: {}", id, e.what()));
        }
    }
}

bool JobProcessor::drain(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(state_mutex_);
    return state_cv_.wait_for(lock, timeout, [this] { return in_flight_ == 0; });
}

void JobProcessor::unregister() {
    // A hung queue must not hold up shutdown, so the call runs on its own
    // thread and is abandoned after unregister_timeout
    auto outcome = std::make_shared<std::promise<void>>();
    std::future<void> finished = outcome->get_future();
    try {
        std::thread([queue = queue_, worker_id = options_.worker_id, outcome] {
            try {
                queue->unregister_worker(worker_id);
                outcome->set_value();
            } catch (...) {
                outcome->set_exception(std::current_exception());
            }
            queue->release_thread_resources();
        }).detach();
    } catch (const std::system_error& e) {
        log_error(std::format("Could not start unregistration of {}: {}", options_.worker_id, e.what()));
        return;
    }

    if (finished.wait_for(options_.unregister_timeout) != std::future_status::ready) {
        log_warning(std::format("Unregistering worker {} timed out", options_.worker_id));
        return;
    }
    try {
        finished.get();
        log_info(std::format("Worker {} unregistered", options_.worker_id));
    } catch (const std::exception& e) {
        log_error(std::format("Failed to unregister worker {}: {}", options_.worker_id, e.what()));
    }
}
