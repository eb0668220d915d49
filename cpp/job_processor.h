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

#ifndef JOB_PROCESSOR_H
#define JOB_PROCESSOR_H

#include "build_executor.h"
#include "build_queue.h"
#include "callback_notifier.h"
#include "config.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <semaphore>
#include <stop_token>
#include <string>
#include <utility>

#include <QJsonObject>

class AdmissionSlots;

// Holds one admission slot and gives it back exactly once
class SlotGuard {
public:
    SlotGuard(const SlotGuard&) = delete;
    SlotGuard& operator=(const SlotGuard&) = delete;
    SlotGuard(SlotGuard&& other) noexcept : slots_(std::exchange(other.slots_, nullptr)) {}
    SlotGuard& operator=(SlotGuard&& other) noexcept;
    ~SlotGuard() { release(); }

    void release();
    bool held() const { return slots_ != nullptr; }

private:
    friend class AdmissionSlots;
    explicit SlotGuard(AdmissionSlots* slots) : slots_(slots) {}

    AdmissionSlots* slots_;
};

// Counting semaphore bounding the builds one worker runs at a time
class AdmissionSlots {
public:
    explicit AdmissionSlots(int capacity);

    std::optional<SlotGuard> try_acquire();

    int capacity() const { return capacity_; }
    int available() const { return capacity_ - held_.load(); }

private:
    friend class SlotGuard;
    void release();

    int capacity_;
    std::counting_semaphore<> semaphore_;
    std::atomic<int> held_{0};
};

struct ProcessorOptions {
    std::string worker_id;
    int max_concurrent_builds = 3;
    std::chrono::milliseconds poll_interval{std::chrono::seconds(5)};
    std::chrono::milliseconds build_timeout{std::chrono::minutes(30)};
    std::chrono::milliseconds shutdown_timeout{std::chrono::minutes(5)};
    std::chrono::milliseconds unregister_timeout{std::chrono::seconds(5)};
    std::chrono::milliseconds dequeue_backoff{std::chrono::seconds(1)};

    // Starts a build on its own thread. Empty means a detached std::thread.
    std::function<void(std::move_only_function<void()>)> launch_build;

    static ProcessorOptions from_config(const WorkerConfig& config);
};

struct ProcessorStats {
    std::string worker_id;
    int max_concurrent = 0;
    int active_builds = 0;
    int available_slots = 0;
    std::uint64_t processed = 0;
    std::uint64_t succeeded = 0;
    std::uint64_t failed = 0;
    bool shutting_down = false;

    QJsonObject to_json() const;
};

// Pulls jobs from the queue and runs each on its own thread, never more
// than max_concurrent_builds at once. Build threads share ownership of the
// processor, so it must be created through create().
class JobProcessor : public std::enable_shared_from_this<JobProcessor> {
public:
    static std::shared_ptr<JobProcessor> create(ProcessorOptions options,
                                                std::shared_ptr<BuildQueue> queue,
                                                std::shared_ptr<Builder> builder,
                                                std::shared_ptr<CallbackNotifier> notifier);

    // Blocks until shutdown has completed. Returns 0 after a full drain, 1 if
    // the shutdown ceiling cut in-flight builds short. A stop request on
    // `stop` also cancels the builds in flight.
    int run(std::stop_token stop);

    // Stops admitting new jobs; in-flight builds keep running until drained
    void request_shutdown();

    ProcessorStats stats() const;
    const ProcessorOptions& options() const { return options_; }

private:
    JobProcessor(ProcessorOptions options, std::shared_ptr<BuildQueue> queue,
                 std::shared_ptr<Builder> builder, std::shared_ptr<CallbackNotifier> notifier);

    void dispatch(BuildJob job, SlotGuard slot);
    void process_job(const BuildJob& job, const CancelToken& token);
    void fail_unstarted(const QUuid& job_id, const QUuid& release_id, const std::string& reason);
    void task_finished();
    bool drain(std::chrono::milliseconds timeout);
    void unregister();

    ProcessorOptions options_;
    std::shared_ptr<BuildQueue> queue_;
    std::shared_ptr<Builder> builder_;
    std::shared_ptr<CallbackNotifier> notifier_;

    AdmissionSlots slots_;
    std::stop_source admission_stop_;
    std::stop_source build_stop_;

    mutable std::mutex state_mutex_;
    std::condition_variable_any state_cv_;
    int in_flight_ = 0;

    std::atomic<std::uint64_t> processed_{0};
    std::atomic<std::uint64_t> succeeded_{0};
    std::atomic<std::uint64_t> failed_{0};
};

#endif // JOB_PROCESSOR_H
