#pragma once

/**
 * @file work_scheduler.hpp
 * @brief In-process work scheduler running background tasks on worker threads
 *
 * Plays the host scheduler's role: work is enqueued by task type name, built
 * through a TaskLoader when a worker picks it up, and its final state and output
 * record stay queryable afterwards.
 *
 * States: ENQUEUED -> RUNNING -> SUCCEEDED | FAILED | CANCELLED, or
 * ENQUEUED -> CANCELLED. Cancelling running work requests a cooperative stop:
 * the work ends CANCELLED if the task then reports failure, and SUCCEEDED if it
 * completed anyway.
 *
 * Records of the finished_history most recently finished works are kept; older
 * ones are forgotten and look like unknown ids.
 */

#include <xfer/common/error.hpp>
#include <xfer/task/background_task.hpp>
#include <xfer/task/task_factory.hpp>
#include <xfer/task/task_data.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace xfer::task {

enum class WorkState : uint8_t {
    ENQUEUED,
    RUNNING,
    SUCCEEDED,
    FAILED,
    CANCELLED,
};

constexpr std::string_view work_state_name(WorkState state) noexcept {
    switch (state) {
        case WorkState::ENQUEUED:
            return "ENQUEUED";
        case WorkState::RUNNING:
            return "RUNNING";
        case WorkState::SUCCEEDED:
            return "SUCCEEDED";
        case WorkState::FAILED:
            return "FAILED";
        case WorkState::CANCELLED:
            return "CANCELLED";
    }
    return "UNKNOWN";
}

constexpr bool is_finished(WorkState state) noexcept {
    return state == WorkState::SUCCEEDED || state == WorkState::FAILED ||
           state == WorkState::CANCELLED;
}

/// Output "error" of work whose task could not be constructed
constexpr std::string_view CONSTRUCTION_FAILED_MESSAGE = "task construction failed";

struct WorkRequest {
    std::string task_type;
    TaskData input;
};

struct WorkInfo {
    WorkId id = 0;
    std::string task_type;
    WorkState state = WorkState::ENQUEUED;
    TaskData output;
    uint32_t run_attempt = 0;
};

struct WorkSchedulerConfig {
    size_t worker_threads   = 2;
    size_t max_queue_size   = 256;
    size_t finished_history = 1024;
};

struct WorkSchedulerStats {
    uint64_t enqueued  = 0;
    uint64_t rejected  = 0;
    uint64_t succeeded = 0;
    uint64_t failed    = 0;
    uint64_t cancelled = 0;
    size_t queue_size  = 0;
    /// Work records currently held, pending and running included
    size_t retained    = 0;
};

class WorkScheduler {
public:
    WorkScheduler(const TaskLoader& loader, TaskEnvironment env,
                  WorkSchedulerConfig config = WorkSchedulerConfig{});
    ~WorkScheduler();

    WorkScheduler(const WorkScheduler&)            = delete;
    WorkScheduler& operator=(const WorkScheduler&) = delete;

    /**
     * @brief Start the worker threads
     * @return false if already running
     */
    bool start();

    /**
     * @brief Cancel pending work, wait for running work and join the workers
     */
    void stop();

    bool is_running() const noexcept;

    /**
     * @brief Queue work; SCHEDULER_STOPPED when not running, SCHEDULER_OVERLOADED
     *        when max_queue_size items are pending
     */
    common::Result<WorkId> enqueue(WorkRequest request);

    std::optional<WorkInfo> get_work_info(WorkId id) const;

    /**
     * @return true if the work was pending or running; false if unknown or finished
     */
    bool cancel(WorkId id);

    /**
     * @brief Block until the work finished
     *
     * WORK_NOT_FOUND for an unknown id, OPERATION_TIMEOUT if it is still unfinished
     * after @p timeout.
     */
    common::Result<WorkInfo> wait(WorkId id, std::chrono::milliseconds timeout);

    WorkSchedulerStats stats() const;

    const WorkSchedulerConfig& config() const noexcept;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace xfer::task
