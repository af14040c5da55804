#pragma once

/**
 * @file background_task.hpp
 * @brief Base class of scheduler-visible units of work
 *
 * A task runs exactly once: ENQUEUED -> RUNNING -> SUCCEEDED | FAILED.
 * run() never throws; an exception escaping do_work() becomes a failure whose
 * output carries the exception message under "error" (UNKNOWN_EXCEPTION_MESSAGE
 * for anything not derived from std::exception).
 */

#include <xfer/bridge/progress.hpp>
#include <xfer/task/engine.hpp>
#include <xfer/task/foreground.hpp>
#include <xfer/task/task_data.hpp>

#include <atomic>
#include <cstdint>
#include <stop_token>
#include <string_view>

namespace xfer::task {

using WorkId = uint64_t;

namespace keys {
/// Failure output: exception or cancellation message
constexpr std::string_view ERROR = "error";
/// Failure output: non-zero engine result
constexpr std::string_view ERROR_CODE = "error_code";
}  // namespace keys

/// Failure output "error" when do_work() throws something other than std::exception
constexpr std::string_view UNKNOWN_EXCEPTION_MESSAGE = "unknown exception";

enum class TaskState : uint8_t {
    ENQUEUED,
    RUNNING,
    SUCCEEDED,
    FAILED,
};

constexpr std::string_view task_state_name(TaskState state) noexcept {
    switch (state) {
        case TaskState::ENQUEUED:
            return "ENQUEUED";
        case TaskState::RUNNING:
            return "RUNNING";
        case TaskState::SUCCEEDED:
            return "SUCCEEDED";
        case TaskState::FAILED:
            return "FAILED";
    }
    return "UNKNOWN";
}

/**
 * @brief Result handed back to the scheduler; there is no retry variant
 */
struct TaskOutcome {
    enum class Kind : uint8_t { SUCCESS, FAILURE };

    Kind kind = Kind::FAILURE;
    TaskData output;

    static TaskOutcome success(TaskData output = {}) {
        return TaskOutcome{Kind::SUCCESS, std::move(output)};
    }

    static TaskOutcome failure(TaskData output = {}) {
        return TaskOutcome{Kind::FAILURE, std::move(output)};
    }

    bool is_success() const noexcept { return kind == Kind::SUCCESS; }
};

struct TaskParameters {
    WorkId work_id = 0;
    TaskData input;
    std::stop_token stop_token;
    uint32_t run_attempt = 1;
};

/**
 * @brief Collaborators shared by every task a scheduler runs
 */
struct TaskEnvironment {
    ITransferEngine& engine;
    bridge::ProgressRegistry& progress;
    IForegroundPromoter* promoter = nullptr;
    ForegroundConfig foreground{};
};

class BackgroundTask {
public:
    explicit BackgroundTask(TaskParameters params) : params_(std::move(params)) {}
    virtual ~BackgroundTask() = default;

    BackgroundTask(const BackgroundTask&)            = delete;
    BackgroundTask& operator=(const BackgroundTask&) = delete;

    /**
     * @brief Execute the task; a second call fails without running anything
     */
    TaskOutcome run() noexcept;

    virtual std::string_view type_name() const noexcept = 0;

    TaskState state() const noexcept { return state_.load(std::memory_order_acquire); }
    WorkId work_id() const noexcept { return params_.work_id; }
    uint32_t run_attempt() const noexcept { return params_.run_attempt; }
    bool is_stopped() const noexcept { return params_.stop_token.stop_requested(); }

protected:
    virtual TaskOutcome do_work() = 0;

    const TaskData& input() const noexcept { return params_.input; }
    const std::stop_token& stop_token() const noexcept { return params_.stop_token; }

private:
    TaskParameters params_;
    std::atomic<TaskState> state_{TaskState::ENQUEUED};
};

}  // namespace xfer::task
