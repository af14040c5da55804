#include <xfer/common/debug.hpp>
#include <xfer/task/background_task.hpp>

#include <exception>

namespace xfer::task {

namespace {
constexpr std::string_view LOG_CAT = common::debug::category::TASK;
}  // namespace

TaskOutcome BackgroundTask::run() noexcept {
    TaskState expected = TaskState::ENQUEUED;
    if (!state_.compare_exchange_strong(expected, TaskState::RUNNING,
                                        std::memory_order_acq_rel)) {
        XFER_LOG_ERROR(LOG_CAT, type_name() << " for work " << params_.work_id
                                            << " already left ENQUEUED ("
                                            << task_state_name(expected) << ")");
        return TaskOutcome::failure();
    }

    XFER_LOG_DEBUG(LOG_CAT, type_name() << " started for work " << params_.work_id
                                        << " (attempt " << params_.run_attempt << ")");

    TaskOutcome outcome;
    try {
        outcome = do_work();
    } catch (const std::exception& e) {
        XFER_LOG_ERROR(LOG_CAT, type_name() << " for work " << params_.work_id
                                            << " threw: " << e.what());
        outcome = TaskOutcome::failure(
            TaskData::Builder().put_string(std::string(keys::ERROR), e.what()).build());
    } catch (...) {
        XFER_LOG_ERROR(LOG_CAT, type_name() << " for work " << params_.work_id
                                            << " threw a non-standard exception");
        outcome = TaskOutcome::failure(TaskData::Builder()
                                           .put_string(std::string(keys::ERROR),
                                                       std::string(UNKNOWN_EXCEPTION_MESSAGE))
                                           .build());
    }

    state_.store(outcome.is_success() ? TaskState::SUCCEEDED : TaskState::FAILED,
                 std::memory_order_release);
    XFER_LOG_DEBUG(LOG_CAT, type_name() << " for work " << params_.work_id << " finished "
                                        << task_state_name(state()));
    return outcome;
}

}  // namespace xfer::task
