/**
 * @file test_work_scheduler.cpp
 * @brief Unit tests for WorkScheduler
 *
 * Tests coverage for:
 * - Lifecycle and enqueue rejection
 * - Running TransferTask work end to end
 * - Cancellation of pending and running work
 * - Construction failures
 * - Queue limits and statistics
 * - Retention of finished work records
 */

#include <xfer/task/task_factory.hpp>
#include <xfer/task/transfer_task.hpp>
#include <xfer/task/work_scheduler.hpp>

#include <xfer_test_support.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <set>
#include <string>
#include <thread>

#include <gtest/gtest.h>

using namespace xfer::task;
using namespace xfer::common;
using namespace std::chrono_literals;

namespace {

/// Shared control block of the gated test task
struct Gate {
    xfer::test::TestLatch started{1};
    xfer::test::TestLatch released{1};
    std::atomic<bool> succeed{true};
    std::atomic<uint64_t> last_trace{0};
};

/// Task that blocks until released or stopped; a stop before release is a failure
class GatedTask : public BackgroundTask {
public:
    GatedTask(TaskParameters params, std::shared_ptr<Gate> gate)
        : BackgroundTask(std::move(params)), gate_(std::move(gate)) {}

    std::string_view type_name() const noexcept override { return "test.Gated"; }

protected:
    TaskOutcome do_work() override {
        gate_->last_trace = debug::TraceScope::current().work_id;
        gate_->started.count_down();
        auto deadline = std::chrono::steady_clock::now() + 5s;
        while (!gate_->released.is_released() && !stop_token().stop_requested() &&
               std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(1ms);
        }
        if (!gate_->released.is_released() && stop_token().stop_requested()) {
            return TaskOutcome::failure(
                TaskData::Builder()
                    .put_string(std::string(keys::ERROR), std::string(CANCELLED_MESSAGE))
                    .build());
        }
        return gate_->succeed ? TaskOutcome::success() : TaskOutcome::failure();
    }

private:
    std::shared_ptr<Gate> gate_;
};

WorkRequest transfer_work(const std::string& url = "https://x/y") {
    return WorkRequest{std::string(TRANSFER_TASK_TYPE), make_transfer_input(url, "/tmp/f")};
}

}  // namespace

class WorkSchedulerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_RESULT_OK(register_builtin_tasks(factory_));
        ASSERT_RESULT_OK(factory_.register_type(
            "test.Gated",
            [gate = gate_](TaskEnvironment&, TaskParameters params) -> std::unique_ptr<BackgroundTask> {
                return std::make_unique<GatedTask>(std::move(params), gate);
            }));
    }

    std::unique_ptr<WorkScheduler> make_scheduler(WorkSchedulerConfig config = {}) {
        auto scheduler = std::make_unique<WorkScheduler>(loader_, env_, config);
        EXPECT_TRUE(scheduler->start());
        return scheduler;
    }

    xfer::test::RecordingEngine engine_;
    xfer::bridge::ProgressRegistry progress_;
    TaskEnvironment env_{engine_, progress_};
    TaskFactory factory_;
    TaskLoader loader_{factory_};
    std::shared_ptr<Gate> gate_ = std::make_shared<Gate>();
};

TEST_F(WorkSchedulerTest, StartStop) {
    WorkScheduler scheduler(loader_, env_);
    EXPECT_FALSE(scheduler.is_running());
    EXPECT_TRUE(scheduler.start());
    EXPECT_FALSE(scheduler.start());
    EXPECT_TRUE(scheduler.is_running());
    scheduler.stop();
    EXPECT_FALSE(scheduler.is_running());
    scheduler.stop();
}

TEST_F(WorkSchedulerTest, EnqueueWhenStopped) {
    WorkScheduler scheduler(loader_, env_);
    EXPECT_RESULT_ERROR(scheduler.enqueue(transfer_work()), ErrorCode::SCHEDULER_STOPPED);
    EXPECT_EQ(scheduler.stats().rejected, 1u);
}

TEST_F(WorkSchedulerTest, RunsTransferWork) {
    auto scheduler = make_scheduler();

    auto id = scheduler->enqueue(transfer_work());
    ASSERT_RESULT_OK(id);
    EXPECT_EQ(id.value(), 1u);

    auto info = scheduler->wait(id.value(), 5000ms);
    ASSERT_RESULT_OK(info);
    EXPECT_EQ(info.value().state, WorkState::SUCCEEDED);
    EXPECT_EQ(info.value().task_type, TRANSFER_TASK_TYPE);
    EXPECT_EQ(info.value().run_attempt, 1u);
    EXPECT_TRUE(info.value().output.empty());
    EXPECT_EQ(engine_.submit_count(), 1u);
    EXPECT_EQ(scheduler->stats().succeeded, 1u);
}

TEST_F(WorkSchedulerTest, EngineFailureRecorded) {
    engine_.set_result(7);
    auto scheduler = make_scheduler();

    auto id   = scheduler->enqueue(transfer_work()).value();
    auto info = scheduler->wait(id, 5000ms);
    ASSERT_RESULT_OK(info);
    EXPECT_EQ(info.value().state, WorkState::FAILED);
    EXPECT_EQ(info.value().output.get_int(keys::ERROR_CODE, 0), 7);
    EXPECT_EQ(scheduler->stats().failed, 1u);
}

TEST_F(WorkSchedulerTest, WorkIdsAreSequential) {
    auto scheduler = make_scheduler();
    std::set<WorkId> ids;
    for (int i = 0; i < 10; ++i) {
        auto id = scheduler->enqueue(transfer_work("https://x/" + std::to_string(i)));
        ASSERT_RESULT_OK(id);
        ids.insert(id.value());
    }
    EXPECT_EQ(ids.size(), 10u);
    EXPECT_EQ(*ids.begin(), 1u);
    EXPECT_EQ(*ids.rbegin(), 10u);

    for (WorkId id : ids) {
        ASSERT_RESULT_OK(scheduler->wait(id, 5000ms));
    }
    EXPECT_EQ(engine_.submit_count(), 10u);
}

TEST_F(WorkSchedulerTest, UnknownTypeFailsConstruction) {
    auto scheduler = make_scheduler();

    auto id   = scheduler->enqueue(WorkRequest{"test.Unknown", TaskData()}).value();
    auto info = scheduler->wait(id, 5000ms);
    ASSERT_RESULT_OK(info);
    EXPECT_EQ(info.value().state, WorkState::FAILED);
    EXPECT_EQ(info.value().output.get_string(keys::ERROR),
              std::optional<std::string>("task construction failed"));
}

TEST_F(WorkSchedulerTest, CancelRunningWork) {
    auto scheduler = make_scheduler();

    auto id = scheduler->enqueue(WorkRequest{"test.Gated", TaskData()}).value();
    ASSERT_TRUE(gate_->started.wait(5000ms));
    EXPECT_EQ(scheduler->get_work_info(id)->state, WorkState::RUNNING);

    EXPECT_TRUE(scheduler->cancel(id));
    auto info = scheduler->wait(id, 5000ms);
    ASSERT_RESULT_OK(info);
    EXPECT_EQ(info.value().state, WorkState::CANCELLED);
    EXPECT_EQ(info.value().output.get_string(keys::ERROR),
              std::optional<std::string>(std::string(CANCELLED_MESSAGE)));
    EXPECT_FALSE(scheduler->cancel(id));
    EXPECT_EQ(scheduler->stats().cancelled, 1u);
}

TEST_F(WorkSchedulerTest, CancelPendingWork) {
    auto scheduler = make_scheduler(WorkSchedulerConfig{1, 16});

    auto blocker = scheduler->enqueue(WorkRequest{"test.Gated", TaskData()}).value();
    ASSERT_TRUE(gate_->started.wait(5000ms));

    auto pending = scheduler->enqueue(transfer_work()).value();
    EXPECT_EQ(scheduler->get_work_info(pending)->state, WorkState::ENQUEUED);
    EXPECT_TRUE(scheduler->cancel(pending));
    EXPECT_EQ(scheduler->get_work_info(pending)->state, WorkState::CANCELLED);

    gate_->released.count_down();
    ASSERT_RESULT_OK(scheduler->wait(blocker, 5000ms));
    EXPECT_EQ(scheduler->get_work_info(blocker)->state, WorkState::SUCCEEDED);
    EXPECT_EQ(engine_.submit_count(), 0u);
}

TEST_F(WorkSchedulerTest, CancelRunningTransferForwardsHint) {
    auto listener = std::make_shared<xfer::test::RecordingProgressListener>();
    auto handle   = progress_.register_item(listener).value();
    engine_.set_block_until_cancelled(true);
    engine_.set_result(3);

    auto scheduler = make_scheduler();
    auto id        = scheduler
                  ->enqueue(WorkRequest{std::string(TRANSFER_TASK_TYPE),
                                        make_transfer_input("https://x/y", "/tmp/f", "{}", handle)})
                  .value();
    ASSERT_TRUE(xfer::test::wait_for([this]() { return engine_.submit_count() == 1; }));

    EXPECT_TRUE(scheduler->cancel(id));
    auto info = scheduler->wait(id, 5000ms);
    ASSERT_RESULT_OK(info);
    EXPECT_EQ(info.value().state, WorkState::CANCELLED);
    EXPECT_EQ(engine_.cancelled(), (std::vector<xfer::bridge::TransferHandle>{handle}));
}

TEST_F(WorkSchedulerTest, CancelDuringSubmitThatCompletesSucceeds) {
    std::unique_ptr<WorkScheduler> scheduler;
    std::atomic<bool> cancel_accepted{false};
    engine_.set_on_submit([&]() { cancel_accepted = scheduler->cancel(1); });

    scheduler = make_scheduler();
    auto id   = scheduler->enqueue(transfer_work()).value();
    ASSERT_EQ(id, 1u);

    auto info = scheduler->wait(id, 5000ms);
    ASSERT_RESULT_OK(info);
    EXPECT_TRUE(cancel_accepted.load());
    EXPECT_EQ(info.value().state, WorkState::SUCCEEDED);
    EXPECT_TRUE(info.value().output.empty());
    EXPECT_EQ(scheduler->stats().succeeded, 1u);
    EXPECT_EQ(scheduler->stats().cancelled, 0u);
}

TEST_F(WorkSchedulerTest, NonStandardExceptionFailsWork) {
    xfer::test::LogCapture logs(debug::LogLevel::ERROR);
    engine_.set_throw_value(42);
    auto scheduler = make_scheduler();

    auto id   = scheduler->enqueue(transfer_work()).value();
    auto info = scheduler->wait(id, 5000ms);
    ASSERT_RESULT_OK(info);
    EXPECT_EQ(info.value().state, WorkState::FAILED);
    EXPECT_EQ(info.value().output.get_string(keys::ERROR),
              std::optional<std::string>(std::string(UNKNOWN_EXCEPTION_MESSAGE)));
    EXPECT_TRUE(logs.contains("non-standard exception"));
    EXPECT_EQ(scheduler->stats().failed, 1u);
}

TEST_F(WorkSchedulerTest, FinishedHistoryForgetsOldestWork) {
    auto scheduler = make_scheduler(WorkSchedulerConfig{1, 16, 2});

    for (int i = 1; i <= 5; ++i) {
        auto id = scheduler->enqueue(transfer_work("https://x/" + std::to_string(i))).value();
        ASSERT_RESULT_OK(scheduler->wait(id, 5000ms));
    }

    EXPECT_FALSE(scheduler->get_work_info(1).has_value());
    EXPECT_FALSE(scheduler->get_work_info(3).has_value());
    EXPECT_RESULT_ERROR(scheduler->wait(1, 10ms), ErrorCode::WORK_NOT_FOUND);
    EXPECT_FALSE(scheduler->cancel(1));
    ASSERT_TRUE(scheduler->get_work_info(4).has_value());
    EXPECT_EQ(scheduler->get_work_info(5)->state, WorkState::SUCCEEDED);

    auto stats = scheduler->stats();
    EXPECT_EQ(stats.retained, 2u);
    EXPECT_EQ(stats.succeeded, 5u);
}

TEST_F(WorkSchedulerTest, WaiterSeesFinalStateOfForgottenWork) {
    auto scheduler = make_scheduler(WorkSchedulerConfig{1, 16, 1});

    auto first  = scheduler->enqueue(WorkRequest{"test.Gated", TaskData()}).value();
    auto second = scheduler->enqueue(transfer_work()).value();
    ASSERT_TRUE(gate_->started.wait(5000ms));

    std::atomic<bool> waited{false};
    std::thread waiter([&]() {
        auto info = scheduler->wait(first, 5000ms);
        EXPECT_RESULT_OK(info);
        if (info.is_success()) {
            EXPECT_EQ(info.value().state, WorkState::SUCCEEDED);
        }
        waited = true;
    });
    std::this_thread::sleep_for(20ms);

    gate_->released.count_down();
    EXPECT_RESULT_OK(scheduler->wait(second, 5000ms));
    waiter.join();

    EXPECT_TRUE(waited.load());
    EXPECT_FALSE(scheduler->get_work_info(first).has_value());
    EXPECT_EQ(scheduler->stats().retained, 1u);
}

TEST_F(WorkSchedulerTest, CancelUnknownOrFinished) {
    auto scheduler = make_scheduler();
    EXPECT_FALSE(scheduler->cancel(999));

    auto id = scheduler->enqueue(transfer_work()).value();
    ASSERT_RESULT_OK(scheduler->wait(id, 5000ms));
    EXPECT_FALSE(scheduler->cancel(id));
}

TEST_F(WorkSchedulerTest, WaitErrors) {
    auto scheduler = make_scheduler();
    EXPECT_RESULT_ERROR(scheduler->wait(12345, 10ms), ErrorCode::WORK_NOT_FOUND);

    auto id = scheduler->enqueue(WorkRequest{"test.Gated", TaskData()}).value();
    ASSERT_TRUE(gate_->started.wait(5000ms));
    EXPECT_RESULT_ERROR(scheduler->wait(id, 20ms), ErrorCode::OPERATION_TIMEOUT);

    gate_->released.count_down();
    EXPECT_RESULT_OK(scheduler->wait(id, 5000ms));
}

TEST_F(WorkSchedulerTest, QueueLimit) {
    auto scheduler = make_scheduler(WorkSchedulerConfig{1, 2});

    ASSERT_RESULT_OK(scheduler->enqueue(WorkRequest{"test.Gated", TaskData()}));
    ASSERT_TRUE(gate_->started.wait(5000ms));

    ASSERT_RESULT_OK(scheduler->enqueue(transfer_work()));
    ASSERT_RESULT_OK(scheduler->enqueue(transfer_work()));
    EXPECT_RESULT_ERROR(scheduler->enqueue(transfer_work()), ErrorCode::SCHEDULER_OVERLOADED);

    auto stats = scheduler->stats();
    EXPECT_EQ(stats.enqueued, 3u);
    EXPECT_EQ(stats.rejected, 1u);
    EXPECT_EQ(stats.queue_size, 2u);

    gate_->released.count_down();
}

TEST_F(WorkSchedulerTest, StopCancelsPendingWork) {
    auto scheduler = make_scheduler(WorkSchedulerConfig{1, 16});

    auto running = scheduler->enqueue(WorkRequest{"test.Gated", TaskData()}).value();
    ASSERT_TRUE(gate_->started.wait(5000ms));
    auto pending = scheduler->enqueue(transfer_work()).value();

    std::thread releaser([this]() {
        std::this_thread::sleep_for(20ms);
        gate_->released.count_down();
    });
    scheduler->stop();
    releaser.join();

    EXPECT_EQ(scheduler->get_work_info(pending)->state, WorkState::CANCELLED);
    EXPECT_EQ(scheduler->get_work_info(running)->state, WorkState::SUCCEEDED);
    EXPECT_RESULT_ERROR(scheduler->enqueue(transfer_work()), ErrorCode::SCHEDULER_STOPPED);
}

TEST_F(WorkSchedulerTest, WorkerRunsUnderWorkTraceContext) {
    auto scheduler = make_scheduler();
    auto id        = scheduler->enqueue(WorkRequest{"test.Gated", TaskData()}).value();
    ASSERT_TRUE(gate_->started.wait(5000ms));
    gate_->released.count_down();
    ASSERT_RESULT_OK(scheduler->wait(id, 5000ms));

    EXPECT_EQ(gate_->last_trace.load(), id);
}

TEST_F(WorkSchedulerTest, ZeroConfigFallsBackToDefaults) {
    WorkScheduler scheduler(loader_, env_, WorkSchedulerConfig{0, 0, 0});
    EXPECT_EQ(scheduler.config().worker_threads, WorkSchedulerConfig{}.worker_threads);
    EXPECT_EQ(scheduler.config().max_queue_size, WorkSchedulerConfig{}.max_queue_size);
    EXPECT_EQ(scheduler.config().finished_history, WorkSchedulerConfig{}.finished_history);
}
