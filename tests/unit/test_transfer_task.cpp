/**
 * @file test_transfer_task.cpp
 * @brief Unit tests for TransferTask
 *
 * Tests coverage for:
 * - Success and engine failure outcomes
 * - Missing input
 * - Header and progress handle plumbing
 * - Foreground promotion
 * - Cancellation before and during the engine call
 * - Engine exceptions and repeated runs
 */

#include <xfer/task/background_task.hpp>
#include <xfer/task/transfer_task.hpp>

#include <xfer_test_support.hpp>

#include <chrono>
#include <memory>
#include <stop_token>
#include <thread>

#include <gtest/gtest.h>

using namespace xfer::task;
using namespace xfer::bridge;
using namespace std::chrono_literals;
using xfer::common::debug::LogLevel;
using xfer::test::RecordingEngine;
using xfer::test::RecordingProgressListener;
using xfer::test::RecordingPromoter;

class TransferTaskTest : public ::testing::Test {
protected:
    std::unique_ptr<TransferTask> make_task(TaskData input, std::stop_token token = {}) {
        TaskParameters params;
        params.work_id    = ++next_id_;
        params.input      = std::move(input);
        params.stop_token = std::move(token);
        return std::make_unique<TransferTask>(env_, std::move(params));
    }

    RecordingEngine engine_;
    ProgressRegistry progress_;
    RecordingPromoter promoter_;
    TaskEnvironment env_{engine_, progress_, &promoter_};
    WorkId next_id_ = 0;
};

TEST_F(TransferTaskTest, EngineSuccessGivesEmptySuccess) {
    engine_.set_result(ENGINE_SUCCESS);
    auto task = make_task(TaskData::Builder()
                              .put_string("url", "https://x/y")
                              .put_string("file_path", "/tmp/f")
                              .put_string("headers", "{}")
                              .build());

    auto outcome = task->run();
    EXPECT_TRUE(outcome.is_success());
    EXPECT_TRUE(outcome.output.empty());
    EXPECT_EQ(task->state(), TaskState::SUCCEEDED);

    ASSERT_EQ(engine_.submit_count(), 1u);
    auto request = engine_.last_request();
    EXPECT_EQ(request.url, "https://x/y");
    EXPECT_EQ(request.destination_path, "/tmp/f");
    EXPECT_EQ(request.headers_json, "{}");
    EXPECT_FALSE(request.progress_handle.has_value());
    EXPECT_FALSE(engine_.last_had_progress());
}

TEST_F(TransferTaskTest, EngineErrorCodeGivesFailure) {
    engine_.set_result(7);
    auto task = make_task(
        TaskData::Builder().put_string("url", "https://x/y").put_string("file_path", "/tmp/f").build());

    auto outcome = task->run();
    EXPECT_FALSE(outcome.is_success());
    EXPECT_EQ(outcome.output.get_int(keys::ERROR_CODE, 0), 7);
    EXPECT_EQ(outcome.output.size(), 1u);
    EXPECT_EQ(task->state(), TaskState::FAILED);
}

TEST_F(TransferTaskTest, MissingFilePathSkipsEngine) {
    auto task = make_task(TaskData::Builder().put_string("url", "https://x/y").build());

    auto outcome = task->run();
    EXPECT_FALSE(outcome.is_success());
    EXPECT_TRUE(outcome.output.empty());
    EXPECT_EQ(engine_.submit_count(), 0u);
    EXPECT_EQ(promoter_.calls(), 0u);
}

TEST_F(TransferTaskTest, MissingUrlSkipsEngine) {
    auto task = make_task(TaskData::Builder().put_string("file_path", "/tmp/f").build());
    EXPECT_FALSE(task->run().is_success());
    EXPECT_EQ(engine_.submit_count(), 0u);
}

TEST_F(TransferTaskTest, NonStringUrlCountsAsMissing) {
    auto task = make_task(
        TaskData::Builder().put_int("url", 5).put_string("file_path", "/tmp/f").build());
    EXPECT_FALSE(task->run().is_success());
    EXPECT_EQ(engine_.submit_count(), 0u);
}

TEST_F(TransferTaskTest, HeadersAreForwardedAsJson) {
    auto task = make_task(make_transfer_input("https://x/y", "/tmp/f",
                                              R"({"Authorization":"Bearer t","X-Retry":3})"));
    EXPECT_TRUE(task->run().is_success());
    EXPECT_EQ(engine_.last_request().headers_json, R"({"Authorization":"Bearer t"})");
}

TEST_F(TransferTaskTest, MalformedHeadersBecomeEmpty) {
    xfer::test::LogCapture logs(LogLevel::WARN);
    auto task = make_task(make_transfer_input("https://x/y", "/tmp/f", "not json"));

    EXPECT_TRUE(task->run().is_success());
    EXPECT_EQ(engine_.last_request().headers_json, "{}");
    EXPECT_TRUE(logs.contains(LogLevel::WARN, "ignoring request headers"));
}

TEST_F(TransferTaskTest, ProgressFlowsToListener) {
    auto listener = std::make_shared<RecordingProgressListener>();
    auto handle   = progress_.register_item(listener).value();
    engine_.set_progress_steps({{100, 400}, {400, 400}, {500, -1}});

    auto task = make_task(make_transfer_input("https://x/y", "/tmp/f", "{}", handle));
    EXPECT_TRUE(task->run().is_success());

    EXPECT_TRUE(engine_.last_had_progress());
    EXPECT_EQ(engine_.last_request().progress_handle, std::optional<TransferHandle>(handle));

    auto events = listener->events();
    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events[0], RecordingProgressListener::Event(100, 400));
    EXPECT_EQ(events[1], RecordingProgressListener::Event(400, 400));
    EXPECT_EQ(events[2].first, 500u);
    EXPECT_FALSE(events[2].second.has_value());
}

TEST_F(TransferTaskTest, NoHandleRecordMeansNoProgressCallback) {
    auto input = make_transfer_input("https://x/y", "/tmp/f");
    EXPECT_EQ(input.get_long(keys::PROGRESS_HANDLE_ID, 0), NO_HANDLE_RECORD_VALUE);

    engine_.set_progress_steps({{1, 2}});
    EXPECT_TRUE(make_task(input)->run().is_success());
    EXPECT_FALSE(engine_.last_had_progress());
}

TEST_F(TransferTaskTest, RetiredProgressHandleIsHarmless) {
    auto listener = std::make_shared<RecordingProgressListener>();
    auto handle   = progress_.register_item(listener).value();
    progress_.retire(handle);
    engine_.set_progress_steps({{1, 10}});

    auto task = make_task(make_transfer_input("https://x/y", "/tmp/f", "{}", handle));
    EXPECT_TRUE(task->run().is_success());
    EXPECT_EQ(listener->count(), 0u);
}

TEST_F(TransferTaskTest, PromotesToForegroundWithConfiguredInfo) {
    env_.foreground.info.title           = "Syncing";
    env_.foreground.info.notification_id = 9;

    auto task = make_task(make_transfer_input("https://x/y", "/tmp/f"));
    EXPECT_TRUE(task->run().is_success());
    EXPECT_EQ(promoter_.calls(), 1u);
    EXPECT_EQ(promoter_.last_info().title, "Syncing");
    EXPECT_EQ(promoter_.last_info().notification_id, 9);
}

TEST_F(TransferTaskTest, ForegroundDisabled) {
    env_.foreground.enabled = false;
    EXPECT_TRUE(make_task(make_transfer_input("https://x/y", "/tmp/f"))->run().is_success());
    EXPECT_EQ(promoter_.calls(), 0u);
}

TEST_F(TransferTaskTest, ForegroundFailureDoesNotFailTask) {
    xfer::test::LogCapture logs(LogLevel::WARN);
    promoter_.set_fail(true);

    EXPECT_TRUE(make_task(make_transfer_input("https://x/y", "/tmp/f"))->run().is_success());
    EXPECT_EQ(engine_.submit_count(), 1u);
    EXPECT_TRUE(logs.contains(LogLevel::WARN, "foreground promotion failed"));
}

TEST_F(TransferTaskTest, ForegroundThrowDoesNotFailTask) {
    xfer::test::LogCapture logs(LogLevel::WARN);
    promoter_.set_throw("no notification permission");

    EXPECT_TRUE(make_task(make_transfer_input("https://x/y", "/tmp/f"))->run().is_success());
    EXPECT_TRUE(logs.contains(LogLevel::WARN, "no notification permission"));
}

TEST_F(TransferTaskTest, MissingPromoterIsSkipped) {
    env_.promoter = nullptr;
    EXPECT_TRUE(make_task(make_transfer_input("https://x/y", "/tmp/f"))->run().is_success());
}

TEST_F(TransferTaskTest, StoppedBeforeStartSkipsEngine) {
    std::stop_source source;
    source.request_stop();

    auto task    = make_task(make_transfer_input("https://x/y", "/tmp/f"), source.get_token());
    auto outcome = task->run();

    EXPECT_FALSE(outcome.is_success());
    EXPECT_EQ(outcome.output.get_string(keys::ERROR), std::optional<std::string>("cancelled"));
    EXPECT_EQ(engine_.submit_count(), 0u);
}

TEST_F(TransferTaskTest, StopDuringSubmitForwardsCancelHint) {
    auto handle = progress_.register_item(std::make_shared<RecordingProgressListener>()).value();
    engine_.set_block_until_cancelled(true);
    engine_.set_result(42);

    std::stop_source source;
    auto task = make_task(make_transfer_input("https://x/y", "/tmp/f", "{}", handle),
                          source.get_token());

    TaskOutcome outcome;
    std::thread runner([&]() { outcome = task->run(); });
    ASSERT_TRUE(xfer::test::wait_for([this]() { return engine_.submit_count() == 1; }));

    source.request_stop();
    runner.join();

    EXPECT_EQ(engine_.cancelled(), (std::vector<TransferHandle>{handle}));
    // The engine call itself is not interrupted; its result stands
    EXPECT_EQ(outcome.output.get_int(keys::ERROR_CODE, 0), 42);
}

TEST_F(TransferTaskTest, StopWithoutHandleSendsNoHint) {
    engine_.set_block_until_cancelled(true, 100ms);

    std::stop_source source;
    auto task = make_task(make_transfer_input("https://x/y", "/tmp/f"), source.get_token());

    std::thread runner([&]() { task->run(); });
    ASSERT_TRUE(xfer::test::wait_for([this]() { return engine_.submit_count() == 1; }));
    source.request_stop();
    runner.join();

    EXPECT_TRUE(engine_.cancelled().empty());
}

TEST_F(TransferTaskTest, StopAfterCompletionSendsNoHint) {
    auto handle = progress_.register_item(std::make_shared<RecordingProgressListener>()).value();
    std::stop_source source;
    auto task = make_task(make_transfer_input("https://x/y", "/tmp/f", "{}", handle),
                          source.get_token());

    EXPECT_TRUE(task->run().is_success());
    source.request_stop();
    EXPECT_TRUE(engine_.cancelled().empty());
}

TEST_F(TransferTaskTest, EngineExceptionBecomesFailure) {
    engine_.set_throw("socket closed");

    auto task    = make_task(make_transfer_input("https://x/y", "/tmp/f"));
    auto outcome = task->run();

    EXPECT_FALSE(outcome.is_success());
    EXPECT_EQ(outcome.output.get_string(keys::ERROR), std::optional<std::string>("socket closed"));
    EXPECT_EQ(task->state(), TaskState::FAILED);
}

TEST_F(TransferTaskTest, NonStandardEngineExceptionBecomesFailure) {
    engine_.set_throw_value(42);

    auto task    = make_task(make_transfer_input("https://x/y", "/tmp/f"));
    auto outcome = task->run();

    EXPECT_FALSE(outcome.is_success());
    EXPECT_EQ(outcome.output.get_string(keys::ERROR),
              std::optional<std::string>(std::string(UNKNOWN_EXCEPTION_MESSAGE)));
    EXPECT_EQ(task->state(), TaskState::FAILED);
}

TEST_F(TransferTaskTest, SecondRunFailsWithoutEngineCall) {
    auto task = make_task(make_transfer_input("https://x/y", "/tmp/f"));
    EXPECT_TRUE(task->run().is_success());

    auto second = task->run();
    EXPECT_FALSE(second.is_success());
    EXPECT_EQ(engine_.submit_count(), 1u);
    EXPECT_EQ(task->state(), TaskState::SUCCEEDED);
}

TEST_F(TransferTaskTest, TypeName) {
    auto task = make_task(TaskData());
    EXPECT_EQ(task->type_name(), TRANSFER_TASK_TYPE);
    EXPECT_EQ(task->state(), TaskState::ENQUEUED);
    EXPECT_EQ(task->run_attempt(), 1u);
}
