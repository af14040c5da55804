#include <xfer/common/debug.hpp>
#include <xfer/task/headers.hpp>
#include <xfer/task/transfer_task.hpp>

#include <exception>
#include <functional>
#include <stop_token>

namespace xfer::task {

namespace {
constexpr std::string_view LOG_CAT = common::debug::category::TASK;
}  // namespace

TaskData make_transfer_input(const std::string& url, const std::string& file_path,
                             const std::string& headers_json,
                             std::optional<bridge::TransferHandle> progress_handle) {
    return TaskData::Builder()
        .put_string(std::string(keys::URL), url)
        .put_string(std::string(keys::FILE_PATH), file_path)
        .put_string(std::string(keys::HEADERS), headers_json)
        .put_long(std::string(keys::PROGRESS_HANDLE_ID), bridge::handle_to_record(progress_handle))
        .build();
}

TransferTask::TransferTask(TaskEnvironment& env, TaskParameters params)
    : BackgroundTask(std::move(params)), env_(env) {}

TaskOutcome TransferTask::do_work() {
    XFER_SPAN_CAT("TransferTask::do_work", LOG_CAT);

    auto url       = input().get_string(keys::URL);
    auto file_path = input().get_string(keys::FILE_PATH);
    if (!url || !file_path) {
        common::Error error(common::ErrorCode::INVALID_INPUT,
                            !url ? "missing 'url'" : "missing 'file_path'");
        XFER_LOG_ERROR(LOG_CAT, "work " << work_id() << ": " << error.to_string());
        return TaskOutcome::failure();
    }

    if (env_.foreground.enabled) {
        promote_to_foreground();
    }

    HeaderMap headers = parse_headers_json(input().get_string(keys::HEADERS).value_or("{}"));

    TransferRequest request;
    request.url              = *url;
    request.destination_path = *file_path;
    request.headers_json     = headers_to_json(headers);
    request.progress_handle  = bridge::handle_from_record(
        input().get_long(keys::PROGRESS_HANDLE_ID, bridge::NO_HANDLE_RECORD_VALUE));

    std::optional<bridge::ProgressReporter> reporter;
    if (request.progress_handle) {
        XFER_LOG_DEBUG(LOG_CAT, "reporting progress to handle "
                                    << bridge::handle_to_string(*request.progress_handle));
        reporter.emplace(env_.progress, *request.progress_handle);
    }

    if (is_stopped()) {
        XFER_LOG_INFO(LOG_CAT, "work " << work_id() << " cancelled before the transfer started");
        return TaskOutcome::failure(
            TaskData::Builder()
                .put_string(std::string(keys::ERROR), std::string(CANCELLED_MESSAGE))
                .build());
    }

    // Cancellation during submit() can only be passed on as a hint
    std::optional<std::stop_callback<std::function<void()>>> cancel_hint;
    if (request.progress_handle) {
        ITransferEngine& engine            = env_.engine;
        const bridge::TransferHandle handle = *request.progress_handle;
        cancel_hint.emplace(stop_token(), std::function<void()>([&engine, handle]() {
                                XFER_LOG_INFO(LOG_CAT, "forwarding cancel for "
                                                           << bridge::handle_to_string(handle));
                                engine.cancel(handle);
                            }));
    }

    XFER_LOG_INFO(LOG_CAT, "work " << work_id() << ": " << request.url << " -> "
                                   << request.destination_path << " (" << headers.size()
                                   << " headers)");

    const int32_t result = env_.engine.submit(request, reporter ? &*reporter : nullptr);
    cancel_hint.reset();

    if (result == ENGINE_SUCCESS) {
        XFER_LOG_INFO(LOG_CAT, "work " << work_id() << " transfer succeeded");
        return TaskOutcome::success();
    }

    XFER_LOG_ERROR(LOG_CAT, "work " << work_id() << " transfer failed: "
                                    << common::error_name(common::ErrorCode::ENGINE_ERROR)
                                    << " " << result);
    return TaskOutcome::failure(
        TaskData::Builder().put_int(std::string(keys::ERROR_CODE), result).build());
}

void TransferTask::promote_to_foreground() noexcept {
    if (env_.promoter == nullptr) {
        XFER_LOG_DEBUG(LOG_CAT, "no foreground promoter installed");
        return;
    }

    try {
        auto result = env_.promoter->set_foreground(env_.foreground.info);
        if (result.is_error()) {
            XFER_LOG_WARN(LOG_CAT, "foreground promotion failed: " << result.error().to_string());
        }
    } catch (const std::exception& e) {
        XFER_LOG_WARN(LOG_CAT, "foreground promotion threw: " << e.what());
    } catch (...) {
        XFER_LOG_WARN(LOG_CAT, "foreground promotion threw a non-standard exception");
    }
}

}  // namespace xfer::task
