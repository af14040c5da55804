#include <xfer/common/debug.hpp>
#include <xfer/task/transfer_client.hpp>
#include <xfer/task/transfer_task.hpp>

#include <memory>

namespace xfer::task {

namespace {
constexpr std::string_view LOG_CAT = common::debug::category::CLIENT;
}  // namespace

common::Result<WorkInfo> BackgroundTransferClient::download(const std::string& url,
                                                            const std::string& file_path,
                                                            const HeaderMap& headers,
                                                            ProgressFunction progress_fn) {
    XFER_SPAN_CAT("BackgroundTransferClient::download", LOG_CAT);

    bridge::ScopedHandle<bridge::IProgressListener> progress_handle;
    if (progress_fn) {
        XFER_TRY_ASSIGN(progress_handle,
                        bridge::ScopedHandle<bridge::IProgressListener>::make(
                            progress_, std::make_shared<bridge::FunctionProgressListener>(
                                           std::move(progress_fn))));
    }

    std::optional<bridge::TransferHandle> handle;
    if (progress_handle.valid()) {
        handle = progress_handle.get();
    }

    WorkRequest request{std::string(TRANSFER_TASK_TYPE),
                        make_transfer_input(url, file_path, headers_to_json(headers), handle)};

    WorkId id = 0;
    XFER_TRY_ASSIGN(id, scheduler_.enqueue(std::move(request)));
    XFER_LOG_INFO(LOG_CAT, "download of " << url << " queued as work " << id);

    auto finished = scheduler_.wait(id, config_.timeout);
    if (finished.is_error()) {
        if (finished.code() == common::ErrorCode::OPERATION_TIMEOUT) {
            XFER_LOG_WARN(LOG_CAT, "work " << id << " timed out; cancelling");
            scheduler_.cancel(id);
        }
        return finished.error();
    }

    WorkInfo info = std::move(finished).value();
    switch (info.state) {
        case WorkState::SUCCEEDED:
            return info;
        case WorkState::CANCELLED:
            return common::err<WorkInfo>(common::ErrorCode::TASK_CANCELLED,
                                         "work " + std::to_string(id) + " was cancelled");
        default:
            break;
    }

    common::Error error(common::ErrorCode::TASK_FAILED,
                        "work " + std::to_string(id) + " " +
                            std::string(work_state_name(info.state)));
    if (info.output.contains(keys::ERROR_CODE)) {
        error.with_context(keys::ERROR_CODE,
                           std::to_string(info.output.get_int(keys::ERROR_CODE, 0)));
    }
    if (auto message = info.output.get_string(keys::ERROR)) {
        error.with_context(keys::ERROR, *message);
    }
    XFER_LOG_WARN(LOG_CAT, error.to_string());
    return error;
}

}  // namespace xfer::task
