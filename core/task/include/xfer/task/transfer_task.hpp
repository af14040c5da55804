#pragma once

/**
 * @file transfer_task.hpp
 * @brief Background task that runs one download through the transfer engine
 *
 * Input record:
 * - "url"                 string, required
 * - "file_path"           string, required
 * - "headers"             JSON object string, default "{}"
 * - "progress_handle_id"  int64 handle of a progress listener, -1 when absent
 *
 * Outcome: success with an empty record when the engine returns 0; failure with
 * "error_code" for a non-zero engine result, "error" for an exception or
 * cancellation, and an empty record when required input is missing.
 */

#include <xfer/bridge/handle.hpp>
#include <xfer/task/background_task.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace xfer::task {

constexpr std::string_view TRANSFER_TASK_TYPE = "xfer.TransferTask";

namespace keys {
constexpr std::string_view URL                = "url";
constexpr std::string_view FILE_PATH          = "file_path";
constexpr std::string_view HEADERS            = "headers";
constexpr std::string_view PROGRESS_HANDLE_ID = "progress_handle_id";
}  // namespace keys

/// Value of "error" when the work was cancelled before the engine call
constexpr std::string_view CANCELLED_MESSAGE = "cancelled";

/**
 * @brief Build the input record of a TransferTask
 */
TaskData make_transfer_input(const std::string& url, const std::string& file_path,
                             const std::string& headers_json = "{}",
                             std::optional<bridge::TransferHandle> progress_handle = std::nullopt);

class TransferTask : public BackgroundTask {
public:
    TransferTask(TaskEnvironment& env, TaskParameters params);

    std::string_view type_name() const noexcept override { return TRANSFER_TASK_TYPE; }

protected:
    TaskOutcome do_work() override;

private:
    void promote_to_foreground() noexcept;

    TaskEnvironment& env_;
};

}  // namespace xfer::task
