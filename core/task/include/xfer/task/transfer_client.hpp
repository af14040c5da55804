#pragma once

/**
 * @file transfer_client.hpp
 * @brief Blocking front end for background downloads
 *
 * download() registers the caller's progress function under a fresh handle,
 * enqueues an "xfer.TransferTask" with that handle in its input record, waits
 * for the work and retires the handle again on every path.
 */

#include <xfer/bridge/progress.hpp>
#include <xfer/common/error.hpp>
#include <xfer/task/headers.hpp>
#include <xfer/task/work_scheduler.hpp>

#include <chrono>
#include <string>

namespace xfer::task {

struct TransferClientConfig {
    std::chrono::milliseconds timeout{30000};
};

class BackgroundTransferClient {
public:
    using ProgressFunction = bridge::FunctionProgressListener::Function;

    BackgroundTransferClient(WorkScheduler& scheduler, bridge::ProgressRegistry& progress,
                             TransferClientConfig config = TransferClientConfig{}) noexcept
        : scheduler_(scheduler), progress_(progress), config_(config) {}

    /**
     * @brief Download @p url to @p file_path and wait for the outcome
     *
     * TASK_FAILED carries the engine code or error message as context,
     * TASK_CANCELLED if the work was cancelled, OPERATION_TIMEOUT (after
     * cancelling the work) if it did not finish within the configured timeout.
     */
    common::Result<WorkInfo> download(const std::string& url, const std::string& file_path,
                                      const HeaderMap& headers     = {},
                                      ProgressFunction progress_fn = nullptr);

    const TransferClientConfig& config() const noexcept { return config_; }

private:
    WorkScheduler& scheduler_;
    bridge::ProgressRegistry& progress_;
    TransferClientConfig config_;
};

}  // namespace xfer::task
