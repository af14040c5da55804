#include <xfer/bridge/upload_provider.hpp>
#include <xfer/common/debug.hpp>

#include <algorithm>
#include <cstring>
#include <exception>

namespace xfer::bridge {

namespace {
constexpr std::string_view LOG_CAT = common::debug::category::UPLOAD;
}  // namespace

UploadCursorProvider::UploadCursorProvider(std::vector<uint8_t> body) : body_(std::move(body)) {}

UploadCursorProvider::UploadCursorProvider(std::vector<uint8_t> body,
                                           ProgressRegistry& progress_registry,
                                           TransferHandle progress_handle)
    : body_(std::move(body)) {
    progress_.emplace(progress_registry, progress_handle);
}

uint64_t UploadCursorProvider::position() const noexcept {
    std::lock_guard lock(mutex_);
    return position_;
}

size_t UploadCursorProvider::read(IUploadDataSink& sink, std::span<uint8_t> buffer) noexcept {
    size_t copied = 0;
    try {
        {
            std::lock_guard lock(mutex_);
            const uint64_t remaining = body_.size() - position_;
            copied = static_cast<size_t>(std::min<uint64_t>(remaining, buffer.size()));
            if (copied > 0) {
                std::memcpy(buffer.data(), body_.data() + position_, copied);
                position_ += copied;
            }
            // Reported under the lock so positions reach the listener in order
            if (progress_ && copied > 0) {
                progress_->report(position_, body_.size());
            }
        }

        XFER_LOG_TRACE(LOG_CAT, "read " << copied << " bytes, position " << position() << "/"
                                        << body_.size());
        sink.on_read_succeeded(copied, false);
    } catch (const std::exception& e) {
        XFER_LOG_WARN(LOG_CAT, "upload read acknowledgment rejected: " << e.what());
        report_read_error(sink, common::Error(common::ErrorCode::SINK_READ_FAILED, e.what()));
    } catch (...) {
        XFER_LOG_WARN(LOG_CAT, "upload read acknowledgment rejected with a non-standard exception");
        report_read_error(sink, common::Error(common::ErrorCode::SINK_READ_FAILED,
                                              "non-standard exception"));
    }
    return copied;
}

void UploadCursorProvider::rewind(IUploadDataSink& sink) noexcept {
    {
        std::lock_guard lock(mutex_);
        position_ = 0;
    }

    try {
        XFER_LOG_DEBUG(LOG_CAT, "upload rewound (" << body_.size() << " bytes)");
        sink.on_rewind_succeeded();
    } catch (const std::exception& e) {
        XFER_LOG_WARN(LOG_CAT, "upload rewind acknowledgment rejected: " << e.what());
        report_rewind_error(sink, common::Error(common::ErrorCode::SINK_REWIND_FAILED, e.what()));
    } catch (...) {
        XFER_LOG_WARN(LOG_CAT, "upload rewind acknowledgment rejected with a non-standard exception");
        report_rewind_error(sink, common::Error(common::ErrorCode::SINK_REWIND_FAILED,
                                                "non-standard exception"));
    }
}

void UploadCursorProvider::report_read_error(IUploadDataSink& sink,
                                             const common::Error& error) noexcept {
    try {
        sink.on_read_error(error);
    } catch (const std::exception& e) {
        XFER_LOG_ERROR(LOG_CAT, "sink rejected read error report: " << e.what());
    } catch (...) {
        XFER_LOG_ERROR(LOG_CAT, "sink rejected read error report with a non-standard exception");
    }
}

void UploadCursorProvider::report_rewind_error(IUploadDataSink& sink,
                                               const common::Error& error) noexcept {
    try {
        sink.on_rewind_error(error);
    } catch (const std::exception& e) {
        XFER_LOG_ERROR(LOG_CAT, "sink rejected rewind error report: " << e.what());
    } catch (...) {
        XFER_LOG_ERROR(LOG_CAT, "sink rejected rewind error report with a non-standard exception");
    }
}

}  // namespace xfer::bridge
