#include <xfer/bridge/progress.hpp>
#include <xfer/common/debug.hpp>

#include <exception>

namespace xfer::bridge {

namespace {
constexpr std::string_view LOG_CAT = common::debug::category::BRIDGE;
}  // namespace

void ProgressReporter::on_progress(int64_t bytes, int64_t total) noexcept {
    report(bytes > 0 ? static_cast<uint64_t>(bytes) : 0,
           total > 0 ? std::optional<uint64_t>(static_cast<uint64_t>(total)) : std::nullopt);
}

void ProgressReporter::report(uint64_t bytes, std::optional<uint64_t> total) noexcept {
    try {
        auto listener = registry_.lookup(handle_);
        if (listener.is_error()) {
            XFER_LOG_DEBUG(LOG_CAT, "dropping progress " << bytes << " for "
                                                         << handle_to_string(handle_) << ": "
                                                         << listener.message());
            return;
        }
        listener.value()->on_progress(bytes, total);
    } catch (const std::exception& e) {
        XFER_LOG_WARN(LOG_CAT, "progress listener for " << handle_to_string(handle_)
                                                        << " threw: " << e.what());
    } catch (...) {
        XFER_LOG_WARN(LOG_CAT, "progress listener for " << handle_to_string(handle_)
                                                        << " threw a non-standard exception");
    }
}

}  // namespace xfer::bridge
