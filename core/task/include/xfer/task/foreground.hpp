#pragma once

/**
 * @file foreground.hpp
 * @brief Foreground (elevated priority) promotion of long-running tasks
 */

#include <xfer/common/error.hpp>

#include <cstdint>
#include <string>

namespace xfer::task {

/**
 * @brief Presentation of a promoted task; has no effect on the transfer itself
 */
struct ForegroundInfo {
    int32_t notification_id  = 1;
    std::string channel_id   = "download_channel";
    std::string channel_name = "Downloads";
    std::string title        = "Background Download";
    std::string text         = "Downloading file...";
    bool ongoing             = true;
};

struct ForegroundConfig {
    bool enabled = true;
    ForegroundInfo info;
};

/**
 * @brief Host hook that elevates the calling task
 */
class IForegroundPromoter {
public:
    virtual ~IForegroundPromoter() = default;

    virtual common::Result<void> set_foreground(const ForegroundInfo& info) = 0;
};

}  // namespace xfer::task
