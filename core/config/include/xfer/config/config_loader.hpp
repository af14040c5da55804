#pragma once

/**
 * @file config_loader.hpp
 * @brief Loads XferConfig from YAML (default) or JSON
 *
 * Missing keys keep their defaults. Errors:
 * - CONFIG_FILE_NOT_FOUND   file missing or unreadable
 * - CONFIG_PARSE_ERROR      syntax error
 * - CONFIG_TYPE_MISMATCH    a present key holds the wrong type
 * - CONFIG_VALUE_OUT_OF_RANGE  a value outside its accepted range
 * - CONFIG_INVALID          keys that contradict each other
 */

#include <xfer/common/error.hpp>
#include <xfer/config/config_types.hpp>

#include <filesystem>
#include <memory>
#include <string_view>

namespace xfer::config {

class ConfigLoader {
public:
    virtual ~ConfigLoader() = default;

    /**
     * @brief YAML for .yml/.yaml, JSON for .json, YAML otherwise
     */
    static ConfigFormat detect_format(const std::filesystem::path& path);

    /**
     * @brief JSON if the first non-blank character is '{', YAML otherwise
     */
    static ConfigFormat detect_format_from_content(std::string_view content);

    virtual common::Result<XferConfig> load(const std::filesystem::path& path,
                                            ConfigFormat format = ConfigFormat::AUTO) = 0;

    virtual common::Result<XferConfig> parse(std::string_view content,
                                             ConfigFormat format = ConfigFormat::AUTO) = 0;

    virtual common::Result<void> validate(const XferConfig& config) = 0;
};

/**
 * @brief ConfigLoader backed by yaml-cpp and jsoncpp
 */
std::unique_ptr<ConfigLoader> create_config_loader();

/**
 * @brief Replace the logger's sinks and level according to @p config
 *
 * XFER_LOG_LEVEL in the environment still overrides the configured level.
 */
common::Result<void> apply_logging_config(const LoggingConfig& config);

}  // namespace xfer::config
