#pragma once

/**
 * @file config_types.hpp
 * @brief Configuration structures of a transfer bridge deployment
 *
 * Defaults match a configuration file with every key omitted.
 */

#include <xfer/bridge/callback_dispatcher.hpp>
#include <xfer/bridge/handle_registry.hpp>
#include <xfer/common/debug.hpp>
#include <xfer/task/foreground.hpp>
#include <xfer/task/transfer_client.hpp>
#include <xfer/task/work_scheduler.hpp>

#include <cstdint>
#include <string>

namespace xfer::config {

enum class ConfigFormat : uint8_t {
    AUTO,
    YAML,
    JSON,
};

enum class LogOutput : uint8_t {
    CONSOLE,
    FILE,
    BOTH,
    NONE,
};

struct LoggingConfig {
    common::debug::LogLevel level = common::debug::LogLevel::INFO;
    LogOutput output              = LogOutput::CONSOLE;
    std::string file_path;
    size_t max_file_size_mb = 10;
    uint32_t max_files      = 5;
    bool include_timestamp  = true;
    bool include_thread_id  = true;
    bool use_colors         = true;
};

struct DispatcherSection {
    /// Route request phases through a CallbackDispatcher instead of calling handlers inline
    bool enabled = false;
    bridge::DispatcherConfig dispatcher;
};

struct XferConfig {
    LoggingConfig logging;
    bridge::HandleRegistryConfig registry;
    DispatcherSection dispatcher;
    task::WorkSchedulerConfig scheduler;
    task::ForegroundConfig foreground;
    task::TransferClientConfig client;
};

}  // namespace xfer::config
