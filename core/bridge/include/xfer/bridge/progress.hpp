#pragma once

/**
 * @file progress.hpp
 * @brief Progress reporting by handle
 *
 * A progress listener lives in a HandleRegistry<IProgressListener>; whoever transfers
 * bytes only holds the handle and reports through a ProgressReporter bound to it.
 */

#include <xfer/bridge/handle.hpp>
#include <xfer/bridge/handle_registry.hpp>

#include <cstdint>
#include <functional>
#include <optional>

namespace xfer::bridge {

/**
 * @brief Receiver of (bytes transferred, total) pairs
 *
 * @p total is empty when the size is unknown.
 */
class IProgressListener {
public:
    virtual ~IProgressListener() = default;

    virtual void on_progress(uint64_t bytes, std::optional<uint64_t> total) = 0;
};

using ProgressRegistry = HandleRegistry<IProgressListener>;

/**
 * @brief Adapts a std::function to IProgressListener
 */
class FunctionProgressListener : public IProgressListener {
public:
    using Function = std::function<void(uint64_t, std::optional<uint64_t>)>;

    explicit FunctionProgressListener(Function fn) : fn_(std::move(fn)) {}

    void on_progress(uint64_t bytes, std::optional<uint64_t> total) override {
        if (fn_) {
            fn_(bytes, total);
        }
    }

private:
    Function fn_;
};

/**
 * @brief Callback the engine invokes while a transfer runs
 *
 * Engines report a total <= 0 when the size is unknown.
 */
class IProgressCallback {
public:
    virtual ~IProgressCallback() = default;

    virtual void on_progress(int64_t bytes, int64_t total) noexcept = 0;
};

/**
 * @brief Progress callback bound to one handle of a ProgressRegistry
 *
 * Reports for a retired or unknown handle are logged and dropped.
 */
class ProgressReporter : public IProgressCallback {
public:
    ProgressReporter(ProgressRegistry& registry, TransferHandle handle) noexcept
        : registry_(registry), handle_(handle) {}

    TransferHandle handle() const noexcept { return handle_; }

    void on_progress(int64_t bytes, int64_t total) noexcept override;

    /**
     * @brief Report with an explicit "unknown total"
     */
    void report(uint64_t bytes, std::optional<uint64_t> total) noexcept;

private:
    ProgressRegistry& registry_;
    TransferHandle handle_;
};

}  // namespace xfer::bridge
