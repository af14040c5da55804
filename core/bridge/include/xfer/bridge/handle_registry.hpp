#pragma once

/**
 * @file handle_registry.hpp
 * @brief Thread-safe handle -> object registry backed by a generation-counted slot arena
 *
 * Each registration takes a free slot and stamps the handle with the slot's current
 * generation. Retiring a handle bumps the generation, so any copy of the old handle
 * resolves to HANDLE_NOT_FOUND (counted as a stale lookup, see is_stale()) instead of
 * whatever is registered in the slot later.
 *
 * Usage:
 * @code
 * HandleRegistry<IRequestHandler> registry;
 * auto handle = registry.register_item(handler);   // Result<TransferHandle>
 * auto found  = registry.lookup(handle.value());   // Result<shared_ptr<IRequestHandler>>
 * registry.retire(handle.value());                 // idempotent
 * @endcode
 */

#include <xfer/bridge/handle.hpp>
#include <xfer/common/debug.hpp>
#include <xfer/common/error.hpp>

#include <atomic>
#include <cstdint>
#include <limits>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

namespace xfer::bridge {

struct HandleRegistryConfig {
    /// Maximum number of simultaneously live handles
    size_t max_handles = 65536;
};

/**
 * @brief Snapshot of registry counters
 */
struct HandleRegistryStats {
    uint64_t registered     = 0;
    uint64_t retired        = 0;
    uint64_t lookups        = 0;
    uint64_t failed_lookups = 0;
    uint64_t stale_lookups  = 0;
    size_t live_handles     = 0;
};

template <typename T>
class HandleRegistry {
public:
    using ItemPtr = std::shared_ptr<T>;

    HandleRegistry() : HandleRegistry(HandleRegistryConfig{}) {}

    explicit HandleRegistry(HandleRegistryConfig config) : config_(config) {
        if (config_.max_handles == 0 ||
            config_.max_handles > std::numeric_limits<uint32_t>::max()) {
            config_.max_handles = HandleRegistryConfig{}.max_handles;
        }
    }

    HandleRegistry(const HandleRegistry&)            = delete;
    HandleRegistry& operator=(const HandleRegistry&) = delete;

    /**
     * @brief Register an object and issue a fresh handle for it
     */
    common::Result<TransferHandle> register_item(ItemPtr item) {
        if (!item) {
            return common::err<TransferHandle>(common::ErrorCode::NULL_POINTER,
                                               "cannot register a null callback");
        }

        TransferHandle handle = INVALID_HANDLE;
        {
            std::unique_lock lock(mutex_);
            if (live_ >= config_.max_handles) {
                return common::err<TransferHandle>(
                    common::ErrorCode::CAPACITY_EXCEEDED,
                    "handle registry full (" + std::to_string(config_.max_handles) + " live)");
            }

            uint32_t slot_index;
            if (!free_slots_.empty()) {
                slot_index = free_slots_.back();
                free_slots_.pop_back();
            } else {
                slot_index = static_cast<uint32_t>(slots_.size());
                slots_.push_back(Slot{});
                // retire() appends to free_slots_ under noexcept; keep room for every slot
                free_slots_.reserve(slots_.size());
            }

            Slot& slot = slots_[slot_index];
            slot.item  = std::move(item);
            ++live_;
            handle = make_handle(slot_index, slot.generation);
        }

        registered_.fetch_add(1, std::memory_order_relaxed);
        XFER_LOG_TRACE(common::debug::category::REGISTRY,
                       "registered handle " << handle_to_string(handle));
        return handle;
    }

    /**
     * @brief Resolve a handle to its object
     *
     * HANDLE_INVALID for 0, HANDLE_NOT_FOUND for a handle this registry never issued
     * or that was retired. A retired handle's error carries the context "stale=true".
     */
    common::Result<ItemPtr> lookup(TransferHandle handle) const {
        lookups_.fetch_add(1, std::memory_order_relaxed);

        if (handle == INVALID_HANDLE) {
            failed_lookups_.fetch_add(1, std::memory_order_relaxed);
            return common::err<ItemPtr>(common::ErrorCode::HANDLE_INVALID, "handle 0 is invalid");
        }

        std::shared_lock lock(mutex_);
        const uint32_t index = handle_slot(handle);
        if (index >= slots_.size()) {
            failed_lookups_.fetch_add(1, std::memory_order_relaxed);
            return common::err<ItemPtr>(common::ErrorCode::HANDLE_NOT_FOUND,
                                        "unknown handle " + handle_to_string(handle));
        }

        const Slot& slot = slots_[index];
        if (slot.generation != handle_generation(handle)) {
            failed_lookups_.fetch_add(1, std::memory_order_relaxed);
            stale_lookups_.fetch_add(1, std::memory_order_relaxed);
            common::Error error(common::ErrorCode::HANDLE_NOT_FOUND,
                                "handle " + handle_to_string(handle) + " was retired");
            error.with_context("stale", "true");
            return error;
        }
        if (!slot.item) {
            failed_lookups_.fetch_add(1, std::memory_order_relaxed);
            return common::err<ItemPtr>(common::ErrorCode::HANDLE_NOT_FOUND,
                                        "no object registered for " + handle_to_string(handle));
        }
        return slot.item;
    }

    /**
     * @brief Remove the mapping for @p handle
     * @return true if an object was removed; false for unknown or already retired handles
     */
    bool retire(TransferHandle handle) noexcept {
        ItemPtr released;
        {
            std::unique_lock lock(mutex_);
            const uint32_t index = handle_slot(handle);
            if (handle == INVALID_HANDLE || index >= slots_.size()) {
                return false;
            }
            Slot& slot = slots_[index];
            if (slot.generation != handle_generation(handle) || !slot.item) {
                return false;
            }

            released        = std::move(slot.item);
            slot.item       = nullptr;
            slot.generation = next_generation(slot.generation);
            --live_;
            free_slots_.push_back(index);
        }

        retired_.fetch_add(1, std::memory_order_relaxed);
        XFER_LOG_TRACE(common::debug::category::REGISTRY,
                       "retired handle " << handle_to_string(handle));
        // Released outside the lock: the destructor may call back into this registry
        released.reset();
        return true;
    }

    bool contains(TransferHandle handle) const noexcept {
        std::shared_lock lock(mutex_);
        const uint32_t index = handle_slot(handle);
        return handle != INVALID_HANDLE && index < slots_.size() &&
               slots_[index].generation == handle_generation(handle) && slots_[index].item;
    }

    /**
     * @brief True if @p handle was issued by this registry and has since been retired
     */
    bool is_stale(TransferHandle handle) const noexcept {
        std::shared_lock lock(mutex_);
        const uint32_t index = handle_slot(handle);
        return handle != INVALID_HANDLE && index < slots_.size() &&
               handle_generation(handle) != 0 &&
               slots_[index].generation != handle_generation(handle);
    }

    size_t size() const noexcept {
        std::shared_lock lock(mutex_);
        return live_;
    }

    size_t capacity() const noexcept { return config_.max_handles; }

    bool empty() const noexcept { return size() == 0; }

    /**
     * @brief Retire every live handle
     */
    void clear() {
        std::vector<ItemPtr> released;
        {
            std::unique_lock lock(mutex_);
            for (uint32_t i = 0; i < slots_.size(); ++i) {
                Slot& slot = slots_[i];
                if (slot.item) {
                    released.push_back(std::move(slot.item));
                    slot.item       = nullptr;
                    slot.generation = next_generation(slot.generation);
                    free_slots_.push_back(i);
                    retired_.fetch_add(1, std::memory_order_relaxed);
                }
            }
            live_ = 0;
        }
    }

    HandleRegistryStats stats() const noexcept {
        HandleRegistryStats s;
        s.registered     = registered_.load(std::memory_order_relaxed);
        s.retired        = retired_.load(std::memory_order_relaxed);
        s.lookups        = lookups_.load(std::memory_order_relaxed);
        s.failed_lookups = failed_lookups_.load(std::memory_order_relaxed);
        s.stale_lookups  = stale_lookups_.load(std::memory_order_relaxed);
        s.live_handles   = size();
        return s;
    }

private:
    struct Slot {
        uint32_t generation = 1;
        ItemPtr item;
    };

    HandleRegistryConfig config_;

    mutable std::shared_mutex mutex_;
    std::vector<Slot> slots_;
    std::vector<uint32_t> free_slots_;
    size_t live_ = 0;

    std::atomic<uint64_t> registered_{0};
    std::atomic<uint64_t> retired_{0};
    mutable std::atomic<uint64_t> lookups_{0};
    mutable std::atomic<uint64_t> failed_lookups_{0};
    mutable std::atomic<uint64_t> stale_lookups_{0};
};

/**
 * @brief RAII registration: retires its handle when destroyed
 */
template <typename T>
class ScopedHandle {
public:
    ScopedHandle() noexcept = default;

    ScopedHandle(HandleRegistry<T>& registry, TransferHandle handle) noexcept
        : registry_(&registry), handle_(handle) {}

    ~ScopedHandle() { reset(); }

    ScopedHandle(const ScopedHandle&)            = delete;
    ScopedHandle& operator=(const ScopedHandle&) = delete;

    ScopedHandle(ScopedHandle&& other) noexcept
        : registry_(std::exchange(other.registry_, nullptr)),
          handle_(std::exchange(other.handle_, INVALID_HANDLE)) {}

    ScopedHandle& operator=(ScopedHandle&& other) noexcept {
        if (this != &other) {
            reset();
            registry_ = std::exchange(other.registry_, nullptr);
            handle_   = std::exchange(other.handle_, INVALID_HANDLE);
        }
        return *this;
    }

    /**
     * @brief Register @p item and wrap the issued handle
     */
    static common::Result<ScopedHandle> make(HandleRegistry<T>& registry,
                                             std::shared_ptr<T> item) {
        auto handle = registry.register_item(std::move(item));
        if (handle.is_error()) {
            return handle.error();
        }
        return ScopedHandle(registry, handle.value());
    }

    TransferHandle get() const noexcept { return handle_; }
    bool valid() const noexcept { return registry_ != nullptr && handle_ != INVALID_HANDLE; }

    void reset() noexcept {
        if (registry_ && handle_ != INVALID_HANDLE) {
            registry_->retire(handle_);
        }
        registry_ = nullptr;
        handle_   = INVALID_HANDLE;
    }

    /**
     * @brief Give up ownership without retiring
     */
    TransferHandle release() noexcept {
        registry_ = nullptr;
        return std::exchange(handle_, INVALID_HANDLE);
    }

private:
    HandleRegistry<T>* registry_ = nullptr;
    TransferHandle handle_       = INVALID_HANDLE;
};

}  // namespace xfer::bridge
