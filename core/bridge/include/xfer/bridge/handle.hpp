#pragma once

/**
 * @file handle.hpp
 * @brief Opaque 64-bit transfer handle
 *
 * Layout (least significant bit first):
 * - bits  0..31  slot index in the owning registry
 * - bits 32..62  slot generation, never 0 for an issued handle
 * - bit  63      always 0, so a handle survives a signed 64-bit record field
 *
 * Handle 0 is never issued.
 */

#include <xfer/common/platform.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace xfer::bridge {

using TransferHandle = uint64_t;

constexpr TransferHandle INVALID_HANDLE = 0;

/// Value stored in a task record when no handle is attached
constexpr int64_t NO_HANDLE_RECORD_VALUE = -1;

constexpr uint32_t HANDLE_GENERATION_MASK = 0x7FFFFFFFu;

constexpr TransferHandle make_handle(uint32_t slot, uint32_t generation) noexcept {
    return (static_cast<uint64_t>(generation & HANDLE_GENERATION_MASK) << 32) | slot;
}

constexpr uint32_t handle_slot(TransferHandle handle) noexcept {
    return static_cast<uint32_t>(handle & 0xFFFFFFFFu);
}

constexpr uint32_t handle_generation(TransferHandle handle) noexcept {
    return static_cast<uint32_t>(handle >> 32) & HANDLE_GENERATION_MASK;
}

/**
 * @brief Next generation for a slot; wraps within 31 bits and skips 0
 */
constexpr uint32_t next_generation(uint32_t generation) noexcept {
    uint32_t next = (generation + 1) & HANDLE_GENERATION_MASK;
    return next == 0 ? 1 : next;
}

inline int64_t handle_to_record(std::optional<TransferHandle> handle) noexcept {
    return handle ? static_cast<int64_t>(*handle) : NO_HANDLE_RECORD_VALUE;
}

/**
 * @brief Decode a record field; -1 (or any non-positive value) means "no handle"
 */
inline std::optional<TransferHandle> handle_from_record(int64_t value) noexcept {
    if (value <= 0) {
        return std::nullopt;
    }
    return static_cast<TransferHandle>(value);
}

/**
 * @brief "slot#generation" form used in log lines
 */
inline std::string handle_to_string(TransferHandle handle) {
    return std::to_string(handle_slot(handle)) + "#" + std::to_string(handle_generation(handle));
}

}  // namespace xfer::bridge
