#pragma once

/**
 * @file callback_phase.hpp
 * @brief Phases of one network request as seen by its callback bridge
 *
 * Allowed order:
 *   CREATED -> REDIRECT_RECEIVED* -> RESPONSE_STARTED -> READING* -> SUCCEEDED | FAILED
 * SUCCEEDED and FAILED may also be reached from any earlier non-terminal phase.
 * Nothing is accepted after a terminal phase.
 */

#include <cstdint>
#include <string_view>

namespace xfer::bridge {

enum class CallbackPhase : uint8_t {
    CREATED = 0,
    REDIRECT_RECEIVED,
    RESPONSE_STARTED,
    READING,
    SUCCEEDED,
    FAILED,
};

constexpr std::string_view phase_name(CallbackPhase phase) noexcept {
    switch (phase) {
        case CallbackPhase::CREATED:
            return "CREATED";
        case CallbackPhase::REDIRECT_RECEIVED:
            return "REDIRECT_RECEIVED";
        case CallbackPhase::RESPONSE_STARTED:
            return "RESPONSE_STARTED";
        case CallbackPhase::READING:
            return "READING";
        case CallbackPhase::SUCCEEDED:
            return "SUCCEEDED";
        case CallbackPhase::FAILED:
            return "FAILED";
        default:
            return "UNKNOWN";
    }
}

constexpr bool is_terminal(CallbackPhase phase) noexcept {
    return phase == CallbackPhase::SUCCEEDED || phase == CallbackPhase::FAILED;
}

/**
 * @brief Whether a notification of phase @p next may follow phase @p current
 */
constexpr bool is_valid_transition(CallbackPhase current, CallbackPhase next) noexcept {
    if (is_terminal(current)) {
        return false;
    }
    switch (next) {
        case CallbackPhase::REDIRECT_RECEIVED:
        case CallbackPhase::RESPONSE_STARTED:
            return current == CallbackPhase::CREATED ||
                   current == CallbackPhase::REDIRECT_RECEIVED;
        case CallbackPhase::READING:
            return current == CallbackPhase::RESPONSE_STARTED || current == CallbackPhase::READING;
        case CallbackPhase::SUCCEEDED:
        case CallbackPhase::FAILED:
            return true;
        case CallbackPhase::CREATED:
        default:
            return false;
    }
}

}  // namespace xfer::bridge
