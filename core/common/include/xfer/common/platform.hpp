#pragma once

/**
 * @file platform.hpp
 * @brief Build macros and the OS calls the bridge makes directly
 *
 * xfer targets POSIX hosts; engine threads and the scheduler's workers are
 * plain pthreads, and configuration overrides come from the environment.
 */

#include <cstdint>
#include <string>
#include <string_view>

#if !defined(__unix__) && !(defined(__APPLE__) && defined(__MACH__))
    #error "xfer requires a POSIX host"
#endif

#if defined(__linux__)
    #define XFER_OS_LINUX 1
#elif defined(__APPLE__)
    #define XFER_OS_MACOS 1
#endif

#if __cplusplus >= 202002L
    #define XFER_CPP_VERSION 20
#else
    #define XFER_CPP_VERSION 17
#endif

#if defined(__cpp_lib_source_location) || XFER_CPP_VERSION >= 20
    #define XFER_HAS_SOURCE_LOCATION 1
#endif

#if defined(__GNUC__) || defined(__clang__)
    #define XFER_UNLIKELY(x) __builtin_expect(!!(x), 0)
    #if defined(XFER_BUILDING_SHARED)
        #define XFER_API __attribute__((visibility("default")))
    #endif
#else
    #define XFER_UNLIKELY(x) (x)
#endif

#ifndef XFER_API
    #define XFER_API
#endif

namespace xfer::common::platform {

/**
 * @brief Kernel id of the calling thread, as shown by ps and gdb
 */
XFER_API uint64_t get_thread_id() noexcept;

/**
 * @brief Name the calling thread for the OS (truncated to 15 characters)
 * @return false if the kernel refused the name
 */
XFER_API bool set_thread_name(std::string_view name) noexcept;

/**
 * @brief Read an environment variable; empty string when unset
 */
XFER_API std::string get_env(std::string_view name);

XFER_API bool set_env(std::string_view name, std::string_view value);

XFER_API bool unset_env(std::string_view name);

}  // namespace xfer::common::platform
