#pragma once

/**
 * @file error.hpp
 * @brief Error codes, rich error values and Result<T> for the transfer bridge
 *
 * This header provides:
 * - Error codes grouped by category (0xCCEE)
 * - Error values carrying source location and key/value context
 * - Result<T> with ok()/err() helpers and propagation macros
 */

#include "platform.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#if defined(XFER_HAS_SOURCE_LOCATION)
    #include <source_location>
#endif

namespace xfer::common {

// ============================================================================
// ERROR CATEGORY SYSTEM
// ============================================================================

/**
 * @brief Error categories
 *
 * - 0x00xx: General
 * - 0x01xx: I/O, connection and upload sink errors
 * - 0x02xx: Callback protocol errors
 * - 0x03xx: Resource errors
 * - 0x04xx: Configuration errors
 * - 0x05xx: Handle errors
 * - 0x06xx: Transfer engine errors
 * - 0x07xx: Task execution and scheduling errors
 * - 0x08xx: Task loader errors
 * - 0x09xx: Validation errors
 * - 0x0Axx: Platform errors
 */
enum class ErrorCategory : uint8_t {
    GENERAL    = 0x00,
    IO         = 0x01,
    PROTOCOL   = 0x02,
    RESOURCE   = 0x03,
    CONFIG     = 0x04,
    HANDLE     = 0x05,
    ENGINE     = 0x06,
    TASK       = 0x07,
    LOADER     = 0x08,
    VALIDATION = 0x09,
    PLATFORM   = 0x0A,
};

constexpr std::string_view category_name(ErrorCategory cat) noexcept {
    switch (cat) {
        case ErrorCategory::GENERAL:    return "General";
        case ErrorCategory::IO:         return "I/O";
        case ErrorCategory::PROTOCOL:   return "Protocol";
        case ErrorCategory::RESOURCE:   return "Resource";
        case ErrorCategory::CONFIG:     return "Configuration";
        case ErrorCategory::HANDLE:     return "Handle";
        case ErrorCategory::ENGINE:     return "Engine";
        case ErrorCategory::TASK:       return "Task";
        case ErrorCategory::LOADER:     return "Loader";
        case ErrorCategory::VALIDATION: return "Validation";
        case ErrorCategory::PLATFORM:   return "Platform";
        default:                        return "Unknown";
    }
}

// ============================================================================
// ERROR CODE DEFINITIONS
// ============================================================================

/**
 * @brief Error codes
 *
 * Format: 0xCCEE where CC = category, EE = specific error
 */
enum class ErrorCode : uint32_t {
    // ========== General (0x00xx) ==========
    SUCCESS             = 0x0000,
    UNKNOWN_ERROR       = 0x0001,
    NOT_IMPLEMENTED     = 0x0002,
    INVALID_ARGUMENT    = 0x0003,
    INVALID_STATE       = 0x0004,
    OPERATION_CANCELLED = 0x0005,
    OPERATION_TIMEOUT   = 0x0006,
    ALREADY_EXISTS      = 0x0007,
    NOT_FOUND           = 0x0008,

    // ========== I/O (0x01xx) ==========
    CONNECTION_FAILED   = 0x0100,
    CONNECTION_TIMEOUT  = 0x0101,
    HOST_UNREACHABLE    = 0x0102,
    READ_ERROR          = 0x0103,
    WRITE_ERROR         = 0x0104,
    IO_FILE_NOT_FOUND   = 0x0105,
    SINK_READ_FAILED    = 0x0106,
    SINK_REWIND_FAILED  = 0x0107,

    // ========== Protocol (0x02xx) ==========
    PROTOCOL_VIOLATION  = 0x0200,
    INVALID_HEADER      = 0x0201,
    MALFORMED_DATA      = 0x0202,
    UNSUPPORTED_FEATURE = 0x0203,

    // ========== Resource (0x03xx) ==========
    OUT_OF_MEMORY       = 0x0300,
    QUEUE_FULL          = 0x0301,
    RESOURCE_EXHAUSTED  = 0x0302,
    CAPACITY_EXCEEDED   = 0x0303,

    // ========== Configuration (0x04xx) ==========
    CONFIG_INVALID            = 0x0400,
    CONFIG_PARSE_ERROR        = 0x0401,
    CONFIG_VALUE_OUT_OF_RANGE = 0x0402,
    CONFIG_TYPE_MISMATCH      = 0x0403,
    CONFIG_FILE_NOT_FOUND     = 0x0404,

    // ========== Handle (0x05xx) ==========
    HANDLE_INVALID      = 0x0500,
    HANDLE_NOT_FOUND    = 0x0501,

    // ========== Engine (0x06xx) ==========
    ENGINE_ERROR        = 0x0600,
    ENGINE_UNAVAILABLE  = 0x0601,
    CALLBACK_FAILED     = 0x0602,

    // ========== Task (0x07xx) ==========
    TASK_CANCELLED      = 0x0700,
    TASK_FAILED         = 0x0701,
    SCHEDULER_STOPPED   = 0x0702,
    SCHEDULER_OVERLOADED = 0x0703,
    WORK_NOT_FOUND      = 0x0704,

    // ========== Loader (0x08xx) ==========
    TASK_TYPE_NOT_FOUND      = 0x0800,
    TASK_CONSTRUCTION_FAILED = 0x0801,
    TASK_TYPE_CONFLICT       = 0x0802,

    // ========== Validation (0x09xx) ==========
    VALIDATION_FAILED   = 0x0900,
    INVALID_INPUT       = 0x0901,
    VALUE_OUT_OF_RANGE  = 0x0902,
    TYPE_MISMATCH       = 0x0903,
    NULL_POINTER        = 0x0904,
    EMPTY_VALUE         = 0x0905,
    FORMAT_INVALID      = 0x0906,

    // ========== Platform (0x0Axx) ==========
    PLATFORM_ERROR      = 0x0A00,
    THREAD_ERROR        = 0x0A01,
    SYSCALL_FAILED      = 0x0A02,
};

constexpr ErrorCategory get_category(ErrorCode code) noexcept {
    return static_cast<ErrorCategory>((static_cast<uint32_t>(code) >> 8) & 0xFF);
}

constexpr bool is_success(ErrorCode code) noexcept {
    return code == ErrorCode::SUCCESS;
}

/**
 * @brief Check if error code indicates a transient error (can retry)
 */
constexpr bool is_transient(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::CONNECTION_TIMEOUT:
        case ErrorCode::QUEUE_FULL:
        case ErrorCode::SCHEDULER_OVERLOADED:
        case ErrorCode::ENGINE_UNAVAILABLE:
            return true;
        default:
            return false;
    }
}

/**
 * @brief Check if error is fatal for the operation that raised it
 *
 * Loader failures are fatal for the work item: the scheduler never retries them.
 */
constexpr bool is_fatal(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::OUT_OF_MEMORY:
        case ErrorCode::TASK_TYPE_NOT_FOUND:
        case ErrorCode::TASK_CONSTRUCTION_FAILED:
            return true;
        default:
            return false;
    }
}

constexpr std::string_view error_name(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::SUCCESS:              return "SUCCESS";
        case ErrorCode::UNKNOWN_ERROR:        return "UNKNOWN_ERROR";
        case ErrorCode::NOT_IMPLEMENTED:      return "NOT_IMPLEMENTED";
        case ErrorCode::INVALID_ARGUMENT:     return "INVALID_ARGUMENT";
        case ErrorCode::INVALID_STATE:        return "INVALID_STATE";
        case ErrorCode::OPERATION_CANCELLED:  return "OPERATION_CANCELLED";
        case ErrorCode::OPERATION_TIMEOUT:    return "OPERATION_TIMEOUT";
        case ErrorCode::ALREADY_EXISTS:       return "ALREADY_EXISTS";
        case ErrorCode::NOT_FOUND:            return "NOT_FOUND";

        case ErrorCode::CONNECTION_FAILED:    return "CONNECTION_FAILED";
        case ErrorCode::CONNECTION_TIMEOUT:   return "CONNECTION_TIMEOUT";
        case ErrorCode::HOST_UNREACHABLE:     return "HOST_UNREACHABLE";
        case ErrorCode::READ_ERROR:           return "READ_ERROR";
        case ErrorCode::WRITE_ERROR:          return "WRITE_ERROR";
        case ErrorCode::IO_FILE_NOT_FOUND:    return "IO_FILE_NOT_FOUND";
        case ErrorCode::SINK_READ_FAILED:     return "SINK_READ_FAILED";
        case ErrorCode::SINK_REWIND_FAILED:   return "SINK_REWIND_FAILED";

        case ErrorCode::PROTOCOL_VIOLATION:   return "PROTOCOL_VIOLATION";
        case ErrorCode::INVALID_HEADER:       return "INVALID_HEADER";
        case ErrorCode::MALFORMED_DATA:       return "MALFORMED_DATA";
        case ErrorCode::UNSUPPORTED_FEATURE:  return "UNSUPPORTED_FEATURE";

        case ErrorCode::OUT_OF_MEMORY:        return "OUT_OF_MEMORY";
        case ErrorCode::QUEUE_FULL:           return "QUEUE_FULL";
        case ErrorCode::RESOURCE_EXHAUSTED:   return "RESOURCE_EXHAUSTED";
        case ErrorCode::CAPACITY_EXCEEDED:    return "CAPACITY_EXCEEDED";

        case ErrorCode::CONFIG_INVALID:            return "CONFIG_INVALID";
        case ErrorCode::CONFIG_PARSE_ERROR:        return "CONFIG_PARSE_ERROR";
        case ErrorCode::CONFIG_VALUE_OUT_OF_RANGE: return "CONFIG_VALUE_OUT_OF_RANGE";
        case ErrorCode::CONFIG_TYPE_MISMATCH:      return "CONFIG_TYPE_MISMATCH";
        case ErrorCode::CONFIG_FILE_NOT_FOUND:     return "CONFIG_FILE_NOT_FOUND";

        case ErrorCode::HANDLE_INVALID:       return "HANDLE_INVALID";
        case ErrorCode::HANDLE_NOT_FOUND:     return "HANDLE_NOT_FOUND";

        case ErrorCode::ENGINE_ERROR:         return "ENGINE_ERROR";
        case ErrorCode::ENGINE_UNAVAILABLE:   return "ENGINE_UNAVAILABLE";
        case ErrorCode::CALLBACK_FAILED:      return "CALLBACK_FAILED";

        case ErrorCode::TASK_CANCELLED:       return "TASK_CANCELLED";
        case ErrorCode::TASK_FAILED:          return "TASK_FAILED";
        case ErrorCode::SCHEDULER_STOPPED:    return "SCHEDULER_STOPPED";
        case ErrorCode::SCHEDULER_OVERLOADED: return "SCHEDULER_OVERLOADED";
        case ErrorCode::WORK_NOT_FOUND:       return "WORK_NOT_FOUND";

        case ErrorCode::TASK_TYPE_NOT_FOUND:      return "TASK_TYPE_NOT_FOUND";
        case ErrorCode::TASK_CONSTRUCTION_FAILED: return "TASK_CONSTRUCTION_FAILED";
        case ErrorCode::TASK_TYPE_CONFLICT:       return "TASK_TYPE_CONFLICT";

        case ErrorCode::VALIDATION_FAILED:    return "VALIDATION_FAILED";
        case ErrorCode::INVALID_INPUT:        return "INVALID_INPUT";
        case ErrorCode::VALUE_OUT_OF_RANGE:   return "VALUE_OUT_OF_RANGE";
        case ErrorCode::TYPE_MISMATCH:        return "TYPE_MISMATCH";
        case ErrorCode::NULL_POINTER:         return "NULL_POINTER";
        case ErrorCode::EMPTY_VALUE:          return "EMPTY_VALUE";
        case ErrorCode::FORMAT_INVALID:       return "FORMAT_INVALID";

        case ErrorCode::PLATFORM_ERROR:       return "PLATFORM_ERROR";
        case ErrorCode::THREAD_ERROR:         return "THREAD_ERROR";
        case ErrorCode::SYSCALL_FAILED:       return "SYSCALL_FAILED";

        default:                              return "UNKNOWN";
    }
}

// ============================================================================
// SOURCE LOCATION
// ============================================================================

struct SourceLocation {
    const char* file     = "";
    const char* function = "";
    uint32_t line        = 0;
    uint32_t column      = 0;

    constexpr SourceLocation() noexcept = default;

    constexpr SourceLocation(const char* file_, const char* func_, uint32_t line_,
                             uint32_t col_ = 0) noexcept
        : file(file_), function(func_), line(line_), column(col_) {}

#if defined(XFER_HAS_SOURCE_LOCATION)
    constexpr SourceLocation(const std::source_location& loc) noexcept
        : file(loc.file_name()), function(loc.function_name()), line(loc.line()),
          column(loc.column()) {}

    static constexpr SourceLocation current(
        const std::source_location& loc = std::source_location::current()) noexcept {
        return SourceLocation(loc);
    }
#else
    static constexpr SourceLocation current() noexcept { return SourceLocation(); }
#endif

    constexpr bool is_valid() const noexcept { return line > 0 && file[0] != '\0'; }
};

#if defined(XFER_HAS_SOURCE_LOCATION)
    #define XFER_CURRENT_LOCATION ::xfer::common::SourceLocation::current()
#else
    #define XFER_CURRENT_LOCATION ::xfer::common::SourceLocation(__FILE__, __func__, __LINE__)
#endif

// ============================================================================
// ERROR CONTEXT
// ============================================================================

/**
 * @brief Error value with message, location and key/value context
 */
class Error {
public:
    Error() noexcept = default;

    Error(ErrorCode code) noexcept : code_(code) {}

    Error(ErrorCode code, std::string message, SourceLocation loc = {}) noexcept
        : code_(code), message_(std::move(message)), location_(loc) {}

    ErrorCode code() const noexcept { return code_; }
    ErrorCategory category() const noexcept { return get_category(code_); }
    const std::string& message() const noexcept { return message_; }
    const SourceLocation& location() const noexcept { return location_; }

    bool is_success() const noexcept { return common::is_success(code_); }
    bool is_error() const noexcept { return !is_success(); }
    bool is_transient() const noexcept { return common::is_transient(code_); }
    bool is_fatal() const noexcept { return common::is_fatal(code_); }

    /**
     * @brief One log line: "NAME (0xCCEE, category): message {key=value, ...} at file:line"
     */
    std::string to_string() const;

    Error& with_context(std::string_view key, std::string_view value);

    const std::vector<std::pair<std::string, std::string>>& context() const noexcept {
        return context_;
    }

private:
    ErrorCode code_ = ErrorCode::SUCCESS;
    std::string message_;
    SourceLocation location_;
    std::vector<std::pair<std::string, std::string>> context_;
};

// ============================================================================
// RESULT TYPE
// ============================================================================

template <typename T = void>
class Result;

template <>
class Result<void> {
public:
    Result() noexcept = default;

    Result(ErrorCode code) noexcept : error_(code) {}

    Result(ErrorCode code, std::string_view message, SourceLocation loc = XFER_CURRENT_LOCATION)
        : error_(code, std::string(message), loc) {}

    Result(Error error) noexcept : error_(std::move(error)) {}

    bool is_success() const noexcept { return error_.is_success(); }
    bool is_error() const noexcept { return error_.is_error(); }
    explicit operator bool() const noexcept { return is_success(); }

    ErrorCode code() const noexcept { return error_.code(); }
    const Error& error() const noexcept { return error_; }
    const std::string& message() const noexcept { return error_.message(); }

private:
    Error error_;
};

template <typename T>
class Result {
public:
    Result(T value) noexcept(std::is_nothrow_move_constructible_v<T>)
        : value_(std::move(value)) {}

    Result(ErrorCode code) noexcept : error_(code) {}

    Result(ErrorCode code, std::string_view message, SourceLocation loc = XFER_CURRENT_LOCATION)
        : error_(code, std::string(message), loc) {}

    Result(Error error) noexcept : error_(std::move(error)) {}

    bool is_success() const noexcept { return value_.has_value(); }
    bool is_error() const noexcept { return !value_.has_value(); }
    explicit operator bool() const noexcept { return is_success(); }

    // Only valid when is_success()
    T& value() & noexcept { return *value_; }
    const T& value() const& noexcept { return *value_; }
    T&& value() && noexcept { return std::move(*value_); }

    T value_or(T default_value) const& {
        return value_ ? *value_ : std::move(default_value);
    }

    T value_or(T default_value) && {
        return value_ ? std::move(*value_) : std::move(default_value);
    }

    ErrorCode code() const noexcept { return value_ ? ErrorCode::SUCCESS : error_.code(); }
    const Error& error() const noexcept { return error_; }
    const std::string& message() const noexcept { return error_.message(); }

    template <typename F>
    auto map(F&& func) && -> Result<decltype(func(std::declval<T&&>()))> {
        using ReturnType = Result<decltype(func(std::declval<T&&>()))>;
        if (value_) {
            return ReturnType(func(std::move(*value_)));
        }
        return ReturnType(error_);
    }

private:
    std::optional<T> value_;
    Error error_;
};

// ============================================================================
// HELPER FUNCTIONS
// ============================================================================

template <typename T>
Result<T> ok(T value) {
    return Result<T>(std::move(value));
}

inline Result<void> ok() {
    return Result<void>();
}

template <typename T = void>
Result<T> err(ErrorCode code, std::string_view message = {},
              SourceLocation loc = XFER_CURRENT_LOCATION) {
    return Result<T>(code, message, loc);
}

template <typename T = void>
Result<T> err(Error error) {
    return Result<T>(std::move(error));
}

// ============================================================================
// ERROR PROPAGATION MACROS
// ============================================================================

/**
 * @brief Return the error of @p expr from the enclosing Result-returning function
 *
 * Usage: XFER_TRY(some_function_returning_result());
 */
#define XFER_TRY(expr)                                 \
    do {                                               \
        auto _xfer_result = (expr);                    \
        if (XFER_UNLIKELY(_xfer_result.is_error())) {  \
            return _xfer_result.error();               \
        }                                              \
    } while (0)

/**
 * @brief Assign value or return error
 *
 * Usage: XFER_TRY_ASSIGN(var, some_function_returning_result());
 */
#define XFER_TRY_ASSIGN(var, expr)                     \
    auto _xfer_try_##var = (expr);                     \
    if (XFER_UNLIKELY(_xfer_try_##var.is_error())) {   \
        return _xfer_try_##var.error();                \
    }                                                  \
    var = std::move(_xfer_try_##var).value()

}  // namespace xfer::common
