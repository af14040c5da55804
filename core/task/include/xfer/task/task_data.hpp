#pragma once

/**
 * @file task_data.hpp
 * @brief Typed key/value record exchanged between a scheduler and its tasks
 *
 * Values are bool, int32, int64, double or string. Getters return the supplied
 * default when a key is absent or holds another type; get_long() also accepts an
 * int32 value, since small numbers come back from JSON as int32.
 */

#include <xfer/common/error.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace xfer::task {

using TaskValue = std::variant<bool, int32_t, int64_t, double, std::string>;

class TaskData {
public:
    class Builder {
    public:
        Builder() = default;

        /// Start from a copy of @p data
        explicit Builder(const TaskData& data) : values_(data.values_) {}

        Builder& put_bool(std::string key, bool value);
        Builder& put_int(std::string key, int32_t value);
        Builder& put_long(std::string key, int64_t value);
        Builder& put_double(std::string key, double value);
        Builder& put_string(std::string key, std::string value);

        Builder& put_all(const TaskData& data);

        TaskData build() const { return TaskData(values_); }

    private:
        std::map<std::string, TaskValue, std::less<>> values_;
    };

    TaskData() = default;

    bool contains(std::string_view key) const;
    size_t size() const noexcept { return values_.size(); }
    bool empty() const noexcept { return values_.empty(); }

    std::vector<std::string> keys() const;

    /// Raw value or nullptr
    const TaskValue* find(std::string_view key) const;

    std::optional<std::string> get_string(std::string_view key) const;
    int32_t get_int(std::string_view key, int32_t default_value) const;
    int64_t get_long(std::string_view key, int64_t default_value) const;
    bool get_bool(std::string_view key, bool default_value) const;
    double get_double(std::string_view key, double default_value) const;

    /**
     * @brief Compact JSON object, one member per key
     */
    std::string to_json() const;

    /**
     * @brief Parse a flat JSON object
     *
     * MALFORMED_DATA for invalid JSON, FORMAT_INVALID if the root is not an object,
     * TYPE_MISMATCH for null, array or object members.
     */
    static common::Result<TaskData> from_json(std::string_view json);

    bool operator==(const TaskData& other) const { return values_ == other.values_; }
    bool operator!=(const TaskData& other) const { return !(*this == other); }

private:
    explicit TaskData(std::map<std::string, TaskValue, std::less<>> values)
        : values_(std::move(values)) {}

    std::map<std::string, TaskValue, std::less<>> values_;
};

}  // namespace xfer::task
