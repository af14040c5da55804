#include <xfer/task/task_data.hpp>

#include <json/json.h>

#include <sstream>
#include <type_traits>

namespace xfer::task {

// ============================================================================
// BUILDER
// ============================================================================

TaskData::Builder& TaskData::Builder::put_bool(std::string key, bool value) {
    values_.insert_or_assign(std::move(key), TaskValue(value));
    return *this;
}

TaskData::Builder& TaskData::Builder::put_int(std::string key, int32_t value) {
    values_.insert_or_assign(std::move(key), TaskValue(value));
    return *this;
}

TaskData::Builder& TaskData::Builder::put_long(std::string key, int64_t value) {
    values_.insert_or_assign(std::move(key), TaskValue(value));
    return *this;
}

TaskData::Builder& TaskData::Builder::put_double(std::string key, double value) {
    values_.insert_or_assign(std::move(key), TaskValue(value));
    return *this;
}

TaskData::Builder& TaskData::Builder::put_string(std::string key, std::string value) {
    values_.insert_or_assign(std::move(key), TaskValue(std::move(value)));
    return *this;
}

TaskData::Builder& TaskData::Builder::put_all(const TaskData& data) {
    for (const auto& [key, value] : data.values_) {
        values_.insert_or_assign(key, value);
    }
    return *this;
}

// ============================================================================
// ACCESSORS
// ============================================================================

bool TaskData::contains(std::string_view key) const {
    return values_.find(key) != values_.end();
}

std::vector<std::string> TaskData::keys() const {
    std::vector<std::string> result;
    result.reserve(values_.size());
    for (const auto& [key, value] : values_) {
        result.push_back(key);
    }
    return result;
}

const TaskValue* TaskData::find(std::string_view key) const {
    auto it = values_.find(key);
    return it == values_.end() ? nullptr : &it->second;
}

std::optional<std::string> TaskData::get_string(std::string_view key) const {
    const TaskValue* value = find(key);
    if (value == nullptr) {
        return std::nullopt;
    }
    if (const auto* s = std::get_if<std::string>(value)) {
        return *s;
    }
    return std::nullopt;
}

int32_t TaskData::get_int(std::string_view key, int32_t default_value) const {
    const TaskValue* value = find(key);
    if (value == nullptr) {
        return default_value;
    }
    if (const auto* i = std::get_if<int32_t>(value)) {
        return *i;
    }
    return default_value;
}

int64_t TaskData::get_long(std::string_view key, int64_t default_value) const {
    const TaskValue* value = find(key);
    if (value == nullptr) {
        return default_value;
    }
    if (const auto* l = std::get_if<int64_t>(value)) {
        return *l;
    }
    if (const auto* i = std::get_if<int32_t>(value)) {
        return *i;
    }
    return default_value;
}

bool TaskData::get_bool(std::string_view key, bool default_value) const {
    const TaskValue* value = find(key);
    if (value == nullptr) {
        return default_value;
    }
    if (const auto* b = std::get_if<bool>(value)) {
        return *b;
    }
    return default_value;
}

double TaskData::get_double(std::string_view key, double default_value) const {
    const TaskValue* value = find(key);
    if (value == nullptr) {
        return default_value;
    }
    if (const auto* d = std::get_if<double>(value)) {
        return *d;
    }
    return default_value;
}

// ============================================================================
// JSON
// ============================================================================

std::string TaskData::to_json() const {
    Json::Value root(Json::objectValue);
    for (const auto& [key, value] : values_) {
        std::visit(
            [&root, &key = key](const auto& v) {
                using V = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<V, int64_t>) {
                    root[key] = Json::Value(static_cast<Json::Int64>(v));
                } else {
                    root[key] = Json::Value(v);
                }
            },
            value);
    }

    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    return Json::writeString(writer, root);
}

common::Result<TaskData> TaskData::from_json(std::string_view json) {
    Json::Value root;
    Json::CharReaderBuilder builder;
    std::string errors;
    std::istringstream stream{std::string{json}};

    if (!Json::parseFromStream(builder, stream, &root, &errors)) {
        return common::err<TaskData>(common::ErrorCode::MALFORMED_DATA,
                                     "task data is not valid JSON: " + errors);
    }
    if (!root.isObject()) {
        return common::err<TaskData>(common::ErrorCode::FORMAT_INVALID,
                                     "task data must be a JSON object");
    }

    Builder data;
    for (const auto& key : root.getMemberNames()) {
        const Json::Value& value = root[key];
        switch (value.type()) {
            case Json::booleanValue:
                data.put_bool(key, value.asBool());
                break;
            case Json::stringValue:
                data.put_string(key, value.asString());
                break;
            case Json::intValue:
            case Json::uintValue:
                if (value.isInt()) {
                    data.put_int(key, value.asInt());
                } else if (value.isInt64()) {
                    data.put_long(key, value.asInt64());
                } else {
                    return common::err<TaskData>(common::ErrorCode::VALUE_OUT_OF_RANGE,
                                                 "integer member '" + key + "' out of range");
                }
                break;
            case Json::realValue:
                data.put_double(key, value.asDouble());
                break;
            default:
                return common::err<TaskData>(common::ErrorCode::TYPE_MISMATCH,
                                             "member '" + key + "' is not a scalar");
        }
    }
    return data.build();
}

}  // namespace xfer::task
