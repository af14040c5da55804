#include <xfer/common/debug.hpp>
#include <xfer/task/headers.hpp>

#include <json/json.h>

#include <sstream>

namespace xfer::task {

namespace {
constexpr std::string_view LOG_CAT = common::debug::category::TASK;

bool is_blank(std::string_view text) {
    return text.find_first_not_of(" \t\r\n") == std::string_view::npos;
}
}  // namespace

common::Result<HeaderMap> try_parse_headers_json(std::string_view json) {
    if (is_blank(json)) {
        return HeaderMap{};
    }

    Json::Value root;
    Json::CharReaderBuilder builder;
    std::string errors;
    std::istringstream stream{std::string{json}};

    if (!Json::parseFromStream(builder, stream, &root, &errors)) {
        return common::err<HeaderMap>(common::ErrorCode::MALFORMED_DATA,
                                      "headers are not valid JSON: " + errors);
    }
    if (!root.isObject()) {
        return common::err<HeaderMap>(common::ErrorCode::FORMAT_INVALID,
                                      "headers must be a JSON object");
    }

    HeaderMap headers;
    for (const auto& name : root.getMemberNames()) {
        const Json::Value& value = root[name];
        if (!value.isString()) {
            XFER_LOG_DEBUG(LOG_CAT, "skipping non-string header '" << name << "'");
            continue;
        }
        headers.emplace(name, value.asString());
    }
    return headers;
}

HeaderMap parse_headers_json(std::string_view json) {
    auto parsed = try_parse_headers_json(json);
    if (parsed.is_error()) {
        XFER_LOG_WARN(LOG_CAT, "ignoring request headers: " << parsed.message());
        return {};
    }
    return std::move(parsed).value();
}

std::string headers_to_json(const HeaderMap& headers) {
    Json::Value root(Json::objectValue);
    for (const auto& [name, value] : headers) {
        root[name] = value;
    }

    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    return Json::writeString(writer, root);
}

}  // namespace xfer::task
