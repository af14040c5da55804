#include <xfer/bridge/request_types.hpp>

#include <algorithm>
#include <cctype>
#include <sstream>

namespace xfer::bridge {

namespace {

bool iequals(std::string_view a, std::string_view b) noexcept {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

}  // namespace

std::optional<std::string> ResponseInfo::header(std::string_view name) const {
    for (const auto& [key, value] : headers) {
        if (iequals(key, name)) {
            return value;
        }
    }
    return std::nullopt;
}

std::string RequestError::to_string() const {
    std::ostringstream oss;
    oss << common::error_name(code);
    if (internal_code != 0) {
        oss << " (internal " << internal_code << ")";
    }
    if (!message.empty()) {
        oss << ": " << message;
    }
    return oss.str();
}

}  // namespace xfer::bridge
