#include <xfer/common/error.hpp>

#include <cstring>
#include <iomanip>
#include <sstream>

namespace xfer::common {

std::string Error::to_string() const {
    std::ostringstream oss;
    oss << error_name(code_) << " (0x" << std::hex << std::setw(4) << std::setfill('0')
        << static_cast<uint32_t>(code_) << std::dec << ", " << category_name(category()) << ')';

    if (!message_.empty()) {
        oss << ": " << message_;
    }

    if (!context_.empty()) {
        oss << " {";
        const char* separator = "";
        for (const auto& [key, value] : context_) {
            oss << separator << key << '=' << value;
            separator = ", ";
        }
        oss << '}';
    }

    if (location_.is_valid()) {
        const char* slash = std::strrchr(location_.file, '/');
        oss << " at " << (slash ? slash + 1 : location_.file) << ':' << location_.line;
    }
    return oss.str();
}

Error& Error::with_context(std::string_view key, std::string_view value) {
    context_.emplace_back(std::string(key), std::string(value));
    return *this;
}

}  // namespace xfer::common
