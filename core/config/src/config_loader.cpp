/**
 * @file config_loader.cpp
 * @brief Configuration loader implementation
 */

#include <xfer/common/debug.hpp>
#include <xfer/config/config_loader.hpp>

#include <json/json.h>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <limits>
#include <optional>
#include <sstream>

namespace xfer::config {

namespace {
constexpr std::string_view LOG_CAT = common::debug::category::CONFIG;

using common::ErrorCode;

// ============================================================================
// READERS
// ============================================================================

/**
 * Both readers expose section()/get_bool()/get_int()/get_string() so that one
 * template maps either document onto XferConfig. The first error encountered is
 * kept in the shared slot; later lookups return their defaults.
 */
class YamlReader {
public:
    YamlReader(YAML::Node node, std::string path, std::optional<common::Error>& error)
        : node_(std::move(node)), path_(std::move(path)), error_(&error) {}

    YamlReader section(const std::string& key) const {
        auto child = find(key);
        if (child && !child->IsMap()) {
            fail(ErrorCode::CONFIG_TYPE_MISMATCH, path(key) + " must be a mapping");
            return YamlReader(YAML::Node(), path(key), *error_);
        }
        return YamlReader(child ? *child : YAML::Node(), path(key), *error_);
    }

    bool get_bool(const std::string& key, bool default_value) const {
        return get<bool>(key, default_value, "a boolean");
    }

    int64_t get_int(const std::string& key, int64_t default_value) const {
        return get<int64_t>(key, default_value, "an integer");
    }

    std::string get_string(const std::string& key, std::string default_value) const {
        return get<std::string>(key, std::move(default_value), "a string");
    }

    std::string path(const std::string& key) const {
        return path_.empty() ? key : path_ + "." + key;
    }

    void fail(ErrorCode code, std::string message) const {
        if (!*error_) {
            *error_ = common::Error(code, std::move(message));
        }
    }

private:
    std::optional<YAML::Node> find(const std::string& key) const {
        if (!node_.IsMap()) {
            return std::nullopt;
        }
        YAML::Node child = node_[key];
        if (!child.IsDefined() || child.IsNull()) {
            return std::nullopt;
        }
        return child;
    }

    template <typename T>
    T get(const std::string& key, T default_value, std::string_view expected) const {
        auto child = find(key);
        if (!child) {
            return default_value;
        }
        if (!child->IsScalar()) {
            fail(ErrorCode::CONFIG_TYPE_MISMATCH, path(key) + " must be " + std::string(expected));
            return default_value;
        }
        try {
            return child->as<T>();
        } catch (const YAML::Exception& e) {
            fail(ErrorCode::CONFIG_TYPE_MISMATCH,
                 path(key) + " must be " + std::string(expected) + " (" + e.what() + ")");
            return default_value;
        }
    }

    YAML::Node node_;
    std::string path_;
    std::optional<common::Error>* error_;
};

class JsonReader {
public:
    JsonReader(const Json::Value& node, std::string path, std::optional<common::Error>& error)
        : node_(node), path_(std::move(path)), error_(&error) {}

    JsonReader section(const std::string& key) const {
        const Json::Value* child = find(key);
        if (child != nullptr && !child->isObject()) {
            fail(ErrorCode::CONFIG_TYPE_MISMATCH, path(key) + " must be an object");
            return JsonReader(null_value(), path(key), *error_);
        }
        return JsonReader(child != nullptr ? *child : null_value(), path(key), *error_);
    }

    bool get_bool(const std::string& key, bool default_value) const {
        const Json::Value* child = find(key);
        if (child == nullptr) {
            return default_value;
        }
        if (!child->isBool()) {
            fail(ErrorCode::CONFIG_TYPE_MISMATCH, path(key) + " must be a boolean");
            return default_value;
        }
        return child->asBool();
    }

    int64_t get_int(const std::string& key, int64_t default_value) const {
        const Json::Value* child = find(key);
        if (child == nullptr) {
            return default_value;
        }
        if (!child->isInt64() || child->isBool()) {
            fail(ErrorCode::CONFIG_TYPE_MISMATCH, path(key) + " must be an integer");
            return default_value;
        }
        return child->asInt64();
    }

    std::string get_string(const std::string& key, std::string default_value) const {
        const Json::Value* child = find(key);
        if (child == nullptr) {
            return default_value;
        }
        if (!child->isString()) {
            fail(ErrorCode::CONFIG_TYPE_MISMATCH, path(key) + " must be a string");
            return default_value;
        }
        return child->asString();
    }

    std::string path(const std::string& key) const {
        return path_.empty() ? key : path_ + "." + key;
    }

    void fail(ErrorCode code, std::string message) const {
        if (!*error_) {
            *error_ = common::Error(code, std::move(message));
        }
    }

private:
    static const Json::Value& null_value() {
        static const Json::Value null_node;
        return null_node;
    }

    const Json::Value* find(const std::string& key) const {
        if (!node_.isObject() || !node_.isMember(key)) {
            return nullptr;
        }
        const Json::Value& child = node_[key];
        return child.isNull() ? nullptr : &child;
    }

    const Json::Value& node_;
    std::string path_;
    std::optional<common::Error>* error_;
};

// ============================================================================
// MAPPING
// ============================================================================

template <typename Reader>
int64_t get_ranged(const Reader& reader, const std::string& key, int64_t default_value,
                   int64_t min_value, int64_t max_value) {
    int64_t value = reader.get_int(key, default_value);
    if (value < min_value || value > max_value) {
        reader.fail(ErrorCode::CONFIG_VALUE_OUT_OF_RANGE,
                    reader.path(key) + " = " + std::to_string(value) + " outside [" +
                        std::to_string(min_value) + ", " + std::to_string(max_value) + "]");
        return default_value;
    }
    return value;
}

std::optional<LogOutput> output_from_name(const std::string& name) {
    if (name == "console")
        return LogOutput::CONSOLE;
    if (name == "file")
        return LogOutput::FILE;
    if (name == "both")
        return LogOutput::BOTH;
    if (name == "none")
        return LogOutput::NONE;
    return std::nullopt;
}

template <typename Reader>
void read_logging(const Reader& node, LoggingConfig& config) {
    std::string level = node.get_string("level", "info");
    if (auto parsed = common::debug::parse_log_level(level)) {
        config.level = *parsed;
    } else {
        node.fail(ErrorCode::CONFIG_VALUE_OUT_OF_RANGE,
                  node.path("level") + ": unknown log level '" + level + "'");
    }

    std::string output = node.get_string("output", "console");
    if (auto parsed = output_from_name(output)) {
        config.output = *parsed;
    } else {
        node.fail(ErrorCode::CONFIG_VALUE_OUT_OF_RANGE,
                  node.path("output") + ": expected console, file, both or none");
    }

    config.file_path = node.get_string("file_path", "");
    config.max_file_size_mb =
        static_cast<size_t>(get_ranged(node, "max_file_size_mb", 10, 1, 4096));
    config.max_files = static_cast<uint32_t>(get_ranged(node, "max_files", 5, 1, 100));
    config.include_timestamp = node.get_bool("include_timestamp", true);
    config.include_thread_id = node.get_bool("include_thread_id", true);
    config.use_colors        = node.get_bool("use_colors", true);
}

template <typename Reader>
void read_foreground(const Reader& node, task::ForegroundConfig& config) {
    const task::ForegroundInfo defaults;
    config.enabled              = node.get_bool("enabled", true);
    config.info.notification_id = static_cast<int32_t>(
        get_ranged(node, "notification_id", defaults.notification_id, 0,
                   std::numeric_limits<int32_t>::max()));
    config.info.channel_id   = node.get_string("channel_id", defaults.channel_id);
    config.info.channel_name = node.get_string("channel_name", defaults.channel_name);
    config.info.title        = node.get_string("title", defaults.title);
    config.info.text         = node.get_string("text", defaults.text);
    config.info.ongoing      = node.get_bool("ongoing", defaults.ongoing);
}

template <typename Reader>
common::Result<XferConfig> read_config(const Reader& root,
                                       std::optional<common::Error>& error) {
    XferConfig config;

    read_logging(root.section("logging"), config.logging);

    const Reader registry       = root.section("registry");
    config.registry.max_handles = static_cast<size_t>(get_ranged(
        registry, "max_handles", 65536, 1, std::numeric_limits<uint32_t>::max()));

    const Reader dispatcher   = root.section("dispatcher");
    config.dispatcher.enabled = dispatcher.get_bool("enabled", false);
    config.dispatcher.dispatcher.queue_capacity =
        static_cast<size_t>(get_ranged(dispatcher, "queue_capacity", 1024, 1, 1 << 20));
    config.dispatcher.dispatcher.enqueue_timeout = std::chrono::milliseconds(
        get_ranged(dispatcher, "enqueue_timeout_ms", 100, 0, 3'600'000));
    config.dispatcher.dispatcher.terminal_history =
        static_cast<size_t>(get_ranged(dispatcher, "terminal_history", 4096, 0, 1 << 24));

    const Reader scheduler = root.section("scheduler");
    config.scheduler.worker_threads =
        static_cast<size_t>(get_ranged(scheduler, "worker_threads", 2, 1, 256));
    config.scheduler.max_queue_size =
        static_cast<size_t>(get_ranged(scheduler, "max_queue_size", 256, 1, 1 << 20));
    config.scheduler.finished_history =
        static_cast<size_t>(get_ranged(scheduler, "finished_history", 1024, 1, 1 << 24));

    read_foreground(root.section("foreground"), config.foreground);

    const Reader client   = root.section("client");
    config.client.timeout = std::chrono::milliseconds(
        get_ranged(client, "timeout_ms", 30000, 1, 86'400'000));

    if (error) {
        return *error;
    }
    return config;
}

}  // namespace

// ============================================================================
// FORMAT DETECTION
// ============================================================================

ConfigFormat ConfigLoader::detect_format(const std::filesystem::path& path) {
    auto ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (ext == ".json") {
        return ConfigFormat::JSON;
    }
    return ConfigFormat::YAML;
}

ConfigFormat ConfigLoader::detect_format_from_content(std::string_view content) {
    size_t pos = content.find_first_not_of(" \t\r\n");
    if (pos != std::string_view::npos && content[pos] == '{') {
        return ConfigFormat::JSON;
    }
    return ConfigFormat::YAML;
}

// ============================================================================
// IMPLEMENTATION
// ============================================================================

namespace {

class ConfigLoaderImpl : public ConfigLoader {
public:
    common::Result<XferConfig> load(const std::filesystem::path& path,
                                    ConfigFormat format) override {
        XFER_LOG_DEBUG(LOG_CAT, "loading configuration from " << path.string());

        auto content = read_file(path);
        if (content.is_error()) {
            return content.error();
        }
        if (format == ConfigFormat::AUTO) {
            format = detect_format(path);
        }
        return parse(content.value(), format);
    }

    common::Result<XferConfig> parse(std::string_view content, ConfigFormat format) override {
        if (format == ConfigFormat::AUTO) {
            format = detect_format_from_content(content);
        }

        std::optional<common::Error> error;
        common::Result<XferConfig> config = common::err<XferConfig>(ErrorCode::CONFIG_PARSE_ERROR);

        if (format == ConfigFormat::JSON) {
            Json::Value root;
            Json::CharReaderBuilder builder;
            std::string errors;
            std::istringstream stream{std::string{content}};

            if (!Json::parseFromStream(builder, stream, &root, &errors)) {
                return common::err<XferConfig>(ErrorCode::CONFIG_PARSE_ERROR,
                                               "JSON parse error: " + errors);
            }
            if (!root.isObject() && !root.isNull()) {
                return common::err<XferConfig>(ErrorCode::CONFIG_TYPE_MISMATCH,
                                               "configuration root must be an object");
            }
            config = read_config(JsonReader(root, "", error), error);
        } else {
            YAML::Node root;
            try {
                root = YAML::Load(std::string(content));
            } catch (const YAML::Exception& e) {
                return common::err<XferConfig>(ErrorCode::CONFIG_PARSE_ERROR,
                                               std::string("YAML parse error: ") + e.what());
            }
            if (!root.IsMap() && !root.IsNull()) {
                return common::err<XferConfig>(ErrorCode::CONFIG_TYPE_MISMATCH,
                                               "configuration root must be a mapping");
            }
            config = read_config(YamlReader(root, "", error), error);
        }

        if (config.is_error()) {
            XFER_LOG_WARN(LOG_CAT, "invalid configuration: " << config.message());
            return config;
        }
        XFER_TRY(validate(config.value()));
        return config;
    }

    common::Result<void> validate(const XferConfig& config) override {
        const auto& logging = config.logging;
        if ((logging.output == LogOutput::FILE || logging.output == LogOutput::BOTH) &&
            logging.file_path.empty()) {
            return common::err(ErrorCode::CONFIG_INVALID,
                               "logging.file_path is required for file output");
        }
        if (config.registry.max_handles == 0) {
            return common::err(ErrorCode::CONFIG_VALUE_OUT_OF_RANGE,
                               "registry.max_handles must be positive");
        }
        if (config.dispatcher.dispatcher.queue_capacity == 0) {
            return common::err(ErrorCode::CONFIG_VALUE_OUT_OF_RANGE,
                               "dispatcher.queue_capacity must be positive");
        }
        if (config.scheduler.worker_threads == 0 || config.scheduler.max_queue_size == 0 ||
            config.scheduler.finished_history == 0) {
            return common::err(ErrorCode::CONFIG_VALUE_OUT_OF_RANGE,
                               "scheduler.worker_threads, max_queue_size and finished_history "
                               "must be positive");
        }
        if (config.client.timeout.count() <= 0) {
            return common::err(ErrorCode::CONFIG_VALUE_OUT_OF_RANGE,
                               "client.timeout_ms must be positive");
        }
        return common::ok();
    }

private:
    static common::Result<std::string> read_file(const std::filesystem::path& path) {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec)) {
            return common::err<std::string>(ErrorCode::CONFIG_FILE_NOT_FOUND,
                                            "configuration file not found: " + path.string());
        }

        std::ifstream file(path);
        if (!file.is_open()) {
            return common::err<std::string>(ErrorCode::CONFIG_FILE_NOT_FOUND,
                                            "cannot open configuration file: " + path.string());
        }

        std::stringstream buffer;
        buffer << file.rdbuf();
        return buffer.str();
    }
};

}  // namespace

std::unique_ptr<ConfigLoader> create_config_loader() {
    return std::make_unique<ConfigLoaderImpl>();
}

// ============================================================================
// LOGGING SETUP
// ============================================================================

common::Result<void> apply_logging_config(const LoggingConfig& config) {
    using namespace common::debug;

    auto& logger = Logger::instance();
    logger.clear_sinks();

    if (config.output == LogOutput::CONSOLE || config.output == LogOutput::BOTH) {
        ConsoleSink::Config console;
        console.use_colors        = config.use_colors;
        console.include_timestamp = config.include_timestamp;
        console.include_thread_id = config.include_thread_id;
        logger.add_sink(std::make_shared<ConsoleSink>(console));
    }

    if (config.output == LogOutput::FILE || config.output == LogOutput::BOTH) {
        if (config.file_path.empty()) {
            return common::err(ErrorCode::CONFIG_INVALID,
                               "logging.file_path is required for file output");
        }
        FileSink::Config file;
        file.file_path     = config.file_path;
        file.max_file_size = config.max_file_size_mb * 1024 * 1024;
        file.max_files     = config.max_files;

        auto sink = std::make_shared<FileSink>(file);
        if (!sink->is_ready()) {
            return common::err(ErrorCode::CONFIG_INVALID,
                               "cannot open log file " + config.file_path);
        }
        logger.add_sink(std::move(sink));
    }

    init_logging(config.level);
    XFER_LOG_DEBUG(LOG_CAT, "logging configured at " << level_name(config.level));
    return common::ok();
}

}  // namespace xfer::config
