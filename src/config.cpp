#include "kioskagent/config.hpp"
#include "kioskagent/http.hpp"
#include "kioskagent/json.hpp"
#include "kioskagent/storage.hpp"

#include <boost/log/trivial.hpp>

#include <cstdlib>
#include <string>

namespace kioskagent {
namespace config {

namespace {

constexpr int MAX_DOWNLOAD_ATTEMPTS = 10;

template <typename T> void read_value(const nlohmann::json& j, const char* key, T& target) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return;
    }
    target = it->get<T>();
}

std::optional<double> parse_seconds(const std::string& name, const std::string& value) {
    try {
        size_t consumed = 0;
        double seconds = std::stod(value, &consumed);
        if (consumed == value.size()) {
            return seconds;
        }
    } catch (const std::exception&) {
        // Reported below
    }
    BOOST_LOG_TRIVIAL(warning) << "Ignoring " << name << "=" << value << ": not a number";
    return std::nullopt;
}

}  // namespace

Result<Config> parse_config(const std::string& text) {
    auto parsed = json::try_parse(text);
    if (!parsed) {
        return Result<Config>::error(ErrorCode::ParseError, "Configuration is not valid JSON");
    }
    if (!parsed->is_object()) {
        return Result<Config>::error(ErrorCode::ParseError, "Configuration is not a JSON object");
    }

    const auto& j = *parsed;
    Config config;
    try {
        read_value(j, "base_url", config.base_url);
        read_value(j, "inventory_base_url", config.inventory_base_url);
        read_value(j, "device_type", config.device_type);
        read_value(j, "config_dir", config.config_dir);
        read_value(j, "cache_dir", config.cache_dir);
        read_value(j, "max_cache_bytes", config.max_cache_bytes);
        read_value(j, "registration_poll_interval", config.registration_poll_interval);
        read_value(j, "heartbeat_interval", config.heartbeat_interval);
        read_value(j, "heartbeat_timeout_seconds", config.heartbeat_timeout_seconds);
        read_value(j, "timeout_seconds", config.timeout_seconds);
        read_value(j, "download_timeout_seconds", config.download_timeout_seconds);
        read_value(j, "max_download_attempts", config.max_download_attempts);
        read_value(j, "download_backoff_ms", config.download_backoff_ms);
        read_value(j, "max_concurrent_downloads", config.max_concurrent_downloads);
        read_value(j, "default_image_duration", config.default_image_duration);
        read_value(j, "verify_ssl", config.verify_ssl);
        read_value(j, "log_level", config.log_level);
        read_value(j, "log_file", config.log_file);
    } catch (const nlohmann::json::exception& e) {
        return Result<Config>::error(ErrorCode::ParseError, std::string("Configuration field has wrong type: ") + e.what());
    }

    return Result<Config>::ok(std::move(config));
}

Result<Config> load_config(const std::filesystem::path& path) {
    auto content = files::read_file(path);
    if (!content) {
        return Result<Config>::error(ErrorCode::FileNotFound, "Cannot read " + path.string());
    }
    return parse_config(*content);
}

EnvironmentLookup process_environment() {
    return [](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (value == nullptr || *value == '\0') {
            return std::nullopt;
        }
        return std::string(value);
    };
}

void apply_environment(Config& config, const EnvironmentLookup& lookup) {
    if (auto value = lookup("BASE_URL")) {
        config.base_url = *value;
    }
    if (auto value = lookup("BASE_URL_INVENTORY")) {
        config.inventory_base_url = *value;
    }
    if (auto value = lookup("DEVICE_TYPE")) {
        try {
            size_t consumed = 0;
            int device_type = std::stoi(*value, &consumed);
            if (consumed == value->size()) {
                config.device_type = device_type;
            } else {
                BOOST_LOG_TRIVIAL(warning) << "Ignoring DEVICE_TYPE=" << *value << ": not an integer";
            }
        } catch (const std::exception&) {
            BOOST_LOG_TRIVIAL(warning) << "Ignoring DEVICE_TYPE=" << *value << ": not an integer";
        }
    }
    if (auto value = lookup("REGISTRATION_POLL_INTERVAL")) {
        if (auto seconds = parse_seconds("REGISTRATION_POLL_INTERVAL", *value)) {
            config.registration_poll_interval = *seconds;
        }
    }
    if (auto value = lookup("HEARTBEAT_INTERVAL")) {
        if (auto seconds = parse_seconds("HEARTBEAT_INTERVAL", *value)) {
            config.heartbeat_interval = *seconds;
        }
    }
    if (auto value = lookup("LOG_LEVEL")) {
        config.log_level = *value;
    }
    if (auto value = lookup("KIOSKAGENT_CACHE_DIR")) {
        config.cache_dir = *value;
    }
    if (auto value = lookup("KIOSKAGENT_CONFIG_DIR")) {
        config.config_dir = *value;
    }
}

Result<void> validate(const Config& config) {
    if (config.base_url.empty()) {
        return Result<void>::error(ErrorCode::MissingParameter, "base_url is required");
    }
    if (!http::split_url(config.base_url)) {
        return Result<void>::error(ErrorCode::InvalidParameter, "base_url must be an http(s) URL");
    }
    if (config.inventory_base_url.empty()) {
        return Result<void>::error(ErrorCode::MissingParameter, "inventory_base_url is required");
    }
    if (config.registration_poll_interval <= 0 || config.heartbeat_interval <= 0) {
        return Result<void>::error(ErrorCode::InvalidParameter, "Poll intervals must be positive");
    }
    if (config.timeout_seconds <= 0 || config.heartbeat_timeout_seconds <= 0 ||
        config.download_timeout_seconds <= 0) {
        return Result<void>::error(ErrorCode::InvalidParameter, "Timeouts must be positive");
    }
    if (config.max_download_attempts < 1 || config.max_concurrent_downloads < 1) {
        return Result<void>::error(ErrorCode::InvalidParameter,
                                   "Download attempts and workers must be at least 1");
    }
    if (config.max_download_attempts > MAX_DOWNLOAD_ATTEMPTS) {
        return Result<void>::error(ErrorCode::InvalidParameter, "max_download_attempts must not exceed " +
                                                                    std::to_string(MAX_DOWNLOAD_ATTEMPTS));
    }
    if (config.download_backoff_ms < 0) {
        return Result<void>::error(ErrorCode::InvalidParameter, "download_backoff_ms must not be negative");
    }
    if (config.max_cache_bytes == 0) {
        return Result<void>::error(ErrorCode::InvalidParameter, "max_cache_bytes must be positive");
    }
    if (config.cache_dir.empty() || config.config_dir.empty()) {
        return Result<void>::error(ErrorCode::MissingParameter, "cache_dir and config_dir are required");
    }
    return Result<void>::ok();
}

}  // namespace config
}  // namespace kioskagent
