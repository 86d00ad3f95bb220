#include <gtest/gtest.h>
#include <kioskagent/config.hpp>
#include <kioskagent/logging.hpp>
#include <kioskagent/storage.hpp>

#include "mock_http.hpp"

#include <map>

namespace kioskagent {
namespace {

using testutil::TempDirectory;

config::EnvironmentLookup fake_environment(std::map<std::string, std::string> values) {
    return [values = std::move(values)](const std::string& name) -> std::optional<std::string> {
        auto it = values.find(name);
        if (it == values.end()) {
            return std::nullopt;
        }
        return it->second;
    };
}

// ==================== Parsing ====================

TEST(ConfigParseTest, MissingKeysKeepDefaults) {
    auto result = config::parse_config(R"({"base_url": "https://devices.example.com", "unknown": 1})");
    ASSERT_TRUE(result.is_ok()) << result.error_message();

    const auto& cfg = result.value();
    EXPECT_EQ(cfg.base_url, "https://devices.example.com");
    EXPECT_EQ(cfg.inventory_base_url, "http://localhost:5001");
    EXPECT_EQ(cfg.device_type, 11);
    EXPECT_DOUBLE_EQ(cfg.heartbeat_interval, 60.0);
}

TEST(ConfigParseTest, AllTunables) {
    auto result = config::parse_config(R"({
        "device_type": 12,
        "cache_dir": "/var/cache/kiosk",
        "max_cache_bytes": 1048576,
        "registration_poll_interval": 2.5,
        "heartbeat_interval": 30,
        "max_download_attempts": 5,
        "download_backoff_ms": 250,
        "max_concurrent_downloads": 2,
        "default_image_duration": 8,
        "verify_ssl": false,
        "log_level": "debug",
        "log_file": "/var/log/kiosk.log"
    })");
    ASSERT_TRUE(result.is_ok()) << result.error_message();

    const auto& cfg = result.value();
    EXPECT_EQ(cfg.device_type, 12);
    EXPECT_EQ(cfg.cache_dir, "/var/cache/kiosk");
    EXPECT_EQ(cfg.max_cache_bytes, 1048576u);
    EXPECT_DOUBLE_EQ(cfg.registration_poll_interval, 2.5);
    EXPECT_DOUBLE_EQ(cfg.heartbeat_interval, 30.0);
    EXPECT_EQ(cfg.max_download_attempts, 5);
    EXPECT_EQ(cfg.download_backoff_ms, 250);
    EXPECT_EQ(cfg.max_concurrent_downloads, 2);
    EXPECT_EQ(cfg.default_image_duration, 8);
    EXPECT_FALSE(cfg.verify_ssl);
    EXPECT_EQ(cfg.log_level, "debug");
    EXPECT_EQ(cfg.log_file, "/var/log/kiosk.log");
}

TEST(ConfigParseTest, WrongTypeIsParseError) {
    auto result = config::parse_config(R"({"device_type": "eleven"})");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error_code(), ErrorCode::ParseError);
}

TEST(ConfigParseTest, NotJson) {
    EXPECT_EQ(config::parse_config("base_url=x").error_code(), ErrorCode::ParseError);
    EXPECT_EQ(config::parse_config("[]").error_code(), ErrorCode::ParseError);
}

TEST(ConfigLoadTest, MissingFile) {
    TempDirectory temp_dir;
    auto result = config::load_config(temp_dir.path() / "config.json");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error_code(), ErrorCode::FileNotFound);
}

TEST(ConfigLoadTest, ReadsFile) {
    TempDirectory temp_dir;
    auto path = temp_dir.path() / "config.json";
    ASSERT_TRUE(files::write_file_atomic(path, R"({"config_dir": "/etc/kiosk"})"));

    auto result = config::load_config(path);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().config_dir, "/etc/kiosk");
}

// ==================== Environment ====================

TEST(ConfigEnvironmentTest, OverridesFileValues) {
    Config cfg;
    config::apply_environment(cfg, fake_environment({{"BASE_URL", "https://api.example.com"},
                                                     {"BASE_URL_INVENTORY", "https://inventory.example.com"},
                                                     {"DEVICE_TYPE", "14"},
                                                     {"REGISTRATION_POLL_INTERVAL", "0.5"},
                                                     {"HEARTBEAT_INTERVAL", "15"},
                                                     {"LOG_LEVEL", "trace"},
                                                     {"KIOSKAGENT_CACHE_DIR", "/data/media"},
                                                     {"KIOSKAGENT_CONFIG_DIR", "/data/config"}}));

    EXPECT_EQ(cfg.base_url, "https://api.example.com");
    EXPECT_EQ(cfg.inventory_base_url, "https://inventory.example.com");
    EXPECT_EQ(cfg.device_type, 14);
    EXPECT_DOUBLE_EQ(cfg.registration_poll_interval, 0.5);
    EXPECT_DOUBLE_EQ(cfg.heartbeat_interval, 15.0);
    EXPECT_EQ(cfg.log_level, "trace");
    EXPECT_EQ(cfg.cache_dir, "/data/media");
    EXPECT_EQ(cfg.config_dir, "/data/config");
}

TEST(ConfigEnvironmentTest, InvalidNumbersIgnored) {
    Config cfg;
    config::apply_environment(cfg, fake_environment({{"DEVICE_TYPE", "11a"}, {"HEARTBEAT_INTERVAL", "soon"}}));
    EXPECT_EQ(cfg.device_type, 11);
    EXPECT_DOUBLE_EQ(cfg.heartbeat_interval, 60.0);
}

TEST(ConfigEnvironmentTest, UnsetVariablesChangeNothing) {
    Config cfg;
    cfg.base_url = "https://from-file.example.com";
    config::apply_environment(cfg, fake_environment({}));
    EXPECT_EQ(cfg.base_url, "https://from-file.example.com");
}

// ==================== Validation ====================

TEST(ConfigValidateTest, DefaultsAreValid) {
    EXPECT_TRUE(config::validate(Config{}).is_ok());
}

TEST(ConfigValidateTest, RejectsUnusableValues) {
    Config no_url;
    no_url.base_url = "";
    EXPECT_EQ(config::validate(no_url).error_code(), ErrorCode::MissingParameter);

    Config bad_url;
    bad_url.base_url = "devices.example.com";
    EXPECT_EQ(config::validate(bad_url).error_code(), ErrorCode::InvalidParameter);

    Config zero_interval;
    zero_interval.heartbeat_interval = 0;
    EXPECT_EQ(config::validate(zero_interval).error_code(), ErrorCode::InvalidParameter);

    Config no_workers;
    no_workers.max_concurrent_downloads = 0;
    EXPECT_EQ(config::validate(no_workers).error_code(), ErrorCode::InvalidParameter);

    Config no_cache;
    no_cache.max_cache_bytes = 0;
    EXPECT_EQ(config::validate(no_cache).error_code(), ErrorCode::InvalidParameter);

    Config negative_backoff;
    negative_backoff.download_backoff_ms = -1;
    EXPECT_EQ(config::validate(negative_backoff).error_code(), ErrorCode::InvalidParameter);

    Config endless_retries;
    endless_retries.max_download_attempts = 64;
    EXPECT_EQ(config::validate(endless_retries).error_code(), ErrorCode::InvalidParameter);

    Config no_dir;
    no_dir.cache_dir = "";
    EXPECT_EQ(config::validate(no_dir).error_code(), ErrorCode::MissingParameter);
}

// ==================== Logging ====================

TEST(LoggingTest, ParseLevel) {
    using boost::log::trivial::severity_level;
    EXPECT_EQ(logging::parse_level("trace"), severity_level::trace);
    EXPECT_EQ(logging::parse_level("debug"), severity_level::debug);
    EXPECT_EQ(logging::parse_level("warn"), severity_level::warning);
    EXPECT_EQ(logging::parse_level("warning"), severity_level::warning);
    EXPECT_EQ(logging::parse_level("fatal"), severity_level::fatal);
    EXPECT_EQ(logging::parse_level("chatty"), severity_level::info);
}

TEST(LoggingTest, ParseLevelIgnoresCase) {
    using boost::log::trivial::severity_level;
    EXPECT_EQ(logging::parse_level("DEBUG"), severity_level::debug);
    EXPECT_EQ(logging::parse_level("WARNING"), severity_level::warning);
    EXPECT_EQ(logging::parse_level("Error"), severity_level::error);
    EXPECT_EQ(logging::parse_level("INFO"), severity_level::info);
}

TEST(LoggingTest, InitWithFileSink) {
    TempDirectory temp_dir;
    auto log_path = temp_dir.path() / "agent.log";
    EXPECT_NO_THROW(logging::init("debug", log_path.string()));
    BOOST_LOG_TRIVIAL(info) << "file sink check";
    EXPECT_NO_THROW(logging::set_level("error"));
}

}  // namespace
}  // namespace kioskagent
