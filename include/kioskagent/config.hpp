#pragma once

/**
 * @file config.hpp
 * @brief Loading and validation of the agent configuration
 *
 * The base configuration is a JSON file with snake_case keys matching the
 * Config fields. Environment variables overlay it at startup.
 */

#include "kioskagent.hpp"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace kioskagent {
namespace config {

/// Parse a JSON configuration document; missing keys keep their defaults, unknown keys are ignored
[[nodiscard]] Result<Config> parse_config(const std::string& text);

/// Read and parse a configuration file
[[nodiscard]] Result<Config> load_config(const std::filesystem::path& path);

/// Environment lookup; returns nullopt for unset variables
using EnvironmentLookup = std::function<std::optional<std::string>(const std::string& name)>;

/// Lookup backed by std::getenv
[[nodiscard]] EnvironmentLookup process_environment();

/**
 * @brief Overlay environment variables onto a configuration
 *
 * Recognised: BASE_URL, BASE_URL_INVENTORY, DEVICE_TYPE,
 * REGISTRATION_POLL_INTERVAL, HEARTBEAT_INTERVAL, LOG_LEVEL,
 * KIOSKAGENT_CACHE_DIR, KIOSKAGENT_CONFIG_DIR. Unparseable numbers are
 * logged and ignored.
 */
void apply_environment(Config& config, const EnvironmentLookup& lookup = process_environment());

/// Reject configurations the agent cannot run with
[[nodiscard]] Result<void> validate(const Config& config);

}  // namespace config
}  // namespace kioskagent
