#pragma once

/**
 * @file logging.hpp
 * @brief Boost.Log setup for the kiosk agent
 *
 * Components log through BOOST_LOG_TRIVIAL; init() installs the sinks and
 * the severity filter once at startup.
 */

#include <boost/log/trivial.hpp>

#include <string>

namespace kioskagent {
namespace logging {

/// Map a level name (trace, debug, info, warning, error, fatal; any case) to a severity; unknown names give info
[[nodiscard]] boost::log::trivial::severity_level parse_level(const std::string& level);

/**
 * @brief Install console and optional rotating file sinks
 *
 * @param level Minimum severity name
 * @param log_file File name pattern; empty disables the file sink
 */
void init(const std::string& level, const std::string& log_file = "");

/// Change the severity filter without touching the sinks
void set_level(const std::string& level);

}  // namespace logging
}  // namespace kioskagent
