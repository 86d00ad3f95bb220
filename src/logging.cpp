#include "kioskagent/logging.hpp"

#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>

namespace kioskagent {
namespace logging {

namespace blog = boost::log;
namespace trivial = boost::log::trivial;

namespace {

constexpr const char* LOG_FORMAT = "[%TimeStamp%] [%Severity%]: %Message%";
constexpr unsigned long ROTATION_SIZE = 10 * 1024 * 1024;

}  // namespace

trivial::severity_level parse_level(const std::string& name) {
    std::string level = name;
    std::transform(level.begin(), level.end(), level.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (level == "trace") {
        return trivial::trace;
    } else if (level == "debug") {
        return trivial::debug;
    } else if (level == "info") {
        return trivial::info;
    } else if (level == "warning" || level == "warn") {
        return trivial::warning;
    } else if (level == "error") {
        return trivial::error;
    } else if (level == "fatal") {
        return trivial::fatal;
    }
    return trivial::info;
}

void set_level(const std::string& level) {
    blog::core::get()->set_filter(trivial::severity >= parse_level(level));
}

void init(const std::string& level, const std::string& log_file) {
    blog::add_common_attributes();

    blog::add_console_log(std::clog, blog::keywords::format = LOG_FORMAT,
                          blog::keywords::auto_flush = true);

    if (!log_file.empty()) {
        std::filesystem::path path(log_file);
        std::filesystem::path dir = path.has_parent_path() ? path.parent_path() : std::filesystem::path(".");
        std::string pattern = (dir / (path.stem().string() + "_%N" + path.extension().string())).string();

        auto sink = blog::add_file_log(blog::keywords::file_name = pattern,
                                       blog::keywords::rotation_size = ROTATION_SIZE,
                                       blog::keywords::format = LOG_FORMAT,
                                       blog::keywords::auto_flush = true,
                                       blog::keywords::open_mode = std::ios_base::app);
        // Keep at most ten rotated files next to the active one
        sink->locked_backend()->set_file_collector(blog::sinks::file::make_collector(
            blog::keywords::target = dir.string(),
            blog::keywords::max_size = ROTATION_SIZE * 10,
            blog::keywords::max_files = 10));
        sink->locked_backend()->scan_for_files();
    }

    set_level(level);
}

}  // namespace logging
}  // namespace kioskagent
