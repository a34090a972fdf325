#pragma once

#include <spdlog/fmt/ostr.h>  // Enables fallback to ostream <<
#include <spdlog/spdlog.h>

#include <string>

// The main logging macros are LOG_INFO(), LOG_DEBUG(), LOG_WARN(), and LOG_ERROR().
//
// These use fmt::format() to format the message. For example:
//
// LOG_INFO("Hello {}!", "world");
// LOG_DEBUG("x={} pi={}", 3, 3.14159);
//
// LOG_TRACE() and LOG_DEBUG() statements are compiled out unless SPDLOG_ACTIVE_LEVEL is lowered,
// which the Debug build type does in CMakeLists.txt. Of the statements compiled in, --log-level
// picks which are printed.

#define LOG_TRACE(...) SPDLOG_TRACE(__VA_ARGS__)
#define LOG_DEBUG(...) SPDLOG_DEBUG(__VA_ARGS__)
#define LOG_INFO(...) SPDLOG_INFO(__VA_ARGS__)
#define LOG_WARN(...) SPDLOG_WARN(__VA_ARGS__)
#define LOG_ERROR(...) SPDLOG_ERROR(__VA_ARGS__)

namespace util {

struct Logging {
  struct Params {
    std::string log_filename;
    std::string log_level = "info";
    bool append_mode = false;
    bool omit_timestamps = false;

    auto make_options_description();
  };

  static constexpr const char* kLoggerName = "ggpcore";

  // Throws util::CleanException for an unknown level name.
  static void init(const Params&);
};  // Logging

}  // namespace util

#include "inline/util/LoggingUtil.inl"
