// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <spdlog/spdlog.h>

#include <optional>
#include <string>

namespace bricklayers {
namespace logging {

/// Second sink next to stderr
enum class LogTarget {
    Console, ///< stderr only
    File,    ///< plus a rotating file, 5 MB x 3
    Syslog,  ///< plus syslog(3) (Linux only; console elsewhere)
};

struct LogConfig {
    spdlog::level::level_enum level = spdlog::level::warn;
    LogTarget target = LogTarget::Console;
    std::string file_path; ///< Required for LogTarget::File
};

/**
 * @brief Install the default spdlog logger
 *
 * The console sink writes to stderr so processed G-code on stdout stays clean.
 * A 32-message backtrace is kept for dumping when a job faults.
 *
 * @return false if the extra sink could not be created; logging then goes to
 *         stderr only and the reason has been logged
 */
bool init(const LogConfig& config);

/// "trace" ... "off" (plus "warning"); case sensitive, @p fallback otherwise
spdlog::level::level_enum parse_level(const std::string& str,
                                      spdlog::level::level_enum fallback = spdlog::level::warn);

/// CLI -v count to level: 0 warn, 1 info, 2 debug, 3+ trace
spdlog::level::level_enum verbosity_to_level(int verbosity);

/// CLI verbosity wins over the config file's level; warn if neither is set
spdlog::level::level_enum resolve_log_level(int verbosity, const std::string& config_level);

/// "console", "file", "syslog"; nullopt otherwise
std::optional<LogTarget> parse_log_target(const std::string& str);

const char* log_target_name(LogTarget target);

} // namespace logging
} // namespace bricklayers
