// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "logging_init.h"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <utility>
#include <vector>

#ifdef __linux__
#include <spdlog/sinks/syslog_sink.h>
#endif

namespace bricklayers {
namespace logging {

namespace {

constexpr size_t kBacktraceMessages = 32;
constexpr size_t kMaxFileSize = 5 * 1024 * 1024;
constexpr size_t kMaxFiles = 3;

const std::pair<const char*, spdlog::level::level_enum> kLevelNames[] = {
    {"trace", spdlog::level::trace},
    {"debug", spdlog::level::debug},
    {"info", spdlog::level::info},
    {"warn", spdlog::level::warn},
    {"warning", spdlog::level::warn},
    {"error", spdlog::level::err},
    {"critical", spdlog::level::critical},
    {"off", spdlog::level::off},
};

const std::pair<const char*, LogTarget> kTargetNames[] = {
    {"console", LogTarget::Console},
    {"file", LogTarget::File},
    {"syslog", LogTarget::Syslog},
};

/// Sink for @p config.target; nullptr for Console. Throws spdlog_ex on failure.
spdlog::sink_ptr make_target_sink(const LogConfig& config) {
    switch (config.target) {
    case LogTarget::Console:
        return nullptr;
    case LogTarget::File:
        if (config.file_path.empty()) {
            throw spdlog::spdlog_ex("file target needs a log file path");
        }
        return std::make_shared<spdlog::sinks::rotating_file_sink_mt>(config.file_path,
                                                                      kMaxFileSize, kMaxFiles);
    case LogTarget::Syslog:
#ifdef __linux__
        return std::make_shared<spdlog::sinks::syslog_sink_mt>("bricklayers", LOG_PID, LOG_USER,
                                                               false);
#else
        return nullptr;
#endif
    }
    return nullptr;
}

} // namespace

bool init(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks{std::make_shared<spdlog::sinks::stderr_color_sink_mt>()};

    std::string sink_error;
    try {
        if (auto extra = make_target_sink(config)) {
            sinks.push_back(std::move(extra));
        }
    } catch (const spdlog::spdlog_ex& e) {
        sink_error = e.what();
    }

    auto logger = std::make_shared<spdlog::logger>("bricklayers", sinks.begin(), sinks.end());
    logger->set_level(config.level);
    spdlog::set_default_logger(logger);
    spdlog::enable_backtrace(kBacktraceMessages);

    if (!sink_error.empty()) {
        spdlog::warn("[Logging] Cannot log to {}: {}; using stderr only",
                     log_target_name(config.target), sink_error);
        return false;
    }
    spdlog::debug("[Logging] Initialized: target={}, level={}", log_target_name(config.target),
                  spdlog::level::to_string_view(config.level));
    return true;
}

spdlog::level::level_enum parse_level(const std::string& str,
                                      spdlog::level::level_enum fallback) {
    for (const auto& [name, level] : kLevelNames) {
        if (str == name) {
            return level;
        }
    }
    return fallback;
}

spdlog::level::level_enum verbosity_to_level(int verbosity) {
    if (verbosity >= 3) {
        return spdlog::level::trace;
    }
    if (verbosity == 2) {
        return spdlog::level::debug;
    }
    return verbosity == 1 ? spdlog::level::info : spdlog::level::warn;
}

spdlog::level::level_enum resolve_log_level(int verbosity, const std::string& config_level) {
    return verbosity > 0 ? verbosity_to_level(verbosity)
                         : parse_level(config_level, spdlog::level::warn);
}

std::optional<LogTarget> parse_log_target(const std::string& str) {
    for (const auto& [name, target] : kTargetNames) {
        if (str == name) {
            return target;
        }
    }
    return std::nullopt;
}

const char* log_target_name(LogTarget target) {
    for (const auto& [name, value] : kTargetNames) {
        if (value == target) {
            return name;
        }
    }
    return "unknown";
}

} // namespace logging
} // namespace bricklayers
