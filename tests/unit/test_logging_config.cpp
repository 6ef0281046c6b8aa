// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "logging_init.h"

#include <filesystem>
#include <fstream>
#include <sstream>

#include <catch2/catch_test_macros.hpp>

using namespace bricklayers::logging;
namespace fs = std::filesystem;

TEST_CASE("parse_level: config file spellings", "[logging][config]") {
    REQUIRE(parse_level("trace") == spdlog::level::trace);
    REQUIRE(parse_level("debug") == spdlog::level::debug);
    REQUIRE(parse_level("info") == spdlog::level::info);
    REQUIRE(parse_level("warn") == spdlog::level::warn);
    REQUIRE(parse_level("warning") == spdlog::level::warn);
    REQUIRE(parse_level("error") == spdlog::level::err);
    REQUIRE(parse_level("critical") == spdlog::level::critical);
    REQUIRE(parse_level("off") == spdlog::level::off);

    SECTION("anything else gives the fallback") {
        REQUIRE(parse_level("", spdlog::level::debug) == spdlog::level::debug);
        REQUIRE(parse_level("err") == spdlog::level::warn);
        REQUIRE(parse_level("INFO", spdlog::level::trace) == spdlog::level::trace);
    }
}

TEST_CASE("verbosity_to_level and resolve_log_level", "[logging][config]") {
    REQUIRE(verbosity_to_level(-1) == spdlog::level::warn);
    REQUIRE(verbosity_to_level(0) == spdlog::level::warn);
    REQUIRE(verbosity_to_level(1) == spdlog::level::info);
    REQUIRE(verbosity_to_level(2) == spdlog::level::debug);
    REQUIRE(verbosity_to_level(7) == spdlog::level::trace);

    // -v on the command line beats the file; the file beats the default
    REQUIRE(resolve_log_level(1, "trace") == spdlog::level::info);
    REQUIRE(resolve_log_level(0, "error") == spdlog::level::err);
    REQUIRE(resolve_log_level(0, "") == spdlog::level::warn);
    REQUIRE(resolve_log_level(0, "chatty") == spdlog::level::warn);
}

TEST_CASE("parse_log_target and log_target_name", "[logging][config]") {
    for (LogTarget target : {LogTarget::Console, LogTarget::File, LogTarget::Syslog}) {
        INFO(log_target_name(target));
        REQUIRE(parse_log_target(log_target_name(target)) == target);
    }
    REQUIRE(std::string(log_target_name(LogTarget::File)) == "file");
    REQUIRE_FALSE(parse_log_target("journal").has_value());
    REQUIRE_FALSE(parse_log_target("Console").has_value());
    REQUIRE_FALSE(parse_log_target("").has_value());
}

TEST_CASE("init: sinks", "[logging][init]") {
    SECTION("file target writes to the given path") {
        fs::path path = fs::temp_directory_path() / "bricklayers_logging_test.log";
        fs::remove(path);

        LogConfig config;
        config.level = spdlog::level::info;
        config.target = LogTarget::File;
        config.file_path = path.string();
        REQUIRE(init(config));

        spdlog::info("[Test] layer 3 raised");
        spdlog::default_logger()->flush();

        std::ifstream in(path);
        std::stringstream content;
        content << in.rdbuf();
        REQUIRE(content.str().find("layer 3 raised") != std::string::npos);
        REQUIRE(spdlog::default_logger()->level() == spdlog::level::info);
        fs::remove(path);
    }

    SECTION("file target without a path falls back to stderr") {
        LogConfig config;
        config.target = LogTarget::File;
        REQUIRE_FALSE(init(config));
        REQUIRE(spdlog::default_logger()->sinks().size() == 1);
    }

    // Back to stderr-only for the rest of the run
    REQUIRE(init(LogConfig{}));
    REQUIRE(spdlog::default_logger()->level() == spdlog::level::warn);
}
