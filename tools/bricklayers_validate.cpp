// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file bricklayers_validate.cpp
 * @brief Check whether a G-code file carries the markers brick layering needs
 *
 * Usage: bricklayers-validate [-c config.json] <file.gcode>
 * Exit status 0 = compatible, 1 = not compatible or unreadable, 2 = usage.
 */

#include "config.h"
#include "gcode_compat_validator.h"
#include "gcode_stream_source.h"
#include "logging_init.h"

#include <spdlog/spdlog.h>

#include <cstdio>
#include <cstring>
#include <filesystem>
#include <string>

using namespace bricklayers;

int main(int argc, char** argv) {
    std::string config_path;
    std::string gcode_path;
    int verbosity = 0;

    for (int i = 1; i < argc; i++) {
        if ((strcmp(argv[i], "-c") == 0 || strcmp(argv[i], "--config") == 0) && i + 1 < argc) {
            config_path = argv[++i];
        } else if (strcmp(argv[i], "-v") == 0) {
            verbosity++;
        } else if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            printf("Usage: %s [-c config.json] [-v] <file.gcode>\n", argv[0]);
            return 0;
        } else if (argv[i][0] != '-' && gcode_path.empty()) {
            gcode_path = argv[i];
        } else {
            fprintf(stderr, "Unknown argument: %s\n", argv[i]);
            return 2;
        }
    }

    if (gcode_path.empty()) {
        fprintf(stderr, "Usage: %s [-c config.json] [-v] <file.gcode>\n", argv[0]);
        return 2;
    }

    logging::LogConfig log_config;
    log_config.level = logging::verbosity_to_level(verbosity);
    if (!logging::init(log_config)) {
        fprintf(stderr, "Logging setup failed\n");
    }

    MarkerSyntax syntax;
    if (!config_path.empty()) {
        Config config;
        config.init(config_path);
        syntax = config.markers();
    }

    if (!std::filesystem::exists(gcode_path)) {
        printf("File not found: %s\n", gcode_path.c_str());
        return 1;
    }

    gcode::FileStreamSource source(gcode_path);
    auto report = gcode::analyze_compatibility(source, syntax);
    printf("%s", report.format().c_str());

    return report.compatible() ? 0 : 1;
}
