// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "cli_args.h"

#include "logging_init.h"

#include <cstdio>
#include <cstring>

namespace bricklayers {

namespace {

/// Value of "--opt value" or "--opt=value"; advances @p i in the first form
const char* option_value(int argc, char** argv, int& i, const char* long_name) {
    size_t len = strlen(long_name);
    if (strncmp(argv[i], long_name, len) == 0 && argv[i][len] == '=') {
        return argv[i] + len + 1;
    }
    if (i + 1 < argc) {
        return argv[++i];
    }
    fprintf(stderr, "Error: %s requires an argument\n", long_name);
    return nullptr;
}

bool matches(const char* arg, const char* short_name, const char* long_name) {
    if (short_name && strcmp(arg, short_name) == 0) {
        return true;
    }
    size_t len = strlen(long_name);
    return strncmp(arg, long_name, len) == 0 && (arg[len] == '\0' || arg[len] == '=');
}

} // namespace

bool split_assignment(const std::string& text, std::string& name, std::string& value) {
    size_t eq = text.find('=');
    if (eq == std::string::npos || eq == 0) {
        return false;
    }
    name = text.substr(0, eq);
    value = text.substr(eq + 1);
    return true;
}

void print_help(const char* program_name) {
    printf("Usage: %s [options] -i <input.gcode>\n", program_name);
    printf("Streams a G-code file through the brick layers transform.\n");
    printf("Options:\n");
    printf("  -c, --config <path>    JSON configuration file (default: bricklayers.json)\n");
    printf("  -i, --input <path>     G-code file to process\n");
    printf("  -o, --output <path>    Output file (default: stdout)\n");
    printf("  -e, --enable           Enable the transform regardless of config\n");
    printf("  --no-prescan           Classify live instead of pre-scanning the file\n");
    printf("  --set <name=value>     Override a parameter (repeatable)\n");
    printf("  --status-json          Print final status as JSON instead of text\n");
    printf("  -v, --verbose          Increase verbosity (-v=info, -vv=debug, -vvv=trace)\n");
    printf("  --log-dest <dest>      Log destination: console, file, syslog\n");
    printf("  --log-file <path>      Log file path (when --log-dest=file)\n");
    printf("  -h, --help             Show this help message\n");
    printf("  -V, --version          Show version information\n");
    printf("\nParameters: enabled, z_offset_magnitude, extrusion_multiplier, start_layer,\n");
    printf("            require_feature_markers, eligible_feature_tags, verbose, prescan\n");
}

bool parse_cli_args(int argc, char** argv, CliArgs& args) {
    for (int i = 1; i < argc; i++) {
        const char* arg = argv[i];

        if (matches(arg, "-c", "--config")) {
            const char* value = option_value(argc, argv, i, "--config");
            if (!value)
                return false;
            args.config_path = value;
        } else if (matches(arg, "-i", "--input")) {
            const char* value = option_value(argc, argv, i, "--input");
            if (!value)
                return false;
            args.input_path = value;
        } else if (matches(arg, "-o", "--output")) {
            const char* value = option_value(argc, argv, i, "--output");
            if (!value)
                return false;
            args.output_path = value;
        } else if (matches(arg, "-e", "--enable")) {
            args.force_enable = true;
        } else if (strcmp(arg, "--no-prescan") == 0) {
            args.no_prescan = true;
        } else if (matches(arg, nullptr, "--set")) {
            const char* value = option_value(argc, argv, i, "--set");
            if (!value)
                return false;
            std::string name, text;
            if (!split_assignment(value, name, text)) {
                fprintf(stderr, "Error: --set expects name=value, got '%s'\n", value);
                return false;
            }
            args.overrides.emplace_back(name, text);
        } else if (strcmp(arg, "--status-json") == 0) {
            args.status_json = true;
        }
        // Verbosity
        else if (strcmp(arg, "-v") == 0 || strcmp(arg, "-vv") == 0 || strcmp(arg, "-vvv") == 0) {
            const char* p = arg;
            while (*p == '-')
                p++;
            while (*p == 'v') {
                args.verbosity++;
                p++;
            }
        } else if (strcmp(arg, "--verbose") == 0) {
            args.verbosity++;
        }
        // Logging
        else if (matches(arg, nullptr, "--log-dest")) {
            const char* value = option_value(argc, argv, i, "--log-dest");
            if (!value)
                return false;
            args.log_dest = value;
            if (!logging::parse_log_target(args.log_dest)) {
                fprintf(stderr, "Error: invalid --log-dest value: %s\n", value);
                fprintf(stderr, "Valid values: console, file, syslog\n");
                return false;
            }
        } else if (matches(arg, nullptr, "--log-file")) {
            const char* value = option_value(argc, argv, i, "--log-file");
            if (!value)
                return false;
            args.log_file = value;
        }
        // Help / version
        else if (strcmp(arg, "-h") == 0 || strcmp(arg, "--help") == 0) {
            args.show_help = true;
            return true;
        } else if (strcmp(arg, "-V") == 0 || strcmp(arg, "--version") == 0) {
            args.show_version = true;
            return true;
        }
        // Unknown argument
        else {
            fprintf(stderr, "Unknown argument: %s\n", arg);
            fprintf(stderr, "Use --help for usage information\n");
            return false;
        }
    }

    if (args.input_path.empty()) {
        fprintf(stderr, "Error: no input file (use -i <path>)\n");
        return false;
    }
    return true;
}

} // namespace bricklayers
