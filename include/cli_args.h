// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
#pragma once

/**
 * @file cli_args.h
 * @brief Command-line argument parsing for bricklayers-process
 */

#include <string>
#include <utility>
#include <vector>

namespace bricklayers {

constexpr const char* BRICKLAYERS_VERSION_STRING = "1.2.0";

/**
 * @brief Parsed command-line arguments
 */
struct CliArgs {
    // Files
    std::string config_path = "bricklayers.json";
    std::string input_path;  ///< Required unless help/version
    std::string output_path; ///< Empty = stdout

    // Engine overrides
    bool force_enable = false;
    bool no_prescan = false;
    std::vector<std::pair<std::string, std::string>> overrides; ///< --set name=value, in order

    // Reporting
    bool status_json = false;

    // Logging
    int verbosity = 0;
    std::string log_dest; ///< Empty = from config file
    std::string log_file;

    // Early exits
    bool show_help = false;
    bool show_version = false;

    /** @brief True if the program should exit right after parsing */
    bool exit_early() const {
        return show_help || show_version;
    }
};

/**
 * @brief Parse command-line arguments
 *
 * Errors are printed to stderr.
 *
 * @param argc Argument count
 * @param argv Argument values
 * @param args Output: parsed arguments
 * @return false on a usage error
 */
bool parse_cli_args(int argc, char** argv, CliArgs& args);

/**
 * @brief Split "name=value"
 *
 * @return false if there is no '=' or the name is empty
 */
bool split_assignment(const std::string& text, std::string& name, std::string& value);

void print_help(const char* program_name);

} // namespace bricklayers
