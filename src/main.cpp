// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "brick_layers_engine.h"
#include "cli_args.h"
#include "config.h"
#include "gcode_stream_source.h"
#include "logging_init.h"
#include "transform_stage.h"

#include <spdlog/spdlog.h>

#include <cstdio>
#include <fstream>
#include <iostream>
#include <memory>
#include <vector>

using namespace bricklayers;

namespace {

void init_logging(const CliArgs& args, const Config& config) {
    logging::LogConfig log_config;
    log_config.level =
        logging::resolve_log_level(args.verbosity, config.get<std::string>("/logging/level", ""));

    std::string dest = args.log_dest;
    if (dest.empty()) {
        dest = config.get<std::string>("/logging/target", "console");
    }
    auto target = logging::parse_log_target(dest);
    log_config.target = target.value_or(logging::LogTarget::Console);

    log_config.file_path = args.log_file;
    if (log_config.file_path.empty()) {
        log_config.file_path = config.get<std::string>("/logging/file", "");
    }

    if (!logging::init(log_config)) {
        spdlog::warn("[Main] Log target '{}' unavailable", dest);
    }
    if (!target) {
        spdlog::warn("[Main] Unknown log target '{}', logging to stderr", dest);
    }
}

/// Apply --enable / --no-prescan / --set; false on the first rejected value
bool apply_overrides(const CliArgs& args, BrickLayersEngine& engine) {
    if (args.no_prescan) {
        BrickError err = engine.set_parameter("prescan", false);
        if (err.has_error()) {
            fprintf(stderr, "Error: %s\n", err.message.c_str());
            return false;
        }
    }
    for (const auto& [name, value] : args.overrides) {
        BrickError err = engine.set_parameter_string(name, value);
        if (err.has_error()) {
            fprintf(stderr, "Error: %s\n", err.message.c_str());
            return false;
        }
    }
    if (args.force_enable) {
        engine.enable();
    }
    return true;
}

} // namespace

int main(int argc, char** argv) {
    CliArgs args;
    if (!parse_cli_args(argc, argv, args)) {
        return 2;
    }
    if (args.show_help) {
        print_help(argv[0]);
        return 0;
    }
    if (args.show_version) {
        printf("bricklayers-process %s\n", BRICKLAYERS_VERSION_STRING);
        return 0;
    }

    // Config first (with default stderr logging), then the configured logger
    Config config;
    config.init(args.config_path);
    init_logging(args, config);

    std::vector<BrickError> config_errors;
    BrickLayersEngine engine(config.brick_layers(&config_errors), config.markers(&config_errors));
    for (const auto& err : config_errors) {
        spdlog::warn("[Main] {}: {}", err.get_type_string(), err.message);
    }
    if (!apply_overrides(args, engine)) {
        return 2;
    }

    auto input = std::make_unique<gcode::FileStreamSource>(args.input_path);
    if (!input->is_open()) {
        spdlog::error("[Main] Cannot open {}", args.input_path);
        return 1;
    }

    std::ofstream out_file;
    std::ostream* out = &std::cout;
    if (!args.output_path.empty()) {
        out_file.open(args.output_path);
        if (!out_file.is_open()) {
            spdlog::error("[Main] Cannot write {}", args.output_path);
            return 1;
        }
        out = &out_file;
    }

    TransformChain chain;
    if (!chain.add_stage(engine.make_stage())) {
        spdlog::error("[Main] Failed to register the brick_layers stage");
        return 1;
    }

    // The pre-scan gets its own reader; the playback reader below is the "host"
    engine.start_job(std::make_unique<gcode::FileStreamSource>(args.input_path));

    std::string line;
    StreamPosition position = 0;
    gcode::ReadStatus status;
    while ((status = input->next_line(line)) == gcode::ReadStatus::LINE) {
        StreamCommand result = chain.run(StreamCommand{++position, line});
        *out << result.text << '\n';
    }
    out->flush();

    EngineStatus final_status = engine.status();
    engine.end_job();

    int exit_code = 0;
    if (status == gcode::ReadStatus::ERROR) {
        spdlog::error("[Main] Reading {} failed: {}", args.input_path, input->error_message());
        exit_code = 1;
    }
    if (!out->good()) {
        spdlog::error("[Main] Writing output failed");
        exit_code = 1;
    }

    if (args.status_json) {
        fprintf(stderr, "%s\n", final_status.to_json().dump(2).c_str());
    } else {
        fprintf(stderr, "%s\n", final_status.format_report().c_str());
    }
    return exit_code;
}
