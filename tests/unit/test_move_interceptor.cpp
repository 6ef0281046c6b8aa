// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "move_interceptor.h"
#include "stream_prescanner.h"
#include "test_helpers/gcode_test_streams.h"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace bricklayers;
using Catch::Approx;

namespace {

Configuration enabled_config() {
    Configuration config;
    config.enabled = true;
    return config;
}

std::vector<StreamCommand> run_job(const MoveInterceptor& interceptor, JobContext& job,
                                   const Configuration& config,
                                   const std::vector<StreamCommand>& commands) {
    std::vector<StreamCommand> out;
    out.reserve(commands.size());
    for (const auto& cmd : commands) {
        out.push_back(interceptor.intercept(job, config, cmd));
    }
    return out;
}

JobContext table_job(const std::string& content, const Configuration& config) {
    JobContext job;
    auto result = StreamPreScanner().scan_content(content, config);
    job.table = std::move(result.table);
    job.prescan_status = PreScanStatus::READY;
    return job;
}

} // namespace

TEST_CASE("MoveInterceptor - apply rewrites only Z and E", "[interceptor]") {
    auto decision = TransformDecision::eligible(0.1, 1.05);

    SECTION("both words present") {
        auto cmd = gcode::GCodeCommand::parse("G1 X10 Y10 Z1.30 E0.45");
        REQUIRE(MoveInterceptor::apply(cmd, decision) == "G1 X10 Y10 Z1.4 E0.4725");
    }

    SECTION("no Z word: Z is not injected") {
        auto cmd = gcode::GCodeCommand::parse("G1 X20 Y10 E0.45 F1800");
        REQUIRE(MoveInterceptor::apply(cmd, decision) == "G1 X20 Y10 E0.4725 F1800");
    }

    SECTION("negative phase") {
        auto cmd = gcode::GCodeCommand::parse("G1 Z1.30");
        REQUIRE(MoveInterceptor::apply(cmd, TransformDecision::eligible(-0.1, 1.05)) == "G1 Z1.2");
    }

    SECTION("travel without Z or E is left alone") {
        auto cmd = gcode::GCodeCommand::parse("G0 X0 Y0");
        REQUIRE_FALSE(MoveInterceptor::apply(cmd, decision).has_value());
    }
}

TEST_CASE("MoveInterceptor - live classification scenario", "[interceptor]") {
    MoveInterceptor interceptor;
    Configuration config = enabled_config();
    JobContext job;
    auto commands = test::to_commands(test::brick_scenario_stream());

    auto out = run_job(interceptor, job, config, commands);

    REQUIRE(out.size() == commands.size());
    REQUIRE(test::line_at(out, 16) == "G1 X10 Y10 Z1.4 E0.4725");
    REQUIRE(test::line_at(out, 17) == "G1 X20 Y10 E0.4725 F1800");
    REQUIRE(test::line_at(out, 23) == "G1 X10 Y10 Z1.2 E0.4725");
    REQUIRE(test::line_at(out, 24) == "G1 X20 Y10 E0.4725 F1800");

    for (StreamPosition pos = 1; pos <= static_cast<StreamPosition>(commands.size()); ++pos) {
        if (pos == 16 || pos == 17 || pos == 23 || pos == 24) {
            continue;
        }
        INFO("position " << pos);
        REQUIRE(test::line_at(out, pos) == test::line_at(commands, pos));
    }

    REQUIRE(job.transformed_commands == 4);
    REQUIRE(job.motion_commands == 11);
    REQUIRE(job.commands_seen == commands.size());
    REQUIRE(job.current_layer == 4);
    REQUIRE(job.last_phase == -1);
    REQUIRE(job.feature_markers_seen == 7);
}

TEST_CASE("MoveInterceptor - disabled is identity", "[interceptor]") {
    MoveInterceptor interceptor;
    Configuration config;
    JobContext job;
    auto commands = test::to_commands(test::mixed_feature_stream());

    auto out = run_job(interceptor, job, config, commands);
    for (size_t i = 0; i < commands.size(); ++i) {
        REQUIRE(out[i].text == commands[i].text);
        REQUIRE(out[i].position == commands[i].position);
    }
    REQUIRE(job.transformed_commands == 0);
}

TEST_CASE("MoveInterceptor - missing feature markers fail closed", "[interceptor]") {
    MoveInterceptor interceptor;
    Configuration config = enabled_config();
    JobContext job;
    auto commands = test::to_commands(test::unmarked_stream());

    auto out = run_job(interceptor, job, config, commands);
    for (size_t i = 0; i < commands.size(); ++i) {
        REQUIRE(out[i].text == commands[i].text);
    }
    REQUIRE(job.missing_marker_warned);
    REQUIRE(job.feature_markers_seen == 0);
    REQUIRE(job.motion_commands == 10);
}

TEST_CASE("MoveInterceptor - table and live paths agree", "[interceptor]") {
    MoveInterceptor interceptor;
    Configuration config = enabled_config();

    for (const std::string& content :
         {test::brick_scenario_stream(), test::mixed_feature_stream(25)}) {
        auto commands = test::to_commands(content);

        JobContext live_job;
        auto live = run_job(interceptor, live_job, config, commands);

        JobContext prescan_job = table_job(content, config);
        REQUIRE(prescan_job.uses_table());
        auto prescanned = run_job(interceptor, prescan_job, config, commands);

        REQUIRE(live.size() == prescanned.size());
        for (size_t i = 0; i < live.size(); ++i) {
            REQUIRE(live[i].text == prescanned[i].text);
        }
        REQUIRE(live_job.transformed_commands == prescan_job.transformed_commands);
        REQUIRE(live_job.motion_commands == prescan_job.motion_commands);
        REQUIRE(live_job.current_layer == prescan_job.current_layer);
    }
}

TEST_CASE("MoveInterceptor - table is not consulted while disabled", "[interceptor]") {
    MoveInterceptor interceptor;
    Configuration config;
    JobContext job = table_job(test::brick_scenario_stream(), config);
    REQUIRE(job.table->size() == 4);

    auto commands = test::to_commands(test::brick_scenario_stream());
    auto out = run_job(interceptor, job, config, commands);
    REQUIRE(test::line_at(out, 16) == test::line_at(commands, 16));
    REQUIRE(job.transformed_commands == 0);
}

TEST_CASE("MoveInterceptor - out-of-order position faults the job", "[interceptor]") {
    MoveInterceptor interceptor;
    Configuration config = enabled_config();
    JobContext job;
    auto commands = test::to_commands(test::brick_scenario_stream());

    // Run up to layer 3, then replay a position
    for (size_t i = 0; i < 15; ++i) {
        interceptor.intercept(job, config, commands[i]);
    }
    REQUIRE_FALSE(job.faulted);

    StreamCommand replay = interceptor.intercept(job, config, commands[14]);
    REQUIRE(replay.text == commands[14].text);
    REQUIRE(job.faulted);
    REQUIRE_FALSE(job.fault_reason.empty());

    // Position 16 would normally be raised; after the fault it passes through
    StreamCommand next = interceptor.intercept(job, config, commands[15]);
    REQUIRE(next.text == commands[15].text);
    REQUIRE(job.transformed_commands == 0);
}

TEST_CASE("MoveInterceptor - non-motion commands are never rewritten", "[interceptor]") {
    MoveInterceptor interceptor;
    Configuration config = enabled_config();
    config.start_layer = 0;
    config.require_feature_markers = false;

    JobContext job;
    std::vector<StreamCommand> commands = {
        {1, ";LAYER_CHANGE"}, {2, ";TYPE:Inner wall"}, {3, "G92 E0"},
        {4, "M83"},           {5, "G1 Z0.3 E1"},       {6, "G1 X1 Y1 Zabc E1"},
    };
    auto out = run_job(interceptor, job, config, commands);

    REQUIRE(out[2].text == "G92 E0");
    REQUIRE(out[3].text == "M83");
    REQUIRE(out[4].text == "G1 Z0.4 E1.05");
    // Malformed motion is forwarded unchanged
    REQUIRE(out[5].text == "G1 X1 Y1 Zabc E1");
    REQUIRE(job.transformed_commands == 1);
}

TEST_CASE("MoveInterceptor - absolute extrusion passes through", "[interceptor]") {
    MoveInterceptor interceptor;
    Configuration config = enabled_config();
    config.start_layer = 1;
    auto commands = test::to_commands(test::extrusion_mode_stream());

    SECTION("live classification") {
        JobContext job;
        auto out = run_job(interceptor, job, config, commands);

        REQUIRE(test::line_at(out, 4) == "G1 X1 Y1 E1500.20");
        REQUIRE(test::line_at(out, 6) == "G1 X3 Y1 E1500.60");
        REQUIRE(test::line_at(out, 10) == "G1 X1 Y1 Z0.7 E0.4725");
        REQUIRE(job.transformed_commands == 1);
        REQUIRE(job.motion_commands == 3);
        REQUIRE(job.last_phase == 1);
        REQUIRE(job.absolute_extrusion_warned);
    }

    SECTION("pre-scanned table gives the same output") {
        JobContext live_job;
        auto live = run_job(interceptor, live_job, config, commands);

        JobContext job = table_job(test::extrusion_mode_stream(), config);
        auto out = run_job(interceptor, job, config, commands);
        for (size_t i = 0; i < out.size(); ++i) {
            REQUIRE(out[i].text == live[i].text);
        }
        REQUIRE(job.table->absolute_extrusion_skips() == 1);
    }
}

TEST_CASE("MoveInterceptor - malformed motion counts the same in both paths", "[interceptor]") {
    MoveInterceptor interceptor;
    Configuration config = enabled_config();
    config.start_layer = 0;

    const std::string content = ";LAYER_CHANGE\n"
                                ";TYPE:Inner wall\n"
                                "G1 X1 Y1 Z0.2 E0.5\n"
                                "G1 X1e-3 Y2 E0.5\n"
                                "G1 X2 Y2 E0.5\n";
    auto commands = test::to_commands(content);

    JobContext live_job;
    auto live = run_job(interceptor, live_job, config, commands);
    JobContext prescan_job = table_job(content, config);
    auto prescanned = run_job(interceptor, prescan_job, config, commands);

    REQUIRE(test::line_at(live, 4) == "G1 X1e-3 Y2 E0.5");
    REQUIRE(test::line_at(prescanned, 4) == "G1 X1e-3 Y2 E0.5");
    REQUIRE(test::line_at(live, 5) == "G1 X2 Y2 E0.525");
    REQUIRE(live_job.motion_commands == 2);
    REQUIRE(prescan_job.motion_commands == 2);
    REQUIRE(live_job.transformed_commands == prescan_job.transformed_commands);
}
