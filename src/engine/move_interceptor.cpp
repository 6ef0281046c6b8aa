// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "move_interceptor.h"

#include "transform_planner.h"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <map>

namespace bricklayers {

MoveInterceptor::MoveInterceptor(MarkerSyntax syntax) : classifier_(std::move(syntax)) {}

std::optional<std::string> MoveInterceptor::apply(const gcode::GCodeCommand& cmd,
                                                  const TransformDecision& decision) {
    std::map<char, double> overrides;
    if (auto z = cmd.get_param('Z')) {
        overrides['Z'] = *z + decision.z_delta();
    }
    if (auto e = cmd.get_param('E')) {
        overrides['E'] = *e * decision.e_multiplier();
    }
    if (overrides.empty()) {
        return std::nullopt;
    }
    return cmd.with_values(overrides);
}

TransformDecision MoveInterceptor::decide_live(JobContext& job, const Configuration& config,
                                               const StreamCommand& command,
                                               std::optional<gcode::GCodeCommand>& parsed) const {
    MarkerKind marker = MarkerKind::NONE;
    job.state = classifier_.advance(job.state, command.text, &marker);
    job.current_layer = job.state.layer_index;

    if (marker == MarkerKind::FEATURE_TYPE) {
        job.feature_markers_seen++;
    }
    if (marker != MarkerKind::NONE) {
        return TransformDecision::pass_through();
    }

    if (!gcode::GCodeCommand::is_motion_line(command.text)) {
        return TransformDecision::pass_through();
    }
    parsed = gcode::GCodeCommand::parse(command.text);
    if (!parsed->is_motion() || parsed->is_malformed()) {
        return TransformDecision::pass_through();
    }
    job.motion_commands++;

    if (config.require_feature_markers && job.feature_markers_seen == 0 &&
        !job.missing_marker_warned && job.state.layer_index >= config.start_layer) {
        job.missing_marker_warned = true;
        spdlog::warn("[MoveInterceptor] {} (job {}, layer {})",
                     BrickError::missing_marker().message, job.job_id, job.state.layer_index);
    }

    TransformDecision decision = job.planner.plan(job.state, config);
    if (job.planner.absolute_extrusion_skips() > 0 && !job.absolute_extrusion_warned) {
        job.absolute_extrusion_warned = true;
        spdlog::warn("[MoveInterceptor] {} (job {}, layer {})",
                     BrickError::absolute_extrusion().message, job.job_id, job.state.layer_index);
    }
    return decision;
}

TransformDecision
MoveInterceptor::decide_from_table(JobContext& job, const Configuration& config,
                                   const StreamCommand& command,
                                   std::optional<gcode::GCodeCommand>& parsed) const {
    const PreScanTable& table = *job.table;
    job.current_layer = table.layer_at(command.position);

    if (!gcode::GCodeCommand::is_motion_line(command.text)) {
        return TransformDecision::pass_through();
    }
    parsed = gcode::GCodeCommand::parse(command.text);
    if (!parsed->is_motion() || parsed->is_malformed()) {
        return TransformDecision::pass_through();
    }
    job.motion_commands++;

    const TransformDecision* decision = table.lookup(command.position);
    if (decision == nullptr || !config.enabled) {
        return TransformDecision::pass_through();
    }
    return *decision;
}

StreamCommand MoveInterceptor::intercept(JobContext& job, const Configuration& config,
                                         const StreamCommand& command) const {
    job.commands_seen++;

    if (job.faulted) {
        return command;
    }

    if (job.last_position && command.position <= *job.last_position) {
        BrickError err = BrickError::invariant_violation(
            fmt::format("stream position {} after {}", command.position, *job.last_position));
        job.faulted = true;
        job.fault_reason = err.message;
        spdlog::error("[MoveInterceptor] Job {} faulted: {}; passing through for the rest of the "
                      "job",
                      job.job_id, err.message);
        spdlog::dump_backtrace();
        return command;
    }
    job.last_position = command.position;

    std::optional<gcode::GCodeCommand> parsed;
    TransformDecision decision = job.uses_table()
                                     ? decide_from_table(job, config, command, parsed)
                                     : decide_live(job, config, command, parsed);

    if (!decision.is_eligible()) {
        spdlog::trace("[MoveInterceptor] {}: pass", command.position);
        return command;
    }

    auto rewritten = apply(*parsed, decision);
    if (!rewritten) {
        spdlog::trace("[MoveInterceptor] {}: eligible but no Z/E, pass", command.position);
        return command;
    }

    job.transformed_commands++;
    job.last_phase = decision.z_delta() >= 0 ? 1 : -1;

    auto level = config.verbose ? spdlog::level::info : spdlog::level::debug;
    spdlog::log(level, "[MoveInterceptor] Layer {} line {}: '{}' -> '{}'", job.current_layer,
                command.position, command.text, *rewritten);

    return StreamCommand{command.position, std::move(*rewritten)};
}

} // namespace bricklayers
