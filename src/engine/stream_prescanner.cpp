// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "stream_prescanner.h"

#include "transform_planner.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>

namespace bricklayers {

// ============================================================================
// PreScanTable
// ============================================================================

const TransformDecision* PreScanTable::lookup(StreamPosition position) const {
    auto it = decisions_.find(position);
    return it != decisions_.end() ? &it->second : nullptr;
}

size_t PreScanTable::layer_at(StreamPosition position) const {
    // Number of layer markers at or before this position
    auto it = std::upper_bound(layer_starts_.begin(), layer_starts_.end(), position);
    return static_cast<size_t>(std::distance(layer_starts_.begin(), it));
}

bool PreScanTable::operator==(const PreScanTable& o) const {
    return decisions_ == o.decisions_ && layer_starts_ == o.layer_starts_ &&
           feature_markers_seen_ == o.feature_markers_seen_ &&
           motion_commands_ == o.motion_commands_ && lines_scanned_ == o.lines_scanned_ &&
           absolute_extrusion_skips_ == o.absolute_extrusion_skips_;
}

// ============================================================================
// StreamPreScanner
// ============================================================================

StreamPreScanner::StreamPreScanner(MarkerSyntax syntax) : classifier_(std::move(syntax)) {}

PreScanResult StreamPreScanner::scan(gcode::GCodeStreamSource& source, const Configuration& config,
                                     const std::atomic<bool>* cancel) const {
    auto start_time = std::chrono::steady_clock::now();
    PreScanResult result;

    Configuration scan_config = config;
    scan_config.enabled = true;

    PreScanTable table;
    LayerState state;
    TransformPlanner planner;
    StreamPosition position = 0;
    std::string line;

    spdlog::info("[StreamPreScanner] Pre-scanning {}", source.describe());

    while (true) {
        if (cancel && cancel->load()) {
            spdlog::info("[StreamPreScanner] Pre-scan of {} cancelled at line {}",
                         source.describe(), position);
            result.cancelled = true;
            return result;
        }

        gcode::ReadStatus status = source.next_line(line);
        if (status == gcode::ReadStatus::END) {
            break;
        }
        if (status == gcode::ReadStatus::ERROR) {
            result.error = BrickError::prescan_io(source.describe(), source.error_message());
            spdlog::warn("[StreamPreScanner] {} (after {} lines); table discarded",
                         result.error.message, position);
            return result;
        }

        position++;

        MarkerKind marker = MarkerKind::NONE;
        state = classifier_.advance(state, line, &marker);
        if (marker == MarkerKind::LAYER_CHANGE) {
            table.layer_starts_.push_back(position);
            continue;
        }
        if (marker == MarkerKind::FEATURE_TYPE) {
            table.feature_markers_seen_++;
            continue;
        }
        if (marker != MarkerKind::NONE) {
            continue;
        }

        auto cmd = gcode::GCodeCommand::parse(line);
        if (!cmd.is_motion() || cmd.is_malformed()) {
            continue;
        }
        table.motion_commands_++;

        TransformDecision decision = planner.plan(state, scan_config);
        if (decision.is_eligible()) {
            table.decisions_.emplace(position, decision);
        }
    }

    table.lines_scanned_ = static_cast<size_t>(position);
    table.absolute_extrusion_skips_ = planner.absolute_extrusion_skips();

    auto elapsed = std::chrono::steady_clock::now() - start_time;
    result.elapsed_ms = std::chrono::duration<double, std::milli>(elapsed).count();

    spdlog::info("[StreamPreScanner] Pre-scanned {} lines ({} motion commands, {} layers) in "
                 "{:.1f}ms",
                 table.lines_scanned_, table.motion_commands_, table.layer_starts_.size(),
                 result.elapsed_ms);
    spdlog::info("[StreamPreScanner] Found {} transform points", table.decisions_.size());
    if (config.require_feature_markers && table.feature_markers_seen_ == 0) {
        spdlog::warn("[StreamPreScanner] {}", BrickError::missing_marker().message);
    }
    if (table.absolute_extrusion_skips_ > 0) {
        spdlog::warn("[StreamPreScanner] {} ({} moves)", BrickError::absolute_extrusion().message,
                     table.absolute_extrusion_skips_);
    }

    result.table = std::move(table);
    return result;
}

PreScanResult StreamPreScanner::scan_content(const std::string& content,
                                             const Configuration& config) const {
    gcode::StringStreamSource source(content);
    return scan(source, config);
}

} // namespace bricklayers
