// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "brick_error.h"
#include "brick_types.h"
#include "gcode_command.h"
#include "stream_prescanner.h"
#include "transform_planner.h"

#include <cstdint>
#include <optional>
#include <string>

namespace bricklayers {

enum class PreScanStatus {
    NONE,      ///< No pre-scan requested (live classification)
    PENDING,   ///< Scan running; playback waits
    READY,     ///< Table available and authoritative
    FAILED,    ///< Stream unreadable; live classification
    ABANDONED, ///< Cancelled by the host; live classification
};

const char* prescan_status_name(PreScanStatus status);

/**
 * @brief Everything that belongs to one print job
 *
 * Created at job start and thrown away at job end or abort, so nothing can
 * leak from one job into the next. Passed explicitly to every real-time
 * operation.
 */
struct JobContext {
    uint64_t job_id = 0;
    std::string source_name;

    // Live classification
    LayerState state;
    TransformPlanner planner;
    size_t feature_markers_seen = 0;

    // Pre-scan
    PreScanStatus prescan_status = PreScanStatus::NONE;
    std::optional<PreScanTable> table;
    BrickError prescan_error; ///< Why the job fell back to live classification

    // Ordering
    std::optional<StreamPosition> last_position;

    // Counters for status
    size_t commands_seen = 0;
    size_t motion_commands = 0;
    size_t transformed_commands = 0;
    size_t current_layer = 0;
    int last_phase = 0; ///< +1 / -1 of the last applied offset, 0 before any

    // Degraded states
    bool missing_marker_warned = false;
    bool absolute_extrusion_warned = false;
    bool faulted = false;
    std::string fault_reason;

    /// True while the pre-scan table drives decisions
    bool uses_table() const {
        return prescan_status == PreScanStatus::READY && table.has_value();
    }
};

} // namespace bricklayers
