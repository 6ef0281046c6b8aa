// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "brick_config.h"
#include "brick_error.h"
#include "brick_types.h"
#include "command_classifier.h"
#include "gcode_command.h"
#include "gcode_stream_source.h"

#include <atomic>
#include <optional>
#include <unordered_map>
#include <vector>

namespace bricklayers {

/**
 * @brief Cached transform decisions for one job, keyed by stream position
 *
 * Sparse: only eligible positions are stored, absence means pass-through.
 * Read-only once built; a new job gets a new table.
 */
class PreScanTable {
  public:
    /// Decision at @p position, or nullptr for pass-through
    const TransformDecision* lookup(StreamPosition position) const;

    /// Layer index in effect at @p position
    size_t layer_at(StreamPosition position) const;

    size_t size() const {
        return decisions_.size();
    }
    bool empty() const {
        return decisions_.empty();
    }

    size_t feature_markers_seen() const {
        return feature_markers_seen_;
    }
    size_t motion_commands() const {
        return motion_commands_;
    }
    size_t lines_scanned() const {
        return lines_scanned_;
    }
    /// Otherwise eligible moves left alone because of M82
    size_t absolute_extrusion_skips() const {
        return absolute_extrusion_skips_;
    }
    const std::vector<StreamPosition>& layer_starts() const {
        return layer_starts_;
    }

    bool operator==(const PreScanTable& o) const;
    bool operator!=(const PreScanTable& o) const {
        return !(*this == o);
    }

  private:
    friend class StreamPreScanner;

    std::unordered_map<StreamPosition, TransformDecision> decisions_;
    std::vector<StreamPosition> layer_starts_; ///< Position of each layer marker, ascending
    size_t feature_markers_seen_ = 0;
    size_t motion_commands_ = 0;
    size_t lines_scanned_ = 0;
    size_t absolute_extrusion_skips_ = 0;
};

/**
 * @brief Outcome of a pre-scan pass
 */
struct PreScanResult {
    std::optional<PreScanTable> table; ///< Empty on failure or cancellation
    BrickError error;                  ///< PRESCAN_IO on failure
    bool cancelled = false;
    double elapsed_ms = 0.0;
};

/**
 * @brief Replays a whole stream through classifier and planner ahead of playback
 *
 * Runs the exact same CommandClassifier / TransformPlanner sequence as the live
 * path, so for an unchanged stream and configuration the table reproduces the
 * live decisions. Planning is done with `enabled` forced on; whether the table
 * is honoured is decided at intercept time.
 *
 * A stream that cannot be read to the end yields no table at all.
 *
 * @code
 * StreamPreScanner scanner(syntax);
 * gcode::FileStreamSource source("benchy.gcode");
 * auto result = scanner.scan(source, config);
 * if (result.table) {
 *     spdlog::info("{} transform points", result.table->size());
 * }
 * @endcode
 */
class StreamPreScanner {
  public:
    explicit StreamPreScanner(MarkerSyntax syntax = {});

    /**
     * @brief Scan a stream to completion
     *
     * @param source Stream to read (consumed)
     * @param config Configuration the table is computed for
     * @param cancel Optional flag polled between lines; when set the scan stops
     *               and no table is produced
     */
    PreScanResult scan(gcode::GCodeStreamSource& source, const Configuration& config,
                       const std::atomic<bool>* cancel = nullptr) const;

    /// Convenience for in-memory content
    PreScanResult scan_content(const std::string& content, const Configuration& config) const;

  private:
    CommandClassifier classifier_;
};

} // namespace bricklayers
