// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "brick_config.h"
#include "brick_error.h"
#include "brick_types.h"
#include "gcode_stream_source.h"

#include <map>
#include <string>
#include <vector>

namespace bricklayers {
namespace gcode {

/**
 * @brief A distinct feature-type marker text found in a file
 */
struct DetectedFeature {
    std::string raw_tag;     ///< Tag as written by the slicer ("Inner wall")
    FeatureTag tag = FeatureTag::UNKNOWN; ///< Canonical mapping
    size_t occurrences = 0;
    size_t first_line = 0;   ///< 1-indexed
};

/**
 * @brief Result of scanning a file for the markers brick layering depends on
 */
struct CompatibilityReport {
    std::string source;
    size_t lines = 0;
    size_t layer_changes = 0;
    size_t feature_markers = 0;
    size_t malformed_markers = 0;
    size_t motion_commands = 0;
    std::map<std::string, DetectedFeature> features; ///< Keyed by raw tag, sorted
    BrickError read_error;

    bool has_layer_changes() const {
        return layer_changes > 0;
    }
    bool has_feature_markers() const {
        return feature_markers > 0;
    }

    /// True if any detected feature maps to inner-wall
    [[nodiscard]] bool has_inner_walls() const;

    /// Layer and feature markers present and the whole file was readable
    [[nodiscard]] bool compatible() const;

    /// Human-readable problems / hints (empty for a clean file)
    [[nodiscard]] std::vector<std::string> warnings() const;

    /// Multi-line report for the terminal
    [[nodiscard]] std::string format() const;
};

/**
 * @brief Check a G-code stream for brick layering compatibility
 *
 * Reads the whole stream once with the same marker syntax the engine uses.
 */
CompatibilityReport analyze_compatibility(GCodeStreamSource& source,
                                          const MarkerSyntax& syntax = {});

} // namespace gcode
} // namespace bricklayers
