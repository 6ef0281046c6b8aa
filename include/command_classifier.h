// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "brick_config.h"
#include "brick_types.h"
#include "gcode_command.h"

#include <string>

namespace bricklayers {

/**
 * @brief What a single line meant to the classifier
 */
enum class MarkerKind {
    NONE,           ///< Not a marker (motion, mode switch, plain comment)
    LAYER_CHANGE,   ///< Layer-boundary marker
    FEATURE_TYPE,   ///< Feature-type marker with a usable tag
    MALFORMED,      ///< Looked like a marker but carried no tag; ignored
};

/**
 * @brief Stream classification state machine
 *
 * advance() is a pure function of (state, line): the same ordered input always
 * produces the same states, which is what lets the pre-scan and live paths
 * agree. The classifier holds nothing but the (immutable) marker syntax.
 *
 * Rules:
 * - layer marker: layer_index + 1, depth and inner-loop run reset, tag kept
 * - feature marker: tag replaced; an inner-wall tag opening a new run bumps
 *   depth, an external-wall tag resets depth, any other tag closes the run
 * - M82 / M83: extrusion mode set to absolute / relative
 * - anything else: no change
 */
class CommandClassifier {
  public:
    explicit CommandClassifier(MarkerSyntax syntax = {});

    /**
     * @brief Advance the state by one raw line
     *
     * @param state Current state
     * @param line Raw command line
     * @param kind Optional out-parameter receiving the marker kind
     * @return Updated state
     */
    LayerState advance(const LayerState& state, const std::string& line,
                       MarkerKind* kind = nullptr) const;

    /// Same as advance() for an already-parsed command
    LayerState advance(const LayerState& state, const gcode::GCodeCommand& command,
                       MarkerKind* kind = nullptr) const;

    /**
     * @brief Recognize a marker without changing any state
     *
     * @param line Raw line
     * @param tag Receives the mapped tag for FEATURE_TYPE markers
     * @param raw_tag Receives the free-text tag for FEATURE_TYPE markers
     */
    MarkerKind match_marker(const std::string& line, FeatureTag* tag = nullptr,
                            std::string* raw_tag = nullptr) const;

    const MarkerSyntax& syntax() const {
        return syntax_;
    }

  private:
    MarkerSyntax syntax_;
};

} // namespace bricklayers
