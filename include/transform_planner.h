// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "brick_config.h"
#include "brick_types.h"

#include <cstddef>
#include <optional>

namespace bricklayers {

/**
 * @brief Decides whether a motion command is offset, and by how much
 *
 * Eligibility:
 *   enabled && layer >= start_layer && depth > 0 &&
 *   (!require_feature_markers || tag in eligible_feature_tags)
 *
 * With require_feature_markers set and no feature marker seen yet, the answer
 * is always pass-through (fail closed). The same holds for moves that would be
 * eligible while absolute extrusion (M82) is in effect; those are counted in
 * absolute_extrusion_skips() and do not advance the phase.
 *
 * The only state is the brick phase: positive on the first eligible layer of
 * a job, flipped whenever an eligible decision lands on a different layer than
 * the previous eligible one. Layers without eligible moves therefore do not
 * disturb the alternation.
 */
class TransformPlanner {
  public:
    TransformPlanner() = default;

    /**
     * @brief Plan one motion command
     *
     * @param state Classifier state at this command
     * @param config Configuration snapshot
     */
    TransformDecision plan(const LayerState& state, const Configuration& config);

    /// Eligibility rule alone, without touching the phase
    static bool is_eligible(const LayerState& state, const Configuration& config);

    /// Current phase: true = positive offset
    bool phase() const {
        return phase_;
    }

    /// Layer of the last eligible decision, if any
    std::optional<size_t> last_eligible_layer() const {
        return last_eligible_layer_;
    }

    /// Otherwise eligible moves passed through because of M82
    size_t absolute_extrusion_skips() const {
        return absolute_extrusion_skips_;
    }

    /// Back to job-start state
    void reset();

  private:
    bool phase_ = true;
    std::optional<size_t> last_eligible_layer_;
    size_t absolute_extrusion_skips_ = 0;
};

} // namespace bricklayers
