// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "transform_planner.h"

#include <spdlog/spdlog.h>

namespace bricklayers {

bool TransformPlanner::is_eligible(const LayerState& state, const Configuration& config) {
    if (!config.enabled) {
        return false;
    }
    if (state.layer_index < config.start_layer) {
        return false;
    }
    if (state.perimeter_depth == 0) {
        return false;
    }
    if (config.require_feature_markers) {
        if (!state.feature_tag) {
            return false;
        }
        if (!config.is_eligible_tag(*state.feature_tag)) {
            return false;
        }
    }
    return true;
}

TransformDecision TransformPlanner::plan(const LayerState& state, const Configuration& config) {
    if (!is_eligible(state, config)) {
        return TransformDecision::pass_through();
    }
    // Absolute E values are never scaled
    if (state.absolute_extrusion) {
        absolute_extrusion_skips_++;
        return TransformDecision::pass_through();
    }

    if (last_eligible_layer_ && *last_eligible_layer_ != state.layer_index) {
        phase_ = !phase_;
        spdlog::debug("[TransformPlanner] Brick phase {} on layer {}", phase_ ? "+" : "-",
                      state.layer_index);
    }
    last_eligible_layer_ = state.layer_index;

    double z_delta = phase_ ? config.z_offset_magnitude : -config.z_offset_magnitude;
    return TransformDecision::eligible(z_delta, config.extrusion_multiplier);
}

void TransformPlanner::reset() {
    phase_ = true;
    last_eligible_layer_.reset();
    absolute_extrusion_skips_ = 0;
}

} // namespace bricklayers
