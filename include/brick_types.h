// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace bricklayers {

/**
 * @brief Canonical print feature categories
 *
 * Slicer-specific spellings are mapped onto this vocabulary by MarkerSyntax.
 */
enum class FeatureTag {
    INNER_WALL,    ///< Loop not exposed on the visible surface
    EXTERNAL_WALL, ///< Loop forming the visible outer surface
    INFILL,
    SKIRT,
    UNKNOWN, ///< Marker present but tag not recognized
};

/// Canonical name ("inner-wall", "external-wall", ...)
const char* feature_tag_name(FeatureTag tag);

/// Reverse of feature_tag_name(); nullopt for names outside the vocabulary
std::optional<FeatureTag> parse_feature_tag(const std::string& name);

/**
 * @brief Classification state of the command stream
 *
 * Owned by the job and advanced only by CommandClassifier, strictly forward.
 */
struct LayerState {
    size_t layer_index = 0;                ///< Layer boundaries seen since job start
    std::optional<FeatureTag> feature_tag; ///< Empty until the first feature marker
    size_t perimeter_depth = 0;            ///< Inner-wall runs since the outer wall
    bool in_inner_loop = false;            ///< Current feature is an inner wall run
    bool absolute_extrusion = false;       ///< M82 in effect; M83 clears it

    bool operator==(const LayerState& o) const {
        return layer_index == o.layer_index && feature_tag == o.feature_tag &&
               perimeter_depth == o.perimeter_depth && in_inner_loop == o.in_inner_loop &&
               absolute_extrusion == o.absolute_extrusion;
    }
    bool operator!=(const LayerState& o) const {
        return !(*this == o);
    }
};

/**
 * @brief Result of planning one motion command
 *
 * Tagged value: either PASS_THROUGH or ELIGIBLE carrying the offsets.
 * Immutable once created.
 */
class TransformDecision {
  public:
    enum class Kind { PASS_THROUGH, ELIGIBLE };

    static TransformDecision pass_through() {
        return TransformDecision(Kind::PASS_THROUGH, 0.0, 1.0);
    }

    static TransformDecision eligible(double z_delta, double e_multiplier) {
        return TransformDecision(Kind::ELIGIBLE, z_delta, e_multiplier);
    }

    Kind kind() const {
        return kind_;
    }
    bool is_eligible() const {
        return kind_ == Kind::ELIGIBLE;
    }
    double z_delta() const {
        return z_delta_;
    }
    double e_multiplier() const {
        return e_multiplier_;
    }

    bool operator==(const TransformDecision& o) const {
        return kind_ == o.kind_ && z_delta_ == o.z_delta_ && e_multiplier_ == o.e_multiplier_;
    }
    bool operator!=(const TransformDecision& o) const {
        return !(*this == o);
    }

  private:
    TransformDecision(Kind kind, double z_delta, double e_multiplier)
        : kind_(kind), z_delta_(z_delta), e_multiplier_(e_multiplier) {}

    Kind kind_;
    double z_delta_;
    double e_multiplier_;
};

} // namespace bricklayers
