// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "brick_error.h"
#include "brick_types.h"

#include <set>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace bricklayers {

/// Recommended (not enforced) ranges; values outside are accepted with a warning
constexpr double RECOMMENDED_Z_OFFSET_MIN = 0.05;
constexpr double RECOMMENDED_Z_OFFSET_MAX = 0.2;
constexpr double RECOMMENDED_MULTIPLIER_MIN = 1.0;
constexpr double RECOMMENDED_MULTIPLIER_MAX = 1.1;

/// Hard limits; values outside are rejected
constexpr double MAX_Z_OFFSET_MAGNITUDE = 1.0;
constexpr double MAX_EXTRUSION_MULTIPLIER = 2.0;

/**
 * @brief Engine parameters
 *
 * Immutable once published: the engine shares snapshots as
 * std::shared_ptr<const Configuration> and replaces them wholesale.
 */
struct Configuration {
    bool enabled = false;
    double z_offset_magnitude = 0.1;   ///< mm
    double extrusion_multiplier = 1.05;
    size_t start_layer = 3;
    bool require_feature_markers = true;
    std::set<std::string> eligible_feature_tags{"inner-wall"};

    bool verbose = false; ///< Log every transformation at info level
    bool prescan = true;  ///< Build a pre-scan table at job start when a source is available

    /// Membership test against eligible_feature_tags
    bool is_eligible_tag(FeatureTag tag) const;

    nlohmann::json to_json() const;
};

/**
 * @brief Names accepted by apply_parameter()
 */
const std::vector<std::string>& parameter_names();

/// Lower-cased name with printer-config aliases (z_offset, require_slicer_comments) resolved
std::string canonical_parameter_name(const std::string& name);

/**
 * @brief Validate and apply one named parameter to a configuration copy
 *
 * On error @p config is left untouched.
 *
 * @param config Configuration to modify
 * @param name Parameter name (see parameter_names())
 * @param value Typed value; numbers given as strings are accepted
 * @return BrickError of type CONFIGURATION on rejection, empty otherwise
 */
BrickError apply_parameter(Configuration& config, const std::string& name,
                           const nlohmann::json& value);

/**
 * @brief Build a configuration from a JSON object (the /brick_layers section)
 *
 * Keys are applied one by one through apply_parameter(); invalid keys keep
 * their defaults and are reported in @p errors.
 */
Configuration configuration_from_json(const nlohmann::json& j, std::vector<BrickError>* errors);

/**
 * @brief Rule mapping slicer feature text onto the canonical vocabulary
 */
struct FeatureAlias {
    std::string match; ///< Lower-case substring searched in the marker text
    FeatureTag tag;
};

/**
 * @brief Lexical syntax of the markers in the command stream
 *
 * Slicers and hosts disagree on marker spelling, so nothing here is hardcoded
 * in the classifier.
 */
struct MarkerSyntax {
    std::vector<std::string> layer_change_prefixes{";LAYER_CHANGE"};
    std::vector<std::string> feature_type_prefixes{";TYPE:"};
    std::vector<FeatureAlias> feature_aliases = default_feature_aliases();

    /// Map free-text marker content to a tag (first matching alias wins)
    FeatureTag map_feature(const std::string& text) const;

    nlohmann::json to_json() const;

    static std::vector<FeatureAlias> default_feature_aliases();
};

/**
 * @brief Build marker syntax from a JSON object (the /markers section)
 *
 * Missing keys keep their defaults. Malformed entries are skipped and reported.
 */
MarkerSyntax marker_syntax_from_json(const nlohmann::json& j, std::vector<BrickError>* errors);

} // namespace bricklayers
