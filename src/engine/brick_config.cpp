// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "brick_config.h"

#include "json_utils.h"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <sstream>

using json = nlohmann::json;

namespace bricklayers {

// ============================================================================
// Feature vocabulary
// ============================================================================

const char* feature_tag_name(FeatureTag tag) {
    switch (tag) {
    case FeatureTag::INNER_WALL:
        return "inner-wall";
    case FeatureTag::EXTERNAL_WALL:
        return "external-wall";
    case FeatureTag::INFILL:
        return "infill";
    case FeatureTag::SKIRT:
        return "skirt";
    case FeatureTag::UNKNOWN:
        return "unknown";
    }
    return "unknown";
}

std::optional<FeatureTag> parse_feature_tag(const std::string& name) {
    constexpr FeatureTag all[] = {FeatureTag::INNER_WALL, FeatureTag::EXTERNAL_WALL,
                                  FeatureTag::INFILL, FeatureTag::SKIRT, FeatureTag::UNKNOWN};
    std::string lower = json_util::to_lower(name);
    for (auto tag : all) {
        if (lower == feature_tag_name(tag)) {
            return tag;
        }
    }
    return std::nullopt;
}

// ============================================================================
// Configuration
// ============================================================================

bool Configuration::is_eligible_tag(FeatureTag tag) const {
    return eligible_feature_tags.count(feature_tag_name(tag)) != 0;
}

json Configuration::to_json() const {
    return {{"enabled", enabled},
            {"z_offset_magnitude", z_offset_magnitude},
            {"extrusion_multiplier", extrusion_multiplier},
            {"start_layer", start_layer},
            {"require_feature_markers", require_feature_markers},
            {"eligible_feature_tags", eligible_feature_tags},
            {"verbose", verbose},
            {"prescan", prescan}};
}

const std::vector<std::string>& parameter_names() {
    static const std::vector<std::string> names = {
        "enabled",
        "z_offset_magnitude",
        "extrusion_multiplier",
        "start_layer",
        "require_feature_markers",
        "eligible_feature_tags",
        "verbose",
        "prescan",
    };
    return names;
}

std::string canonical_parameter_name(const std::string& name) {
    std::string lower = json_util::to_lower(name);
    if (lower == "z_offset") {
        return "z_offset_magnitude";
    }
    if (lower == "require_slicer_comments") {
        return "require_feature_markers";
    }
    return lower;
}

namespace {

BrickError apply_bool(bool& target, const std::string& name, const json& value) {
    auto b = json_util::as_bool(value);
    if (!b) {
        return BrickError::configuration(name, "expected a boolean, got " + value.dump());
    }
    target = *b;
    return {};
}

BrickError parse_tag_set(const json& value, std::set<std::string>& out) {
    std::vector<std::string> names;
    if (value.is_array()) {
        for (const auto& item : value) {
            if (!item.is_string()) {
                return BrickError::configuration("eligible_feature_tags",
                                                 "entries must be strings, got " + item.dump());
            }
            names.push_back(item.get<std::string>());
        }
    } else if (value.is_string()) {
        std::istringstream ss(value.get<std::string>());
        std::string item;
        while (std::getline(ss, item, ',')) {
            size_t b = item.find_first_not_of(" \t");
            size_t e = item.find_last_not_of(" \t");
            if (b != std::string::npos) {
                names.push_back(item.substr(b, e - b + 1));
            }
        }
    } else {
        return BrickError::configuration("eligible_feature_tags",
                                         "expected a list of tags, got " + value.dump());
    }

    std::set<std::string> tags;
    for (const auto& name : names) {
        auto tag = parse_feature_tag(name);
        if (!tag) {
            return BrickError::configuration("eligible_feature_tags", "unknown tag '" + name + "'");
        }
        tags.insert(feature_tag_name(*tag));
    }
    if (tags.empty()) {
        return BrickError::configuration("eligible_feature_tags", "at least one tag is required");
    }
    out = std::move(tags);
    return {};
}

} // namespace

BrickError apply_parameter(Configuration& config, const std::string& name, const json& value) {
    const std::string param = canonical_parameter_name(name);
    Configuration updated = config;

    if (param == "enabled") {
        if (auto err = apply_bool(updated.enabled, param, value); err.has_error()) {
            return err;
        }
    } else if (param == "require_feature_markers") {
        if (auto err = apply_bool(updated.require_feature_markers, param, value);
            err.has_error()) {
            return err;
        }
    } else if (param == "verbose") {
        if (auto err = apply_bool(updated.verbose, param, value); err.has_error()) {
            return err;
        }
    } else if (param == "prescan") {
        if (auto err = apply_bool(updated.prescan, param, value); err.has_error()) {
            return err;
        }
    } else if (param == "z_offset_magnitude") {
        auto v = json_util::as_double(value);
        if (!v) {
            return BrickError::configuration(param, "expected a number, got " + value.dump());
        }
        if (*v <= 0.0 || *v > MAX_Z_OFFSET_MAGNITUDE) {
            return BrickError::configuration(
                param, fmt::format("{} out of range (0, {}] mm", *v, MAX_Z_OFFSET_MAGNITUDE));
        }
        if (*v < RECOMMENDED_Z_OFFSET_MIN || *v > RECOMMENDED_Z_OFFSET_MAX) {
            spdlog::warn("[BrickConfig] z_offset_magnitude={} outside recommended range {}-{} mm",
                         *v, RECOMMENDED_Z_OFFSET_MIN, RECOMMENDED_Z_OFFSET_MAX);
        }
        updated.z_offset_magnitude = *v;
    } else if (param == "extrusion_multiplier") {
        auto v = json_util::as_double(value);
        if (!v) {
            return BrickError::configuration(param, "expected a number, got " + value.dump());
        }
        if (*v <= 0.0 || *v > MAX_EXTRUSION_MULTIPLIER) {
            return BrickError::configuration(
                param, fmt::format("{} out of range (0, {}]", *v, MAX_EXTRUSION_MULTIPLIER));
        }
        if (*v < RECOMMENDED_MULTIPLIER_MIN || *v > RECOMMENDED_MULTIPLIER_MAX) {
            spdlog::warn("[BrickConfig] extrusion_multiplier={} outside recommended range {}-{}",
                         *v, RECOMMENDED_MULTIPLIER_MIN, RECOMMENDED_MULTIPLIER_MAX);
        }
        updated.extrusion_multiplier = *v;
    } else if (param == "start_layer") {
        auto v = json_util::as_integer(value);
        if (!v) {
            return BrickError::configuration(param, "expected an integer, got " + value.dump());
        }
        if (*v < 0) {
            return BrickError::configuration(param, "must be non-negative");
        }
        updated.start_layer = static_cast<size_t>(*v);
    } else if (param == "eligible_feature_tags") {
        if (auto err = parse_tag_set(value, updated.eligible_feature_tags); err.has_error()) {
            return err;
        }
    } else {
        return BrickError::configuration(name, "unknown parameter");
    }

    config = std::move(updated);
    return {};
}

Configuration configuration_from_json(const json& j, std::vector<BrickError>* errors) {
    Configuration config;
    if (!j.is_object()) {
        return config;
    }

    for (const auto& [key, value] : j.items()) {
        BrickError err = apply_parameter(config, key, value);
        if (err.has_error()) {
            spdlog::error("[BrickConfig] Ignoring {}: {}", key, err.message);
            if (errors) {
                errors->push_back(err);
            }
        }
    }
    return config;
}

// ============================================================================
// MarkerSyntax
// ============================================================================

std::vector<FeatureAlias> MarkerSyntax::default_feature_aliases() {
    // Order matters: external spellings must be tested before the generic
    // "perimeter"/"wall" ones they contain.
    return {
        {"external perimeter", FeatureTag::EXTERNAL_WALL},
        {"outer wall", FeatureTag::EXTERNAL_WALL},
        {"wall-outer", FeatureTag::EXTERNAL_WALL},
        {"overhang perimeter", FeatureTag::EXTERNAL_WALL},
        {"inner wall", FeatureTag::INNER_WALL},
        {"wall-inner", FeatureTag::INNER_WALL},
        {"perimeter", FeatureTag::INNER_WALL},
        {"infill", FeatureTag::INFILL},
        {"fill", FeatureTag::INFILL},
        {"skirt", FeatureTag::SKIRT},
        {"brim", FeatureTag::SKIRT},
    };
}

FeatureTag MarkerSyntax::map_feature(const std::string& text) const {
    std::string lower = json_util::to_lower(text);
    for (const auto& alias : feature_aliases) {
        if (!alias.match.empty() && lower.find(alias.match) != std::string::npos) {
            return alias.tag;
        }
    }
    return FeatureTag::UNKNOWN;
}

json MarkerSyntax::to_json() const {
    json aliases = json::array();
    for (const auto& alias : feature_aliases) {
        aliases.push_back({{"match", alias.match}, {"tag", feature_tag_name(alias.tag)}});
    }
    return {{"layer_change", layer_change_prefixes},
            {"feature_type", feature_type_prefixes},
            {"feature_aliases", aliases}};
}

namespace {

bool read_prefix_list(const json& j, const char* key, std::vector<std::string>& out,
                      std::vector<BrickError>* errors) {
    if (!j.contains(key)) {
        return false;
    }
    const auto& v = j[key];
    std::vector<std::string> prefixes;
    if (v.is_string()) {
        prefixes.push_back(v.get<std::string>());
    } else if (v.is_array()) {
        for (const auto& item : v) {
            if (item.is_string() && !item.get<std::string>().empty()) {
                prefixes.push_back(item.get<std::string>());
            }
        }
    }
    if (prefixes.empty()) {
        if (errors) {
            errors->push_back(BrickError::configuration(
                std::string("markers/") + key, "expected a non-empty string list"));
        }
        return false;
    }
    out = std::move(prefixes);
    return true;
}

} // namespace

MarkerSyntax marker_syntax_from_json(const json& j, std::vector<BrickError>* errors) {
    MarkerSyntax syntax;
    if (!j.is_object()) {
        return syntax;
    }

    read_prefix_list(j, "layer_change", syntax.layer_change_prefixes, errors);
    read_prefix_list(j, "feature_type", syntax.feature_type_prefixes, errors);

    if (j.contains("feature_aliases") && j["feature_aliases"].is_array()) {
        std::vector<FeatureAlias> aliases;
        for (const auto& item : j["feature_aliases"]) {
            std::string match = json_util::to_lower(json_util::safe_string(item, "match"));
            auto tag = parse_feature_tag(json_util::safe_string(item, "tag"));
            if (match.empty() || !tag) {
                if (errors) {
                    errors->push_back(BrickError::configuration("markers/feature_aliases",
                                                                "invalid alias " + item.dump()));
                }
                continue;
            }
            aliases.push_back({match, *tag});
        }
        if (!aliases.empty()) {
            syntax.feature_aliases = std::move(aliases);
        }
    }

    spdlog::debug("[BrickConfig] Marker syntax: {} layer prefix(es), {} feature prefix(es), "
                  "{} alias(es)",
                  syntax.layer_change_prefixes.size(), syntax.feature_type_prefixes.size(),
                  syntax.feature_aliases.size());
    return syntax;
}

} // namespace bricklayers
