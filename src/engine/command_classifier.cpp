// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "command_classifier.h"

#include <spdlog/spdlog.h>

#include <cctype>
#include <optional>

namespace bricklayers {

namespace {

size_t first_non_space(const std::string& line) {
    size_t pos = 0;
    while (pos < line.size() && (line[pos] == ' ' || line[pos] == '\t')) {
        pos++;
    }
    return pos;
}

bool has_prefix_at(const std::string& line, size_t pos, const std::string& prefix) {
    return !prefix.empty() && line.size() - pos >= prefix.size() &&
           line.compare(pos, prefix.size(), prefix) == 0;
}

/// true for M82 (absolute E), false for M83 (relative E), nullopt for anything else
std::optional<bool> extrusion_mode_switch(const std::string& line) {
    size_t pos = first_non_space(line);
    if (pos >= line.size() || std::toupper(static_cast<unsigned char>(line[pos])) != 'M') {
        return std::nullopt;
    }
    pos++;
    while (pos < line.size() && line[pos] == '0') {
        pos++;
    }
    if (line.size() - pos < 2 || line[pos] != '8' ||
        (line[pos + 1] != '2' && line[pos + 1] != '3')) {
        return std::nullopt;
    }
    bool absolute = line[pos + 1] == '2';
    pos += 2;
    if (pos < line.size() && std::isdigit(static_cast<unsigned char>(line[pos]))) {
        return std::nullopt;
    }
    return absolute;
}

} // namespace

CommandClassifier::CommandClassifier(MarkerSyntax syntax) : syntax_(std::move(syntax)) {}

MarkerKind CommandClassifier::match_marker(const std::string& line, FeatureTag* tag,
                                           std::string* raw_tag) const {
    size_t start = first_non_space(line);
    if (start >= line.size()) {
        return MarkerKind::NONE;
    }

    for (const auto& prefix : syntax_.layer_change_prefixes) {
        if (has_prefix_at(line, start, prefix)) {
            return MarkerKind::LAYER_CHANGE;
        }
    }

    for (const auto& prefix : syntax_.feature_type_prefixes) {
        if (!has_prefix_at(line, start, prefix)) {
            continue;
        }
        std::string text = gcode::trim(line.substr(start + prefix.size()));
        if (text.empty()) {
            return MarkerKind::MALFORMED;
        }
        if (tag) {
            *tag = syntax_.map_feature(text);
        }
        if (raw_tag) {
            *raw_tag = text;
        }
        return MarkerKind::FEATURE_TYPE;
    }

    return MarkerKind::NONE;
}

LayerState CommandClassifier::advance(const LayerState& state, const std::string& line,
                                      MarkerKind* kind) const {
    FeatureTag tag = FeatureTag::UNKNOWN;
    MarkerKind marker = match_marker(line, &tag);
    if (kind) {
        *kind = marker;
    }

    LayerState next = state;
    switch (marker) {
    case MarkerKind::NONE:
        if (auto absolute = extrusion_mode_switch(line)) {
            if (*absolute != state.absolute_extrusion) {
                spdlog::debug("[CommandClassifier] {} extrusion on layer {}",
                              *absolute ? "Absolute" : "Relative", state.layer_index);
            }
            next.absolute_extrusion = *absolute;
        }
        break;

    case MarkerKind::LAYER_CHANGE:
        next.layer_index = state.layer_index + 1;
        next.perimeter_depth = 0;
        next.in_inner_loop = false;
        spdlog::trace("[CommandClassifier] Layer {} -> {}", state.layer_index, next.layer_index);
        break;

    case MarkerKind::FEATURE_TYPE:
        next.feature_tag = tag;
        if (tag == FeatureTag::INNER_WALL) {
            if (!state.in_inner_loop) {
                next.perimeter_depth = state.perimeter_depth + 1;
            }
            next.in_inner_loop = true;
        } else {
            if (tag == FeatureTag::EXTERNAL_WALL) {
                next.perimeter_depth = 0;
            }
            next.in_inner_loop = false;
        }
        spdlog::trace("[CommandClassifier] Feature {} (depth {}) on layer {}",
                      feature_tag_name(tag), next.perimeter_depth, next.layer_index);
        break;

    case MarkerKind::MALFORMED:
        spdlog::debug("[CommandClassifier] {}", BrickError::marker_parse(line).message);
        break;
    }
    return next;
}

LayerState CommandClassifier::advance(const LayerState& state, const gcode::GCodeCommand& command,
                                      MarkerKind* kind) const {
    return advance(state, command.raw(), kind);
}

} // namespace bricklayers
