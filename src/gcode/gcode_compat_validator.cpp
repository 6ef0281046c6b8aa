// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "gcode_compat_validator.h"

#include "command_classifier.h"
#include "gcode_command.h"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>

namespace bricklayers {
namespace gcode {

bool CompatibilityReport::has_inner_walls() const {
    return std::any_of(features.begin(), features.end(), [](const auto& entry) {
        return entry.second.tag == FeatureTag::INNER_WALL;
    });
}

bool CompatibilityReport::compatible() const {
    return !read_error.has_error() && has_layer_changes() && has_feature_markers();
}

std::vector<std::string> CompatibilityReport::warnings() const {
    std::vector<std::string> out;
    if (read_error.has_error()) {
        out.push_back(read_error.message);
    }
    if (!has_layer_changes()) {
        out.push_back("Missing: layer change markers");
    }
    if (!has_feature_markers()) {
        out.push_back("Missing: feature type markers");
    }
    if (has_feature_markers() && !has_inner_walls()) {
        out.push_back("No inner walls detected - check wall count in slicer");
    }
    if (malformed_markers > 0) {
        out.push_back(fmt::format("{} feature markers without a tag were ignored",
                                  malformed_markers));
    }
    return out;
}

std::string CompatibilityReport::format() const {
    std::string out;
    out += fmt::format("Analyzing: {}\n\n", source);
    out += "Validation Results:\n";
    out += fmt::format("  Layer changes found: {}\n", has_layer_changes() ? "Yes" : "No");
    out += fmt::format("  Layer count: {}\n", layer_changes);
    out += fmt::format("  Feature markers found: {}\n", has_feature_markers() ? "Yes" : "No");
    out += fmt::format("  Motion commands: {}\n", motion_commands);

    if (!features.empty()) {
        out += "\n  Detected feature types:\n";
        for (const auto& [raw, feature] : features) {
            out += fmt::format("    - {} -> {} ({}x, first at line {})\n", raw,
                               feature_tag_name(feature.tag), feature.occurrences,
                               feature.first_line);
        }
    }
    out += "\n";

    if (compatible()) {
        out += "G-code is compatible with brick layering\n";
        if (has_inner_walls()) {
            out += "Inner wall perimeters detected\n";
        }
    } else {
        out += "G-code is NOT compatible with brick layering\n";
    }
    for (const auto& warning : warnings()) {
        out += fmt::format("  {}\n", warning);
    }
    if (!compatible()) {
        out += "\n  Try slicing with PrusaSlicer or OrcaSlicer\n";
    }
    return out;
}

CompatibilityReport analyze_compatibility(GCodeStreamSource& source, const MarkerSyntax& syntax) {
    CompatibilityReport report;
    report.source = source.describe();

    CommandClassifier classifier(syntax);
    std::string line;

    while (true) {
        ReadStatus status = source.next_line(line);
        if (status == ReadStatus::END) {
            break;
        }
        if (status == ReadStatus::ERROR) {
            report.read_error = BrickError::prescan_io(source.describe(), source.error_message());
            spdlog::warn("[CompatValidator] {}", report.read_error.message);
            break;
        }
        report.lines++;

        FeatureTag tag = FeatureTag::UNKNOWN;
        std::string raw_tag;
        switch (classifier.match_marker(line, &tag, &raw_tag)) {
        case MarkerKind::LAYER_CHANGE:
            report.layer_changes++;
            break;
        case MarkerKind::FEATURE_TYPE: {
            report.feature_markers++;
            auto [it, inserted] = report.features.try_emplace(raw_tag);
            if (inserted) {
                it->second.raw_tag = raw_tag;
                it->second.tag = tag;
                it->second.first_line = report.lines;
            }
            it->second.occurrences++;
            break;
        }
        case MarkerKind::MALFORMED:
            report.malformed_markers++;
            break;
        case MarkerKind::NONE:
            if (GCodeCommand::is_motion_line(line)) {
                report.motion_commands++;
            }
            break;
        }
    }

    spdlog::debug("[CompatValidator] {}: {} lines, {} layers, {} feature markers", report.source,
                  report.lines, report.layer_changes, report.feature_markers);
    return report;
}

} // namespace gcode
} // namespace bricklayers
