// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "gcode_compat_validator.h"
#include "test_helpers/gcode_test_streams.h"

#include <algorithm>

#include <catch2/catch_test_macros.hpp>

using namespace bricklayers;
using namespace bricklayers::gcode;

namespace {

CompatibilityReport analyze(const std::string& content, const MarkerSyntax& syntax = {}) {
    StringStreamSource source(content, "part.gcode");
    return analyze_compatibility(source, syntax);
}

bool has_warning(const CompatibilityReport& report, const std::string& text) {
    auto warnings = report.warnings();
    return std::any_of(warnings.begin(), warnings.end(), [&](const std::string& w) {
        return w.find(text) != std::string::npos;
    });
}

} // namespace

TEST_CASE("Compat validator - compatible slicer output", "[gcode][validator]") {
    CompatibilityReport report = analyze(test::brick_scenario_stream());

    REQUIRE(report.compatible());
    REQUIRE(report.has_inner_walls());
    REQUIRE(report.lines == 27);
    REQUIRE(report.layer_changes == 4);
    REQUIRE(report.feature_markers == 7);
    REQUIRE(report.motion_commands == 11);
    REQUIRE(report.warnings().empty());

    REQUIRE(report.features.size() == 2);
    const DetectedFeature& inner = report.features.at("Inner wall");
    REQUIRE(inner.tag == FeatureTag::INNER_WALL);
    REQUIRE(inner.occurrences == 2);
    REQUIRE(inner.first_line == 15);
    REQUIRE(report.features.at("External perimeter").first_line == 4);

    std::string text = report.format();
    REQUIRE(text.find("Analyzing: part.gcode") != std::string::npos);
    REQUIRE(text.find("G-code is compatible") != std::string::npos);
    REQUIRE(text.find("Inner wall -> inner-wall (2x, first at line 15)") != std::string::npos);
}

TEST_CASE("Compat validator - problems are reported", "[gcode][validator]") {
    SECTION("no feature markers") {
        CompatibilityReport report = analyze(test::unmarked_stream());
        REQUIRE_FALSE(report.compatible());
        REQUIRE(report.layer_changes == 5);
        REQUIRE(has_warning(report, "Missing: feature type markers"));
        REQUIRE(report.format().find("NOT compatible") != std::string::npos);
    }

    SECTION("no layer markers") {
        CompatibilityReport report = analyze(";TYPE:Inner wall\nG1 X1 E1\n");
        REQUIRE_FALSE(report.compatible());
        REQUIRE(has_warning(report, "Missing: layer change markers"));
    }

    SECTION("outer walls only") {
        CompatibilityReport report =
            analyze(";LAYER_CHANGE\n;TYPE:External perimeter\nG1 X1 E1\n");
        REQUIRE(report.compatible());
        REQUIRE_FALSE(report.has_inner_walls());
        REQUIRE(has_warning(report, "No inner walls detected"));
    }

    SECTION("tag-less markers are counted") {
        CompatibilityReport report = analyze(";LAYER_CHANGE\n;TYPE:\n;TYPE:Perimeter\n");
        REQUIRE(report.malformed_markers == 1);
        REQUIRE(report.feature_markers == 1);
        REQUIRE(has_warning(report, "1 feature markers without a tag"));
    }

    SECTION("unreadable stream is never compatible") {
        FileStreamSource source("/nonexistent/part.gcode");
        CompatibilityReport report = analyze_compatibility(source);
        REQUIRE(report.read_error.type == BrickErrorType::PRESCAN_IO);
        REQUIRE_FALSE(report.compatible());
    }
}

TEST_CASE("Compat validator - uses the configured marker syntax", "[gcode][validator]") {
    MarkerSyntax syntax;
    syntax.layer_change_prefixes = {";LAYER:"};
    std::string cura_style = ";LAYER:0\n;TYPE:WALL-INNER\nG1 X1 E1\n;LAYER:1\n";

    CompatibilityReport with_default = analyze(cura_style);
    REQUIRE_FALSE(with_default.has_layer_changes());

    CompatibilityReport with_custom = analyze(cura_style, syntax);
    REQUIRE(with_custom.layer_changes == 2);
    REQUIRE(with_custom.has_inner_walls());
    REQUIRE(with_custom.compatible());
}
