// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "gcode_command.h"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace bricklayers;
using namespace bricklayers::gcode;
using Catch::Approx;

TEST_CASE("GCodeCommand - line kinds", "[gcode][command]") {
    SECTION("empty and whitespace lines") {
        REQUIRE(GCodeCommand::parse("").kind() == GCodeCommand::Kind::EMPTY);
        REQUIRE(GCodeCommand::parse("   \t").kind() == GCodeCommand::Kind::EMPTY);
    }

    SECTION("comment-only line") {
        auto cmd = GCodeCommand::parse(";TYPE:Inner wall");
        REQUIRE(cmd.kind() == GCodeCommand::Kind::COMMENT);
        REQUIRE(cmd.comment() == "TYPE:Inner wall");
        REQUIRE(cmd.command().empty());
    }

    SECTION("motion commands") {
        REQUIRE(GCodeCommand::parse("G0 X1").is_motion());
        REQUIRE(GCodeCommand::parse("G1 X1").is_motion());
        REQUIRE(GCodeCommand::parse("G2 X1 Y1 I1 J0").is_motion());
        REQUIRE(GCodeCommand::parse("G3 X1 Y1 I1 J0").is_motion());
        REQUIRE(GCodeCommand::parse("  g01 x1").is_motion());
    }

    SECTION("non-motion commands") {
        REQUIRE(GCodeCommand::parse("G28").kind() == GCodeCommand::Kind::OTHER);
        REQUIRE(GCodeCommand::parse("G92 E0").kind() == GCodeCommand::Kind::OTHER);
        REQUIRE(GCodeCommand::parse("M83").kind() == GCodeCommand::Kind::OTHER);
        REQUIRE(GCodeCommand::parse("SET_PRINT_STATS_INFO CURRENT_LAYER=3").kind() ==
                GCodeCommand::Kind::OTHER);
    }

    SECTION("command word is normalized") {
        REQUIRE(GCodeCommand::parse("g01 X1").command() == "G1");
        REQUIRE(GCodeCommand::parse("G00").command() == "G0");
        REQUIRE(GCodeCommand::parse("m083").command() == "M83");
    }
}

TEST_CASE("GCodeCommand - parameter parsing", "[gcode][command]") {
    SECTION("parameters with comment") {
        auto cmd = GCodeCommand::parse("G1 X10.5 Y-3 Z.2 E0.45 F1800 ; perimeter");
        REQUIRE(cmd.is_motion());
        REQUIRE_FALSE(cmd.is_malformed());
        REQUIRE(cmd.words().size() == 5);
        REQUIRE(cmd.get_param('X').value() == Approx(10.5));
        REQUIRE(cmd.get_param('Y').value() == Approx(-3.0));
        REQUIRE(cmd.get_param('Z').value() == Approx(0.2));
        REQUIRE(cmd.get_param('E').value() == Approx(0.45));
        REQUIRE(cmd.get_param('F').value() == Approx(1800));
        REQUIRE(cmd.comment() == " perimeter");
    }

    SECTION("lower-case letters and packed words") {
        auto cmd = GCodeCommand::parse("G1x1y2");
        REQUIRE(cmd.get_param('X').value() == Approx(1.0));
        REQUIRE(cmd.get_param('Y').value() == Approx(2.0));
    }

    SECTION("missing parameter") {
        auto cmd = GCodeCommand::parse("G1 X1");
        REQUIRE_FALSE(cmd.has_param('Z'));
        REQUIRE_FALSE(cmd.get_param('E').has_value());
    }

    SECTION("malformed values are flagged, not repaired") {
        auto bad_value = GCodeCommand::parse("G1 Xabc");
        REQUIRE(bad_value.is_malformed());
        REQUIRE(bad_value.words().empty());

        auto bad_letter = GCodeCommand::parse("G1 X1 #5");
        REQUIRE(bad_letter.is_malformed());

        auto bad_number = GCodeCommand::parse("G1 X1-2");
        REQUIRE(bad_number.is_malformed());
    }

    SECTION("a repeated parameter letter is malformed") {
        auto repeated = GCodeCommand::parse("G1 X1 X2");
        REQUIRE(repeated.is_malformed());
        REQUIRE(repeated.words().empty());

        // The exponent reads as a second E word
        auto exponent = GCodeCommand::parse("G1 X1e-3 Y2 E0.5");
        REQUIRE(exponent.is_malformed());
        REQUIRE_FALSE(exponent.get_param('E').has_value());
        REQUIRE(exponent.with_values({{'E', 0.525}}) == "G1 X1e-3 Y2 E0.5");
    }
}

TEST_CASE("GCodeCommand - with_values rewrites only the targeted words", "[gcode][command]") {
    SECTION("Z and E replaced, everything else byte-identical") {
        auto cmd = GCodeCommand::parse("G1  X10 Y10\tZ1.30 E0.45 F1800 ; keep me");
        std::string out = cmd.with_values({{'Z', 1.4}, {'E', 0.4725}});
        REQUIRE(out == "G1  X10 Y10\tZ1.4 E0.4725 F1800 ; keep me");
    }

    SECTION("overrides for absent words change nothing") {
        auto cmd = GCodeCommand::parse("G1 X10 Y10");
        REQUIRE(cmd.with_values({{'Z', 2.0}}) == "G1 X10 Y10");
    }

    SECTION("lower-case word keeps its letter") {
        auto cmd = GCodeCommand::parse("G1 x1 e0.5");
        REQUIRE(cmd.with_values({{'E', 1.0}}) == "G1 x1 e1");
    }
}

TEST_CASE("GCodeCommand - format_number", "[gcode][command]") {
    REQUIRE(GCodeCommand::format_number(1.4) == "1.4");
    REQUIRE(GCodeCommand::format_number(1.30 + 0.1) == "1.4");
    REQUIRE(GCodeCommand::format_number(0.45 * 1.05) == "0.4725");
    REQUIRE(GCodeCommand::format_number(2.0) == "2");
    REQUIRE(GCodeCommand::format_number(-0.8) == "-0.8");
    REQUIRE(GCodeCommand::format_number(-0.0000001) == "0");
    REQUIRE(GCodeCommand::format_number(0.1234567) == "0.123457");
}

TEST_CASE("GCodeCommand - is_motion_line agrees with parse", "[gcode][command]") {
    const char* lines[] = {"G0 X1", "G1 X1",  "G01 X1", "G2 X1", "G3",    "  G1 E1", "g1 x1",
                           "G4 P10", "G10",    "G28",    "G92 E0", "M83",   ";G1",    "",
                           "GET",   "G",      "G1X1",   "G00",    "G31 X1"};
    for (const char* line : lines) {
        INFO(line);
        REQUIRE(GCodeCommand::is_motion_line(line) == GCodeCommand::parse(line).is_motion());
    }
}

TEST_CASE("trim", "[gcode][command]") {
    REQUIRE(trim("  Inner wall \r\n") == "Inner wall");
    REQUIRE(trim("") == "");
    REQUIRE(trim(" \t ") == "");
}
