// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "gcode_command.h"

#include <sstream>
#include <string>
#include <vector>

namespace bricklayers {
namespace test {

/**
 * @brief Five-layer stream: preamble plus layers 1-4 (layer index = markers seen)
 *
 * Layers 0-2 only have external perimeters. Layers 3 and 4 open with an inner
 * wall carrying "G1 X10 Y10 Z1.30 E0.45", followed by an external perimeter
 * and a travel move.
 */
inline std::string brick_scenario_stream() {
    std::string s;
    s += "; generated by PrusaSlicer 2.7.1\n";
    s += "M83 ; relative extrusion\n";
    s += "G28\n";
    s += ";TYPE:External perimeter\n";
    s += "G1 X5 Y5 Z0.2 E0.3\n";
    for (int layer = 1; layer <= 2; ++layer) {
        s += ";LAYER_CHANGE\n";
        s += ";Z:" + std::to_string(layer) + "\n";
        s += ";TYPE:External perimeter\n";
        s += "G1 X5 Y5 Z0.6 E0.3\n";
    }
    for (int layer = 3; layer <= 4; ++layer) {
        s += ";LAYER_CHANGE\n";
        s += ";TYPE:Inner wall\n";
        s += "G1 X10 Y10 Z1.30 E0.45\n";
        s += "G1 X20 Y10 E0.45 F1800\n";
        s += ";TYPE:External perimeter\n";
        s += "G1 X20 Y20 E0.45\n";
        s += "G0 X0 Y0\n";
    }
    return s;
}

/// Same layout as brick_scenario_stream() but without any ;TYPE: marker
inline std::string unmarked_stream() {
    std::string s;
    s += "M83\n";
    for (int layer = 1; layer <= 5; ++layer) {
        s += ";LAYER_CHANGE\n";
        s += "G1 X10 Y10 Z" + std::to_string(layer) + ".0 E0.45\n";
        s += "G1 X20 Y10 E0.45\n";
    }
    return s;
}

/**
 * @brief Longer stream exercising depth changes, infill and layers without inner walls
 */
inline std::string mixed_feature_stream(int layers = 12) {
    std::ostringstream s;
    s << "M83\n";
    for (int layer = 1; layer <= layers; ++layer) {
        s << ";LAYER_CHANGE\n";
        s << ";Z:" << layer * 0.2 << "\n";
        if (layer % 5 == 0) {
            // Top/bottom-style layer: no inner walls at all
            s << ";TYPE:Solid infill\n";
            s << "G1 X1 Y1 Z" << layer * 0.2 << " E0.2\n";
            continue;
        }
        s << ";TYPE:Perimeter\n";
        s << "G1 X1 Y1 Z" << layer * 0.2 << " E0.2\n";
        s << "G1 X2 Y1 E0.2\n";
        s << ";TYPE:External perimeter\n";
        s << "G1 X3 Y1 E0.2\n";
        s << ";TYPE:Perimeter\n";
        s << "G1 X4 Y1 E0.2\n";
        s << ";TYPE:Internal infill\n";
        s << "G1 X5 Y1 E0.2\n";
        s << "G1 X6 Y1\n";
    }
    return s.str();
}

/**
 * @brief Layer 1 printed with absolute extrusion, layer 2 after switching back to M83
 *
 * With start_layer = 1 the inner wall at line 4 is skipped and the one at
 * line 10 is the first transformed move.
 */
inline std::string extrusion_mode_stream() {
    std::string s;
    s += "M82 ; absolute extrusion\n";
    s += ";LAYER_CHANGE\n";
    s += ";TYPE:Inner wall\n";
    s += "G1 X1 Y1 E1500.20\n";
    s += ";TYPE:External perimeter\n";
    s += "G1 X3 Y1 E1500.60\n";
    s += "M83\n";
    s += ";LAYER_CHANGE\n";
    s += ";TYPE:Inner wall\n";
    s += "G1 X1 Y1 Z0.6 E0.45\n";
    return s;
}

/// Split into stream commands numbered from 1
inline std::vector<StreamCommand> to_commands(const std::string& content) {
    std::vector<StreamCommand> out;
    std::istringstream in(content);
    std::string line;
    StreamPosition position = 0;
    while (std::getline(in, line)) {
        out.push_back(StreamCommand{++position, line});
    }
    return out;
}

/// Text of the command at 1-based @p position
inline const std::string& line_at(const std::vector<StreamCommand>& commands,
                                  StreamPosition position) {
    return commands.at(static_cast<size_t>(position - 1)).text;
}

} // namespace test
} // namespace bricklayers
