// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <string>

namespace bricklayers {

/**
 * @brief Error categories reported by the brick layers engine
 *
 * None of these ever halts motion: the engine always degrades to pass-through.
 */
enum class BrickErrorType {
    NONE,                ///< No error
    CONFIGURATION,       ///< Out-of-range or malformed parameter, prior value kept
    MARKER_PARSE,        ///< Malformed marker line, ignored for classification
    PRESCAN_IO,          ///< Stream unreadable or truncated during pre-scan
    MISSING_MARKER,      ///< Feature markers required but none observed
    ABSOLUTE_EXTRUSION,  ///< Eligible moves under M82, passed through
    INVARIANT_VIOLATION, ///< Stream order broken, transformation disabled for the job
};

/**
 * @brief Error information returned by control operations and the pre-scanner
 */
struct BrickError {
    BrickErrorType type = BrickErrorType::NONE;
    std::string message;   ///< Human-readable description
    std::string parameter; ///< Parameter name (CONFIGURATION errors only)

    bool has_error() const {
        return type != BrickErrorType::NONE;
    }

    std::string get_type_string() const {
        switch (type) {
        case BrickErrorType::NONE:
            return "NONE";
        case BrickErrorType::CONFIGURATION:
            return "CONFIGURATION";
        case BrickErrorType::MARKER_PARSE:
            return "MARKER_PARSE";
        case BrickErrorType::PRESCAN_IO:
            return "PRESCAN_IO";
        case BrickErrorType::MISSING_MARKER:
            return "MISSING_MARKER";
        case BrickErrorType::ABSOLUTE_EXTRUSION:
            return "ABSOLUTE_EXTRUSION";
        case BrickErrorType::INVARIANT_VIOLATION:
            return "INVARIANT_VIOLATION";
        }
        return "UNKNOWN";
    }

    static BrickError configuration(const std::string& param, const std::string& what) {
        BrickError err;
        err.type = BrickErrorType::CONFIGURATION;
        err.parameter = param;
        err.message = param.empty() ? what : param + ": " + what;
        return err;
    }

    static BrickError marker_parse(const std::string& line) {
        BrickError err;
        err.type = BrickErrorType::MARKER_PARSE;
        err.message = "Malformed marker: " + line;
        return err;
    }

    static BrickError prescan_io(const std::string& source, const std::string& what) {
        BrickError err;
        err.type = BrickErrorType::PRESCAN_IO;
        err.message = "Pre-scan of " + source + " failed: " + what;
        return err;
    }

    static BrickError missing_marker() {
        BrickError err;
        err.type = BrickErrorType::MISSING_MARKER;
        err.message = "No feature-type markers found; transformation disabled for this job";
        return err;
    }

    static BrickError absolute_extrusion() {
        BrickError err;
        err.type = BrickErrorType::ABSOLUTE_EXTRUSION;
        err.message = "Absolute extrusion (M82) in effect; inner walls left untransformed";
        return err;
    }

    static BrickError invariant_violation(const std::string& what) {
        BrickError err;
        err.type = BrickErrorType::INVARIANT_VIOLATION;
        err.message = what;
        return err;
    }
};

} // namespace bricklayers
