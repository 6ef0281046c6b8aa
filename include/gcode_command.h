// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace bricklayers {

/// Place of a command in the total ordering of a job's stream (1-based line number)
using StreamPosition = uint64_t;

/**
 * @brief One command travelling along the transform chain
 */
struct StreamCommand {
    StreamPosition position = 0;
    std::string text; ///< Raw line without trailing newline

    bool operator==(const StreamCommand& o) const {
        return position == o.position && text == o.text;
    }
};

namespace gcode {

/**
 * @brief A single parameter word of a G-code line (e.g. "Z1.30")
 */
struct GCodeWord {
    char letter = '\0'; ///< Upper-case parameter letter
    double value = 0.0; ///< Parsed numeric value
    size_t begin = 0;   ///< Offset of the value text in the raw line
    size_t end = 0;     ///< One past the last character of the value text
};

/**
 * @brief Lightweight view of one raw G-code line
 *
 * Only what the transform needs is extracted: the command word, the numeric
 * parameter words with their byte spans, and the comment. The raw text is kept
 * so that untouched lines can be re-emitted byte-for-byte and rewritten lines
 * differ only in the replaced values.
 *
 * @code
 * auto cmd = GCodeCommand::parse("G1 X10 Z1.30 E0.45 ; inner");
 * if (cmd.is_motion()) {
 *     std::string out = cmd.with_values({{'Z', 1.4}, {'E', 0.4725}});
 *     // "G1 X10 Z1.4 E0.4725 ; inner"
 * }
 * @endcode
 */
class GCodeCommand {
  public:
    enum class Kind {
        EMPTY,   ///< Blank line
        COMMENT, ///< Comment-only line (markers live here)
        MOTION,  ///< G0/G1/G2/G3
        OTHER,   ///< Mode switches, macros, anything else
    };

    /**
     * @brief Parse a raw line
     *
     * Never throws. A motion line with a non-numeric parameter is returned
     * with is_malformed() set.
     */
    static GCodeCommand parse(const std::string& raw);

    /// Cheap motion check without building a command (no allocation)
    static bool is_motion_line(const std::string& raw);

    Kind kind() const {
        return kind_;
    }
    bool is_motion() const {
        return kind_ == Kind::MOTION;
    }
    bool is_malformed() const {
        return malformed_;
    }

    const std::string& raw() const {
        return raw_;
    }

    /// Upper-case command word ("G1", "M83", "SET_PRINT_STATS_INFO"); empty for comments
    const std::string& command() const {
        return command_;
    }

    /// Comment text after ';' (without the ';'), empty if none
    const std::string& comment() const {
        return comment_;
    }

    const std::vector<GCodeWord>& words() const {
        return words_;
    }

    bool has_param(char letter) const;
    std::optional<double> get_param(char letter) const;

    /**
     * @brief Produce the line with selected parameter values replaced
     *
     * Only the value spans of the given letters change; letters not present in
     * the line are ignored (values are never injected).
     */
    std::string with_values(const std::map<char, double>& overrides) const;

    /// Render a number the way rewritten words are emitted (6 decimals, trailing zeros trimmed)
    static std::string format_number(double value);

  private:
    std::string raw_;
    std::string command_;
    std::string comment_;
    std::vector<GCodeWord> words_;
    Kind kind_ = Kind::EMPTY;
    bool malformed_ = false;
};

/// Strip leading/trailing whitespace (space, tab, CR, LF)
std::string trim(const std::string& s);

} // namespace gcode
} // namespace bricklayers
