// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "gcode_command.h"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace bricklayers {
namespace gcode {

namespace {

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

bool is_value_char(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) || c == '.' || c == '-' || c == '+';
}

/// "G01" -> "G1", "g1" -> "G1"; other words are only upper-cased
std::string normalize_command(const std::string& word) {
    std::string upper = word;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper.size() >= 2 && (upper[0] == 'G' || upper[0] == 'M') &&
        std::all_of(upper.begin() + 1, upper.end(),
                    [](char c) { return std::isdigit(static_cast<unsigned char>(c)); })) {
        size_t first_nonzero = upper.find_first_not_of('0', 1);
        if (first_nonzero == std::string::npos) {
            return upper.substr(0, 1) + "0";
        }
        return upper.substr(0, 1) + upper.substr(first_nonzero);
    }
    return upper;
}

bool is_motion_word(const std::string& cmd) {
    return cmd == "G0" || cmd == "G1" || cmd == "G2" || cmd == "G3";
}

} // namespace

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && is_space(s[start])) {
        start++;
    }
    size_t end = s.size();
    while (end > start && is_space(s[end - 1])) {
        end--;
    }
    return s.substr(start, end - start);
}

GCodeCommand GCodeCommand::parse(const std::string& raw) {
    GCodeCommand cmd;
    cmd.raw_ = raw;

    size_t code_end = raw.find(';');
    if (code_end != std::string::npos) {
        cmd.comment_ = raw.substr(code_end + 1);
    } else {
        code_end = raw.size();
    }

    size_t pos = 0;
    while (pos < code_end && is_space(raw[pos])) {
        pos++;
    }
    if (pos >= code_end) {
        cmd.kind_ = (code_end < raw.size()) ? Kind::COMMENT : Kind::EMPTY;
        return cmd;
    }

    // Command word: letter + digits for G/M/T codes ("G1X10" is legal), else up to whitespace
    size_t word_start = pos;
    char lead = static_cast<char>(std::toupper(static_cast<unsigned char>(raw[pos])));
    if ((lead == 'G' || lead == 'M' || lead == 'T') && pos + 1 < code_end &&
        std::isdigit(static_cast<unsigned char>(raw[pos + 1]))) {
        pos++;
        while (pos < code_end && std::isdigit(static_cast<unsigned char>(raw[pos]))) {
            pos++;
        }
    } else {
        while (pos < code_end && !is_space(raw[pos])) {
            pos++;
        }
    }
    cmd.command_ = normalize_command(raw.substr(word_start, pos - word_start));

    if (!is_motion_word(cmd.command_)) {
        cmd.kind_ = Kind::OTHER;
        return cmd;
    }
    cmd.kind_ = Kind::MOTION;

    while (pos < code_end) {
        if (is_space(raw[pos])) {
            pos++;
            continue;
        }

        char letter = raw[pos];
        if (!std::isalpha(static_cast<unsigned char>(letter))) {
            cmd.malformed_ = true;
            break;
        }
        pos++;

        size_t value_start = pos;
        while (pos < code_end && is_value_char(raw[pos])) {
            pos++;
        }
        std::string text = raw.substr(value_start, pos - value_start);
        if (text.empty()) {
            cmd.malformed_ = true;
            break;
        }

        char* endptr = nullptr;
        double value = std::strtod(text.c_str(), &endptr);
        if (endptr == nullptr || *endptr != '\0') {
            cmd.malformed_ = true;
            break;
        }

        GCodeWord word;
        word.letter = static_cast<char>(std::toupper(static_cast<unsigned char>(letter)));
        // Repeated letter is malformed ("X1e-3" reads as X1 E-3)
        if (cmd.get_param(word.letter)) {
            cmd.malformed_ = true;
            break;
        }
        word.value = value;
        word.begin = value_start;
        word.end = pos;
        cmd.words_.push_back(word);
    }

    if (cmd.malformed_) {
        spdlog::debug("[GCodeCommand] Malformed motion command: {}", raw);
        cmd.words_.clear();
    }
    return cmd;
}

bool GCodeCommand::is_motion_line(const std::string& raw) {
    size_t pos = 0;
    while (pos < raw.size() && is_space(raw[pos])) {
        pos++;
    }
    if (pos >= raw.size() || std::toupper(static_cast<unsigned char>(raw[pos])) != 'G') {
        return false;
    }
    pos++;
    while (pos < raw.size() && raw[pos] == '0') {
        pos++;
    }
    // "G0" / "G00" leave nothing but zeros behind
    if (pos >= raw.size() || !std::isdigit(static_cast<unsigned char>(raw[pos]))) {
        return raw[pos - 1] == '0';
    }
    if (raw[pos] > '3') {
        return false;
    }
    pos++;
    return pos >= raw.size() || !std::isdigit(static_cast<unsigned char>(raw[pos]));
}

bool GCodeCommand::has_param(char letter) const {
    return get_param(letter).has_value();
}

std::optional<double> GCodeCommand::get_param(char letter) const {
    for (const auto& word : words_) {
        if (word.letter == letter) {
            return word.value;
        }
    }
    return std::nullopt;
}

std::string GCodeCommand::with_values(const std::map<char, double>& overrides) const {
    std::vector<const GCodeWord*> targets;
    for (const auto& word : words_) {
        if (overrides.count(word.letter) != 0) {
            targets.push_back(&word);
        }
    }
    if (targets.empty()) {
        return raw_;
    }

    // Splice from the back so earlier offsets stay valid
    std::sort(targets.begin(), targets.end(),
              [](const GCodeWord* a, const GCodeWord* b) { return a->begin > b->begin; });

    std::string out = raw_;
    for (const GCodeWord* word : targets) {
        out.replace(word->begin, word->end - word->begin,
                    format_number(overrides.at(word->letter)));
    }
    return out;
}

std::string GCodeCommand::format_number(double value) {
    std::string text = fmt::format("{:.6f}", value);

    size_t dot = text.find('.');
    if (dot != std::string::npos) {
        size_t last = text.find_last_not_of('0');
        if (last == dot) {
            last--;
        }
        text.erase(last + 1);
    }
    if (text == "-0") {
        text = "0";
    }
    return text;
}

} // namespace gcode
} // namespace bricklayers
