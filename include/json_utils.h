// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace bricklayers::json_util {

/// Lower-cased copy, for keyword comparisons
inline std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

/// Interpret a JSON value as a boolean. Accepts bools, 0/1 and the usual words.
inline std::optional<bool> as_bool(const nlohmann::json& v) {
    if (v.is_boolean()) {
        return v.get<bool>();
    }
    if (v.is_number_integer()) {
        auto n = v.get<long long>();
        if (n == 0 || n == 1) {
            return n == 1;
        }
        return std::nullopt;
    }
    if (v.is_string()) {
        std::string s = to_lower(v.get<std::string>());
        if (s == "true" || s == "1" || s == "yes" || s == "on") {
            return true;
        }
        if (s == "false" || s == "0" || s == "no" || s == "off") {
            return false;
        }
    }
    return std::nullopt;
}

/// Interpret a JSON value as a finite double. Numeric strings are accepted.
inline std::optional<double> as_double(const nlohmann::json& v) {
    double out = 0.0;
    if (v.is_number()) {
        out = v.get<double>();
    } else if (v.is_string()) {
        const std::string s = v.get<std::string>();
        if (s.empty()) {
            return std::nullopt;
        }
        char* endptr = nullptr;
        out = std::strtod(s.c_str(), &endptr);
        if (endptr == nullptr || *endptr != '\0') {
            return std::nullopt;
        }
    } else {
        return std::nullopt;
    }
    if (!std::isfinite(out)) {
        return std::nullopt;
    }
    return out;
}

/// Interpret a JSON value as a non-negative integer. Numeric strings are accepted.
inline std::optional<long long> as_integer(const nlohmann::json& v) {
    if (v.is_number_integer()) {
        return v.get<long long>();
    }
    if (v.is_number_float()) {
        double d = v.get<double>();
        if (std::isfinite(d) && std::floor(d) == d) {
            return static_cast<long long>(d);
        }
        return std::nullopt;
    }
    if (v.is_string()) {
        const std::string s = v.get<std::string>();
        if (s.empty()) {
            return std::nullopt;
        }
        char* endptr = nullptr;
        long long n = std::strtoll(s.c_str(), &endptr, 10);
        if (endptr == nullptr || *endptr != '\0') {
            return std::nullopt;
        }
        return n;
    }
    return std::nullopt;
}

/// Safely extract a string from a JSON field that may be missing or null
inline std::string safe_string(const nlohmann::json& j, const char* key,
                               const std::string& def = "") {
    if (!j.is_object() || !j.contains(key) || j[key].is_null()) {
        return def;
    }
    const auto& v = j[key];
    if (v.is_string()) {
        return v.get<std::string>();
    }
    return def;
}

} // namespace bricklayers::json_util
