// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "config.h"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iomanip>

namespace fs = std::filesystem;

namespace bricklayers {

namespace {

/// Default logging section
json get_default_logging_config() {
    return {{"level", "info"}, {"target", "console"}, {"file", ""}};
}

/// Ensure @p section exists at top level and carries every key of @p defaults
/// @return true if anything was added
bool ensure_section(json& data, const char* section, const json& defaults) {
    bool modified = false;
    if (!data.contains(section) || !data[section].is_object()) {
        if (data.contains(section)) {
            spdlog::warn("[Config] /{} is not an object, replacing with defaults", section);
        }
        data[section] = defaults;
        return true;
    }

    auto& target = data[section];
    for (auto& [key, value] : defaults.items()) {
        if (!target.contains(key)) {
            target[key] = value;
            modified = true;
        }
    }
    return modified;
}

/// Like ensure_section(), but a key given under an alias name counts as present
bool ensure_brick_layers_section(json& data) {
    json defaults = Configuration{}.to_json();
    if (data.contains("brick_layers") && data["brick_layers"].is_object()) {
        for (auto& [key, value] : data["brick_layers"].items()) {
            std::string canonical = canonical_parameter_name(key);
            if (canonical != key) {
                defaults.erase(canonical);
            }
        }
    }
    return ensure_section(data, "brick_layers", defaults);
}

} // namespace

json Config::default_document() {
    return {{"brick_layers", Configuration{}.to_json()},
            {"markers", MarkerSyntax{}.to_json()},
            {"logging", get_default_logging_config()}};
}

bool Config::fill_defaults() {
    bool modified = false;
    modified |= ensure_brick_layers_section(data);
    modified |= ensure_section(data, "markers", MarkerSyntax{}.to_json());
    modified |= ensure_section(data, "logging", get_default_logging_config());
    return modified;
}

void Config::init(const std::string& config_path) {
    path = config_path;
    bool config_modified = false;

    std::error_code ec;
    if (fs::exists(config_path, ec)) {
        spdlog::info("[Config] Loading config from {}", config_path);
        std::string parse_error;
        try {
            std::ifstream in(config_path);
            data = json::parse(in);
            if (!data.is_object()) {
                parse_error = "top level is not an object";
            }
        } catch (const json::exception& e) {
            parse_error = e.what();
        }

        if (!parse_error.empty()) {
            spdlog::error("[Config] Failed to parse {}: {}", config_path, parse_error);
            spdlog::warn("[Config] Config file is corrupt, resetting to defaults");

            // Keep the corrupt file for diagnosis
            std::string backup_path = config_path + ".corrupt";
            if (std::rename(config_path.c_str(), backup_path.c_str()) == 0) {
                spdlog::info("[Config] Corrupt config backed up to {}", backup_path);
            } else {
                spdlog::warn("[Config] Could not back up corrupt config to {}", backup_path);
            }

            data = default_document();
            config_modified = true;
        }
    } else {
        spdlog::info("[Config] Creating default config at {}", config_path);
        fs::path config_dir = fs::path(config_path).parent_path();
        if (!config_dir.empty() && !fs::exists(config_dir, ec)) {
            fs::create_directories(config_dir, ec);
            if (ec) {
                spdlog::warn("[Config] Could not create {}: {}", config_dir.string(),
                             ec.message());
            }
        }
        data = default_document();
        config_modified = true;
    }

    if (fill_defaults()) {
        config_modified = true;
    }

    if (config_modified) {
        if (save()) {
            spdlog::debug("[Config] Saved updated config to {}", config_path);
        }
    }

    spdlog::debug("[Config] initialized: enabled={}, start_layer={}",
                  get<bool>("/brick_layers/enabled", false),
                  get<int>("/brick_layers/start_layer", 0));
}

void Config::load_json(const json& document) {
    path.clear();
    data = document.is_object() ? document : json::object();
    fill_defaults();
}

json& Config::get_json(const std::string& json_path) {
    return data[json::json_pointer(json_path)];
}

bool Config::save() {
    if (path.empty()) {
        spdlog::warn("[Config] No file backing this config, nothing saved");
        return false;
    }

    spdlog::trace("[Config] Saving config to {}", path);

    // Write to a temp file first so a failed write never leaves a half file behind
    std::string tmp_path = path + ".tmp";
    {
        std::ofstream o(tmp_path);
        if (!o.is_open()) {
            spdlog::error("[Config] Failed to open config file for writing: {}", tmp_path);
            return false;
        }

        o << std::setw(2) << data << std::endl;

        if (!o.good()) {
            spdlog::error("[Config] Error writing to config file: {}", tmp_path);
            return false;
        }
    }

    std::error_code ec;
    fs::rename(tmp_path, path, ec);
    if (ec) {
        spdlog::error("[Config] Could not replace {}: {}", path, ec.message());
        fs::remove(tmp_path, ec);
        return false;
    }

    spdlog::trace("[Config] saved successfully to {}", path);
    return true;
}

Configuration Config::brick_layers(std::vector<BrickError>* errors) const {
    json::json_pointer ptr("/brick_layers");
    if (!data.contains(ptr)) {
        return Configuration{};
    }
    return configuration_from_json(data[ptr], errors);
}

MarkerSyntax Config::markers(std::vector<BrickError>* errors) const {
    json::json_pointer ptr("/markers");
    if (!data.contains(ptr)) {
        return MarkerSyntax{};
    }
    return marker_syntax_from_json(data[ptr], errors);
}

} // namespace bricklayers
