// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef __BRICKLAYERS_CONFIG_H__
#define __BRICKLAYERS_CONFIG_H__

#include "brick_config.h"
#include "brick_error.h"

#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace bricklayers {

using json = nlohmann::json;

/**
 * @brief JSON configuration file for the brick layers engine and its host tools
 *
 * Uses JSON pointer syntax (RFC 6901) for nested value access. Layout:
 *
 * ```json
 * {
 *   "brick_layers": { "enabled": false, "z_offset_magnitude": 0.1, ... },
 *   "markers":      { "layer_change": [";LAYER_CHANGE"], ... },
 *   "logging":      { "level": "info", "target": "console", "file": "" }
 * }
 * ```
 *
 * Thread safety: not thread-safe. Load once at startup, then hand the typed
 * Configuration / MarkerSyntax to the engine.
 *
 * Example usage:
 * ```cpp
 * Config cfg;
 * cfg.init("/etc/bricklayers.json");
 * double z = cfg.get<double>("/brick_layers/z_offset_magnitude", 0.1);
 * cfg.set<bool>("/brick_layers/enabled", true);
 * cfg.save();
 * ```
 */
class Config {
  public:
    Config() = default;

    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    /**
     * @brief Load configuration from file
     *
     * Creates the file with defaults if it doesn't exist. A file that fails to
     * parse is renamed to `<path>.corrupt` and replaced with defaults. Missing
     * sections are filled in and written back.
     *
     * @param config_path Path to JSON configuration file
     */
    void init(const std::string& config_path);

    /**
     * @brief Load configuration from an in-memory document (no file backing)
     */
    void load_json(const json& document);

    /**
     * @brief Get configuration value at JSON pointer path
     *
     * @throws nlohmann::json::exception if path not found
     */
    template <typename T> T get(const std::string& json_ptr) const {
        return data.at(json::json_pointer(json_ptr)).template get<T>();
    }

    /**
     * @brief Get configuration value with default fallback
     */
    template <typename T> T get(const std::string& json_ptr, const T& default_value) const {
        json::json_pointer ptr(json_ptr);
        if (data.contains(ptr)) {
            try {
                return data[ptr].template get<T>();
            } catch (const json::exception& e) {
                spdlog::warn("[Config] {} has wrong type ({}), using default", json_ptr, e.what());
            }
        }
        return default_value;
    }

    /**
     * @brief Set configuration value at JSON pointer path
     *
     * Creates intermediate objects. In-memory only until save().
     */
    template <typename T> T set(const std::string& json_ptr, T v) {
        data[json::json_pointer(json_ptr)] = v;
        return v;
    }

    /// Mutable sub-object at path
    json& get_json(const std::string& json_path);

    /// Whole document
    const json& document() const {
        return data;
    }

    /**
     * @brief Write the configuration back to its file
     * @return false if the file could not be written
     */
    bool save();

    std::string get_path() const {
        return path;
    }

    /**
     * @brief Typed engine configuration from `/brick_layers`
     *
     * Invalid entries are skipped (defaults stay) and reported in @p errors.
     */
    Configuration brick_layers(std::vector<BrickError>* errors = nullptr) const;

    /// Typed marker syntax from `/markers`
    MarkerSyntax markers(std::vector<BrickError>* errors = nullptr) const;

    /// Default document written for a new configuration file
    static json default_document();

  private:
    /// Add missing top-level sections and keys; returns true if anything changed
    bool fill_defaults();

    std::string path;
    json data = json::object();

};

} // namespace bricklayers

#endif // __BRICKLAYERS_CONFIG_H__
