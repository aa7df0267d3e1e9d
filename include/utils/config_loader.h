#pragma once
/**
 * @file config_loader.h
 * @brief Configuration file loading utilities
 */

#include "engine/advisor_session.h"

#include <string>

namespace hud_advisor {

/**
 * @brief Load the advisor configuration from a JSON file
 *
 * Expected format (matches config/advisor_config.json):
 * {
 *   "log_level": "info",
 *   "detector": { "band_top_frac": 0.85, ... },
 *   "trigger":  { "appear_confirm_frames": 1, ... },
 *   "engine":   { "exit_window_ms": 3000, ... }
 * }
 * Every key is optional; missing keys keep the compiled-in defaults.
 *
 * @param path Path to the config file
 * @param cfg Receives the configuration (defaults on failure)
 * @param errorMessage Populated on failure
 * @return true on success
 */
bool loadAdvisorConfig(const std::string& path, engine::AdvisorConfig& cfg, std::string& errorMessage);

/**
 * @brief Load the advisor configuration, logging and falling back to defaults on error
 */
engine::AdvisorConfig loadAdvisorConfig(const std::string& path);

/**
 * @brief Write the effective configuration
 *
 * Preserves other top-level fields (e.g., "meta"). Parent directories are
 * created as needed.
 *
 * @param path Path to the config file
 * @param cfg Configuration to write
 * @param errorMessage Populated on failure
 * @return true on success
 */
bool writeAdvisorConfig(const std::string& path, const engine::AdvisorConfig& cfg, std::string& errorMessage);

} // namespace hud_advisor
