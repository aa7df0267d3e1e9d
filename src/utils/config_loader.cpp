/**
 * @file config_loader.cpp
 * @brief Configuration file loading
 */

#include "utils/config_loader.h"
#include "utils/logger.h"

#include <nlohmann/json.hpp>
#include <fstream>
#include <filesystem>

namespace hud_advisor {

using json = nlohmann::json;

namespace {

const char* logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:   return "debug";
        case LogLevel::INFO:    return "info";
        case LogLevel::WARNING: return "warning";
        case LogLevel::ERROR:   return "error";
    }
    return "info";
}

json detectorToJson(const detect::ControlDetectorConfig& d) {
    json j;
    j["band_top_frac"] = d.bandTopFrac;
    j["primary_x_begin_frac"] = d.primaryXBeginFrac;
    j["primary_x_end_frac"] = d.primaryXEndFrac;
    j["secondary_x_begin_frac"] = d.secondaryXBeginFrac;
    j["secondary_x_end_frac"] = d.secondaryXEndFrac;
    j["sample_step"] = d.sampleStep;
    j["primary_min_r"] = d.primaryMinR;
    j["primary_max_g"] = d.primaryMaxG;
    j["primary_max_b"] = d.primaryMaxB;
    j["secondary_min_b"] = d.secondaryMinB;
    j["secondary_max_r"] = d.secondaryMaxR;
    j["secondary_blue_margin"] = d.secondaryBlueMargin;
    j["primary_density_threshold"] = d.primaryDensityThreshold;
    j["secondary_density_threshold"] = d.secondaryDensityThreshold;
    j["grid_cols"] = d.gridCols;
    j["grid_rows"] = d.gridRows;
    j["cell_density_threshold"] = d.cellDensityThreshold;
    return j;
}

void detectorFromJson(const json& j, detect::ControlDetectorConfig& d) {
    d.bandTopFrac = j.value("band_top_frac", d.bandTopFrac);
    d.primaryXBeginFrac = j.value("primary_x_begin_frac", d.primaryXBeginFrac);
    d.primaryXEndFrac = j.value("primary_x_end_frac", d.primaryXEndFrac);
    d.secondaryXBeginFrac = j.value("secondary_x_begin_frac", d.secondaryXBeginFrac);
    d.secondaryXEndFrac = j.value("secondary_x_end_frac", d.secondaryXEndFrac);
    d.sampleStep = j.value("sample_step", d.sampleStep);
    d.primaryMinR = j.value("primary_min_r", d.primaryMinR);
    d.primaryMaxG = j.value("primary_max_g", d.primaryMaxG);
    d.primaryMaxB = j.value("primary_max_b", d.primaryMaxB);
    d.secondaryMinB = j.value("secondary_min_b", d.secondaryMinB);
    d.secondaryMaxR = j.value("secondary_max_r", d.secondaryMaxR);
    d.secondaryBlueMargin = j.value("secondary_blue_margin", d.secondaryBlueMargin);
    d.primaryDensityThreshold = j.value("primary_density_threshold", d.primaryDensityThreshold);
    d.secondaryDensityThreshold = j.value("secondary_density_threshold", d.secondaryDensityThreshold);
    d.gridCols = j.value("grid_cols", d.gridCols);
    d.gridRows = j.value("grid_rows", d.gridRows);
    d.cellDensityThreshold = j.value("cell_density_threshold", d.cellDensityThreshold);
}

json triggerToJson(const detect::ControlTriggerConfig& t) {
    json j;
    j["appear_confirm_frames"] = t.appearConfirmFrames;
    j["disappear_confirm_frames"] = t.disappearConfirmFrames;
    return j;
}

void triggerFromJson(const json& j, detect::ControlTriggerConfig& t) {
    t.appearConfirmFrames = j.value("appear_confirm_frames", t.appearConfirmFrames);
    t.disappearConfirmFrames = j.value("disappear_confirm_frames", t.disappearConfirmFrames);
}

json engineToJson(const engine::EngineConfig& e) {
    json j;
    j["exit_window_ms"] = e.exitWindowMs;
    j["exit_confirmations"] = e.exitConfirmations;
    j["entry_confirmations_confident"] = e.entryConfirmationsConfident;
    j["entry_confirmations_low"] = e.entryConfirmationsLow;
    j["pixel_escape_threshold"] = e.pixelEscapeThreshold;
    j["ready_on_control_while_waiting"] = e.readyOnControlWhileWaiting;
    return j;
}

void engineFromJson(const json& j, engine::EngineConfig& e) {
    e.exitWindowMs = j.value("exit_window_ms", e.exitWindowMs);
    e.exitConfirmations = j.value("exit_confirmations", e.exitConfirmations);
    e.entryConfirmationsConfident = j.value("entry_confirmations_confident", e.entryConfirmationsConfident);
    e.entryConfirmationsLow = j.value("entry_confirmations_low", e.entryConfirmationsLow);
    e.pixelEscapeThreshold = j.value("pixel_escape_threshold", e.pixelEscapeThreshold);
    e.readyOnControlWhileWaiting = j.value("ready_on_control_while_waiting", e.readyOnControlWhileWaiting);
}

} // namespace

bool loadAdvisorConfig(const std::string& path, engine::AdvisorConfig& cfg, std::string& errorMessage) {
    errorMessage.clear();
    cfg = engine::AdvisorConfig{};

    std::ifstream file(path);
    if (!file.good()) {
        errorMessage = "Cannot open config file: " + path;
        return false;
    }

    engine::AdvisorConfig loaded;
    try {
        json config = json::parse(file);
        if (!config.is_object()) {
            errorMessage = "Config root is not an object: " + path;
            return false;
        }

        if (config.contains("detector") && config["detector"].is_object()) {
            detectorFromJson(config["detector"], loaded.detector);
        }
        if (config.contains("trigger") && config["trigger"].is_object()) {
            triggerFromJson(config["trigger"], loaded.trigger);
        }
        if (config.contains("engine") && config["engine"].is_object()) {
            engineFromJson(config["engine"], loaded.engine);
        }
        if (config.contains("log_level")) {
            const std::string name = config["log_level"].get<std::string>();
            if (!parseLogLevel(name, loaded.logLevel)) {
                errorMessage = "Unknown log_level: " + name;
                return false;
            }
        }
    } catch (const std::exception& e) {
        errorMessage = std::string("Error parsing config: ") + e.what();
        return false;
    }

    cfg = loaded;
    return true;
}

engine::AdvisorConfig loadAdvisorConfig(const std::string& path) {
    engine::AdvisorConfig cfg;
    std::string err;
    if (!loadAdvisorConfig(path, cfg, err)) {
        logError(err + " (using defaults)");
    }
    return cfg;
}

bool writeAdvisorConfig(const std::string& path, const engine::AdvisorConfig& cfg, std::string& errorMessage) {
    errorMessage.clear();

    json config = json::object();

    // Load existing file if present.
    {
        std::ifstream in(path);
        if (in.good()) {
            try {
                config = json::parse(in);
            } catch (const std::exception& e) {
                errorMessage = std::string("Error parsing config: ") + e.what();
                return false;
            }
        }
    }

    if (!config.is_object()) {
        config = json::object();
    }

    config["log_level"] = logLevelName(cfg.logLevel);
    config["detector"] = detectorToJson(cfg.detector);
    config["trigger"] = triggerToJson(cfg.trigger);
    config["engine"] = engineToJson(cfg.engine);

    try {
        std::filesystem::path p(path);
        if (p.has_parent_path()) {
            std::error_code ec;
            std::filesystem::create_directories(p.parent_path(), ec);
        }

        std::ofstream out(path, std::ios::trunc);
        if (!out.good()) {
            errorMessage = "Cannot open config for writing: " + path;
            return false;
        }
        out << config.dump(2) << std::endl;
    } catch (const std::exception& e) {
        errorMessage = std::string("Error writing config: ") + e.what();
        return false;
    }

    return true;
}

} // namespace hud_advisor
