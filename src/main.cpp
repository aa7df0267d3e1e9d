/**
 * @file main.cpp
 * @brief Table HUD advisor - command-line entry point
 *
 * Offline driver for the advisor core: classify a response file, run the
 * control detector on a screenshot, or replay a scripted session of frames,
 * responses and control events through the reconciliation engine.
 */

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "detection/control_detector.h"
#include "detection/field_parser.h"
#include "engine/advisor_session.h"
#include "types.h"
#include "utils/config_loader.h"
#include "utils/image_loader.h"
#include "utils/logger.h"
#include "utils/timer.h"

namespace fs = std::filesystem;

using namespace hud_advisor;
using json = nlohmann::json;

// One emitted state of a replay, for structured output
struct StateEntry {
    double tMs = 0.0;
    UiState state;
};

static std::string resolvePathWithFallbacks(const std::string& path) {
    if (path.empty()) return path;
    if (fs::exists(path)) return path;

    // Common when running from build/.
    const std::string up1 = std::string("../") + path;
    if (fs::exists(up1)) return up1;

    const std::string up2 = std::string("../../") + path;
    if (fs::exists(up2)) return up2;

    return path;
}

static bool readTextFile(const std::string& path, std::string& out, std::string& err) {
    std::ifstream in(path, std::ios::binary);
    if (!in.good()) {
        err = "Cannot open file: " + path;
        return false;
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    out = ss.str();
    return true;
}

static json fieldsToJson(const ResponseFields& f) {
    json j;
    j["hand"] = f.hand;
    j["board"] = f.board;
    j["stage"] = f.stage;
    j["position"] = f.position;
    j["pot"] = f.pot;
    j["amount_to_call"] = f.amountToCall;
    j["pot_odds"] = f.potOdds;
    j["spr"] = f.stackToPotRatio;
    j["rationale"] = f.rationale;
    j["raise_size"] = f.raiseSize;
    j["predicted_action"] = f.predictedAction;
    j["predicted_raise_size"] = f.predictedRaiseSize;
    j["confidence"] = toString(f.confidence);
    j["issue"] = f.issue;
    return j;
}

static json stateToJson(const UiState& s) {
    json j;
    j["phase"] = toString(s.phase);
    j["acting_kind"] = toString(s.actingKind);
    j["display"] = s.display;
    j["fields"] = fieldsToJson(s.pinnedFields);
    return j;
}

static json pixelToJson(const PixelSignal& p) {
    json j;
    j["primary"] = p.primaryControlPresent;
    j["secondary"] = p.secondaryControlPresent;
    j["density"] = p.density;
    j["secondary_density"] = p.secondaryDensity;
    j["confidence"] = toString(p.confidence);
    return j;
}

static bool writeJsonFile(const std::string& path, const json& doc) {
    try {
        fs::path p(path);
        if (p.has_parent_path()) {
            std::error_code ec;
            fs::create_directories(p.parent_path(), ec);
        }
        std::ofstream out(path, std::ios::trunc);
        if (!out.good()) return false;
        out << doc.dump(2) << std::endl;
        return out.good();
    } catch (const std::exception& e) {
        logError(std::string("Error writing JSON: ") + e.what());
        return false;
    }
}

static void printFields(const ResponseFields& f) {
    auto line = [](const char* name, const std::string& value) {
        if (!value.empty()) std::cout << "  " << std::left << std::setw(16) << name << value << "\n";
    };
    line("hand:", f.hand);
    line("board:", f.board);
    line("stage:", f.stage);
    line("position:", f.position);
    line("pot:", f.pot);
    line("to call:", f.amountToCall);
    line("odds:", f.potOdds);
    line("spr:", f.stackToPotRatio);
    line("raise size:", f.raiseSize);
    line("predicted:", f.predictedAction);
    line("predicted size:", f.predictedRaiseSize);
    line("analysis:", f.rationale);
    std::cout << "  " << std::left << std::setw(16) << "consistency:" << toString(f.confidence);
    if (!f.issue.empty()) std::cout << " (" << f.issue << ")";
    std::cout << "\n";
}

static void printSignal(const PixelSignal& s) {
    std::cout << std::fixed << std::setprecision(4)
              << "  primary:   " << (s.primaryControlPresent ? "present" : "absent")
              << "  (density " << s.density << ")\n"
              << "  secondary: " << (s.secondaryControlPresent ? "present" : "absent")
              << "  (density " << s.secondaryDensity << ")\n"
              << "  confidence: " << toString(s.confidence) << "\n";
}

static PixelSignal pixelFromJson(const json& j) {
    PixelSignal s;
    s.primaryControlPresent = j.value("primary", false);
    s.secondaryControlPresent = j.value("secondary", false);
    s.density = j.value("density", 0.0f);
    s.secondaryDensity = j.value("secondary_density", 0.0f);
    s.confidence = confidenceFor(s.primaryControlPresent, s.secondaryControlPresent);
    return s;
}

static int runParse(const std::string& path, const std::string& jsonOutput) {
    std::string textIn;
    std::string err;
    if (!readTextFile(resolvePathWithFallbacks(path), textIn, err)) {
        logError(err);
        return 1;
    }

    detect::FieldParser parser;
    double parseMs = 0.0;
    ClassifiedResponse r;
    {
        SCOPE_TIMER(parseMs);
        r = parser.parse(textIn);
    }

    std::cout << "Response: " << path << "\n"
              << "  action:         " << toString(r.actionKind) << "\n"
              << "  display:        " << r.displayText << "\n";
    printFields(r.fields);
    std::cout << "  parse time:     " << std::fixed << std::setprecision(3) << parseMs << " ms\n";

    if (!jsonOutput.empty()) {
        json doc;
        doc["source"] = path;
        doc["action"] = toString(r.actionKind);
        doc["display"] = r.displayText;
        doc["fields"] = fieldsToJson(r.fields);
        doc["parse_ms"] = parseMs;
        if (!writeJsonFile(jsonOutput, doc)) {
            logError("Failed to write JSON output: " + jsonOutput);
            return 1;
        }
        std::cout << "JSON output written to: " << jsonOutput << "\n";
    }
    return 0;
}

static int runDetect(const std::string& path, const engine::AdvisorConfig& cfg, const std::string& jsonOutput) {
    Frame frame;
    std::string err;
    if (!loadFrameBGRA(resolvePathWithFallbacks(path), frame, err)) {
        logError(err);
        return 1;
    }

    detect::ControlDetector detector(cfg.detector);
    double detectMs = 0.0;
    PixelSignal s;
    {
        SCOPE_TIMER(detectMs);
        s = detector.detect(frame.view());
    }

    const detect::ControlRegions regions = detector.regionsFor(frame.width, frame.height);
    std::cout << "Image: " << path << " (" << frame.width << "x" << frame.height << ")\n";
    for (const ROI* r : {&regions.primary, &regions.secondary}) {
        std::cout << "  " << r->name << ": x=" << r->x << " y=" << r->y << " w=" << r->w << " h=" << r->h << "\n";
    }
    printSignal(s);
    std::cout << "  detect time: " << std::fixed << std::setprecision(3) << detectMs << " ms\n";

    if (!jsonOutput.empty()) {
        json doc;
        doc["source"] = path;
        doc["width"] = frame.width;
        doc["height"] = frame.height;
        doc["signal"] = pixelToJson(s);
        doc["detect_ms"] = detectMs;
        if (!writeJsonFile(jsonOutput, doc)) {
            logError("Failed to write JSON output: " + jsonOutput);
            return 1;
        }
        std::cout << "JSON output written to: " << jsonOutput << "\n";
    }
    return 0;
}

/**
 * Replay script: JSON array of events, applied in order.
 *   {"t_ms": 0,    "type": "frame", "image": "frames/0001.png"}
 *   {"t_ms": 10,   "type": "pixel", "primary": true, "secondary": false}
 *   {"t_ms": 850,  "type": "start"}
 *   {"t_ms": 900,  "type": "delta", "text": "ACTION: RAISE 120\n"}
 *   {"t_ms": 1200, "type": "response", "text": "ACTION: RAISE 120\nPOT: 80"}
 *   {"t_ms": 5000, "type": "appeared" | "disappeared" | "reset"}
 */
static int runReplay(const std::string& path, const engine::AdvisorConfig& cfg, const std::string& jsonOutput) {
    const std::string resolved = resolvePathWithFallbacks(path);
    std::string content;
    std::string err;
    if (!readTextFile(resolved, content, err)) {
        logError(err);
        return 1;
    }

    json script;
    try {
        script = json::parse(content);
    } catch (const std::exception& e) {
        logError(std::string("Error parsing replay script: ") + e.what());
        return 1;
    }
    if (!script.is_array()) {
        logError("Replay script must be a JSON array of events: " + path);
        return 1;
    }

    const fs::path scriptDir = fs::path(resolved).parent_path();

    double scriptTimeMs = 0.0;
    engine::AdvisorSession session(cfg, [&scriptTimeMs]() { return scriptTimeMs; });

    std::vector<StateEntry> emitted;
    session.setOnStateChange([&](const UiState& s) {
        emitted.push_back(StateEntry{scriptTimeMs, s});
        std::cout << "[" << std::fixed << std::setprecision(0) << std::setw(7) << scriptTimeMs << " ms] "
                  << std::left << std::setw(8) << toString(s.phase) << std::right << " " << s.display;
        if (!s.pinnedFields.hand.empty()) std::cout << "  (hand " << s.pinnedFields.hand << ")";
        std::cout << std::endl;
    });

    HighResTimer wall;
    wall.start();

    size_t index = 0;
    for (const auto& ev : script) {
        ++index;
        if (!ev.is_object()) {
            logWarning("Replay event " + std::to_string(index) + " is not an object, skipped");
            continue;
        }

        try {
            scriptTimeMs = ev.value("t_ms", scriptTimeMs);
            const std::string type = ev.value("type", "");

            if (type == "frame") {
                const std::string image = ev.value("image", "");
                fs::path imagePath(image);
                if (imagePath.is_relative()) imagePath = scriptDir / imagePath;
                Frame frame;
                if (!loadFrameBGRA(imagePath.string(), frame, err)) {
                    logError("Replay event " + std::to_string(index) + ": " + err);
                    return 1;
                }
                session.postFrame(frame.view());
            } else if (type == "pixel") {
                session.postPixelSignal(pixelFromJson(ev));
            } else if (type == "response") {
                session.postResponse(ev.value("text", ""));
            } else if (type == "start") {
                session.postResponseStart();
            } else if (type == "delta") {
                session.postStreamDelta(ev.value("text", ""));
            } else if (type == "appeared" || type == "disappeared") {
                detect::ControlEvent ce;
                ce.appeared = type == "appeared";
                ce.disappeared = type == "disappeared";
                ce.present = ce.appeared;
                ce.frameTimeMs = scriptTimeMs;
                session.postControlEvent(ce);
            } else if (type == "reset") {
                session.reset();
            } else {
                logWarning("Replay event " + std::to_string(index) + ": unknown type '" + type + "', skipped");
                continue;
            }
        } catch (const json::exception& e) {
            logError("Replay event " + std::to_string(index) + ": " + e.what());
            return 1;
        }

        session.drain();
    }

    wall.stop();

    PipelineStats stats = session.stats();
    stats.totalMs = wall.elapsedMs();

    const UiState finalState = session.state();
    const engine::EngineDiagnostics diag = session.diagnostics();
    std::cout << "\nFinal state: " << toString(finalState.phase) << " '" << finalState.display << "'\n"
              << "  waiting streak " << diag.waitingStreak << ", acting streak " << diag.actingStreak
              << ", pixel override streak " << diag.pixelOverrideStreak << "\n"
              << "  " << emitted.size() << " state change(s) from " << index << " event(s)\n\n";
    printStats(stats);

    if (!jsonOutput.empty()) {
        json doc;
        doc["source"] = path;
        doc["events"] = index;
        doc["total_ms"] = stats.totalMs;
        doc["states"] = json::array();
        for (const auto& e : emitted) {
            json s = stateToJson(e.state);
            s["t_ms"] = e.tMs;
            doc["states"].push_back(s);
        }
        doc["final"] = stateToJson(finalState);
        if (!writeJsonFile(jsonOutput, doc)) {
            logError("Failed to write JSON output: " + jsonOutput);
            return 1;
        }
        std::cout << "JSON output written to: " << jsonOutput << "\n";
    }
    return 0;
}

void printBanner() {
    std::cout << R"(
╔═══════════════════════════════════════════════════════════════╗
║         Table HUD Advisor v1.0                                ║
║         Text + pixel signal reconciliation                    ║
╚═══════════════════════════════════════════════════════════════╝
)" << std::endl;
}

void printUsage(const char* programName) {
    std::cout << "Usage: " << programName << " [options]\n\n"
              << "Options:\n"
              << "  --config <path>       Path to config file (default: config/advisor_config.json)\n"
              << "  --parse <file>        Classify one model response read from a text file\n"
              << "  --detect <image>      Run the control detector on a screenshot\n"
              << "  --replay <script>     Replay a JSON event script through an advisor session\n"
              << "  --json-output <file>  Write the result of --parse/--detect/--replay as JSON\n"
              << "  --dump-config <path>  Write the effective configuration and exit\n"
              << "  --verbose             Debug logging (engine decisions, pixel densities)\n"
              << "  --help, -h            Show this help\n";
}

int main(int argc, char* argv[]) {
    std::string configPath = "config/advisor_config.json";
    bool configSpecified = false;
    std::string parsePath;
    std::string detectPath;
    std::string replayPath;
    std::string jsonOutput;
    std::string dumpConfigPath;
    bool verbose = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
            configSpecified = true;
        } else if (arg == "--parse" && i + 1 < argc) {
            parsePath = argv[++i];
        } else if (arg == "--detect" && i + 1 < argc) {
            detectPath = argv[++i];
        } else if (arg == "--replay" && i + 1 < argc) {
            replayPath = argv[++i];
        } else if (arg == "--json-output" && i + 1 < argc) {
            jsonOutput = argv[++i];
        } else if (arg == "--dump-config" && i + 1 < argc) {
            dumpConfigPath = argv[++i];
        } else if (arg == "--verbose") {
            verbose = true;
        } else {
            std::cerr << "Unknown or incomplete option: " << arg << "\n\n";
            printUsage(argv[0]);
            return 1;
        }
    }

    printBanner();

    engine::AdvisorConfig cfg;
    const std::string resolvedConfig = resolvePathWithFallbacks(configPath);
    if (configSpecified || fs::exists(resolvedConfig)) {
        std::string err;
        if (!loadAdvisorConfig(resolvedConfig, cfg, err)) {
            logError(err);
            if (configSpecified) return 1;
            logWarning("Using built-in defaults");
        } else {
            std::cout << "Config: " << resolvedConfig << "\n";
        }
    }
    setLogLevel(verbose ? LogLevel::DEBUG : cfg.logLevel);

    if (!dumpConfigPath.empty()) {
        std::string err;
        if (!writeAdvisorConfig(dumpConfigPath, cfg, err)) {
            logError(err);
            return 1;
        }
        std::cout << "Configuration written to: " << dumpConfigPath << "\n";
        return 0;
    }

    if (!parsePath.empty()) return runParse(parsePath, jsonOutput);
    if (!detectPath.empty()) return runDetect(detectPath, cfg, jsonOutput);
    if (!replayPath.empty()) return runReplay(replayPath, cfg, jsonOutput);

    printUsage(argv[0]);
    return 1;
}
