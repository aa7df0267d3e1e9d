#pragma once
/**
 * @file reconciliation_engine.h
 * @brief State machine fusing the text and pixel sensors into one decision
 */

#include "types.h"
#include "detection/field_parser.h"

#include <optional>
#include <string>

namespace hud_advisor::engine {

struct EngineConfig {
    // Acting -> Waiting is accepted once Acting is strictly older than this
    double exitWindowMs = 3000.0;
    // ... or after this many consecutive waiting-like responses
    int exitConfirmations = 2;

    // Waiting/Ready -> Acting needs this many consecutive acting-like responses
    int entryConfirmationsConfident = 1;    // pixel confidence High/Medium
    int entryConfirmationsLow = 2;          // pixel confidence Low

    // Waiting-like responses contradicting a visible control before the text wins
    int pixelEscapeThreshold = 5;

    // Show Ready with the pinned analysis when the control appears during Waiting
    bool readyOnControlWhileWaiting = false;
};

/**
 * @brief What the engine did with one input
 */
enum class Outcome {
    Committed,          ///< New UiState emitted
    Skipped,            ///< Not a game scene, nothing touched
    ExitSuppressed,     ///< Anti-flicker: still Acting
    PixelRejected,      ///< Waiting text contradicts a visible control
    EntrySuppressed,    ///< Not enough confirmations to enter Acting
    Duplicate,          ///< Same decision as last emitted
    Withheld,           ///< Streamed acting classification before the rationale
    Unmapped,           ///< Unrecognized response, fields refreshed only
    Ignored             ///< Stream delta with nothing to evaluate
};

const char* toString(Outcome outcome);

struct EngineUpdate {
    bool emitted = false;
    Outcome outcome = Outcome::Ignored;
    bool fieldsRefreshed = false;
    UiState state;              ///< Snapshot after this input
};

/**
 * @brief Read-only snapshot of the confirmation counters
 */
struct EngineDiagnostics {
    int waitingStreak = 0;
    int actingStreak = 0;
    int pixelOverrideStreak = 0;
    double lastActingTransitionMs = 0.0;
    bool hasLastEmitted = false;
    ActionKind lastEmittedKind = ActionKind::Waiting;
    std::string lastEmittedDisplay;
    bool streamEvaluated = false;   ///< Current response already applied from a prefix
};

/**
 * @brief Reconciles classified responses with the pixel signal
 *
 * States are Waiting, Ready and Acting(kind). Every input passes, in order:
 * Skip guard, streak update, exit-from-Acting guard, pixel-contradiction
 * guard, entry-into-Acting guard, de-duplication, commit.
 *
 * Not thread-safe. One engine belongs to one session and is driven from a
 * single serialized event stream (see AdvisorSession). No member throws.
 */
class ReconciliationEngine {
public:
    ReconciliationEngine() = default;
    explicit ReconciliationEngine(EngineConfig cfg) : m_cfg(cfg) {}

    const EngineConfig& config() const { return m_cfg; }

    /**
     * @brief Apply a complete response
     *
     * If a prefix of the same response was already applied with the same
     * direction, the streak counters are not advanced a second time.
     */
    EngineUpdate onResponse(const ClassifiedResponse& response, const PixelSignal& pixel, double nowMs);

    /**
     * @brief Evaluate a growing prefix of the in-flight response
     *
     * Evaluated at most once per response, as soon as an ACTION field carries
     * a keyword. Waiting-like results apply immediately; acting-like results
     * are withheld until the rationale label has appeared.
     */
    EngineUpdate onStreamDelta(const std::string& prefix, const PixelSignal& pixel, double nowMs);

    /**
     * @brief A new response has started streaming
     *
     * Drops the early evaluation of a previous response that never
     * completed, so the new response is evaluated and counted on its own.
     */
    void onResponseStarted();

    /**
     * @brief Primary control appeared: pre-seed the acting streak
     */
    void onControlAppeared();

    /**
     * @brief Control appeared while Waiting with a pinned analysis: show Ready
     *
     * Does nothing in Ready or Acting, or when no fields are pinned.
     */
    EngineUpdate onControlsDetectedWhileWaiting(double nowMs);

    /**
     * @brief Primary control disappeared: the user acted, force Waiting
     *
     * Pinned fields survive; everything else is cleared. Nothing is
     * emitted when the engine already shows Waiting.
     */
    EngineUpdate onControlDisappeared(double nowMs);

    /**
     * @brief Session start/stop: clear everything including pinned fields
     */
    void reset();

    UiState state() const { return m_state; }
    EngineDiagnostics diagnostics() const;

private:
    struct Emitted {
        ActionKind kind;
        std::string display;
    };

    EngineConfig m_cfg;
    detect::FieldParser m_parser;

    UiState m_state;
    int m_waitingStreak = 0;
    int m_actingStreak = 0;
    int m_pixelOverrideStreak = 0;
    double m_lastActingTransitionMs = 0.0;
    std::optional<Emitted> m_lastEmitted;

    // Early evaluation of the in-flight response
    bool m_streamEvaluated = false;
    bool m_streamWaitingLike = false;

    void advanceStreaks(bool waitingLike, const PixelSignal& pixel);
    EngineUpdate evaluate(const ClassifiedResponse& response, const PixelSignal& pixel, double nowMs);
    bool refreshFields(const ResponseFields& fields);
    EngineUpdate makeUpdate(Outcome outcome, bool emitted, bool refreshed) const;
};

} // namespace hud_advisor::engine
