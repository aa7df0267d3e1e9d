/**
 * @file reconciliation_engine.cpp
 * @brief Hysteresis, confirmation and override rules of the advisor FSM
 */

#include "engine/reconciliation_engine.h"
#include "utils/logger.h"

#include <algorithm>
#include <sstream>

namespace hud_advisor::engine {

namespace {

std::string describe(const ClassifiedResponse& r) {
    return std::string(toString(r.actionKind)) + " '" + r.displayText + "'";
}

} // namespace

const char* toString(Outcome outcome) {
    switch (outcome) {
        case Outcome::Committed: return "committed";
        case Outcome::Skipped: return "skipped";
        case Outcome::ExitSuppressed: return "exit-suppressed";
        case Outcome::PixelRejected: return "pixel-rejected";
        case Outcome::EntrySuppressed: return "entry-suppressed";
        case Outcome::Duplicate: return "duplicate";
        case Outcome::Withheld: return "withheld";
        case Outcome::Unmapped: return "unmapped";
        case Outcome::Ignored: return "ignored";
    }
    return "unknown";
}

EngineDiagnostics ReconciliationEngine::diagnostics() const {
    EngineDiagnostics d;
    d.waitingStreak = m_waitingStreak;
    d.actingStreak = m_actingStreak;
    d.pixelOverrideStreak = m_pixelOverrideStreak;
    d.lastActingTransitionMs = m_lastActingTransitionMs;
    d.hasLastEmitted = m_lastEmitted.has_value();
    if (m_lastEmitted) {
        d.lastEmittedKind = m_lastEmitted->kind;
        d.lastEmittedDisplay = m_lastEmitted->display;
    }
    d.streamEvaluated = m_streamEvaluated;
    return d;
}

EngineUpdate ReconciliationEngine::makeUpdate(Outcome outcome, bool emitted, bool refreshed) const {
    EngineUpdate u;
    u.outcome = outcome;
    u.emitted = emitted;
    u.fieldsRefreshed = refreshed;
    u.state = m_state;
    return u;
}

bool ReconciliationEngine::refreshFields(const ResponseFields& fields) {
    if (!fields.hasContent()) return false;
    m_state.pinnedFields = fields;
    return true;
}

void ReconciliationEngine::advanceStreaks(bool waitingLike, const PixelSignal& pixel) {
    if (waitingLike) {
        ++m_waitingStreak;
        m_actingStreak = 0;
    } else {
        ++m_actingStreak;
        m_waitingStreak = 0;
    }

    if (waitingLike && pixel.primaryControlPresent) {
        ++m_pixelOverrideStreak;
    } else {
        m_pixelOverrideStreak = 0;
    }
}

EngineUpdate ReconciliationEngine::onResponse(const ClassifiedResponse& response, const PixelSignal& pixel,
                                              double nowMs) {
    const bool streamed = m_streamEvaluated;
    const bool streamedWaiting = m_streamWaitingLike;
    m_streamEvaluated = false;
    m_streamWaitingLike = false;

    if (response.actionKind == ActionKind::Skip) {
        logDebug("engine: skip response ignored");
        return makeUpdate(Outcome::Skipped, false, false);
    }

    const bool waitingLike = isWaitingLike(response.actionKind);
    if (!streamed || streamedWaiting != waitingLike) {
        advanceStreaks(waitingLike, pixel);
    }
    return evaluate(response, pixel, nowMs);
}

void ReconciliationEngine::onResponseStarted() {
    if (m_streamEvaluated) {
        logDebug("engine: previous response never completed, dropping its early evaluation");
    }
    m_streamEvaluated = false;
    m_streamWaitingLike = false;
}

EngineUpdate ReconciliationEngine::onStreamDelta(const std::string& prefix, const PixelSignal& pixel, double nowMs) {
    if (m_streamEvaluated) return makeUpdate(Outcome::Ignored, false, false);
    if (!m_parser.hasActionMarker(prefix)) return makeUpdate(Outcome::Ignored, false, false);

    const ClassifiedResponse early = m_parser.parse(prefix);
    if (early.actionKind == ActionKind::Skip) {
        return makeUpdate(Outcome::Skipped, false, false);
    }
    if (early.actionKind == ActionKind::Unrecognized) {
        return makeUpdate(Outcome::Ignored, false, false);
    }

    const bool waitingLike = isWaitingLike(early.actionKind);
    if (!waitingLike && !m_parser.hasRationaleLabel(prefix)) {
        logDebug("engine: withholding streamed " + describe(early) + " until the analysis arrives");
        return makeUpdate(Outcome::Withheld, false, false);
    }

    m_streamEvaluated = true;
    m_streamWaitingLike = waitingLike;
    advanceStreaks(waitingLike, pixel);
    logDebug("engine: early evaluation " + describe(early));
    return evaluate(early, pixel, nowMs);
}

EngineUpdate ReconciliationEngine::evaluate(const ClassifiedResponse& response, const PixelSignal& pixel,
                                            double nowMs) {
    const bool waitingLike = isWaitingLike(response.actionKind);
    const bool acting = m_state.phase == Phase::Acting;

    // Anti-flicker: leaving Acting needs an absent control, an old Acting
    // state or repeated waiting responses
    bool exitAccepted = false;
    if (acting && waitingLike) {
        const double age = nowMs - m_lastActingTransitionMs;
        exitAccepted = !pixel.primaryControlPresent || age > m_cfg.exitWindowMs ||
                       m_waitingStreak >= m_cfg.exitConfirmations;
        if (!exitAccepted) {
            std::ostringstream oss;
            oss << "engine: exit suppressed (" << describe(response) << ", waiting #" << m_waitingStreak << "/"
                << m_cfg.exitConfirmations << ", acting for " << age << " ms, control visible)";
            logDebug(oss.str());
            return makeUpdate(Outcome::ExitSuppressed, false, refreshFields(response.fields));
        }
    }

    // Waiting text while the control is visible is treated as a vision error,
    // until it has been repeated often enough to distrust the pixels instead
    if (!exitAccepted && !acting && waitingLike && pixel.primaryControlPresent) {
        if (m_pixelOverrideStreak < m_cfg.pixelEscapeThreshold) {
            logDebug("engine: " + describe(response) + " rejected, control visible (" +
                     std::to_string(m_pixelOverrideStreak) + "/" + std::to_string(m_cfg.pixelEscapeThreshold) + ")");
            return makeUpdate(Outcome::PixelRejected, false, refreshFields(response.fields));
        }
        logInfo("engine: pixel deadlock escape after " + std::to_string(m_pixelOverrideStreak) +
                " waiting responses, trusting the text");
        m_pixelOverrideStreak = 0;
    }

    // Anti-misjudgment: entering Acting needs confirmations scaled by pixel confidence
    if (!acting && !waitingLike) {
        const int required = pixel.confidence == Confidence::Low ? m_cfg.entryConfirmationsLow
                                                                 : m_cfg.entryConfirmationsConfident;
        if (m_actingStreak < required) {
            logDebug("engine: entry suppressed (" + describe(response) + ", acting #" +
                     std::to_string(m_actingStreak) + "/" + std::to_string(required) + ", pixel " +
                     toString(pixel.confidence) + ")");
            return makeUpdate(Outcome::EntrySuppressed, false, false);
        }
    }

    if (response.actionKind == ActionKind::Unrecognized) {
        logDebug("engine: unmapped " + describe(response) + ", fields refreshed only");
        return makeUpdate(Outcome::Unmapped, false, refreshFields(response.fields));
    }

    Emitted next;
    next.kind = response.actionKind;
    next.display = response.actionKind == ActionKind::Waiting ? std::string("Waiting") : response.displayText;

    if (m_lastEmitted && m_lastEmitted->kind == next.kind && m_lastEmitted->display == next.display) {
        logDebug("engine: duplicate " + describe(response) + ", fields refreshed only");
        return makeUpdate(Outcome::Duplicate, false, refreshFields(response.fields));
    }

    const bool refreshed = refreshFields(response.fields);
    switch (response.actionKind) {
        case ActionKind::Waiting:
            m_state.phase = Phase::Waiting;
            m_state.actingKind = ActionKind::Waiting;
            break;
        case ActionKind::Ready:
            m_state.phase = Phase::Ready;
            m_state.actingKind = ActionKind::Ready;
            break;
        default:
            m_state.phase = Phase::Acting;
            m_state.actingKind = response.actionKind;
            m_lastActingTransitionMs = nowMs;
            break;
    }
    m_state.display = next.display;
    m_lastEmitted = next;

    logInfo(std::string("engine: state -> ") + toString(m_state.phase) + " '" + m_state.display + "'");
    return makeUpdate(Outcome::Committed, true, refreshed);
}

void ReconciliationEngine::onControlAppeared() {
    m_actingStreak = (std::max)(m_actingStreak, 1);
    m_waitingStreak = 0;
    logDebug("engine: control appeared, acting streak " + std::to_string(m_actingStreak));
}

EngineUpdate ReconciliationEngine::onControlsDetectedWhileWaiting(double nowMs) {
    if (m_state.phase != Phase::Waiting || !m_state.pinnedFields.hasContent()) {
        return makeUpdate(Outcome::Ignored, false, false);
    }

    const std::string display = detect::FieldParser::displayFor(ActionKind::Ready);
    m_state.phase = Phase::Ready;
    m_state.actingKind = ActionKind::Ready;
    m_state.display = display;
    m_lastEmitted = Emitted{ActionKind::Ready, display};

    std::ostringstream oss;
    oss << "engine: controls detected while waiting at " << nowMs << " ms, state -> Ready";
    logInfo(oss.str());
    return makeUpdate(Outcome::Committed, true, false);
}

EngineUpdate ReconciliationEngine::onControlDisappeared(double nowMs) {
    m_waitingStreak = 0;
    m_actingStreak = 0;
    m_pixelOverrideStreak = 0;
    m_lastActingTransitionMs = 0.0;
    m_lastEmitted.reset();
    m_streamEvaluated = false;
    m_streamWaitingLike = false;

    if (m_state.phase == Phase::Waiting && m_state.display == "Waiting") {
        logDebug("engine: control disappeared while already Waiting");
        return makeUpdate(Outcome::Duplicate, false, false);
    }

    m_state.phase = Phase::Waiting;
    m_state.actingKind = ActionKind::Waiting;
    m_state.display = "Waiting";

    std::ostringstream oss;
    oss << "engine: control disappeared at " << nowMs << " ms, state -> Waiting";
    logInfo(oss.str());
    return makeUpdate(Outcome::Committed, true, false);
}

void ReconciliationEngine::reset() {
    m_state = UiState{};
    m_waitingStreak = 0;
    m_actingStreak = 0;
    m_pixelOverrideStreak = 0;
    m_lastActingTransitionMs = 0.0;
    m_lastEmitted.reset();
    m_streamEvaluated = false;
    m_streamWaitingLike = false;
}

} // namespace hud_advisor::engine
