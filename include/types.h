#pragma once
/**
 * @file types.h
 * @brief Common type definitions for the table HUD advisor
 */

#include <cstdint>
#include <string>
#include <vector>

namespace hud_advisor {

/**
 * @brief ROI (Region of Interest) in pixel coordinates
 */
struct ROI {
    std::string name;   ///< ROI identifier (e.g., "primary_band")
    int x = 0;          ///< Top-left X coordinate
    int y = 0;          ///< Top-left Y coordinate
    int w = 0;          ///< Width in pixels
    int h = 0;          ///< Height in pixels

    bool empty() const { return w <= 0 || h <= 0; }
};

/**
 * @brief Non-owning view of a BGRA frame
 */
struct FrameView {
    const uint8_t* bgra = nullptr;  ///< First byte of row 0
    int width = 0;                  ///< Frame width
    int height = 0;                 ///< Frame height
    int strideBytes = 0;            ///< Bytes per row (>= width * 4)
};

/**
 * @brief Owned BGRA frame (offline input, tests)
 */
struct Frame {
    std::vector<uint8_t> bgra;
    int width = 0;
    int height = 0;
    int strideBytes = 0;

    FrameView view() const {
        return FrameView{bgra.empty() ? nullptr : bgra.data(), width, height, strideBytes};
    }
};

/**
 * @brief Closed action taxonomy produced by the field parser
 */
enum class ActionKind {
    Fold,
    Raise,
    Call,
    Check,
    AllIn,
    Ready,
    Waiting,
    Skip,
    Unrecognized
};

/**
 * @brief Three-level confidence used by both sensors
 */
enum class Confidence {
    High,
    Medium,
    Low
};

/**
 * @brief Named attributes extracted from a model response
 *
 * Absent fields are empty strings.
 */
struct ResponseFields {
    std::string hand;               ///< Hole cards, e.g. "Ah Kd"
    std::string board;              ///< Community cards
    std::string stage;              ///< Street (preflop, flop, ...)
    std::string position;           ///< Seat position (BTN, BB, ...)
    std::string pot;                ///< Pot size
    std::string amountToCall;       ///< Amount to call
    std::string potOdds;            ///< Pot odds
    std::string stackToPotRatio;    ///< SPR
    std::string rationale;          ///< Free-form analysis
    std::string raiseSize;          ///< Structured raise size
    std::string predictedAction;    ///< Action expected once it is the user's turn
    std::string predictedRaiseSize; ///< Raise size for the predicted action

    Confidence confidence = Confidence::Medium; ///< Advisory consistency result
    std::string issue;                          ///< Consistency problem, if any

    bool hasContent() const {
        return !hand.empty() || !board.empty() || !stage.empty() || !position.empty() ||
               !pot.empty() || !amountToCall.empty() || !potOdds.empty() ||
               !stackToPotRatio.empty() || !rationale.empty() || !raiseSize.empty() ||
               !predictedAction.empty() || !predictedRaiseSize.empty();
    }
};

/**
 * @brief Field parser output for one (complete or partial) response
 */
struct ClassifiedResponse {
    ActionKind actionKind = ActionKind::Unrecognized;
    std::string displayText;    ///< Short human-facing label, e.g. "Raise 120"
    ResponseFields fields;
};

/**
 * @brief Per-frame result of the control detector
 */
struct PixelSignal {
    bool primaryControlPresent = false;     ///< Unambiguous "your turn" control
    bool secondaryControlPresent = false;   ///< Corroborating control
    float density = 0.0f;                   ///< Primary colour density (diagnostic)
    float secondaryDensity = 0.0f;          ///< Secondary colour density (diagnostic)
    Confidence confidence = Confidence::Low;
};

/** Pixel confidence: High with both controls, Medium with the primary only. */
inline Confidence confidenceFor(bool primaryPresent, bool secondaryPresent) {
    if (primaryPresent && secondaryPresent) return Confidence::High;
    if (primaryPresent) return Confidence::Medium;
    return Confidence::Low;
}

/**
 * @brief Externally visible phase of the advisor
 */
enum class Phase {
    Waiting,
    Ready,
    Acting
};

/**
 * @brief The single displayed decision
 */
struct UiState {
    Phase phase = Phase::Waiting;
    ActionKind actingKind = ActionKind::Waiting;    ///< Raise/Call/Check/Fold/AllIn when Acting
    std::string display = "Waiting";
    ResponseFields pinnedFields;                    ///< Last known-good fields
};

/** Waiting and Ready mean "not the user's turn yet". */
inline bool isWaitingLike(ActionKind kind) {
    return kind == ActionKind::Waiting || kind == ActionKind::Ready;
}

/** Kinds that map onto an Acting sub-kind. */
inline bool isActingKind(ActionKind kind) {
    return kind == ActionKind::Fold || kind == ActionKind::Raise || kind == ActionKind::Call ||
           kind == ActionKind::Check || kind == ActionKind::AllIn;
}

const char* toString(ActionKind kind);
const char* toString(Confidence confidence);
const char* toString(Phase phase);

} // namespace hud_advisor
