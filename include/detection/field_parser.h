#pragma once
/**
 * @file field_parser.h
 * @brief Labeled-field parser and action classifier for model responses
 *
 * Turns the semi-structured text a vision model returns for one frame
 * ("ACTION: RAISE 120\nHAND: Ah Kd\nPOT: 80\nANALYSIS: ...") into a
 * ClassifiedResponse. Works on complete responses and on growing prefixes.
 */

#include "types.h"
#include "detection/hand_validator.h"
#include "detection/label_scanner.h"

#include <optional>
#include <string>
#include <vector>

namespace hud_advisor::detect {

/**
 * @brief Known field labels
 *
 * Each label has an English and (except SPR) a Chinese spelling.
 */
enum class FieldLabel {
    Action,             ///< ACTION / 行动
    Predicted,          ///< PREDICTED / 预判
    PredictedRaiseSize, ///< PREDICTED RAISE SIZE / 预判加注额
    RaiseSize,          ///< RAISE SIZE / 加注额
    Hand,               ///< HAND / 手牌
    Board,              ///< BOARD / 公共牌
    Pot,                ///< POT / 底池
    Stage,              ///< STAGE / 阶段
    Analysis,           ///< ANALYSIS / 分析
    Position,           ///< POSITION / 位置
    ToCall,             ///< TO CALL / 跟注
    Odds,               ///< ODDS / 赔率
    Spr                 ///< SPR
};

/**
 * @brief Kind plus display label for one classification step
 */
struct ActionResult {
    ActionKind kind = ActionKind::Unrecognized;
    std::string display;
};

/**
 * @brief Parser for model responses
 *
 * Stateless after construction; parse() may be called from any thread.
 */
class FieldParser {
public:
    FieldParser();

    /**
     * @brief Classify a complete response or a growing prefix
     *
     * Action sources are tried in order: every ACTION field, the first line,
     * the whole text. The first one that yields a recognised kind wins.
     * Never throws; unparseable text becomes Unrecognized.
     */
    ClassifiedResponse parse(const std::string& text) const;

    /**
     * @brief Classify one line by keyword precedence
     *
     * ALL-IN > RAISE/BET > CALL > CHECK > FOLD > READY > WAIT > SKIP.
     *
     * @param line Text to look for a keyword in
     * @param fullText Whole response, used for raise sizing fallbacks
     * @param raiseSize Value of the structured raise size field, if any
     */
    ActionResult detectAction(const std::string& line, const std::string& fullText,
                              const std::string& raiseSize = "") const;

    /**
     * @brief Value of the first occurrence of a label (empty if absent)
     */
    std::string extractField(const std::string& text, FieldLabel label) const;

    /**
     * @brief True once an ACTION field carries a recognised keyword
     */
    bool hasActionMarker(const std::string& text) const;

    /**
     * @brief True once the rationale label has appeared
     */
    bool hasRationaleLabel(const std::string& text) const;

    /**
     * @brief Action explicitly recommended by a rationale
     *
     * Looks for a recommendation cue ("SHOULD", "建议", ...) directly
     * followed by an action word, then for a conclusion cue ("结论",
     * "OVERALL", ...) followed by one within a few characters. Acting kinds
     * are tried strongest first.
     */
    static std::optional<ActionKind> recommendedAction(const std::string& text);

    /**
     * @brief True if the text settles on folding ("直接弃牌", "JUST FOLD", ...)
     */
    static bool isFoldRecommended(const std::string& text);

    /**
     * @brief Amount for a raise display, empty if none can be derived
     *
     * Order: structured raise size field (number after the last '=', else the
     * trailing number), the number right after the keyword in line then in
     * fullText, two thirds of the POT field.
     */
    std::string raiseAmount(const std::string& line, const std::string& fullText,
                            const std::string& raiseSize) const;

    /// Display label for a kind ("Raise" without amount, "All-in", ...)
    static std::string displayFor(ActionKind kind);

private:
    LabelScanner m_scanner;
    HandValidator m_validator;

    ActionResult raiseResult(const std::string& line, const std::string& fullText,
                             const std::string& raiseSize) const;
    ActionResult reconcile(const ActionResult& result, const std::string& rationale,
                           const std::string& fullText, const std::string& raiseSize) const;
    ResponseFields extractFields(const std::string& text, const std::vector<LabelHit>& hits) const;
    ActionResult upgradePredicted(const ActionResult& result, const ResponseFields& fields,
                                  const std::string& fullText) const;
};

} // namespace hud_advisor::detect
