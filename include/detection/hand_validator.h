#pragma once
/**
 * @file hand_validator.h
 * @brief Advisory cross-check of hand-strength claims against the cards
 */

#include "types.h"

#include <string>
#include <vector>

namespace hud_advisor::detect {

struct ValidationResult {
    Confidence confidence = Confidence::Medium;
    std::string issue;      ///< Empty when consistent
};

/**
 * @brief Checks that a rationale's hand-strength claims fit the cards
 *
 * Catches the usual misreads of a vision model: "top pair of kings" with no
 * king in the hand, "two pair" with one pair on the table, the same card in
 * both hand and board. The result is advisory and never changes the action.
 */
class HandValidator {
public:
    /**
     * @brief Validate a rationale against hand and board text
     * @return Medium for an empty rationale, Low plus an issue note on the
     *         first inconsistency, High otherwise
     */
    ValidationResult validate(const std::string& hand, const std::string& board,
                              const std::string& rationale) const;

    /**
     * @brief Rank of one card ("A♠" -> 'A', "10d" -> 'T'), or 0
     */
    static char parseCardRank(const std::string& card);

    /**
     * @brief Ranks of every card in a hand/board string
     */
    static std::vector<char> extractRanks(const std::string& cards);

private:
    static std::vector<std::string> cardTokens(const std::string& cards);
    static char claimedRankAfter(const std::string& upper, size_t pos);
};

} // namespace hud_advisor::detect
