/**
 * @file hand_validator.cpp
 * @brief Hand-strength claim validation
 */

#include "detection/hand_validator.h"
#include "utils/text_utils.h"

#include <algorithm>
#include <initializer_list>
#include <map>

namespace hud_advisor::detect {

namespace {

const char kRanks[] = "23456789TJQKA";

struct RankWord {
    const char* word;
    char rank;
};

// Longest spellings first so "SIXES" wins over "SIX".
const RankWord kRankWords[] = {
    {"DEUCES", '2'}, {"DEUCE", '2'}, {"THREES", '3'}, {"THREE", '3'}, {"FOURS", '4'}, {"FOUR", '4'},
    {"FIVES", '5'}, {"FIVE", '5'}, {"SIXES", '6'}, {"SIX", '6'}, {"SEVENS", '7'}, {"SEVEN", '7'},
    {"EIGHTS", '8'}, {"EIGHT", '8'}, {"NINES", '9'}, {"NINE", '9'}, {"TENS", 'T'}, {"TEN", 'T'},
    {"JACKS", 'J'}, {"JACK", 'J'}, {"QUEENS", 'Q'}, {"QUEEN", 'Q'}, {"KINGS", 'K'}, {"KING", 'K'},
    {"ACES", 'A'}, {"ACE", 'A'},
};

bool isRankChar(char c) {
    for (const char* r = kRanks; *r; ++r) {
        if (*r == c) return true;
    }
    return false;
}

bool isAsciiLetter(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
}

bool contains(const std::vector<char>& ranks, char r) {
    return std::find(ranks.begin(), ranks.end(), r) != ranks.end();
}

// ASCII needles must be whole words; CJK needles match anywhere.
size_t findWhole(const std::string& upper, const std::string& needle) {
    size_t pos = text::findWord(upper, needle);
    while (pos != std::string::npos) {
        const size_t end = pos + needle.size();
        if (static_cast<unsigned char>(needle[0]) >= 0x80 || end >= upper.size() || !isAsciiLetter(upper[end])) {
            return pos;
        }
        pos = text::findWord(upper, needle, pos + 1);
    }
    return pos;
}

bool containsAny(const std::string& upper, std::initializer_list<const char*> needles) {
    for (const char* n : needles) {
        if (findWhole(upper, n) != std::string::npos) return true;
    }
    return false;
}

std::string normalizeCard(const std::string& token) {
    std::string up = text::toUpperAscii(text::trim(token));
    if (up.compare(0, 2, "10") == 0) up = "T" + up.substr(2);
    return up;
}

std::string rankName(char r) {
    return std::string(1, r);
}

} // namespace

std::vector<std::string> HandValidator::cardTokens(const std::string& cards) {
    std::string cleaned = cards;
    std::replace(cleaned.begin(), cleaned.end(), ',', ' ');
    const std::string up = text::toUpperAscii(text::trim(cleaned));
    if (up.empty() || up == "-" || up == "NONE" || up == "N/A" || up == "无") {
        return {};
    }
    return text::tokenize(cleaned);
}

char HandValidator::parseCardRank(const std::string& card) {
    const std::string up = normalizeCard(card);
    if (up.empty() || !isRankChar(up[0])) return 0;
    return up[0];
}

std::vector<char> HandValidator::extractRanks(const std::string& cards) {
    std::vector<char> ranks;
    for (const auto& tok : cardTokens(cards)) {
        const char r = parseCardRank(tok);
        if (r != 0) ranks.push_back(r);
    }
    return ranks;
}

char HandValidator::claimedRankAfter(const std::string& upper, size_t pos) {
    while (pos < upper.size() && upper[pos] == ' ') ++pos;
    if (upper.compare(pos, 3, "OF ") == 0) {
        pos += 3;
        while (pos < upper.size() && upper[pos] == ' ') ++pos;
    }
    if (pos >= upper.size()) return 0;

    for (const auto& rw : kRankWords) {
        const size_t len = std::char_traits<char>::length(rw.word);
        if (upper.compare(pos, len, rw.word) == 0 &&
            (pos + len >= upper.size() || !isAsciiLetter(upper[pos + len]))) {
            return rw.rank;
        }
    }

    size_t len = 1;
    char rank = upper[pos];
    if (upper.compare(pos, 2, "10") == 0) {
        rank = 'T';
        len = 2;
    }
    if (!isRankChar(rank)) return 0;

    size_t next = pos + len;
    if (next < upper.size() && upper[next] == 'S') ++next;
    if (next < upper.size() && isAsciiLetter(upper[next])) return 0;
    return rank;
}

ValidationResult HandValidator::validate(const std::string& hand, const std::string& board,
                                         const std::string& rationale) const {
    ValidationResult result;
    if (text::trim(rationale).empty()) {
        result.confidence = Confidence::Medium;
        return result;
    }

    const std::vector<char> handRanks = extractRanks(hand);
    const std::vector<char> boardRanks = extractRanks(board);
    std::vector<char> allRanks = handRanks;
    allRanks.insert(allRanks.end(), boardRanks.begin(), boardRanks.end());

    std::map<char, int> rankCounts;
    for (char r : allRanks) rankCounts[r]++;

    const std::string upper = text::toUpperAscii(rationale);

    auto fail = [&](const std::string& issue) {
        result.confidence = Confidence::Low;
        result.issue = issue;
        return result;
    };

    // "top pair X": X must be in the hand and on the board
    char topPair = 0;
    size_t at = findWhole(upper, "TOP PAIR");
    if (at != std::string::npos) topPair = claimedRankAfter(upper, at + 8);
    if (topPair == 0) {
        at = upper.find("顶对");
        if (at != std::string::npos) topPair = claimedRankAfter(upper, at + 6);
    }
    if (topPair != 0) {
        if (!contains(handRanks, topPair)) {
            return fail("analysis claims top pair of " + rankName(topPair) + " but hand '" + hand +
                        "' has no " + rankName(topPair));
        }
        if (!contains(boardRanks, topPair)) {
            return fail("analysis claims top pair of " + rankName(topPair) + " but board '" + board +
                        "' has no " + rankName(topPair));
        }
    }

    // "pair of X": X must appear somewhere
    if (topPair == 0) {
        char pair = 0;
        at = findWhole(upper, "PAIR OF");
        if (at != std::string::npos) pair = claimedRankAfter(upper, at + 7);
        for (at = upper.find("对"); pair == 0 && at != std::string::npos;
             at = upper.find("对", at + 3)) {
            const char r = at + 3 < upper.size() ? upper[at + 3] : 0;
            if (isRankChar(r)) pair = r;
        }
        if (pair != 0 && !contains(allRanks, pair)) {
            return fail("analysis claims a pair of " + rankName(pair) + " but neither hand nor board has one");
        }
    }

    if (containsAny(upper, {"TWO PAIR", "两对", "两對"})) {
        int pairs = 0;
        for (const auto& kv : rankCounts) {
            if (kv.second >= 2) ++pairs;
        }
        if (pairs < 2) {
            return fail("analysis claims two pair but hand '" + hand + "' and board '" + board +
                        "' cannot make two pair");
        }
    }

    if (containsAny(upper, {"THREE OF A KIND", "TRIPS", "SET", "三条", "三條"})) {
        bool trips = false;
        for (const auto& kv : rankCounts) {
            if (kv.second >= 3) trips = true;
        }
        if (!trips) {
            return fail("analysis claims three of a kind but no rank appears three times");
        }
    }

    const bool straightClaim =
        (findWhole(upper, "STRAIGHT") != std::string::npos && findWhole(upper, "STRAIGHT DRAW") == std::string::npos) ||
        ((upper.find("顺子") != std::string::npos ||
          upper.find("順子") != std::string::npos) &&
         upper.find("听牌") == std::string::npos);
    if (straightClaim && rankCounts.size() < 5) {
        return fail("analysis claims a straight but fewer than five distinct ranks are visible");
    }

    // The same physical card cannot be in the hand and on the board
    const auto handCards = cardTokens(hand);
    const auto boardCards = cardTokens(board);
    for (const auto& hc : handCards) {
        const std::string h = normalizeCard(hc);
        for (const auto& bc : boardCards) {
            if (h == normalizeCard(bc)) {
                return fail("card " + hc + " appears in both hand and board, likely a misread");
            }
        }
    }

    if (!handRanks.empty() && handRanks.size() != 2) {
        return fail("recognised " + std::to_string(handRanks.size()) + " hole cards, expected exactly 2");
    }

    result.confidence = Confidence::High;
    return result;
}

} // namespace hud_advisor::detect
