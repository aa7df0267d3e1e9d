/**
 * @file field_parser.cpp
 * @brief Field extraction and action classification for model responses
 */

#include "detection/field_parser.h"
#include "utils/text_utils.h"

#include <cmath>
#include <stdexcept>

namespace hud_advisor::detect {

namespace {

struct KeywordSet {
    ActionKind kind;
    std::vector<std::string> words;
};

// Precedence order. Spellings are upper case; CJK spellings have no case.
const std::vector<KeywordSet>& actionKeywords() {
    static const std::vector<KeywordSet> kKeywords = {
        {ActionKind::AllIn, {"ALL-IN", "ALLIN", "ALL IN", "全压"}},
        {ActionKind::Raise, {"RAISING", "RAISE", "BET", "加注"}},
        {ActionKind::Call, {"CALL", "跟注"}},
        {ActionKind::Check, {"CHECK", "过牌"}},
        {ActionKind::Fold, {"FOLD", "弃牌"}},
        {ActionKind::Ready, {"READY", "准备", "即将"}},
        {ActionKind::Waiting, {"WAIT", "等待"}},
        {ActionKind::Skip, {"SKIP"}},
    };
    return kKeywords;
}

// Words a rationale uses to name an acting kind, strongest first.
const std::vector<KeywordSet>& recommendationWords() {
    static const std::vector<KeywordSet> kWords = {
        {ActionKind::AllIn, {"全压", "ALL-IN", "ALLIN", "ALL IN"}},
        {ActionKind::Raise, {"加注", "RAISE", "BET"}},
        {ActionKind::Call, {"跟注", "CALL"}},
        {ActionKind::Check, {"过牌", "CHECK"}},
        {ActionKind::Fold, {"弃牌", "FOLD"}},
    };
    return kWords;
}

const std::vector<std::string> kRecommendCues = {
    "SHOULD", "RECOMMEND", "BEST TO", "MUST", "CHOOSE TO",
    "建议", "应该", "应当", "应", "选择", "最优", "必须",
};

const std::vector<std::string> kConclusionCues = {
    "CONCLUSION", "FINALLY", "OVERALL", "结论", "最终", "综上",
};

const std::vector<std::string> kFoldPhrases = {
    "最终弃牌", "最终选择弃牌", "应弃牌", "应该弃牌", "选择弃牌", "建议弃牌", "必须弃牌",
    "果断弃牌", "直接弃牌", "只能弃牌", "只能选择弃牌",
    "JUST FOLD", "SHOULD FOLD", "MUST FOLD", "BEST TO FOLD", "FOLD IS BEST",
};

// Inflections accepted after an ASCII keyword ("CALLS", "WAITING").
const char* const kSuffixes[] = {"", "S", "D", "ED", "ING", "TING", "PED", "PING"};

const size_t kConclusionWindowChars = 5;
const size_t kUnrecognizedDisplayChars = 20;

bool isAscii(const std::string& word) {
    return !word.empty() && static_cast<unsigned char>(word[0]) < 0x80;
}

bool isAsciiLetter(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
}

bool isBlank(char c) {
    return c == ' ' || c == '\t';
}

size_t skipBlanks(const std::string& s, size_t pos) {
    while (pos < s.size() && isBlank(s[pos])) ++pos;
    return pos;
}

/**
 * Length of the keyword occurrence at pos including an accepted inflection,
 * or 0 if word does not occur there as a keyword.
 */
size_t keywordAt(const std::string& upper, size_t pos, const std::string& word) {
    if (upper.compare(pos, word.size(), word) != 0) return 0;
    if (!isAscii(word)) return word.size();
    if (!text::isWordStart(upper, pos)) return 0;

    size_t end = pos + word.size();
    size_t tail = end;
    while (tail < upper.size() && isAsciiLetter(upper[tail])) ++tail;
    const std::string suffix = upper.substr(end, tail - end);
    for (const char* s : kSuffixes) {
        if (suffix == s) return tail - pos;
    }
    return 0;
}

/// First keyword occurrence of any word in the set, as (offset, length).
bool findKeyword(const std::string& upper, const std::vector<std::string>& words,
                 size_t& outPos, size_t& outLen) {
    bool found = false;
    for (const auto& w : words) {
        for (size_t pos = upper.find(w); pos != std::string::npos; pos = upper.find(w, pos + 1)) {
            const size_t len = keywordAt(upper, pos, w);
            if (len == 0) continue;
            if (!found || pos < outPos) {
                outPos = pos;
                outLen = len;
                found = true;
            }
            break;
        }
    }
    return found;
}

bool containsKeyword(const std::string& upper, const std::vector<std::string>& words) {
    size_t pos = 0;
    size_t len = 0;
    return findKeyword(upper, words, pos, len);
}

const std::vector<std::string>& raiseWords() {
    return actionKeywords()[1].words;
}

/// Number right after a raise keyword ("RAISE 120", "RAISE TO $120", "加注120").
std::string numberAfterRaiseKeyword(const std::string& text) {
    const std::string upper = text::toUpperAscii(text);
    size_t bestPos = std::string::npos;
    std::string best;
    for (const auto& w : raiseWords()) {
        for (size_t pos = upper.find(w); pos != std::string::npos; pos = upper.find(w, pos + 1)) {
            const size_t len = keywordAt(upper, pos, w);
            if (len == 0 || pos >= bestPos) continue;

            size_t after = skipBlanks(upper, pos + len);
            if (upper.compare(after, 3, "TO ") == 0) after += 3;
            const std::string num = text::numberAt(upper, after);
            if (!num.empty()) {
                bestPos = pos;
                best = num;
            }
        }
    }
    return best;
}

/// Action word of the given kind starting exactly at pos.
bool actionWordAt(const std::string& upper, size_t pos, const KeywordSet& set) {
    for (const auto& w : set.words) {
        if (keywordAt(upper, pos, w) > 0) return true;
    }
    return false;
}

/// Offset where an action word may start after a recommendation cue.
size_t afterCue(const std::string& upper, size_t pos, const std::string& cue) {
    size_t p = pos + cue.size();
    if (isAscii(cue)) {
        while (p < upper.size() && isAsciiLetter(upper[p])) ++p;
        p = skipBlanks(upper, p);
        if (upper.compare(p, 3, "TO ") == 0) p = skipBlanks(upper, p + 3);
        return p;
    }
    return skipBlanks(upper, p);
}

bool endsWithFoldConclusion(const std::string& line) {
    static const std::string kFold = "弃牌";
    static const std::string kPeriod = "。";
    static const std::string kComma = "，";

    std::string s = text::trim(line);
    if (s.size() >= kPeriod.size() && s.compare(s.size() - kPeriod.size(), kPeriod.size(), kPeriod) == 0) {
        s = text::trim(s.substr(0, s.size() - kPeriod.size()));
    }
    if (s.size() < kFold.size() || s.compare(s.size() - kFold.size(), kFold.size(), kFold) != 0) {
        return false;
    }
    const std::string head = text::trim(s.substr(0, s.size() - kFold.size()));
    auto endsWith = [&](const std::string& tail) {
        return head.size() >= tail.size() && head.compare(head.size() - tail.size(), tail.size(), tail) == 0;
    };
    return endsWith(kPeriod) || endsWith(kComma);
}

} // namespace

FieldParser::FieldParser() {
    auto add = [this](FieldLabel label, const char* english, const char* chinese) {
        m_scanner.addLabel(static_cast<int>(label), english);
        if (chinese) m_scanner.addLabel(static_cast<int>(label), chinese);
    };
    add(FieldLabel::Action, "ACTION", "行动");
    add(FieldLabel::Predicted, "PREDICTED", "预判");
    add(FieldLabel::PredictedRaiseSize, "PREDICTED RAISE SIZE", "预判加注额");
    add(FieldLabel::RaiseSize, "RAISE SIZE", "加注额");
    add(FieldLabel::Hand, "HAND", "手牌");
    add(FieldLabel::Board, "BOARD", "公共牌");
    add(FieldLabel::Pot, "POT", "底池");
    add(FieldLabel::Stage, "STAGE", "阶段");
    add(FieldLabel::Analysis, "ANALYSIS", "分析");
    add(FieldLabel::Position, "POSITION", "位置");
    add(FieldLabel::ToCall, "TO CALL", "跟注");
    add(FieldLabel::Odds, "ODDS", "赔率");
    add(FieldLabel::Spr, "SPR", nullptr);
}

std::string FieldParser::displayFor(ActionKind kind) {
    switch (kind) {
        case ActionKind::Fold: return "Fold";
        case ActionKind::Raise: return "Raise";
        case ActionKind::Call: return "Call";
        case ActionKind::Check: return "Check";
        case ActionKind::AllIn: return "All-in";
        case ActionKind::Ready: return "Ready";
        case ActionKind::Waiting: return "Waiting";
        case ActionKind::Skip:
        case ActionKind::Unrecognized:
            break;
    }
    return "";
}

std::string FieldParser::extractField(const std::string& text, FieldLabel label) const {
    return m_scanner.extract(text, static_cast<int>(label));
}

ResponseFields FieldParser::extractFields(const std::string& text, const std::vector<LabelHit>& hits) const {
    auto field = [&](FieldLabel label) { return m_scanner.extract(text, hits, static_cast<int>(label)); };

    ResponseFields f;
    f.hand = field(FieldLabel::Hand);
    f.board = field(FieldLabel::Board);
    f.stage = field(FieldLabel::Stage);
    f.position = field(FieldLabel::Position);
    f.pot = field(FieldLabel::Pot);
    f.amountToCall = field(FieldLabel::ToCall);
    f.potOdds = field(FieldLabel::Odds);
    f.stackToPotRatio = field(FieldLabel::Spr);
    f.rationale = field(FieldLabel::Analysis);
    f.raiseSize = field(FieldLabel::RaiseSize);
    f.predictedAction = field(FieldLabel::Predicted);
    f.predictedRaiseSize = field(FieldLabel::PredictedRaiseSize);
    return f;
}

std::string FieldParser::raiseAmount(const std::string& line, const std::string& fullText,
                                     const std::string& raiseSize) const {
    if (!raiseSize.empty()) {
        const size_t eq = raiseSize.rfind('=');
        std::string amount;
        if (eq != std::string::npos) amount = text::numberAt(raiseSize, eq + 1);
        if (amount.empty()) {
            const auto numbers = text::findNumbers(raiseSize);
            if (!numbers.empty()) amount = numbers.back();
        }
        if (!amount.empty()) return amount;
    }

    std::string amount = numberAfterRaiseKeyword(line);
    if (amount.empty()) amount = numberAfterRaiseKeyword(fullText);
    if (!amount.empty()) return amount;

    const auto potNumbers = text::findNumbers(extractField(fullText, FieldLabel::Pot));
    if (!potNumbers.empty()) {
        try {
            const double pot = std::stod(potNumbers.front());
            return std::to_string(std::lround(pot * 2.0 / 3.0));
        } catch (const std::exception&) {
            return "";
        }
    }
    return "";
}

ActionResult FieldParser::raiseResult(const std::string& line, const std::string& fullText,
                                      const std::string& raiseSize) const {
    const std::string amount = raiseAmount(line, fullText, raiseSize);
    return ActionResult{ActionKind::Raise, amount.empty() ? displayFor(ActionKind::Raise) : "Raise " + amount};
}

ActionResult FieldParser::detectAction(const std::string& line, const std::string& fullText,
                                       const std::string& raiseSize) const {
    const std::string upper = text::toUpperAscii(line);

    for (const auto& set : actionKeywords()) {
        if (!containsKeyword(upper, set.words)) continue;

        switch (set.kind) {
            case ActionKind::Raise:
                return raiseResult(line, fullText, raiseSize);
            case ActionKind::Ready: {
                const auto hint = recommendedAction(fullText);
                if (hint) return ActionResult{ActionKind::Ready, "Predicted: " + displayFor(*hint)};
                return ActionResult{ActionKind::Ready, displayFor(ActionKind::Ready)};
            }
            default:
                return ActionResult{set.kind, displayFor(set.kind)};
        }
    }

    return ActionResult{ActionKind::Unrecognized, text::truncateUtf8(text::trim(line), kUnrecognizedDisplayChars)};
}

std::optional<ActionKind> FieldParser::recommendedAction(const std::string& text) {
    const std::string upper = text::toUpperAscii(text);

    for (const auto& set : recommendationWords()) {
        for (const auto& cue : kRecommendCues) {
            for (size_t pos = text::findWord(upper, cue); pos != std::string::npos;
                 pos = text::findWord(upper, cue, pos + 1)) {
                if (actionWordAt(upper, afterCue(upper, pos, cue), set)) return set.kind;
            }
        }
    }

    for (const auto& cue : kConclusionCues) {
        for (size_t pos = text::findWord(upper, cue); pos != std::string::npos;
             pos = text::findWord(upper, cue, pos + 1)) {
            const size_t start = pos + cue.size();
            const size_t limit = text::advanceCodePoints(upper, start, kConclusionWindowChars);
            for (size_t p = start; p <= limit && p < upper.size(); p = text::advanceCodePoints(upper, p, 1)) {
                for (const auto& set : recommendationWords()) {
                    if (actionWordAt(upper, p, set)) return set.kind;
                }
            }
        }
    }
    return std::nullopt;
}

bool FieldParser::isFoldRecommended(const std::string& text) {
    const std::string upper = text::toUpperAscii(text);

    for (const auto& phrase : kFoldPhrases) {
        if (text::findWord(upper, phrase) != std::string::npos) return true;
    }

    static const std::string kFold = "弃牌";
    const size_t conclusion = upper.find("结论");
    if (conclusion != std::string::npos) {
        size_t p = skipBlanks(upper, conclusion + std::string("结论").size());
        if (upper.compare(p, 1, ":") == 0) p = skipBlanks(upper, p + 1);
        else if (upper.compare(p, 3, "：") == 0) p = skipBlanks(upper, p + 3);
        if (upper.compare(p, kFold.size(), kFold) == 0) return true;
    }

    const size_t summary = upper.find("综上");
    if (summary != std::string::npos && upper.find(kFold, summary) != std::string::npos) return true;

    size_t lineStart = 0;
    while (lineStart <= upper.size()) {
        size_t lineEnd = upper.find('\n', lineStart);
        if (lineEnd == std::string::npos) lineEnd = upper.size();
        if (endsWithFoldConclusion(upper.substr(lineStart, lineEnd - lineStart))) return true;
        lineStart = lineEnd + 1;
    }
    return false;
}

ActionResult FieldParser::reconcile(const ActionResult& result, const std::string& rationale,
                                    const std::string& fullText, const std::string& raiseSize) const {
    // Fold is terminal; every other acting kind follows the rationale
    if (!isActingKind(result.kind) || result.kind == ActionKind::Fold) return result;
    if (text::trim(rationale).empty()) return result;

    auto recommended = recommendedAction(rationale);
    if (!recommended) recommended = recommendedAction(fullText);

    if (recommended && *recommended != result.kind) {
        if (*recommended == ActionKind::Raise) return raiseResult("", fullText, raiseSize);
        return ActionResult{*recommended, displayFor(*recommended)};
    }

    if (isFoldRecommended(rationale) || isFoldRecommended(fullText)) {
        return ActionResult{ActionKind::Fold, displayFor(ActionKind::Fold)};
    }
    return result;
}

ActionResult FieldParser::upgradePredicted(const ActionResult& result, const ResponseFields& fields,
                                           const std::string& fullText) const {
    if (result.kind != ActionKind::Waiting || fields.predictedAction.empty()) return result;

    const ActionResult predicted = detectAction(fields.predictedAction, fullText, fields.predictedRaiseSize);
    if (!isActingKind(predicted.kind)) return result;
    return ActionResult{ActionKind::Ready, "Predicted: " + predicted.display};
}

ClassifiedResponse FieldParser::parse(const std::string& text) const {
    ClassifiedResponse out;
    if (text::trim(text).empty()) {
        out.actionKind = ActionKind::Waiting;
        out.displayText = displayFor(ActionKind::Waiting);
        return out;
    }

    const std::vector<LabelHit> hits = m_scanner.scan(text);
    out.fields = extractFields(text, hits);
    if (hits.empty()) {
        out.fields.rationale = text::trim(text);
    }

    const ValidationResult validation = m_validator.validate(out.fields.hand, out.fields.board, out.fields.rationale);
    out.fields.confidence = validation.confidence;
    out.fields.issue = validation.issue;

    const ResponseFields& f = out.fields;
    auto finish = [&](const ActionResult& r) {
        out.actionKind = r.kind;
        out.displayText = r.display;
        return out;
    };
    auto resolve = [&](const ActionResult& r) {
        if (r.kind == ActionKind::Waiting) return upgradePredicted(r, f, text);
        return reconcile(r, f.rationale, text, f.raiseSize);
    };

    for (const auto& value : m_scanner.extractAll(text, hits, static_cast<int>(FieldLabel::Action))) {
        const ActionResult r = detectAction(value, text, f.raiseSize);
        if (r.kind != ActionKind::Unrecognized) return finish(resolve(r));
    }

    const std::string firstLine = text::trim(text.substr(0, text.find('\n')));
    const ActionResult firstLineResult = detectAction(firstLine, text, f.raiseSize);
    if (firstLineResult.kind != ActionKind::Unrecognized) return finish(resolve(firstLineResult));

    return finish(resolve(detectAction(text, text, f.raiseSize)));
}

bool FieldParser::hasActionMarker(const std::string& text) const {
    const auto hits = m_scanner.scan(text);
    for (const auto& value : m_scanner.extractAll(text, hits, static_cast<int>(FieldLabel::Action))) {
        if (detectAction(value, text).kind != ActionKind::Unrecognized) return true;
    }
    return false;
}

bool FieldParser::hasRationaleLabel(const std::string& text) const {
    for (const auto& hit : m_scanner.scan(text)) {
        if (hit.labelId == static_cast<int>(FieldLabel::Analysis)) return true;
    }
    return false;
}

} // namespace hud_advisor::detect
