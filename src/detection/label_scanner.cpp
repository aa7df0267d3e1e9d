/**
 * @file label_scanner.cpp
 * @brief Labeled-field boundary search
 */

#include "detection/label_scanner.h"
#include "utils/text_utils.h"

#include <algorithm>

namespace hud_advisor::detect {

namespace {

const char kFullWidthColon[] = "\xEF\xBC\x9A"; // U+FF1A

} // namespace

void LabelScanner::addLabel(int labelId, const std::string& spelling) {
    if (spelling.empty()) return;
    m_spellings.push_back(Spelling{labelId, text::toUpperAscii(spelling)});
    std::stable_sort(m_spellings.begin(), m_spellings.end(),
                     [](const Spelling& a, const Spelling& b) { return a.upper.size() > b.upper.size(); });
}

LabelScanner LabelScanner::fromLabels(const std::vector<std::string>& labels) {
    LabelScanner scanner;
    for (size_t i = 0; i < labels.size(); ++i) {
        scanner.addLabel(static_cast<int>(i), labels[i]);
    }
    return scanner;
}

size_t LabelScanner::separatorEnd(const std::string& text, size_t pos) const {
    while (pos < text.size() && (text[pos] == ' ' || text[pos] == '\t')) ++pos;
    if (pos < text.size() && text[pos] == ':') return pos + 1;
    if (text.compare(pos, 3, kFullWidthColon) == 0) return pos + 3;
    return std::string::npos;
}

std::vector<LabelHit> LabelScanner::scan(const std::string& text) const {
    std::vector<LabelHit> hits;
    if (text.empty() || m_spellings.empty()) return hits;

    const std::string upper = text::toUpperAscii(text);
    size_t pos = 0;
    while (pos < upper.size()) {
        bool matched = false;
        for (const auto& sp : m_spellings) {
            if (upper.compare(pos, sp.upper.size(), sp.upper) != 0) continue;
            if (static_cast<unsigned char>(sp.upper[0]) < 0x80 && !text::isWordStart(upper, pos)) continue;

            const size_t end = separatorEnd(upper, pos + sp.upper.size());
            if (end == std::string::npos) continue;

            hits.push_back(LabelHit{sp.labelId, pos, end});
            pos = end;
            matched = true;
            break;
        }
        if (!matched) ++pos;
    }
    return hits;
}

std::string LabelScanner::valueOf(const std::string& text, const std::vector<LabelHit>& hits, size_t index) const {
    if (index >= hits.size()) return "";

    const size_t start = hits[index].valueStart;
    size_t end = text.find('\n', start);
    if (end == std::string::npos) end = text.size();
    if (index + 1 < hits.size()) {
        end = (std::min)(end, hits[index + 1].labelPos);
    }
    if (end <= start) return "";
    return text::trim(text.substr(start, end - start));
}

std::string LabelScanner::extract(const std::string& text, int labelId) const {
    return extract(text, scan(text), labelId);
}

std::string LabelScanner::extract(const std::string& text, const std::vector<LabelHit>& hits, int labelId) const {
    for (size_t i = 0; i < hits.size(); ++i) {
        if (hits[i].labelId == labelId) {
            return valueOf(text, hits, i);
        }
    }
    return "";
}

std::vector<std::string> LabelScanner::extractAll(const std::string& text, const std::vector<LabelHit>& hits, int labelId) const {
    std::vector<std::string> values;
    for (size_t i = 0; i < hits.size(); ++i) {
        if (hits[i].labelId == labelId) {
            values.push_back(valueOf(text, hits, i));
        }
    }
    return values;
}

} // namespace hud_advisor::detect
