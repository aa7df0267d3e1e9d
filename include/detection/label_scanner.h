#pragma once
/**
 * @file label_scanner.h
 * @brief Explicit boundary search for "LABEL: value" fields in free text
 */

#include <cstddef>
#include <string>
#include <vector>

namespace hud_advisor::detect {

/**
 * @brief One label found in the text
 */
struct LabelHit {
    int labelId = -1;       ///< Caller-defined label identifier
    size_t labelPos = 0;    ///< Offset of the label's first byte
    size_t valueStart = 0;  ///< Offset just past the separator
};

/**
 * @brief Scanner for a fixed set of labels
 *
 * A label is recognised when it is followed by optional blanks and an ASCII
 * ':' or a full-width '：'. Matching is case-insensitive for ASCII. At each
 * position the longest spelling wins and scanning resumes after the
 * separator, so "RAISE SIZE:" inside "PREDICTED RAISE SIZE:" is never
 * reported. ASCII spellings must start a word.
 *
 * A value runs from its separator to the next label occurrence on the same
 * line, or to the end of the line.
 */
class LabelScanner {
public:
    /// Add a spelling for labelId. Several spellings may share one id.
    void addLabel(int labelId, const std::string& spelling);

    /// Scanner where each label's id is its index in the list.
    static LabelScanner fromLabels(const std::vector<std::string>& labels);

    /**
     * @brief Locate every label occurrence, sorted by position
     */
    std::vector<LabelHit> scan(const std::string& text) const;

    /**
     * @brief Value of hits[index], bounded by the next label or line end
     */
    std::string valueOf(const std::string& text, const std::vector<LabelHit>& hits, size_t index) const;

    /**
     * @brief Value of the first occurrence of labelId (empty if absent)
     */
    std::string extract(const std::string& text, int labelId) const;
    std::string extract(const std::string& text, const std::vector<LabelHit>& hits, int labelId) const;

    /**
     * @brief Values of every occurrence of labelId, in order
     */
    std::vector<std::string> extractAll(const std::string& text, const std::vector<LabelHit>& hits, int labelId) const;

private:
    struct Spelling {
        int labelId;
        std::string upper;
    };
    std::vector<Spelling> m_spellings; ///< Sorted longest first

    size_t separatorEnd(const std::string& text, size_t pos) const;
};

} // namespace hud_advisor::detect
