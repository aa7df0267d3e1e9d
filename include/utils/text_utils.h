#pragma once
/**
 * @file text_utils.h
 * @brief Byte-level string helpers shared by the text sensors
 *
 * All helpers treat text as UTF-8. Case folding only touches ASCII letters,
 * so byte offsets are identical between a string and its folded copy.
 */

#include <cstddef>
#include <string>
#include <vector>

namespace hud_advisor::text {

/**
 * @brief Uppercase ASCII letters, leave every other byte untouched
 */
std::string toUpperAscii(const std::string& s);

/**
 * @brief Strip ASCII whitespace from both ends
 */
std::string trim(const std::string& s);

/**
 * @brief Tokenize text by whitespace
 */
std::vector<std::string> tokenize(const std::string& s);

/**
 * @brief True if byte is an ASCII letter or digit
 */
bool isAsciiAlnum(char c);

/**
 * @brief True if the byte at pos starts a word
 *
 * Non-ASCII bytes (CJK text) never need a word boundary.
 */
bool isWordStart(const std::string& s, size_t pos);

/**
 * @brief Find the first occurrence of needle at or after pos
 *
 * ASCII needles must start a word; the haystack is expected to be folded
 * with toUpperAscii() already.
 *
 * @return Offset or std::string::npos
 */
size_t findWord(const std::string& haystack, const std::string& needle, size_t pos = 0);

/**
 * @brief Number of UTF-8 code points in s
 */
size_t codePointCount(const std::string& s);

/**
 * @brief Byte offset just past the first n code points starting at pos
 */
size_t advanceCodePoints(const std::string& s, size_t pos, size_t n);

/**
 * @brief Keep at most maxChars code points, appending "..." when cut
 */
std::string truncateUtf8(const std::string& s, size_t maxChars);

/**
 * @brief All decimal numbers in s ("120", "12.5"), in order of appearance
 */
std::vector<std::string> findNumbers(const std::string& s);

/**
 * @brief Number starting at pos after optional spaces and a '$' sign
 * @return Digits (with optional fraction) or empty string
 */
std::string numberAt(const std::string& s, size_t pos);

} // namespace hud_advisor::text
