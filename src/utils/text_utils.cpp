/**
 * @file text_utils.cpp
 * @brief Byte-level string helpers
 */

#include "utils/text_utils.h"

#include <sstream>

namespace hud_advisor::text {

namespace {

bool isDigit(char c) { return c >= '0' && c <= '9'; }

bool isSpace(char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v'; }

bool isContinuationByte(unsigned char c) { return (c & 0xC0) == 0x80; }

} // namespace

std::string toUpperAscii(const std::string& s) {
    std::string out = s;
    for (char& c : out) {
        if (c >= 'a' && c <= 'z') {
            c = static_cast<char>(c - 'a' + 'A');
        }
    }
    return out;
}

std::string trim(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && isSpace(s[b])) ++b;
    while (e > b && isSpace(s[e - 1])) --e;
    return s.substr(b, e - b);
}

std::vector<std::string> tokenize(const std::string& s) {
    std::vector<std::string> tokens;
    std::istringstream iss(s);
    std::string token;

    while (iss >> token) {
        tokens.push_back(token);
    }

    return tokens;
}

bool isAsciiAlnum(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || isDigit(c);
}

bool isWordStart(const std::string& s, size_t pos) {
    if (pos >= s.size()) return false;
    if (static_cast<unsigned char>(s[pos]) >= 0x80) return true;
    return pos == 0 || !isAsciiAlnum(s[pos - 1]);
}

size_t findWord(const std::string& haystack, const std::string& needle, size_t pos) {
    if (needle.empty()) return std::string::npos;
    const bool ascii = static_cast<unsigned char>(needle[0]) < 0x80;
    while (true) {
        pos = haystack.find(needle, pos);
        if (pos == std::string::npos) return pos;
        if (!ascii || isWordStart(haystack, pos)) return pos;
        ++pos;
    }
}

size_t codePointCount(const std::string& s) {
    size_t n = 0;
    for (char c : s) {
        if (!isContinuationByte(static_cast<unsigned char>(c))) ++n;
    }
    return n;
}

size_t advanceCodePoints(const std::string& s, size_t pos, size_t n) {
    while (pos < s.size() && n > 0) {
        ++pos;
        while (pos < s.size() && isContinuationByte(static_cast<unsigned char>(s[pos]))) ++pos;
        --n;
    }
    return pos;
}

std::string truncateUtf8(const std::string& s, size_t maxChars) {
    const size_t end = advanceCodePoints(s, 0, maxChars);
    if (end >= s.size()) return s;
    return s.substr(0, end) + "...";
}

std::vector<std::string> findNumbers(const std::string& s) {
    std::vector<std::string> numbers;
    size_t i = 0;
    while (i < s.size()) {
        if (!isDigit(s[i])) {
            ++i;
            continue;
        }
        size_t j = i;
        while (j < s.size() && isDigit(s[j])) ++j;
        if (j + 1 < s.size() && s[j] == '.' && isDigit(s[j + 1])) {
            ++j;
            while (j < s.size() && isDigit(s[j])) ++j;
        }
        numbers.push_back(s.substr(i, j - i));
        i = j;
    }
    return numbers;
}

std::string numberAt(const std::string& s, size_t pos) {
    while (pos < s.size() && (s[pos] == ' ' || s[pos] == '\t')) ++pos;
    if (pos < s.size() && s[pos] == '$') ++pos;
    if (pos >= s.size() || !isDigit(s[pos])) return "";

    size_t end = pos;
    while (end < s.size() && isDigit(s[end])) ++end;
    if (end + 1 < s.size() && s[end] == '.' && isDigit(s[end + 1])) {
        ++end;
        while (end < s.size() && isDigit(s[end])) ++end;
    }
    return s.substr(pos, end - pos);
}

} // namespace hud_advisor::text
