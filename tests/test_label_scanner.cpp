/**
 * @file test_label_scanner.cpp
 * @brief Unit tests for labeled-field boundary search
 */

#include "detection/label_scanner.h"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace hud_advisor::detect;

class LabelScannerTest : public ::testing::Test {
protected:
    LabelScanner scanner = LabelScanner::fromLabels({"A", "B"});
};

TEST_F(LabelScannerTest, ValueStopsAtNextLabelOnSameLine) {
    EXPECT_EQ(scanner.extract("A: 1 B: 2", 0), "1");
    EXPECT_EQ(scanner.extract("A: 1 B: 2", 1), "2");
}

TEST_F(LabelScannerTest, ValueStopsAtLineEnd) {
    EXPECT_EQ(scanner.extract("A: first line\nB: second", 0), "first line");
    EXPECT_EQ(scanner.extract("A: first line\nB: second", 1), "second");
}

TEST_F(LabelScannerTest, MissingLabelIsEmpty) {
    EXPECT_EQ(scanner.extract("A: 1", 1), "");
    EXPECT_EQ(scanner.extract("", 0), "");
}

TEST_F(LabelScannerTest, AdjacentLabelsGiveEmptyValue) {
    EXPECT_EQ(scanner.extract("A:B: 2", 0), "");
    EXPECT_EQ(scanner.extract("A:B: 2", 1), "2");
}

TEST_F(LabelScannerTest, LabelNeedsSeparator) {
    EXPECT_TRUE(scanner.scan("A 1 B 2").empty());
}

TEST_F(LabelScannerTest, AsciiLabelMustStartWord) {
    // "BA:" is not the label A
    const auto hits = scanner.scan("BA: 1");
    EXPECT_TRUE(hits.empty());
}

TEST_F(LabelScannerTest, CaseInsensitiveAndBlankBeforeSeparator) {
    EXPECT_EQ(scanner.extract("a : 7", 0), "7");
}

TEST(LabelScannerSpellingTest, LongestSpellingWins) {
    LabelScanner s;
    s.addLabel(0, "RAISE SIZE");
    s.addLabel(1, "PREDICTED RAISE SIZE");
    const std::string text = "PREDICTED RAISE SIZE: 300\nRAISE SIZE: 90";

    const auto hits = s.scan(text);
    ASSERT_EQ(hits.size(), 2u);
    EXPECT_EQ(hits[0].labelId, 1);
    EXPECT_EQ(hits[1].labelId, 0);
    EXPECT_EQ(s.extract(text, 0), "90");
    EXPECT_EQ(s.extract(text, 1), "300");
}

TEST(LabelScannerSpellingTest, FullWidthColonAndSharedIds) {
    LabelScanner s;
    s.addLabel(0, "POT");
    s.addLabel(0, "底池");
    EXPECT_EQ(s.extract("底池：300", 0), "300");
    EXPECT_EQ(s.extract("pot: 120", 0), "120");
}

TEST(LabelScannerSpellingTest, ExtractAllKeepsOrder) {
    LabelScanner s = LabelScanner::fromLabels({"ACTION", "POT"});
    const std::string text = "ACTION: pending\nPOT: 10\nACTION: CHECK";
    const auto hits = s.scan(text);
    const std::vector<std::string> values = s.extractAll(text, hits, 0);
    ASSERT_EQ(values.size(), 2u);
    EXPECT_EQ(values[0], "pending");
    EXPECT_EQ(values[1], "CHECK");
}
