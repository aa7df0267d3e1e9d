/**
 * @file test_hand_validator.cpp
 * @brief Unit tests for the hand-strength consistency check
 */

#include "detection/hand_validator.h"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace hud_advisor;
using namespace hud_advisor::detect;

class HandValidatorTest : public ::testing::Test {
protected:
    HandValidator validator;
};

TEST_F(HandValidatorTest, EmptyRationaleIsMedium) {
    const ValidationResult r = validator.validate("Ah Kd", "Ks 7c 2d", "   ");
    EXPECT_EQ(r.confidence, Confidence::Medium);
    EXPECT_TRUE(r.issue.empty());
}

TEST_F(HandValidatorTest, ConsistentTopPairIsHigh) {
    const ValidationResult r = validator.validate("Ah Kd", "Ks 7c 2d", "Top pair of kings, value bet");
    EXPECT_EQ(r.confidence, Confidence::High);
    EXPECT_TRUE(r.issue.empty());
}

TEST_F(HandValidatorTest, TopPairNotInHand) {
    const ValidationResult r = validator.validate("7h 2c", "Ks 9d 4c", "top pair K on a dry board");
    EXPECT_EQ(r.confidence, Confidence::Low);
    EXPECT_NE(r.issue.find("top pair"), std::string::npos);
}

TEST_F(HandValidatorTest, ChineseTopPairNotOnBoard) {
    const ValidationResult r = validator.validate("Kh Qd", "9s 7c 2d", "顶对K，继续下注");
    EXPECT_EQ(r.confidence, Confidence::Low);
}

TEST_F(HandValidatorTest, PairOfMissingRank) {
    EXPECT_EQ(validator.validate("Ah Kd", "9s 7c 2d", "we have a pair of jacks").confidence, Confidence::Low);
    EXPECT_EQ(validator.validate("Kh Qd", "2s 3c 4d", "对A").confidence, Confidence::Low);
    EXPECT_EQ(validator.validate("Jh Qd", "Js 3c 4d", "pair of jacks").confidence, Confidence::High);
}

TEST_F(HandValidatorTest, TwoPairNeedsTwoPairedRanks) {
    EXPECT_EQ(validator.validate("Ah Kd", "Ac 7d 2s", "two pair, bet big").confidence, Confidence::Low);
    EXPECT_EQ(validator.validate("Ah Kd", "Ac Kc 2s", "two pair, bet big").confidence, Confidence::High);
}

TEST_F(HandValidatorTest, TripsNeedThreeOfARank) {
    EXPECT_EQ(validator.validate("7h 7d", "7c 2s 9d", "we flopped a set").confidence, Confidence::High);
    EXPECT_EQ(validator.validate("7h 8d", "7c 2s 9d", "trips, slow play").confidence, Confidence::Low);
}

TEST_F(HandValidatorTest, StraightNeedsFiveRanks) {
    EXPECT_EQ(validator.validate("9h Th", "Jc 2d", "made a straight").confidence, Confidence::Low);
    EXPECT_EQ(validator.validate("9h Th", "Jc 2d", "open-ended straight draw").confidence, Confidence::High);
    EXPECT_EQ(validator.validate("9h Th", "Jc 2d", "顺子听牌").confidence, Confidence::High);
}

TEST_F(HandValidatorTest, SameCardInHandAndBoard) {
    const ValidationResult r = validator.validate("Ah Kd", "Ah 7c 2d", "nice flop");
    EXPECT_EQ(r.confidence, Confidence::Low);
    EXPECT_NE(r.issue.find("Ah"), std::string::npos);
}

TEST_F(HandValidatorTest, HoleCardCount) {
    EXPECT_EQ(validator.validate("Ah Kd 7c", "", "premium hand").confidence, Confidence::Low);
    EXPECT_EQ(validator.validate("-", "", "no cards yet").confidence, Confidence::High);
}

TEST(HandValidatorRankTest, ParseCardRank) {
    EXPECT_EQ(HandValidator::parseCardRank("A♠"), 'A');
    EXPECT_EQ(HandValidator::parseCardRank("10♦"), 'T');
    EXPECT_EQ(HandValidator::parseCardRank("Td"), 'T');
    EXPECT_EQ(HandValidator::parseCardRank("qh"), 'Q');
    EXPECT_EQ(HandValidator::parseCardRank("x"), 0);
}

TEST(HandValidatorRankTest, ExtractRanks) {
    EXPECT_EQ(HandValidator::extractRanks("A♠ 10♦, 7c"), (std::vector<char>{'A', 'T', '7'}));
    EXPECT_TRUE(HandValidator::extractRanks("无").empty());
    EXPECT_TRUE(HandValidator::extractRanks("none").empty());
    EXPECT_TRUE(HandValidator::extractRanks("").empty());
}
