/**
 * @file test_field_parser.cpp
 * @brief Unit tests for response field extraction and action classification
 */

#include "detection/field_parser.h"

#include <gtest/gtest.h>

#include <string>

using namespace hud_advisor;
using namespace hud_advisor::detect;

class FieldParserTest : public ::testing::Test {
protected:
    FieldParser parser;
};

// ---------------------------------------------------------------------------
// Fields
// ---------------------------------------------------------------------------

TEST_F(FieldParserTest, RaiseWithPotRoundTrip) {
    const ClassifiedResponse r = parser.parse("ACTION: RAISE 120\nPOT: 80\n");
    EXPECT_EQ(r.actionKind, ActionKind::Raise);
    EXPECT_EQ(r.displayText, "Raise 120");
    EXPECT_EQ(r.fields.pot, "80");
}

TEST_F(FieldParserTest, ExtractsEveryEnglishField) {
    const std::string text =
        "ACTION: CALL\n"
        "HAND: Ah Kd\n"
        "BOARD: Ks 7c 2d\n"
        "STAGE: flop POSITION: BTN\n"
        "POT: 240 TO CALL: 60\n"
        "ODDS: 20% SPR: 4.5\n"
        "ANALYSIS: top pair of kings with the best kicker";
    const ClassifiedResponse r = parser.parse(text);

    EXPECT_EQ(r.actionKind, ActionKind::Call);
    EXPECT_EQ(r.fields.hand, "Ah Kd");
    EXPECT_EQ(r.fields.board, "Ks 7c 2d");
    EXPECT_EQ(r.fields.stage, "flop");
    EXPECT_EQ(r.fields.position, "BTN");
    EXPECT_EQ(r.fields.pot, "240");
    EXPECT_EQ(r.fields.amountToCall, "60");
    EXPECT_EQ(r.fields.potOdds, "20%");
    EXPECT_EQ(r.fields.stackToPotRatio, "4.5");
    EXPECT_EQ(r.fields.rationale, "top pair of kings with the best kicker");
    EXPECT_EQ(r.fields.confidence, Confidence::High);
    EXPECT_TRUE(r.fields.issue.empty());
}

TEST_F(FieldParserTest, ChineseLabels) {
    const ClassifiedResponse r = parser.parse("行动：加注 200\n手牌：A♠ K♦\n底池：300");
    EXPECT_EQ(r.actionKind, ActionKind::Raise);
    EXPECT_EQ(r.displayText, "Raise 200");
    EXPECT_EQ(r.fields.hand, "A♠ K♦");
    EXPECT_EQ(r.fields.pot, "300");
}

TEST_F(FieldParserTest, PredictedRaiseSizeDoesNotLeakIntoRaiseSize) {
    const std::string text = "PREDICTED RAISE SIZE: 300\nRAISE SIZE: 90";
    EXPECT_EQ(parser.extractField(text, FieldLabel::RaiseSize), "90");
    EXPECT_EQ(parser.extractField(text, FieldLabel::PredictedRaiseSize), "300");
}

TEST_F(FieldParserTest, EmptyInputIsWaiting) {
    const ClassifiedResponse r = parser.parse("  \n\t ");
    EXPECT_EQ(r.actionKind, ActionKind::Waiting);
    EXPECT_EQ(r.displayText, "Waiting");
    EXPECT_FALSE(r.fields.hasContent());
}

TEST_F(FieldParserTest, UnlabeledTextBecomesRationale) {
    const ClassifiedResponse r = parser.parse("  I think you should fold here  ");
    EXPECT_EQ(r.actionKind, ActionKind::Fold);
    EXPECT_EQ(r.displayText, "Fold");
    EXPECT_EQ(r.fields.rationale, "I think you should fold here");
}

TEST_F(FieldParserTest, BinaryInputDoesNotThrow) {
    const std::string junk("\x00\xff\xfe\x80 ACTION\x01:", 13);
    ClassifiedResponse r;
    EXPECT_NO_THROW(r = parser.parse(junk));
    EXPECT_EQ(r.actionKind, ActionKind::Unrecognized);
}

// ---------------------------------------------------------------------------
// Action detection
// ---------------------------------------------------------------------------

TEST_F(FieldParserTest, KeywordPrecedence) {
    EXPECT_EQ(parser.parse("ACTION: ALL-IN or CALL").actionKind, ActionKind::AllIn);
    EXPECT_EQ(parser.parse("ACTION: CALL or FOLD").actionKind, ActionKind::Call);
    EXPECT_EQ(parser.parse("ACTION: CHECK").actionKind, ActionKind::Check);
    EXPECT_EQ(parser.parse("ACTION: FOLD").actionKind, ActionKind::Fold);
    EXPECT_EQ(parser.parse("ACTION: READY").actionKind, ActionKind::Ready);
    EXPECT_EQ(parser.parse("ACTION: WAITING for opponents").actionKind, ActionKind::Waiting);
    EXPECT_EQ(parser.parse("ACTION: 过牌").actionKind, ActionKind::Check);
    EXPECT_EQ(parser.parse("ACTION: 等待").actionKind, ActionKind::Waiting);
}

TEST_F(FieldParserTest, DisplayTexts) {
    EXPECT_EQ(parser.parse("ACTION: ALLIN").displayText, "All-in");
    EXPECT_EQ(parser.parse("ACTION: CHECK").displayText, "Check");
    EXPECT_EQ(parser.parse("ACTION: WAIT").displayText, "Waiting");
    EXPECT_EQ(parser.parse("ACTION: READY").displayText, "Ready");
}

TEST_F(FieldParserTest, SkipHasEmptyDisplay) {
    const ClassifiedResponse r = parser.parse("ACTION: SKIP\nANALYSIS: lobby screen");
    EXPECT_EQ(r.actionKind, ActionKind::Skip);
    EXPECT_TRUE(r.displayText.empty());
}

TEST_F(FieldParserTest, KeywordMustBeAWord) {
    EXPECT_EQ(parser.parse("ACTION: BETTER HAND").actionKind, ActionKind::Unrecognized);
    EXPECT_EQ(parser.parse("ACTION: RECALLING").actionKind, ActionKind::Unrecognized);
}

TEST_F(FieldParserTest, UnrecognizedDisplayIsTruncated) {
    const ClassifiedResponse r = parser.parse("Lorem ipsum dolor sit amet consectetur");
    EXPECT_EQ(r.actionKind, ActionKind::Unrecognized);
    EXPECT_EQ(r.displayText, "Lorem ipsum dolor si...");
}

TEST_F(FieldParserTest, LaterActionFieldWhenFirstIsUnrecognized) {
    EXPECT_EQ(parser.parse("ACTION: pending\nACTION: CHECK").actionKind, ActionKind::Check);
}

TEST_F(FieldParserTest, FirstLineBeforeWholeText) {
    const ClassifiedResponse r = parser.parse("Call\nthe villain might fold");
    EXPECT_EQ(r.actionKind, ActionKind::Call);
}

// ---------------------------------------------------------------------------
// Raise sizing
// ---------------------------------------------------------------------------

TEST_F(FieldParserTest, RaiseSizeFieldAfterEquals) {
    EXPECT_EQ(parser.parse("ACTION: RAISE\nRAISE SIZE: 2/3 pot = 60").displayText, "Raise 60");
}

TEST_F(FieldParserTest, RaiseSizeFieldTrailingNumber) {
    EXPECT_EQ(parser.parse("ACTION: RAISE\nRAISE SIZE: 3x to 45").displayText, "Raise 45");
}

TEST_F(FieldParserTest, RaiseToAmount) {
    EXPECT_EQ(parser.parse("ACTION: RAISE TO $75").displayText, "Raise 75");
    EXPECT_EQ(parser.parse("ACTION: BET 50").displayText, "Raise 50");
}

TEST_F(FieldParserTest, RaiseFallsBackToTwoThirdsPot) {
    EXPECT_EQ(parser.parse("ACTION: RAISE\nPOT: 90").displayText, "Raise 60");
}

TEST_F(FieldParserTest, BareRaise) {
    EXPECT_EQ(parser.parse("ACTION: RAISE").displayText, "Raise");
}

// ---------------------------------------------------------------------------
// Predicted / Ready
// ---------------------------------------------------------------------------

TEST_F(FieldParserTest, WaitingWithPredictionBecomesReady) {
    const ClassifiedResponse r =
        parser.parse("ACTION: WAIT\nPREDICTED: RAISE\nPREDICTED RAISE SIZE: 150\nHAND: Qs Qd");
    EXPECT_EQ(r.actionKind, ActionKind::Ready);
    EXPECT_EQ(r.displayText, "Predicted: Raise 150");
    EXPECT_EQ(r.fields.hand, "Qs Qd");
}

TEST_F(FieldParserTest, WaitingWithVaguePredictionStaysWaiting) {
    const ClassifiedResponse r = parser.parse("ACTION: WAIT\nPREDICTED: depends on the turn");
    EXPECT_EQ(r.actionKind, ActionKind::Waiting);
}

TEST_F(FieldParserTest, ReadyCarriesRecommendation) {
    const ClassifiedResponse r = parser.parse("ACTION: READY\nANALYSIS: 建议弃牌");
    EXPECT_EQ(r.actionKind, ActionKind::Ready);
    EXPECT_EQ(r.displayText, "Predicted: Fold");
}

// ---------------------------------------------------------------------------
// Contradiction reconciliation
// ---------------------------------------------------------------------------

TEST_F(FieldParserTest, FoldIsNeverOverridden) {
    const ClassifiedResponse r =
        parser.parse("ACTION: FOLD\nANALYSIS: You should raise here, the best play is to raise");
    EXPECT_EQ(r.actionKind, ActionKind::Fold);
    EXPECT_EQ(r.displayText, "Fold");
}

TEST_F(FieldParserTest, RecommendedCallOverridesRaise) {
    const ClassifiedResponse r =
        parser.parse("ACTION: RAISE 100\nANALYSIS: Odds are poor, you should call.");
    EXPECT_EQ(r.actionKind, ActionKind::Call);
    EXPECT_EQ(r.displayText, "Call");
}

TEST_F(FieldParserTest, RecommendedRaiseOverridesCall) {
    const ClassifiedResponse r = parser.parse("ACTION: CALL\nPOT: 90\nANALYSIS: 建议加注");
    EXPECT_EQ(r.actionKind, ActionKind::Raise);
    EXPECT_EQ(r.displayText, "Raise 60");
}

TEST_F(FieldParserTest, RecommendedCallOverridesCheck) {
    const ClassifiedResponse r = parser.parse("ACTION: CHECK\nANALYSIS: you should call here");
    EXPECT_EQ(r.actionKind, ActionKind::Call);
    EXPECT_EQ(r.displayText, "Call");
}

TEST_F(FieldParserTest, RecommendedCheckOverridesCall) {
    const ClassifiedResponse r = parser.parse("ACTION: CALL\nANALYSIS: best to check");
    EXPECT_EQ(r.actionKind, ActionKind::Check);
    EXPECT_EQ(r.displayText, "Check");
}

TEST_F(FieldParserTest, RecommendedAllInOverridesRaise) {
    const ClassifiedResponse r = parser.parse("ACTION: RAISE 200\nANALYSIS: 对手很弱，应该全压");
    EXPECT_EQ(r.actionKind, ActionKind::AllIn);
    EXPECT_EQ(r.displayText, "All-in");
}

TEST_F(FieldParserTest, RecommendedRaiseOverridesAllInWithSizing) {
    const ClassifiedResponse r = parser.parse("ACTION: ALL IN\nRAISE SIZE: 150\nANALYSIS: you should raise");
    EXPECT_EQ(r.actionKind, ActionKind::Raise);
    EXPECT_EQ(r.displayText, "Raise 150");
}

TEST_F(FieldParserTest, MatchingRecommendationKeepsDeclaredSizing) {
    const ClassifiedResponse r = parser.parse("ACTION: RAISE 80\nANALYSIS: you should raise");
    EXPECT_EQ(r.actionKind, ActionKind::Raise);
    EXPECT_EQ(r.displayText, "Raise 80");
}

TEST_F(FieldParserTest, RecommendedFoldOverridesRaise) {
    const ClassifiedResponse r = parser.parse("ACTION: RAISE\nANALYSIS: 结论：弃牌");
    EXPECT_EQ(r.actionKind, ActionKind::Fold);
}

TEST_F(FieldParserTest, FoldPhraseAsLastResort) {
    const ClassifiedResponse r = parser.parse("ACTION: CALL\nANALYSIS: 牌力太弱，直接弃牌");
    EXPECT_EQ(r.actionKind, ActionKind::Fold);
}

TEST_F(FieldParserTest, NoRationaleNoReconciliation) {
    const ClassifiedResponse r = parser.parse("ACTION: RAISE 40\nHAND: 7h 2c");
    EXPECT_EQ(r.actionKind, ActionKind::Raise);
    EXPECT_EQ(r.displayText, "Raise 40");
}

TEST_F(FieldParserTest, RecommendedActionCues) {
    const auto none = ActionKind::Unrecognized;
    EXPECT_EQ(FieldParser::recommendedAction("we must call here").value_or(none), ActionKind::Call);
    EXPECT_EQ(FieldParser::recommendedAction("Overall, check is fine").value_or(none), ActionKind::Check);
    EXPECT_EQ(FieldParser::recommendedAction("应该全压").value_or(none), ActionKind::AllIn);
    EXPECT_FALSE(FieldParser::recommendedAction("the board is dry").has_value());
}

// ---------------------------------------------------------------------------
// Consistency check
// ---------------------------------------------------------------------------

TEST_F(FieldParserTest, InconsistentClaimLowersConfidenceButKeepsAction) {
    const ClassifiedResponse r =
        parser.parse("ACTION: RAISE 90\nHAND: 7h 2c\nBOARD: Ks 9d 4c\nANALYSIS: top pair of kings, strong");
    EXPECT_EQ(r.actionKind, ActionKind::Raise);
    EXPECT_EQ(r.fields.confidence, Confidence::Low);
    EXPECT_FALSE(r.fields.issue.empty());
}

// ---------------------------------------------------------------------------
// Streaming helpers
// ---------------------------------------------------------------------------

TEST_F(FieldParserTest, ActionMarker) {
    EXPECT_FALSE(parser.hasActionMarker("ACTION: RAI"));
    EXPECT_FALSE(parser.hasActionMarker("HAND: Ah Kd"));
    EXPECT_TRUE(parser.hasActionMarker("ACTION: RAISE"));
    EXPECT_TRUE(parser.hasActionMarker("行动：等待"));
}

TEST_F(FieldParserTest, RationaleLabel) {
    EXPECT_FALSE(parser.hasRationaleLabel("ACTION: RAISE\nANALYSIS"));
    EXPECT_TRUE(parser.hasRationaleLabel("ACTION: RAISE\nANALYSIS:"));
    EXPECT_TRUE(parser.hasRationaleLabel("行动：加注\n分析：对手偏紧"));
}
