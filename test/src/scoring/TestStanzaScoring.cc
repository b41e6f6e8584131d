#include "scoring/StanzaScoring.hh"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

using Whoopie::Scoring::Scores;

namespace {

void test(
    const int score, const int bid, const int tricksTaken,
    const std::string& message)
{
    EXPECT_EQ(
        score,
        Whoopie::Scoring::calculatePlayerStanzaScore(bid, tricksTaken))
        << message;
}

}

TEST(StanzaScoringTest, testPlayerStanzaScore)
{
    test(2, 0, 0, "made zero bid");
    test(5, 3, 3, "made bid");
    test(15, 13, 13, "made maximum bid");
    test(-1, 2, 3, "overtrick");
    test(-1, 2, 1, "undertrick");
    test(-1, 0, 4, "missed zero bid");
}

TEST(StanzaScoringTest, testStanzaScores)
{
    EXPECT_EQ(
        (Scores {3, -1, 2}),
        Whoopie::Scoring::calculateStanzaScores({1, 2, 0}, {1, 0, 0}));
}

TEST(StanzaScoringTest, testStanzaScoresSizeMismatch)
{
    EXPECT_THROW(
        Whoopie::Scoring::calculateStanzaScores({1, 2}, {1}),
        std::invalid_argument);
}

TEST(StanzaScoringTest, testApplyScoreChanges)
{
    EXPECT_EQ(
        (Scores {13, 4, -2}),
        Whoopie::Scoring::applyScoreChanges({10, 5, -1}, {3, -1, -1}));
    EXPECT_THROW(
        Whoopie::Scoring::applyScoreChanges({10}, {3, -1}),
        std::invalid_argument);
}

TEST(StanzaScoringTest, testMissedWhoopieCallPenalty)
{
    EXPECT_EQ(-1, Whoopie::Scoring::getMissedWhoopieCallPenalty());
}

TEST(StanzaScoringTest, testTruncatedAverage)
{
    EXPECT_EQ(0, Whoopie::Scoring::calculateTruncatedAverage({}));
    EXPECT_EQ(5, Whoopie::Scoring::calculateTruncatedAverage({4, 5, 7}));
    EXPECT_EQ(3, Whoopie::Scoring::calculateTruncatedAverage({3, 4}));
}

TEST(StanzaScoringTest, testTruncatedAverageRoundsDown)
{
    EXPECT_EQ(-2, Whoopie::Scoring::calculateTruncatedAverage({-1, -2}));
    EXPECT_EQ(-1, Whoopie::Scoring::calculateTruncatedAverage({-3, 2}));
    EXPECT_EQ(-2, Whoopie::Scoring::calculateTruncatedAverage({-2, -2}));
}
