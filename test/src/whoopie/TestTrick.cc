#include "whoopie/Trick.hh"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

using Whoopie::Card;
using Whoopie::Joker;
using Whoopie::PlayedCard;
using Whoopie::Rank;
using Whoopie::Suit;
using Whoopie::SuitCard;
using Whoopie::TrickCards;

class TrickTest : public testing::Test {
protected:
    void play(
        const Card& card, const std::optional<Suit> trumpSuit,
        const bool jTrumpActive = false)
    {
        const auto seat = static_cast<int>(trick.size());
        trick.push_back({
            card, seat, "player" + std::to_string(seat), trumpSuit,
            jTrumpActive, false, Whoopie::isJoker(card)});
    }

    TrickCards trick;
};

TEST_F(TrickTest, testEmptyTrick)
{
    EXPECT_EQ(std::nullopt, Whoopie::getLeadSuit(trick));
    EXPECT_THROW(
        Whoopie::resolveTrickWinner(trick, Rank::TEN), std::invalid_argument);
}

TEST_F(TrickTest, testHighestOfLeadSuitWins)
{
    play(SuitCard {Suit::HEARTS, Rank::FIVE}, Suit::CLUBS);
    play(SuitCard {Suit::HEARTS, Rank::KING}, Suit::CLUBS);
    play(SuitCard {Suit::SPADES, Rank::ACE}, Suit::CLUBS);
    EXPECT_EQ(Suit::HEARTS, Whoopie::getLeadSuit(trick));
    EXPECT_EQ(1, Whoopie::resolveTrickWinner(trick, Rank::TEN));
}

TEST_F(TrickTest, testTrumpBeatsLeadSuit)
{
    play(SuitCard {Suit::HEARTS, Rank::FIVE}, Suit::CLUBS);
    play(SuitCard {Suit::HEARTS, Rank::KING}, Suit::CLUBS);
    play(SuitCard {Suit::CLUBS, Rank::TWO}, Suit::CLUBS);
    EXPECT_EQ(2, Whoopie::resolveTrickWinner(trick, Rank::TEN));
}

TEST_F(TrickTest, testWhoopieCardIsTrump)
{
    play(SuitCard {Suit::HEARTS, Rank::FIVE}, Suit::CLUBS);
    play(SuitCard {Suit::DIAMONDS, Rank::TEN}, Suit::CLUBS);
    play(SuitCard {Suit::HEARTS, Rank::ACE}, Suit::DIAMONDS);
    EXPECT_EQ(1, Whoopie::resolveTrickWinner(trick, Rank::TEN));
}

TEST_F(TrickTest, testTrumpStatusLockedAtPlay)
{
    play(SuitCard {Suit::HEARTS, Rank::FIVE}, Suit::CLUBS);
    play(SuitCard {Suit::CLUBS, Rank::ACE}, Suit::CLUBS);
    play(SuitCard {Suit::DIAMONDS, Rank::TEN}, Suit::CLUBS);
    play(SuitCard {Suit::DIAMONDS, Rank::THREE}, Suit::DIAMONDS);
    play(SuitCard {Suit::CLUBS, Rank::KING}, Suit::DIAMONDS);
    EXPECT_EQ(1, Whoopie::resolveTrickWinner(trick, Rank::TEN));
    EXPECT_FALSE(Whoopie::wasTrumpWhenPlayed(trick[4], Rank::TEN, Suit::HEARTS));
    EXPECT_TRUE(Whoopie::wasTrumpWhenPlayed(trick[3], Rank::TEN, Suit::HEARTS));
}

TEST_F(TrickTest, testEarlierCardWinsTie)
{
    play(Joker {1}, Suit::CLUBS);
    play(SuitCard {Suit::SPADES, Rank::TEN}, std::nullopt, true);
    EXPECT_EQ(0, Whoopie::resolveTrickWinner(trick, Rank::TEN));
}

TEST_F(TrickTest, testJokerTakesWhoopieRankValue)
{
    EXPECT_EQ(7, Whoopie::getEffectiveRankValue(Joker {1}, Rank::SEVEN));
    EXPECT_EQ(
        Whoopie::PENDING_JOKER_RANK_VALUE,
        Whoopie::getEffectiveRankValue(Joker {1}, std::nullopt));
    EXPECT_EQ(
        12, Whoopie::getEffectiveRankValue(
            SuitCard {Suit::SPADES, Rank::QUEEN}, Rank::SEVEN));
}

TEST_F(TrickTest, testPendingJokerLeadWins)
{
    play(Joker {2}, std::nullopt, true);
    play(SuitCard {Suit::SPADES, Rank::ACE}, std::nullopt, true);
    play(Joker {1}, std::nullopt, true);
    EXPECT_EQ(0, Whoopie::resolveTrickWinner(trick, std::nullopt));
}

TEST_F(TrickTest, testJTrumpMakesLeadSuitTrump)
{
    play(SuitCard {Suit::HEARTS, Rank::FOUR}, std::nullopt, true);
    play(SuitCard {Suit::SPADES, Rank::KING}, std::nullopt, true);
    play(SuitCard {Suit::HEARTS, Rank::NINE}, std::nullopt, true);
    EXPECT_EQ(2, Whoopie::resolveTrickWinner(trick, Rank::TEN));
}

TEST_F(TrickTest, testMakeCompletedTrick)
{
    play(SuitCard {Suit::HEARTS, Rank::FIVE}, Suit::CLUBS);
    play(SuitCard {Suit::CLUBS, Rank::TWO}, Suit::CLUBS);
    const auto completed = Whoopie::makeCompletedTrick(trick, Rank::TEN);
    EXPECT_EQ(trick, completed.cards);
    EXPECT_EQ(1, completed.winnerIndex);
    EXPECT_EQ("player1", completed.winnerId);
    EXPECT_EQ(Suit::HEARTS, completed.leadSuit);
}
