#include "whoopie/AllowedCards.hh"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <string>

using Whoopie::Card;
using Whoopie::Hand;
using Whoopie::Joker;
using Whoopie::PlayedCard;
using Whoopie::Rank;
using Whoopie::Suit;
using Whoopie::SuitCard;
using Whoopie::TrickCards;
using testing::ElementsAre;

namespace {

PlayedCard played(const Card& card, const int seat)
{
    return {card, seat, "p" + std::to_string(seat), Suit::SPADES, false, false,
        false};
}

}

class AllowedCardsTest : public testing::Test {
protected:
    Hand hand {
        SuitCard {Suit::HEARTS, Rank::TWO},
        SuitCard {Suit::CLUBS, Rank::ACE},
        Joker {1},
        SuitCard {Suit::HEARTS, Rank::KING},
    };
};

TEST_F(AllowedCardsTest, testLeaderMayPlayAnything)
{
    EXPECT_EQ(hand, Whoopie::getValidCards(hand, TrickCards {}));
}

TEST_F(AllowedCardsTest, testMustFollowSuit)
{
    const auto trick = TrickCards {
        played(SuitCard {Suit::HEARTS, Rank::TEN}, 0)};
    EXPECT_THAT(
        Whoopie::getValidCards(hand, trick),
        ElementsAre(
            Card {SuitCard {Suit::HEARTS, Rank::TWO}},
            Card {SuitCard {Suit::HEARTS, Rank::KING}}));
    EXPECT_FALSE(Whoopie::isValidPlay(hand, trick, Joker {1}));
    EXPECT_FALSE(
        Whoopie::isValidPlay(hand, trick, SuitCard {Suit::CLUBS, Rank::ACE}));
}

TEST_F(AllowedCardsTest, testVoidInLeadSuit)
{
    const auto trick = TrickCards {
        played(SuitCard {Suit::DIAMONDS, Rank::TEN}, 0)};
    EXPECT_EQ(hand, Whoopie::getValidCards(hand, trick));
}

TEST_F(AllowedCardsTest, testJokerLeadWaivesFollowing)
{
    const auto trick = TrickCards {played(Joker {2}, 0)};
    EXPECT_EQ(hand, Whoopie::getValidCards(hand, trick));
}

TEST_F(AllowedCardsTest, testCardNotInHand)
{
    EXPECT_FALSE(
        Whoopie::isValidPlay(
            hand, TrickCards {}, SuitCard {Suit::SPADES, Rank::ACE}));
}
