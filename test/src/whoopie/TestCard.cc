#include "whoopie/Card.hh"

#include <gtest/gtest.h>

#include <optional>

using Whoopie::Card;
using Whoopie::Joker;
using Whoopie::Rank;
using Whoopie::Suit;
using Whoopie::SuitCard;

TEST(CardTest, testSuitCardAccessors)
{
    const auto card = Card {SuitCard {Suit::HEARTS, Rank::QUEEN}};
    EXPECT_FALSE(Whoopie::isJoker(card));
    EXPECT_EQ(Suit::HEARTS, Whoopie::getSuit(card));
    EXPECT_EQ(Rank::QUEEN, Whoopie::getRank(card));
}

TEST(CardTest, testJokerAccessors)
{
    const auto card = Card {Joker {2}};
    EXPECT_TRUE(Whoopie::isJoker(card));
    EXPECT_EQ(std::nullopt, Whoopie::getSuit(card));
    EXPECT_EQ(std::nullopt, Whoopie::getRank(card));
}

TEST(CardTest, testRankValues)
{
    EXPECT_EQ(2, Whoopie::rankValue(Rank::TWO));
    EXPECT_EQ(10, Whoopie::rankValue(Rank::TEN));
    EXPECT_EQ(11, Whoopie::rankValue(Rank::JACK));
    EXPECT_EQ(14, Whoopie::rankValue(Rank::ACE));
}

TEST(CardTest, testEquality)
{
    EXPECT_TRUE(
        Whoopie::cardsEqual(
            SuitCard {Suit::CLUBS, Rank::TEN},
            SuitCard {Suit::CLUBS, Rank::TEN}));
    EXPECT_FALSE(
        Whoopie::cardsEqual(
            SuitCard {Suit::CLUBS, Rank::TEN},
            SuitCard {Suit::SPADES, Rank::TEN}));
    EXPECT_TRUE(Whoopie::cardsEqual(Joker {1}, Joker {1}));
    EXPECT_FALSE(Whoopie::cardsEqual(Joker {1}, Joker {2}));
}

TEST(CardTest, testCardToString)
{
    EXPECT_EQ("A♠", Whoopie::cardToString(SuitCard {Suit::SPADES, Rank::ACE}));
    EXPECT_EQ("10♦", Whoopie::cardToString(SuitCard {Suit::DIAMONDS, Rank::TEN}));
    EXPECT_EQ("Joker1", Whoopie::cardToString(Joker {1}));
}

TEST(CardTest, testParseCardString)
{
    EXPECT_EQ(
        (Card {SuitCard {Suit::HEARTS, Rank::TEN}}),
        Whoopie::parseCardString("10♥"));
    EXPECT_EQ(Card {Joker {2}}, Whoopie::parseCardString("Joker2"));
}

TEST(CardTest, testParseInvalidCardString)
{
    EXPECT_EQ(std::nullopt, Whoopie::parseCardString("Joker3"));
    EXPECT_EQ(std::nullopt, Whoopie::parseCardString("1♥"));
    EXPECT_EQ(std::nullopt, Whoopie::parseCardString("K"));
    EXPECT_EQ(std::nullopt, Whoopie::parseCardString(""));
}
