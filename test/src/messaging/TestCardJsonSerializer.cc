#include "messaging/CardJsonSerializer.hh"
#include "messaging/JsonSerializerUtility.hh"
#include "messaging/SerializationFailureException.hh"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using nlohmann::json;
using Whoopie::Card;
using Whoopie::Joker;
using Whoopie::Rank;
using Whoopie::Suit;
using Whoopie::SuitCard;
using Whoopie::Messaging::SerializationFailureException;

TEST(CardJsonSerializerTest, testSuitCardToJson)
{
    const auto j = json(Card {SuitCard {Suit::DIAMONDS, Rank::TEN}});
    EXPECT_EQ(
        (json {{"type", "suit"}, {"suit", "diamonds"}, {"rank", "10"}}), j);
}

TEST(CardJsonSerializerTest, testJokerToJson)
{
    const auto j = json(Card {Joker {2}});
    EXPECT_EQ((json {{"type", "joker"}, {"jokerNumber", 2}}), j);
}

TEST(CardJsonSerializerTest, testCardFromJson)
{
    EXPECT_EQ(
        (Card {SuitCard {Suit::SPADES, Rank::QUEEN}}),
        (json {{"type", "suit"}, {"suit", "spades"}, {"rank", "Q"}})
            .get<Card>());
    EXPECT_EQ(
        Card {Joker {1}},
        (json {{"type", "joker"}, {"jokerNumber", 1}}).get<Card>());
}

TEST(CardJsonSerializerTest, testInvalidCardType)
{
    EXPECT_THROW(
        (json {{"type", "tarot"}}).get<Card>(), SerializationFailureException);
}

TEST(CardJsonSerializerTest, testInvalidJokerNumber)
{
    EXPECT_THROW(
        (json {{"type", "joker"}, {"jokerNumber", 3}}).get<Card>(),
        SerializationFailureException);
}

TEST(CardJsonSerializerTest, testInvalidRank)
{
    EXPECT_THROW(
        (json {{"type", "suit"}, {"suit", "spades"}, {"rank", "1"}}).get<Card>(),
        SerializationFailureException);
}

TEST(CardJsonSerializerTest, testMissingKey)
{
    EXPECT_FALSE(
        Whoopie::Messaging::tryFromJson<Card>(
            json {{"type", "suit"}, {"suit", "spades"}}));
}
