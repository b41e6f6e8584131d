#include "messaging/GameEventJsonSerializer.hh"
#include "messaging/SerializationFailureException.hh"
#include "engine/WhoopieEngine.hh"
#include "TestUtility.hh"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using nlohmann::json;
using namespace Whoopie;
using namespace Whoopie::Engine;
using Whoopie::Messaging::SerializationFailureException;

TEST(GameEventJsonSerializerTest, testBidPlacedToJson)
{
    EXPECT_EQ(
        (json {{"type", "bidPlaced"}, {"playerIndex", 2}, {"bid", 1}}),
        json(GameEvent {BidPlaced {2, 1}}));
}

TEST(GameEventJsonSerializerTest, testCardPlayedToJson)
{
    const auto event = GameEvent {
        CardPlayed {
            0, SuitCard {Suit::HEARTS, Rank::SEVEN}, true, false,
            Suit::HEARTS}};
    EXPECT_EQ(
        (json {
            {"type", "cardPlayed"},
            {"playerIndex", 0},
            {"card", {{"type", "suit"}, {"suit", "hearts"}, {"rank", "7"}}},
            {"wasWhoopie", true},
            {"wasScramble", false},
            {"newTrumpSuit", "hearts"},
        }),
        json(event));
}

TEST(GameEventJsonSerializerTest, testCardPlayedWithoutTrump)
{
    const auto j = json(
        GameEvent {CardPlayed {1, Joker {1}, false, true, std::nullopt}});
    EXPECT_TRUE(j.at("newTrumpSuit").is_null());
}

TEST(GameEventJsonSerializerTest, testPlayerLeftWithoutReplacement)
{
    const auto j = json(GameEvent {PlayerLeft {"p", "P", std::nullopt}});
    EXPECT_EQ(
        (json {{"type", "playerLeft"}, {"playerId", "p"}, {"playerName", "P"}}),
        j);
    EXPECT_EQ(
        (GameEvent {PlayerLeft {"p", "P", std::nullopt}}), j.get<GameEvent>());
}

TEST(GameEventJsonSerializerTest, testPlayerLeftWithReplacement)
{
    const auto event = GameEvent {
        PlayerLeft {
            "p", "P", Player {AiPlayer {"bot", "Bot", AiDifficulty::BEGINNER}}}};
    EXPECT_EQ(event, json(event).get<GameEvent>());
}

TEST(GameEventJsonSerializerTest, testEventsFromEngine)
{
    auto state = createGame("player0");
    for (const auto n : to(4)) {
        state = addPlayer(state, makeHuman(n)).state;
    }
    auto rng = makeRng(99);
    const auto result = startGame(state, rng);
    for (const auto& event : result.events) {
        const auto j = json(event);
        EXPECT_EQ(getEventType(event), j.at("type").get<std::string>());
        EXPECT_EQ(event, j.get<GameEvent>());
    }
}

TEST(GameEventJsonSerializerTest, testUnknownEventType)
{
    EXPECT_THROW(
        (json {{"type", "gameExploded"}}).get<GameEvent>(),
        SerializationFailureException);
    EXPECT_THROW(
        (json {{"type", 5}}).get<GameEvent>(), SerializationFailureException);
}
