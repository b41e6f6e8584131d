#include "messaging/CardJsonSerializer.hh"
#include "messaging/GameStateJsonSerializer.hh"
#include "messaging/JsonSerializerUtility.hh"
#include "messaging/PlayerViewJsonSerializer.hh"
#include "messaging/SerializationFailureException.hh"
#include "engine/PlayerView.hh"
#include "engine/WhoopieEngine.hh"
#include "TestUtility.hh"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using nlohmann::json;
using namespace Whoopie;
using namespace Whoopie::Engine;
using Whoopie::Messaging::SerializationFailureException;

class GameStateJsonSerializerTest : public testing::Test {
protected:
    virtual void SetUp()
    {
        state = createGame("player0", GameSettings {5, 3, false, true});
        for (const auto n : to(3)) {
            state = addPlayer(state, makeHuman(n)).state;
        }
    }

    GameState state;
};

TEST_F(GameStateJsonSerializerTest, testPhaseToJson)
{
    EXPECT_EQ(json("trickEnd"), json(Phase::TRICK_END));
    EXPECT_EQ(Phase::STANZA_END, json("stanzaEnd").get<Phase>());
    EXPECT_THROW(json("lunch").get<Phase>(), SerializationFailureException);
}

TEST_F(GameStateJsonSerializerTest, testSettingsToJson)
{
    EXPECT_EQ(
        (json {
            {"maxPlayers", 5}, {"minPlayersToStart", 3}, {"isPublic", false},
            {"allowSpectators", true}}),
        json(state.settings));
}

TEST_F(GameStateJsonSerializerTest, testSettingsDefaults)
{
    EXPECT_EQ(GameSettings {}, json::object().get<GameSettings>());
}

TEST_F(GameStateJsonSerializerTest, testWaitingGame)
{
    const auto j = json(state);
    EXPECT_EQ("waiting", j.at("phase"));
    EXPECT_TRUE(j.at("stanza").is_null());
    EXPECT_TRUE(j.at("scorekeeperIndex").is_null());
    EXPECT_EQ(state, j.get<GameState>());
}

TEST_F(GameStateJsonSerializerTest, testGameInProgress)
{
    auto rng = makeRng(17);
    state = startGame(state, rng).state;
    const auto j = json(state);
    EXPECT_EQ("bidding", j.at("phase"));
    EXPECT_EQ(1, j.at("stanza").at("cardsPerPlayer"));
    EXPECT_EQ("up", j.at("stanza").at("direction"));
    EXPECT_EQ(state, j.get<GameState>());
}

TEST_F(GameStateJsonSerializerTest, testPendingWhoopieRank)
{
    const auto deck = stackDeck(
        {
            {Card {SuitCard {Suit::CLUBS, Rank::TWO}}},
            {Card {SuitCard {Suit::CLUBS, Rank::THREE}}},
            {Card {SuitCard {Suit::CLUBS, Rank::FOUR}}},
        },
        0, Joker {2});
    state = dealStanza(state, 0, 1, Direction::UP, deck).state;
    const auto j = json(state);
    EXPECT_TRUE(j.at("stanza").at("whoopieRank").is_null());
    EXPECT_TRUE(j.at("stanza").at("jTrumpActive").get<bool>());
    EXPECT_EQ(state, j.get<GameState>());
}

TEST_F(GameStateJsonSerializerTest, testScoresMustMatchPlayers)
{
    auto j = json(state);
    j["scores"] = json::array({1, 2});
    EXPECT_THROW(j.get<GameState>(), SerializationFailureException);
}

TEST_F(GameStateJsonSerializerTest, testScorekeeperMustBeSeat)
{
    auto rng = makeRng(17);
    state = startGame(state, rng).state;
    auto j = json(state);
    j["scorekeeperIndex"] = 3;
    EXPECT_THROW(j.get<GameState>(), SerializationFailureException);
}

TEST_F(GameStateJsonSerializerTest, testStanzaSeatDataMustMatchPlayers)
{
    auto rng = makeRng(17);
    state = startGame(state, rng).state;
    const auto j = json(state);
    for (const auto key : {"bids", "hands", "tricksTaken"}) {
        auto shorter = j;
        shorter["stanza"][key].erase(2);
        EXPECT_THROW(shorter.get<GameState>(), SerializationFailureException)
            << key;
        auto longer = j;
        longer["stanza"][key].push_back(shorter["stanza"][key][0]);
        longer["stanza"][key].push_back(shorter["stanza"][key][0]);
        EXPECT_THROW(longer.get<GameState>(), SerializationFailureException)
            << key;
    }
}

TEST_F(GameStateJsonSerializerTest, testStanzaSeatIndicesMustBeSeats)
{
    auto rng = makeRng(17);
    state = startGame(state, rng).state;
    const auto j = json(state);
    for (const auto key : {"dealerIndex", "currentPlayerIndex"}) {
        for (const auto seat : {-1, 3}) {
            auto invalid = j;
            invalid["stanza"][key] = seat;
            EXPECT_THROW(
                invalid.get<GameState>(), SerializationFailureException)
                << key << " " << seat;
        }
    }
}

TEST_F(GameStateJsonSerializerTest, testRejectedSnapshotNeverReachesEngine)
{
    auto rng = makeRng(17);
    state = startGame(state, rng).state;
    auto j = json(state);
    j["stanza"]["bids"] = json::array({nullptr});
    const auto restored = Messaging::tryFromJson<GameState>(j);
    EXPECT_FALSE(restored);
    const auto valid = Messaging::tryFromJson<GameState>(json(state));
    ASSERT_TRUE(valid);
    const auto seat = valid->stanza->currentPlayerIndex;
    EXPECT_NO_THROW(placeBid(*valid, seat, 0));
}

TEST_F(GameStateJsonSerializerTest, testPlayerViewHidesOtherHands)
{
    auto rng = makeRng(23);
    state = startStanza(state, 0, 3, Direction::UP, rng).state;
    const auto view = getPlayerView(state, 2);
    const auto j = json(view);
    EXPECT_EQ(2, j.at("myIndex"));
    EXPECT_FALSE(j.at("stanza").contains("hands"));
    EXPECT_FALSE(j.at("stanza").contains("undealtCards"));
    EXPECT_EQ(json(state.stanza->hands[2]), j.at("stanza").at("myHand"));
    EXPECT_EQ(view, j.get<PlayerView>());
}
