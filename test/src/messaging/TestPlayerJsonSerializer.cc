#include "messaging/PlayerJsonSerializer.hh"
#include "messaging/SerializationFailureException.hh"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using nlohmann::json;
using Whoopie::AiDifficulty;
using Whoopie::AiPlayer;
using Whoopie::HumanPlayer;
using Whoopie::Player;
using Whoopie::Messaging::SerializationFailureException;

TEST(PlayerJsonSerializerTest, testHumanPlayerToJson)
{
    const auto j = json(Player {HumanPlayer {"alice", "Alice", false}});
    EXPECT_EQ(
        (json {
            {"type", "human"}, {"id", "alice"}, {"name", "Alice"},
            {"isConnected", false}}),
        j);
}

TEST(PlayerJsonSerializerTest, testAiPlayerToJson)
{
    const auto j = json(
        Player {AiPlayer {"bot", "Bot", AiDifficulty::INTERMEDIATE}});
    EXPECT_EQ(
        (json {
            {"type", "ai"}, {"id", "bot"}, {"name", "Bot"},
            {"difficulty", "intermediate"}}),
        j);
}

TEST(PlayerJsonSerializerTest, testHumanPlayerConnectedByDefault)
{
    EXPECT_EQ(
        (Player {HumanPlayer {"alice", "Alice", true}}),
        (json {{"type", "human"}, {"id", "alice"}, {"name", "Alice"}})
            .get<Player>());
}

TEST(PlayerJsonSerializerTest, testAiPlayerFromJson)
{
    EXPECT_EQ(
        (Player {AiPlayer {"bot", "Bot", AiDifficulty::EXPERT}}),
        (json {
            {"type", "ai"}, {"id", "bot"}, {"name", "Bot"},
            {"difficulty", "expert"}}).get<Player>());
}

TEST(PlayerJsonSerializerTest, testInvalidPlayer)
{
    EXPECT_THROW(
        (json {{"type", "robot"}, {"id", "bot"}, {"name", "Bot"}}).get<Player>(),
        SerializationFailureException);
    EXPECT_THROW(
        (json {
            {"type", "ai"}, {"id", "bot"}, {"name", "Bot"},
            {"difficulty", "godlike"}}).get<Player>(),
        SerializationFailureException);
}
