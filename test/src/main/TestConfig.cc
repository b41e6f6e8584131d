#include "main/Config.hh"

#include <gtest/gtest.h>

#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace std::string_literals;

using Whoopie::Main::Config;
using Whoopie::AiDifficulty;
using Whoopie::AiPlayer;
using Whoopie::HumanPlayer;
using Whoopie::Player;

class ConfigTest : public testing::Test {
protected:
    std::istringstream in;

    void assertThrows()
    {
        auto f = [this]() { static_cast<void>(Config {in}); };
        EXPECT_THROW(f(), std::runtime_error);
    }
};

TEST_F(ConfigTest, testBadStream)
{
    in.setstate(std::ios::failbit);
    assertThrows();
}

TEST_F(ConfigTest, testBadSyntax)
{
    in.str("this is invalid"s);
    assertThrows();
}

TEST_F(ConfigTest, testDefaultConfig)
{
    const auto config = Config {};
    EXPECT_EQ(Whoopie::Engine::GameSettings {}, config.getGameSettings());
    EXPECT_EQ(4u, config.getPlayers().size());
    EXPECT_FALSE(config.getSeed());
    EXPECT_FALSE(config.getStanzas());
}

TEST_F(ConfigTest, testEmptyScript)
{
    const auto config = Config {in};
    const auto expected_players = std::vector<Player> {
        HumanPlayer {"player1", "Player 1", true},
        HumanPlayer {"player2", "Player 2", true},
        HumanPlayer {"player3", "Player 3", true},
        HumanPlayer {"player4", "Player 4", true},
    };
    EXPECT_EQ(expected_players, config.getPlayers());
}

TEST_F(ConfigTest, testParseGameSettings)
{
    in.str(R"EOF(
max_players = 6
min_players_to_start = 3
is_public = false
allow_spectators = false
)EOF"s);
    const auto config = Config {in};
    const auto expected_settings =
        Whoopie::Engine::GameSettings {6, 3, false, false};
    EXPECT_EQ(expected_settings, config.getGameSettings());
}

TEST_F(ConfigTest, testParseGameSettingsWrongType)
{
    in.str(R"EOF(
is_public = "yes"
)EOF"s);
    assertThrows();
}

TEST_F(ConfigTest, testParseSeedAndStanzas)
{
    in.str(R"EOF(
seed = 1234
stanzas = 2 * 3
)EOF"s);
    const auto config = Config {in};
    EXPECT_EQ(1234u, config.getSeed());
    EXPECT_EQ(6, config.getStanzas());
}

TEST_F(ConfigTest, testParseStanzasNotPositive)
{
    in.str("stanzas = 0"s);
    assertThrows();
}

TEST_F(ConfigTest, testParseSeedWrongType)
{
    in.str("seed = {}"s);
    assertThrows();
}

TEST_F(ConfigTest, testParsePlayers)
{
    in.str(R"EOF(
players = {
    { id = "alice", name = "Alice" },
    { name = "Bob", type = "human" },
    { id = "bot", name = "Bot", type = "ai", difficulty = "expert" },
    { type = "ai" },
}
)EOF"s);
    const auto config = Config {in};
    const auto expected_players = std::vector<Player> {
        HumanPlayer {"alice", "Alice", true},
        HumanPlayer {"player2", "Bob", true},
        AiPlayer {"bot", "Bot", AiDifficulty::EXPERT},
        AiPlayer {"player4", "Player 4", AiDifficulty::BEGINNER},
    };
    EXPECT_EQ(expected_players, config.getPlayers());
}

TEST_F(ConfigTest, testParsePlayersWrongType)
{
    in.str(R"EOF(
players = "alice"
)EOF"s);
    assertThrows();
}

TEST_F(ConfigTest, testParsePlayersInvalidPlayer)
{
    in.str(R"EOF(
players = { 123 }
)EOF"s);
    assertThrows();
}

TEST_F(ConfigTest, testParsePlayersInvalidPlayerType)
{
    in.str(R"EOF(
players = { { name = "Robot", type = "android" } }
)EOF"s);
    assertThrows();
}

TEST_F(ConfigTest, testParsePlayersInvalidDifficulty)
{
    in.str(R"EOF(
players = { { type = "ai", difficulty = "impossible" } }
)EOF"s);
    assertThrows();
}
