#include "main/Config.hh"
#include "main/SelfPlay.hh"
#include "engine/GameState.hh"
#include "messaging/GameEventJsonSerializer.hh"
#include "whoopie/Card.hh"
#include "TestUtility.hh"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <sstream>
#include <string>
#include <vector>

using namespace std::string_literals;
using namespace Whoopie;
using namespace Whoopie::Engine;

using Whoopie::Main::Config;
using Whoopie::Main::SelfPlay;
using Whoopie::Main::requiresWhoopieCall;

class SelfPlayTest : public testing::Test {
protected:
    std::vector<GameEvent> readEvents()
    {
        auto ret = std::vector<GameEvent> {};
        auto line = std::string {};
        while (std::getline(out, line)) {
            ret.emplace_back(nlohmann::json::parse(line).get<GameEvent>());
        }
        return ret;
    }

    std::stringstream out;
};

TEST_F(SelfPlayTest, testRequiresWhoopieCallDefinedRank)
{
    auto stanza = StanzaState {};
    stanza.whoopieDefinition = DefinedWhoopieRank {Rank::NINE};
    stanza.currentTrick.push_back(
        PlayedCard {Card {SuitCard {Suit::CLUBS, Rank::TWO}}, 0});
    EXPECT_TRUE(
        requiresWhoopieCall(stanza, SuitCard {Suit::HEARTS, Rank::NINE}));
    EXPECT_FALSE(
        requiresWhoopieCall(stanza, SuitCard {Suit::HEARTS, Rank::TEN}));
    EXPECT_FALSE(requiresWhoopieCall(stanza, Joker {1}));
}

TEST_F(SelfPlayTest, testRequiresWhoopieCallPendingDefinition)
{
    auto stanza = StanzaState {};
    stanza.whoopieDefinition = PendingDefinition {};
    EXPECT_TRUE(
        requiresWhoopieCall(stanza, SuitCard {Suit::SPADES, Rank::FIVE}));
    EXPECT_FALSE(requiresWhoopieCall(stanza, Joker {2}));
}

TEST_F(SelfPlayTest, testPlayGame)
{
    auto in = std::istringstream {R"EOF(
seed = 2024
stanzas = 3
players = {
    { id = "a", name = "A" },
    { id = "b", name = "B", type = "ai" },
    { id = "c", name = "C" },
}
)EOF"s};
    const auto config = Config {in};
    auto self_play = SelfPlay {config, out};
    const auto state = self_play.run();
    EXPECT_EQ(Phase::GAME_END, state.phase);
    ASSERT_EQ(3u, state.completedStanzas.size());
    EXPECT_EQ(3u, state.scores.size());

    const auto events = readEvents();
    ASSERT_FALSE(events.empty());
    EXPECT_EQ("playerJoined", getEventType(events.front()));
    EXPECT_EQ("gameEnded", getEventType(events.back()));
    auto n_stanzas_completed = 0;
    auto n_missed_calls = 0;
    for (const auto& event : events) {
        const auto type = getEventType(event);
        n_stanzas_completed += (type == "stanzaCompleted");
        n_missed_calls += (type == "whoopieCallMissed");
    }
    EXPECT_EQ(3, n_stanzas_completed);
    EXPECT_EQ(0, n_missed_calls);
}

TEST_F(SelfPlayTest, testSameSeedSameGame)
{
    auto in = std::istringstream {"seed = 7\nstanzas = 2"s};
    const auto config = Config {in};
    auto out2 = std::stringstream {};
    const auto state1 = SelfPlay {config, out}.run();
    const auto state2 = SelfPlay {config, out2}.run();
    EXPECT_EQ(state1.scores, state2.scores);
    EXPECT_EQ(state1.completedStanzas, state2.completedStanzas);
}
