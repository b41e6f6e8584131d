#include "messaging/GameEventJsonSerializer.hh"

#include "messaging/CardJsonSerializer.hh"
#include "messaging/GameStateJsonSerializer.hh"
#include "messaging/JsonSerializerUtility.hh"
#include "messaging/PlayerJsonSerializer.hh"
#include "messaging/TrickJsonSerializer.hh"

#include <functional>
#include <map>

using nlohmann::json;

namespace Whoopie {
namespace Engine {

const std::string EVENT_TYPE_KEY {"type"};

namespace {

const auto PLAYER_KEY = std::string {"player"};
const auto PLAYER_ID_KEY = std::string {"playerId"};
const auto PLAYER_NAME_KEY = std::string {"playerName"};
const auto REPLACEMENT_KEY = std::string {"replacement"};
const auto CUT_CARDS_KEY = std::string {"cutCards"};
const auto DEALER_INDEX_KEY = std::string {"dealerIndex"};
const auto STANZA_KEY = std::string {"stanza"};
const auto PLAYER_INDEX_KEY = std::string {"playerIndex"};
const auto BID_KEY = std::string {"bid"};
const auto CARD_KEY = std::string {"card"};
const auto WAS_WHOOPIE_KEY = std::string {"wasWhoopie"};
const auto WAS_SCRAMBLE_KEY = std::string {"wasScramble"};
const auto NEW_TRUMP_SUIT_KEY = std::string {"newTrumpSuit"};
const auto TRICK_KEY = std::string {"trick"};
const auto SCORE_CHANGES_KEY = std::string {"scoreChanges"};
const auto NEW_SCORES_KEY = std::string {"newScores"};
const auto FINAL_SCORES_KEY = std::string {"finalScores"};
const auto RANKINGS_KEY = std::string {"rankings"};
const auto REASON_KEY = std::string {"reason"};

class JsonSerializerVisitor {
public:
    JsonSerializerVisitor(json& j) : j {j} {}

    void operator()(const PlayerJoined& e) const
    {
        j[PLAYER_KEY] = e.player;
    }

    void operator()(const PlayerLeft& e) const
    {
        j[PLAYER_ID_KEY] = e.playerId;
        j[PLAYER_NAME_KEY] = e.playerName;
        if (e.replacement) {
            j[REPLACEMENT_KEY] = *e.replacement;
        }
    }

    void operator()(const GameStarted&) const {}

    void operator()(const CutForDealer& e) const
    {
        j[CUT_CARDS_KEY] = e.cutCards;
        j[DEALER_INDEX_KEY] = e.dealerIndex;
    }

    void operator()(const StanzaStarted& e) const
    {
        j[STANZA_KEY] = e.stanza;
    }

    void operator()(const BidPlaced& e) const
    {
        j[PLAYER_INDEX_KEY] = e.playerIndex;
        j[BID_KEY] = e.bid;
    }

    void operator()(const CardPlayed& e) const
    {
        j[PLAYER_INDEX_KEY] = e.playerIndex;
        j[CARD_KEY] = e.card;
        j[WAS_WHOOPIE_KEY] = e.wasWhoopie;
        j[WAS_SCRAMBLE_KEY] = e.wasScramble;
        j[NEW_TRUMP_SUIT_KEY] = e.newTrumpSuit;
    }

    void operator()(const TrickCompleted& e) const
    {
        j[TRICK_KEY] = e.trick;
    }

    void operator()(const StanzaCompleted& e) const
    {
        j[SCORE_CHANGES_KEY] = e.scoreChanges;
        j[NEW_SCORES_KEY] = e.newScores;
    }

    void operator()(const GameEnded& e) const
    {
        j[FINAL_SCORES_KEY] = e.finalScores;
        j[RANKINGS_KEY] = e.rankings;
    }

    void operator()(const WhoopieCallMissed& e) const
    {
        j[PLAYER_INDEX_KEY] = e.playerIndex;
    }

    void operator()(const StanzaRedealt& e) const
    {
        j[REASON_KEY] = e.reason;
    }

private:
    json& j;
};

using EventDeserializer = std::function<GameEvent(const json&)>;

const auto EVENTS = std::map<std::string, EventDeserializer> {
    { "playerJoined",
      [](const json& j) -> GameEvent {
          return PlayerJoined {j.at(PLAYER_KEY).get<Player>()};
      }},
    { "playerLeft",
      [](const json& j) -> GameEvent {
          auto replacement = std::optional<Player> {};
          if (const auto iter = j.find(REPLACEMENT_KEY); iter != j.end()) {
              replacement = iter->get<std::optional<Player>>();
          }
          return PlayerLeft {
              j.at(PLAYER_ID_KEY).get<std::string>(),
              j.at(PLAYER_NAME_KEY).get<std::string>(),
              std::move(replacement)};
      }},
    { "gameStarted",
      [](const json&) -> GameEvent { return GameStarted {}; }},
    { "cutForDealer",
      [](const json& j) -> GameEvent {
          return CutForDealer {
              j.at(CUT_CARDS_KEY).get<std::vector<Card>>(),
              j.at(DEALER_INDEX_KEY).get<int>()};
      }},
    { "stanzaStarted",
      [](const json& j) -> GameEvent {
          return StanzaStarted {j.at(STANZA_KEY).get<StanzaState>()};
      }},
    { "bidPlaced",
      [](const json& j) -> GameEvent {
          return BidPlaced {
              j.at(PLAYER_INDEX_KEY).get<int>(), j.at(BID_KEY).get<int>()};
      }},
    { "cardPlayed",
      [](const json& j) -> GameEvent {
          return CardPlayed {
              j.at(PLAYER_INDEX_KEY).get<int>(),
              j.at(CARD_KEY).get<Card>(),
              j.at(WAS_WHOOPIE_KEY).get<bool>(),
              j.at(WAS_SCRAMBLE_KEY).get<bool>(),
              j.at(NEW_TRUMP_SUIT_KEY).get<std::optional<Suit>>()};
      }},
    { "trickCompleted",
      [](const json& j) -> GameEvent {
          return TrickCompleted {j.at(TRICK_KEY).get<CompletedTrick>()};
      }},
    { "stanzaCompleted",
      [](const json& j) -> GameEvent {
          return StanzaCompleted {
              j.at(SCORE_CHANGES_KEY).get<Scoring::Scores>(),
              j.at(NEW_SCORES_KEY).get<Scoring::Scores>()};
      }},
    { "gameEnded",
      [](const json& j) -> GameEvent {
          return GameEnded {
              j.at(FINAL_SCORES_KEY).get<Scoring::Scores>(),
              j.at(RANKINGS_KEY).get<Scoring::Rankings>()};
      }},
    { "whoopieCallMissed",
      [](const json& j) -> GameEvent {
          return WhoopieCallMissed {j.at(PLAYER_INDEX_KEY).get<int>()};
      }},
    { "stanzaRedealt",
      [](const json& j) -> GameEvent {
          return StanzaRedealt {j.at(REASON_KEY).get<std::string>()};
      }},
};

}

void to_json(json& j, const GameEvent& event)
{
    j = json::object();
    j[EVENT_TYPE_KEY] = std::string {getEventType(event)};
    std::visit(JsonSerializerVisitor {j}, event);
}

void from_json(const json& j, GameEvent& event)
{
    const auto& type = j.at(EVENT_TYPE_KEY);
    if (!type.is_string()) {
        throw Messaging::SerializationFailureException {};
    }
    const auto iter = EVENTS.find(type.get<std::string>());
    if (iter == EVENTS.end()) {
        throw Messaging::SerializationFailureException {};
    }
    event = iter->second(j);
}

}
}
