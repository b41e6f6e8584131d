#include "messaging/PlayerViewJsonSerializer.hh"

#include "messaging/CardJsonSerializer.hh"
#include "messaging/GameStateJsonSerializer.hh"
#include "messaging/JsonSerializerUtility.hh"
#include "messaging/PlayerJsonSerializer.hh"
#include "messaging/TrickJsonSerializer.hh"
#include "messaging/UuidJsonSerializer.hh"

using nlohmann::json;

namespace Whoopie {
namespace Engine {

void to_json(json& j, const StanzaView& stanza)
{
    j["stanzaNumber"] = stanza.stanzaNumber;
    j["cardsPerPlayer"] = stanza.cardsPerPlayer;
    j["direction"] = stanza.direction;
    j["dealerIndex"] = stanza.dealerIndex;
    j["whoopieDefiningCard"] = stanza.whoopieDefiningCard;
    j["whoopieRank"] = stanza.whoopieRank;
    j["initialTrumpSuit"] = stanza.initialTrumpSuit;
    j["currentTrumpSuit"] = stanza.trump.trumpSuit;
    j["jTrumpActive"] = stanza.trump.jTrumpActive;
    j["bids"] = stanza.bids;
    j["currentTrickNumber"] = stanza.currentTrickNumber;
    j["currentTrick"] = stanza.currentTrick;
    j["completedTricks"] = stanza.completedTricks;
    j["tricksTaken"] = stanza.tricksTaken;
    j["myHand"] = stanza.myHand;
    j["handCounts"] = stanza.handCounts;
    j["undealtCardCount"] = stanza.undealtCardCount;
    j["currentPlayerIndex"] = stanza.currentPlayerIndex;
}

void from_json(const json& j, StanzaView& stanza)
{
    stanza.stanzaNumber = j.at("stanzaNumber").get<int>();
    stanza.cardsPerPlayer = j.at("cardsPerPlayer").get<int>();
    stanza.direction = j.at("direction").get<Direction>();
    stanza.dealerIndex = j.at("dealerIndex").get<int>();
    stanza.whoopieDefiningCard = j.at("whoopieDefiningCard").get<Card>();
    stanza.whoopieRank = j.at("whoopieRank").get<std::optional<Rank>>();
    stanza.initialTrumpSuit =
        j.at("initialTrumpSuit").get<std::optional<Suit>>();
    stanza.trump = TrumpState {
        j.at("currentTrumpSuit").get<std::optional<Suit>>(),
        j.at("jTrumpActive").get<bool>()};
    stanza.bids = j.at("bids").get<Bids>();
    stanza.currentTrickNumber = j.at("currentTrickNumber").get<int>();
    stanza.currentTrick = j.at("currentTrick").get<TrickCards>();
    stanza.completedTricks =
        j.at("completedTricks").get<std::vector<CompletedTrick>>();
    stanza.tricksTaken = j.at("tricksTaken").get<std::vector<int>>();
    stanza.myHand = j.at("myHand").get<Hand>();
    stanza.handCounts = j.at("handCounts").get<std::vector<int>>();
    stanza.undealtCardCount = j.at("undealtCardCount").get<int>();
    stanza.currentPlayerIndex = j.at("currentPlayerIndex").get<int>();
}

void to_json(json& j, const PlayerView& view)
{
    j["id"] = view.id;
    j["hostId"] = view.hostId;
    j["settings"] = view.settings;
    j["phase"] = view.phase;
    j["players"] = view.players;
    j["scorekeeperIndex"] = view.scorekeeperIndex;
    j["scores"] = view.scores;
    j["stanza"] = view.stanza;
    j["completedStanzas"] = view.completedStanzas;
    j["truncatedAverage"] = view.truncatedAverage;
    j["myIndex"] = view.myIndex;
}

void from_json(const json& j, PlayerView& view)
{
    view.id = j.at("id").get<Uuid>();
    view.hostId = j.at("hostId").get<std::string>();
    view.settings = j.at("settings").get<GameSettings>();
    view.phase = j.at("phase").get<Phase>();
    view.players = j.at("players").get<std::vector<Player>>();
    view.scorekeeperIndex = j.at("scorekeeperIndex").get<std::optional<int>>();
    view.scores = j.at("scores").get<Scoring::Scores>();
    view.stanza = j.at("stanza").get<std::optional<StanzaView>>();
    view.completedStanzas =
        j.at("completedStanzas").get<std::vector<CompletedStanzaRecord>>();
    view.truncatedAverage = j.at("truncatedAverage").get<int>();
    view.myIndex = j.at("myIndex").get<int>();
}

}
}
