#include "messaging/TrickJsonSerializer.hh"

#include "messaging/CardJsonSerializer.hh"
#include "messaging/JsonSerializerUtility.hh"

using nlohmann::json;

namespace Whoopie {

namespace {

const auto CARD_KEY = std::string {"card"};
const auto PLAYER_INDEX_KEY = std::string {"playerIndex"};
const auto PLAYER_ID_KEY = std::string {"playerId"};
const auto TRUMP_SUIT_AT_PLAY_KEY = std::string {"trumpSuitAtPlay"};
const auto J_TRUMP_ACTIVE_AT_PLAY_KEY = std::string {"jTrumpActiveAtPlay"};
const auto WAS_WHOOPIE_KEY = std::string {"wasWhoopie"};
const auto WAS_SCRAMBLE_KEY = std::string {"wasScramble"};
const auto CARDS_KEY = std::string {"cards"};
const auto WINNER_INDEX_KEY = std::string {"winnerIndex"};
const auto WINNER_ID_KEY = std::string {"winnerId"};
const auto LEAD_SUIT_KEY = std::string {"leadSuit"};

}

void to_json(json& j, const PlayedCard& playedCard)
{
    j[CARD_KEY] = playedCard.card;
    j[PLAYER_INDEX_KEY] = playedCard.playerIndex;
    j[PLAYER_ID_KEY] = playedCard.playerId;
    j[TRUMP_SUIT_AT_PLAY_KEY] = playedCard.trumpSuitAtPlay;
    j[J_TRUMP_ACTIVE_AT_PLAY_KEY] = playedCard.jTrumpActiveAtPlay;
    j[WAS_WHOOPIE_KEY] = playedCard.wasWhoopie;
    j[WAS_SCRAMBLE_KEY] = playedCard.wasScramble;
}

void from_json(const json& j, PlayedCard& playedCard)
{
    playedCard.card = j.at(CARD_KEY).get<Card>();
    playedCard.playerIndex = j.at(PLAYER_INDEX_KEY).get<int>();
    playedCard.playerId = j.at(PLAYER_ID_KEY).get<std::string>();
    playedCard.trumpSuitAtPlay =
        j.at(TRUMP_SUIT_AT_PLAY_KEY).get<std::optional<Suit>>();
    playedCard.jTrumpActiveAtPlay = j.at(J_TRUMP_ACTIVE_AT_PLAY_KEY).get<bool>();
    playedCard.wasWhoopie = j.at(WAS_WHOOPIE_KEY).get<bool>();
    playedCard.wasScramble = j.at(WAS_SCRAMBLE_KEY).get<bool>();
}

void to_json(json& j, const CompletedTrick& trick)
{
    j[CARDS_KEY] = trick.cards;
    j[WINNER_INDEX_KEY] = trick.winnerIndex;
    j[WINNER_ID_KEY] = trick.winnerId;
    j[LEAD_SUIT_KEY] = trick.leadSuit;
}

void from_json(const json& j, CompletedTrick& trick)
{
    trick.cards = j.at(CARDS_KEY).get<TrickCards>();
    trick.winnerIndex = j.at(WINNER_INDEX_KEY).get<int>();
    trick.winnerId = j.at(WINNER_ID_KEY).get<std::string>();
    trick.leadSuit = j.at(LEAD_SUIT_KEY).get<std::optional<Suit>>();
}

}
