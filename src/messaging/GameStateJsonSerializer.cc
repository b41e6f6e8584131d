#include "messaging/GameStateJsonSerializer.hh"

#include "messaging/CardJsonSerializer.hh"
#include "messaging/JsonSerializerUtility.hh"
#include "messaging/PlayerJsonSerializer.hh"
#include "messaging/TrickJsonSerializer.hh"
#include "messaging/UuidJsonSerializer.hh"
#include "Utility.hh"

#include <algorithm>

using nlohmann::json;

namespace Whoopie {

void to_json(json& j, const Direction direction)
{
    j = Messaging::enumToJson(direction, DIRECTION_TO_STRING_MAP.left);
}

void from_json(const json& j, Direction& direction)
{
    direction = Messaging::jsonToEnum<Direction>(
        j, DIRECTION_TO_STRING_MAP.right);
}

namespace Engine {

namespace {

const auto MAX_PLAYERS_KEY = std::string {"maxPlayers"};
const auto MIN_PLAYERS_TO_START_KEY = std::string {"minPlayersToStart"};
const auto IS_PUBLIC_KEY = std::string {"isPublic"};
const auto ALLOW_SPECTATORS_KEY = std::string {"allowSpectators"};

const auto STANZA_NUMBER_KEY = std::string {"stanzaNumber"};
const auto CARDS_PER_PLAYER_KEY = std::string {"cardsPerPlayer"};
const auto DIRECTION_KEY = std::string {"direction"};
const auto DEALER_INDEX_KEY = std::string {"dealerIndex"};
const auto WHOOPIE_DEFINING_CARD_KEY = std::string {"whoopieDefiningCard"};
const auto WHOOPIE_RANK_KEY = std::string {"whoopieRank"};
const auto INITIAL_TRUMP_SUIT_KEY = std::string {"initialTrumpSuit"};
const auto CURRENT_TRUMP_SUIT_KEY = std::string {"currentTrumpSuit"};
const auto J_TRUMP_ACTIVE_KEY = std::string {"jTrumpActive"};
const auto BIDS_KEY = std::string {"bids"};
const auto CURRENT_TRICK_NUMBER_KEY = std::string {"currentTrickNumber"};
const auto CURRENT_TRICK_KEY = std::string {"currentTrick"};
const auto COMPLETED_TRICKS_KEY = std::string {"completedTricks"};
const auto TRICKS_TAKEN_KEY = std::string {"tricksTaken"};
const auto HANDS_KEY = std::string {"hands"};
const auto UNDEALT_CARDS_KEY = std::string {"undealtCards"};
const auto CURRENT_PLAYER_INDEX_KEY = std::string {"currentPlayerIndex"};
const auto SCORE_CHANGES_KEY = std::string {"scoreChanges"};
const auto PLAYER_IDS_KEY = std::string {"playerIds"};

const auto ID_KEY = std::string {"id"};
const auto HOST_ID_KEY = std::string {"hostId"};
const auto SETTINGS_KEY = std::string {"settings"};
const auto PHASE_KEY = std::string {"phase"};
const auto PLAYERS_KEY = std::string {"players"};
const auto SCOREKEEPER_INDEX_KEY = std::string {"scorekeeperIndex"};
const auto SCORES_KEY = std::string {"scores"};
const auto STANZA_KEY = std::string {"stanza"};
const auto COMPLETED_STANZAS_KEY = std::string {"completedStanzas"};
const auto TRUNCATED_AVERAGE_KEY = std::string {"truncatedAverage"};

WhoopieDefinition makeDefinition(const std::optional<Rank> rank)
{
    if (rank) {
        return DefinedWhoopieRank {*rank};
    }
    return PendingDefinition {};
}

bool isSeat(const int seat, const int nPlayers)
{
    return 0 <= seat && seat < nPlayers;
}

// Per seat data of a stanza must match the players seated
bool isStanzaConsistent(const StanzaState& stanza, const int nPlayers)
{
    if (isize(stanza.bids) != nPlayers ||
        isize(stanza.hands) != nPlayers ||
        isize(stanza.tricksTaken) != nPlayers) {
        return false;
    }
    if (!isSeat(stanza.dealerIndex, nPlayers) ||
        !isSeat(stanza.currentPlayerIndex, nPlayers)) {
        return false;
    }
    return std::ranges::all_of(
        stanza.currentTrick,
        [nPlayers](const auto& played) {
            return isSeat(played.playerIndex, nPlayers);
        });
}

}

void to_json(json& j, const Phase phase)
{
    j = Messaging::enumToJson(phase, PHASE_TO_STRING_MAP.left);
}

void from_json(const json& j, Phase& phase)
{
    phase = Messaging::jsonToEnum<Phase>(j, PHASE_TO_STRING_MAP.right);
}

void to_json(json& j, const GameSettings& settings)
{
    j[MAX_PLAYERS_KEY] = settings.maxPlayers;
    j[MIN_PLAYERS_TO_START_KEY] = settings.minPlayersToStart;
    j[IS_PUBLIC_KEY] = settings.isPublic;
    j[ALLOW_SPECTATORS_KEY] = settings.allowSpectators;
}

void from_json(const json& j, GameSettings& settings)
{
    const auto defaults = GameSettings {};
    settings.maxPlayers = j.value(MAX_PLAYERS_KEY, defaults.maxPlayers);
    settings.minPlayersToStart =
        j.value(MIN_PLAYERS_TO_START_KEY, defaults.minPlayersToStart);
    settings.isPublic = j.value(IS_PUBLIC_KEY, defaults.isPublic);
    settings.allowSpectators =
        j.value(ALLOW_SPECTATORS_KEY, defaults.allowSpectators);
}

void to_json(json& j, const StanzaState& stanza)
{
    j[STANZA_NUMBER_KEY] = stanza.stanzaNumber;
    j[CARDS_PER_PLAYER_KEY] = stanza.cardsPerPlayer;
    j[DIRECTION_KEY] = stanza.direction;
    j[DEALER_INDEX_KEY] = stanza.dealerIndex;
    j[WHOOPIE_DEFINING_CARD_KEY] = stanza.whoopieDefiningCard;
    j[WHOOPIE_RANK_KEY] = stanza.getWhoopieRank();
    j[INITIAL_TRUMP_SUIT_KEY] = stanza.initialTrumpSuit;
    j[CURRENT_TRUMP_SUIT_KEY] = stanza.trump.trumpSuit;
    j[J_TRUMP_ACTIVE_KEY] = stanza.trump.jTrumpActive;
    j[BIDS_KEY] = stanza.bids;
    j[CURRENT_TRICK_NUMBER_KEY] = stanza.currentTrickNumber;
    j[CURRENT_TRICK_KEY] = stanza.currentTrick;
    j[COMPLETED_TRICKS_KEY] = stanza.completedTricks;
    j[TRICKS_TAKEN_KEY] = stanza.tricksTaken;
    j[HANDS_KEY] = stanza.hands;
    j[UNDEALT_CARDS_KEY] = stanza.undealtCards;
    j[CURRENT_PLAYER_INDEX_KEY] = stanza.currentPlayerIndex;
}

void from_json(const json& j, StanzaState& stanza)
{
    stanza.stanzaNumber = j.at(STANZA_NUMBER_KEY).get<int>();
    stanza.cardsPerPlayer = j.at(CARDS_PER_PLAYER_KEY).get<int>();
    stanza.direction = j.at(DIRECTION_KEY).get<Direction>();
    stanza.dealerIndex = j.at(DEALER_INDEX_KEY).get<int>();
    stanza.whoopieDefiningCard = j.at(WHOOPIE_DEFINING_CARD_KEY).get<Card>();
    stanza.whoopieDefinition = makeDefinition(
        j.at(WHOOPIE_RANK_KEY).get<std::optional<Rank>>());
    stanza.initialTrumpSuit =
        j.at(INITIAL_TRUMP_SUIT_KEY).get<std::optional<Suit>>();
    stanza.trump = TrumpState {
        j.at(CURRENT_TRUMP_SUIT_KEY).get<std::optional<Suit>>(),
        j.at(J_TRUMP_ACTIVE_KEY).get<bool>()};
    stanza.bids = j.at(BIDS_KEY).get<Bids>();
    stanza.currentTrickNumber = j.at(CURRENT_TRICK_NUMBER_KEY).get<int>();
    stanza.currentTrick = j.at(CURRENT_TRICK_KEY).get<TrickCards>();
    stanza.completedTricks =
        j.at(COMPLETED_TRICKS_KEY).get<std::vector<CompletedTrick>>();
    stanza.tricksTaken = j.at(TRICKS_TAKEN_KEY).get<std::vector<int>>();
    stanza.hands = j.at(HANDS_KEY).get<std::vector<Hand>>();
    stanza.undealtCards = j.at(UNDEALT_CARDS_KEY).get<Deck>();
    stanza.currentPlayerIndex = j.at(CURRENT_PLAYER_INDEX_KEY).get<int>();
}

void to_json(json& j, const CompletedStanzaRecord& record)
{
    j[STANZA_NUMBER_KEY] = record.stanzaNumber;
    j[CARDS_PER_PLAYER_KEY] = record.cardsPerPlayer;
    j[DEALER_INDEX_KEY] = record.dealerIndex;
    j[WHOOPIE_DEFINING_CARD_KEY] = record.whoopieDefiningCard;
    j[BIDS_KEY] = record.bids;
    j[TRICKS_TAKEN_KEY] = record.tricksTaken;
    j[SCORE_CHANGES_KEY] = record.scoreChanges;
    j[PLAYER_IDS_KEY] = record.playerIds;
}

void from_json(const json& j, CompletedStanzaRecord& record)
{
    record.stanzaNumber = j.at(STANZA_NUMBER_KEY).get<int>();
    record.cardsPerPlayer = j.at(CARDS_PER_PLAYER_KEY).get<int>();
    record.dealerIndex = j.at(DEALER_INDEX_KEY).get<int>();
    record.whoopieDefiningCard = j.at(WHOOPIE_DEFINING_CARD_KEY).get<Card>();
    record.bids = j.at(BIDS_KEY).get<std::vector<int>>();
    record.tricksTaken = j.at(TRICKS_TAKEN_KEY).get<std::vector<int>>();
    record.scoreChanges = j.at(SCORE_CHANGES_KEY).get<Scoring::Scores>();
    record.playerIds = j.at(PLAYER_IDS_KEY).get<std::vector<std::string>>();
}

void to_json(json& j, const GameState& state)
{
    j[ID_KEY] = state.id;
    j[HOST_ID_KEY] = state.hostId;
    j[SETTINGS_KEY] = state.settings;
    j[PHASE_KEY] = state.phase;
    j[PLAYERS_KEY] = state.players;
    j[SCOREKEEPER_INDEX_KEY] = state.scorekeeperIndex;
    j[SCORES_KEY] = state.scores;
    j[STANZA_KEY] = state.stanza;
    j[COMPLETED_STANZAS_KEY] = state.completedStanzas;
    j[TRUNCATED_AVERAGE_KEY] = state.truncatedAverage;
}

void from_json(const json& j, GameState& state)
{
    state.id = j.at(ID_KEY).get<Uuid>();
    state.hostId = j.at(HOST_ID_KEY).get<std::string>();
    state.settings = j.at(SETTINGS_KEY).get<GameSettings>();
    state.phase = j.at(PHASE_KEY).get<Phase>();
    state.players = j.at(PLAYERS_KEY).get<std::vector<Player>>();
    const auto n_players = isize(state.players);
    state.scorekeeperIndex = Messaging::validate(
        j.at(SCOREKEEPER_INDEX_KEY).get<std::optional<int>>(),
        [n_players](const auto& scorekeeper) {
            return !scorekeeper || isSeat(*scorekeeper, n_players);
        });
    state.scores = Messaging::validate(
        j.at(SCORES_KEY).get<Scoring::Scores>(),
        [n_players](const auto& scores) {
            return isize(scores) == n_players;
        });
    state.stanza = Messaging::validate(
        j.at(STANZA_KEY).get<std::optional<StanzaState>>(),
        [n_players](const auto& stanza) {
            return !stanza || isStanzaConsistent(*stanza, n_players);
        });
    state.completedStanzas =
        j.at(COMPLETED_STANZAS_KEY).get<std::vector<CompletedStanzaRecord>>();
    state.truncatedAverage = j.at(TRUNCATED_AVERAGE_KEY).get<int>();
}

}
}
