#include "engine/GameState.hh"

#include "IoUtility.hh"
#include "Utility.hh"

#include <boost/uuid/uuid_io.hpp>

#include <ostream>

namespace Whoopie {
namespace Engine {

using Whoopie::operator<<;

namespace {

PhaseToStringMap makePhaseToStringMap()
{
    using Relation = PhaseToStringMap::value_type;
    auto ret = PhaseToStringMap {};
    ret.insert(Relation {Phase::WAITING,    "waiting"});
    ret.insert(Relation {Phase::RESUMING,   "resuming"});
    ret.insert(Relation {Phase::BIDDING,    "bidding"});
    ret.insert(Relation {Phase::PLAYING,    "playing"});
    ret.insert(Relation {Phase::TRICK_END,  "trickEnd"});
    ret.insert(Relation {Phase::STANZA_END, "stanzaEnd"});
    ret.insert(Relation {Phase::GAME_END,   "gameEnd"});
    return ret;
}

}

const PhaseToStringMap PHASE_TO_STRING_MAP = makePhaseToStringMap();

std::optional<Rank> StanzaState::getWhoopieRank() const
{
    return Whoopie::getWhoopieRank(whoopieDefinition);
}

bool operator==(const StanzaState& lhs, const StanzaState& rhs)
{
    return &lhs == &rhs || (
        lhs.stanzaNumber == rhs.stanzaNumber &&
        lhs.cardsPerPlayer == rhs.cardsPerPlayer &&
        lhs.direction == rhs.direction &&
        lhs.dealerIndex == rhs.dealerIndex &&
        lhs.whoopieDefiningCard == rhs.whoopieDefiningCard &&
        lhs.whoopieDefinition == rhs.whoopieDefinition &&
        lhs.initialTrumpSuit == rhs.initialTrumpSuit &&
        lhs.trump == rhs.trump &&
        lhs.bids == rhs.bids &&
        lhs.currentTrickNumber == rhs.currentTrickNumber &&
        lhs.currentTrick == rhs.currentTrick &&
        lhs.completedTricks == rhs.completedTricks &&
        lhs.tricksTaken == rhs.tricksTaken &&
        lhs.hands == rhs.hands &&
        lhs.undealtCards == rhs.undealtCards &&
        lhs.currentPlayerIndex == rhs.currentPlayerIndex);
}

bool operator==(const GameState& lhs, const GameState& rhs)
{
    return &lhs == &rhs || (
        lhs.id == rhs.id &&
        lhs.hostId == rhs.hostId &&
        lhs.settings == rhs.settings &&
        lhs.phase == rhs.phase &&
        lhs.players == rhs.players &&
        lhs.scorekeeperIndex == rhs.scorekeeperIndex &&
        lhs.scores == rhs.scores &&
        lhs.stanza == rhs.stanza &&
        lhs.completedStanzas == rhs.completedStanzas &&
        lhs.truncatedAverage == rhs.truncatedAverage);
}

std::optional<int> findPlayerIndex(
    const GameState& state, const std::string& playerId)
{
    for (const auto i : to(isize(state.players))) {
        if (getPlayerId(state.players[i]) == playerId) {
            return i;
        }
    }
    return std::nullopt;
}

std::ostream& operator<<(std::ostream& os, const Phase phase)
{
    return os << PHASE_TO_STRING_MAP.left.at(phase);
}

std::ostream& operator<<(std::ostream& os, const GameSettings& settings)
{
    return os << "max players " << settings.maxPlayers <<
        ", min players to start " << settings.minPlayersToStart <<
        ", public " << settings.isPublic <<
        ", spectators " << settings.allowSpectators;
}

std::ostream& operator<<(std::ostream& os, const StanzaState& stanza)
{
    os << "Stanza " << stanza.stanzaNumber;
    os << "\nCards per player: " << stanza.cardsPerPlayer << " " <<
        stanza.direction;
    os << "\nDealer: " << stanza.dealerIndex;
    os << "\nDefining card: " << stanza.whoopieDefiningCard;
    os << "\nWhoopie rank: " << stanza.whoopieDefinition;
    os << "\nTrump: " << stanza.trump;
    os << "\nBids: " << stanza.bids;
    os << "\nTrick " << stanza.currentTrickNumber << ": " <<
        stanza.currentTrick;
    os << "\nTricks taken: " << stanza.tricksTaken;
    os << "\nIn turn: " << stanza.currentPlayerIndex;
    for (const auto i : to(isize(stanza.hands))) {
        os << "\n  " << i << ": " << stanza.hands[i];
    }
    return os;
}

std::ostream& operator<<(std::ostream& os, const GameState& state)
{
    os << "Game " << state.id;
    os << "\nPhase: " << state.phase;
    os << "\nPlayers: " << state.players;
    os << "\nScores: " << state.scores;
    if (state.stanza) {
        os << "\n" << *state.stanza;
    }
    return os;
}

}
}
