#include "engine/PlayerView.hh"

#include "whoopie/AllowedBids.hh"
#include "whoopie/AllowedCards.hh"
#include "whoopie/WhoopieException.hh"
#include "Utility.hh"

#include <iterator>

namespace Whoopie {
namespace Engine {

namespace {

StanzaView makeStanzaView(const StanzaState& stanza, const int seat)
{
    auto view = StanzaView {};
    view.stanzaNumber = stanza.stanzaNumber;
    view.cardsPerPlayer = stanza.cardsPerPlayer;
    view.direction = stanza.direction;
    view.dealerIndex = stanza.dealerIndex;
    view.whoopieDefiningCard = stanza.whoopieDefiningCard;
    view.whoopieRank = stanza.getWhoopieRank();
    view.initialTrumpSuit = stanza.initialTrumpSuit;
    view.trump = stanza.trump;
    view.bids = stanza.bids;
    view.currentTrickNumber = stanza.currentTrickNumber;
    view.currentTrick = stanza.currentTrick;
    view.completedTricks = stanza.completedTricks;
    view.tricksTaken = stanza.tricksTaken;
    if (seat < isize(stanza.hands)) {
        view.myHand = stanza.hands[seat];
    }
    for (const auto& hand : stanza.hands) {
        view.handCounts.push_back(isize(hand));
    }
    view.undealtCardCount = isize(stanza.undealtCards);
    view.currentPlayerIndex = stanza.currentPlayerIndex;
    return view;
}

}

PlayerView getPlayerView(const GameState& state, const int seat)
{
    if (seat < 0 || seat >= isize(state.players)) {
        throw PlayerNotFound {"No such seat"};
    }
    auto view = PlayerView {};
    view.id = state.id;
    view.hostId = state.hostId;
    view.settings = state.settings;
    view.phase = state.phase;
    view.players = state.players;
    view.scorekeeperIndex = state.scorekeeperIndex;
    view.scores = state.scores;
    if (state.stanza) {
        view.stanza = makeStanzaView(*state.stanza, seat);
    }
    view.completedStanzas = state.completedStanzas;
    view.truncatedAverage = state.truncatedAverage;
    view.myIndex = seat;
    return view;
}

ValidActions getValidActions(const GameState& state)
{
    auto ret = ValidActions {};
    if (!state.stanza) {
        return ret;
    }
    const auto& stanza = *state.stanza;
    const auto seat = stanza.currentPlayerIndex;
    if (state.phase == Phase::BIDDING) {
        getValidBids(
            seat, stanza.dealerIndex, stanza.cardsPerPlayer, stanza.bids,
            std::back_inserter(ret.bids));
    } else if (state.phase == Phase::PLAYING) {
        getValidCards(
            stanza.hands.at(seat), stanza.currentTrick,
            std::back_inserter(ret.cards));
    }
    return ret;
}

bool isPlayersTurn(const GameState& state, const int seat)
{
    if (!state.stanza) {
        return false;
    }
    if (state.phase != Phase::BIDDING && state.phase != Phase::PLAYING) {
        return false;
    }
    return state.stanza->currentPlayerIndex == seat;
}

}
}
