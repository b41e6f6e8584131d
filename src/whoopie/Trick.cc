#include "whoopie/Trick.hh"

#include "whoopie/Deck.hh"
#include "IoUtility.hh"
#include "Logging.hh"
#include "Utility.hh"

#include <ostream>
#include <stdexcept>

namespace Whoopie {

std::optional<Suit> getLeadSuit(const TrickCards& trick)
{
    if (trick.empty()) {
        return std::nullopt;
    }
    return getSuit(trick.front().card);
}

bool wasTrumpWhenPlayed(
    const PlayedCard& playedCard, const std::optional<Rank> whoopieRank,
    const std::optional<Suit> leadSuit)
{
    const auto& card = playedCard.card;
    if (isJoker(card) || isWhoopieCard(card, whoopieRank)) {
        return true;
    }
    const auto suit = getSuit(card);
    if (playedCard.jTrumpActiveAtPlay) {
        return !leadSuit || suit == leadSuit;
    }
    return suit == playedCard.trumpSuitAtPlay;
}

int getEffectiveRankValue(const Card& card, const std::optional<Rank> whoopieRank)
{
    if (const auto rank = getRank(card)) {
        return rankValue(*rank);
    }
    return whoopieRank ? rankValue(*whoopieRank) : PENDING_JOKER_RANK_VALUE;
}

bool cardBeatsCard(
    const PlayedCard& challenger, const PlayedCard& incumbent,
    const std::optional<Rank> whoopieRank, const std::optional<Suit> leadSuit)
{
    const auto challenger_trump =
        wasTrumpWhenPlayed(challenger, whoopieRank, leadSuit);
    const auto incumbent_trump =
        wasTrumpWhenPlayed(incumbent, whoopieRank, leadSuit);
    if (challenger_trump != incumbent_trump) {
        return challenger_trump;
    }
    if (!challenger_trump) {
        const auto challenger_follows =
            leadSuit && getSuit(challenger.card) == leadSuit;
        const auto incumbent_follows =
            leadSuit && getSuit(incumbent.card) == leadSuit;
        if (!challenger_follows) {
            return false;
        } else if (!incumbent_follows) {
            return true;
        }
    }
    return getEffectiveRankValue(challenger.card, whoopieRank) >
        getEffectiveRankValue(incumbent.card, whoopieRank);
}

int resolveTrickWinner(
    const TrickCards& trick, const std::optional<Rank> whoopieRank)
{
    if (trick.empty()) {
        throw std::invalid_argument {"Cannot resolve empty trick"};
    }

    const auto lead_suit = getLeadSuit(trick);
    auto winner = 0;
    for (const auto i : from_to(1, isize(trick))) {
        if (cardBeatsCard(trick[i], trick[winner], whoopieRank, lead_suit)) {
            winner = i;
        }
    }
    log(LogLevel::DEBUG,
        "Trick resolved: lead suit %s, Whoopie rank %s, cards %s, winner %d",
        lead_suit, whoopieRank, trick, winner);
    return winner;
}

CompletedTrick makeCompletedTrick(
    const TrickCards& trick, const std::optional<Rank> whoopieRank)
{
    const auto winner = resolveTrickWinner(trick, whoopieRank);
    const auto& winning_card = trick[winner];
    return {
        trick, winning_card.playerIndex, winning_card.playerId,
        getLeadSuit(trick)};
}

std::ostream& operator<<(std::ostream& os, const PlayedCard& playedCard)
{
    os << playedCard.card << " by " << playedCard.playerIndex <<
        " (trump at play " << playedCard.trumpSuitAtPlay;
    if (playedCard.jTrumpActiveAtPlay) {
        os << ", J-Trump";
    }
    if (playedCard.wasWhoopie) {
        os << ", Whoopie";
    }
    if (playedCard.wasScramble) {
        os << ", scramble";
    }
    return os << ")";
}

std::ostream& operator<<(std::ostream& os, const CompletedTrick& trick)
{
    return os << trick.cards << " won by " << trick.winnerIndex;
}

}
