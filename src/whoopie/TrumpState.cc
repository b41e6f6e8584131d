#include "whoopie/TrumpState.hh"

#include "whoopie/Deck.hh"
#include "IoUtility.hh"

#include <ostream>

namespace Whoopie {

TrumpState TrumpChange::getTrumpState() const
{
    return {newTrumpSuit, newJTrumpActive};
}

std::optional<Rank> getWhoopieRank(const WhoopieDefinition& definition)
{
    if (const auto* defined = std::get_if<DefinedWhoopieRank>(&definition)) {
        return defined->rank;
    }
    return std::nullopt;
}

bool isDefinitionPending(const WhoopieDefinition& definition)
{
    return std::holds_alternative<PendingDefinition>(definition);
}

InitialTrump makeInitialTrump(const Card& definingCard)
{
    if (const auto* suit_card = std::get_if<SuitCard>(&definingCard)) {
        return {
            DefinedWhoopieRank {suit_card->rank},
            TrumpState {suit_card->suit, false}};
    }
    return {PendingDefinition {}, TrumpState {std::nullopt, true}};
}

LeadDefinition defineFromLead(
    const WhoopieDefinition& definition, const TrumpState& trump,
    const Card& leadCard)
{
    if (!isDefinitionPending(definition)) {
        return {definition, trump, false};
    }
    if (const auto* suit_card = std::get_if<SuitCard>(&leadCard)) {
        return {
            DefinedWhoopieRank {suit_card->rank},
            TrumpState {suit_card->suit, false},
            false};
    }
    return {definition, TrumpState {trump.trumpSuit, true}, true};
}

TrumpChange getTrumpStateAfterPlay(
    const Card& card, const TrumpState& trump,
    const std::optional<Rank> whoopieRank, const std::optional<Suit> leadSuit,
    const bool isLead)
{
    if (isJoker(card)) {
        if (isLead) {
            return {std::nullopt, true, false, true};
        }
        return {leadSuit, true, false, true};
    }
    if (isWhoopieCard(card, whoopieRank)) {
        return {getSuit(card), false, true, false};
    }
    return {trump.trumpSuit, trump.jTrumpActive, false, false};
}

std::ostream& operator<<(std::ostream& os, const TrumpState& trump)
{
    os << "trump " << trump.trumpSuit;
    if (trump.jTrumpActive) {
        os << " (J-Trump)";
    }
    return os;
}

std::ostream& operator<<(std::ostream& os, const PendingDefinition&)
{
    return os << "pending";
}

std::ostream& operator<<(std::ostream& os, const DefinedWhoopieRank& defined)
{
    return os << defined.rank;
}

}
