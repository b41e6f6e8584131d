/** \file
 *
 * \brief Definition of Whoopie::getValidCards
 */

#ifndef ALLOWEDCARDS_HH_
#define ALLOWEDCARDS_HH_

#include "whoopie/Deck.hh"
#include "whoopie/Trick.hh"

#include <algorithm>
#include <vector>

namespace Whoopie {

/** \brief Get valid cards that can be played to trick
 *
 * Writes all cards in \p hand that may be played to \p currentTrick to \p
 * out. The leader may play any card. If a joker was led, following suit is
 * waived. Otherwise a hand holding cards of the led suit must play one of
 * them.
 *
 * \param hand the hand of the seat in turn
 * \param currentTrick the cards played to the trick so far
 * \param out the output iterator the cards are written to
 *
 * \return one past the position the last card was written to
 */
template<typename OutputIterator>
OutputIterator getValidCards(
    const Hand& hand, const TrickCards& currentTrick, OutputIterator out)
{
    const auto lead_suit = getLeadSuit(currentTrick);
    if (!lead_suit) {
        return std::copy(hand.begin(), hand.end(), out);
    }
    const auto follows = [lead_suit](const auto& card) {
        return getSuit(card) == lead_suit;
    };
    if (std::none_of(hand.begin(), hand.end(), follows)) {
        return std::copy(hand.begin(), hand.end(), out);
    }
    return std::copy_if(hand.begin(), hand.end(), out, follows);
}

/** \brief Get valid cards as a vector
 *
 * \sa getValidCards(const Hand&, const TrickCards&, OutputIterator)
 */
Hand getValidCards(const Hand& hand, const TrickCards& currentTrick);

/** \brief Determine if a card may be played to trick
 *
 * \return true if \p card is among the cards returned by getValidCards()
 */
bool isValidPlay(
    const Hand& hand, const TrickCards& currentTrick, const Card& card);

}

#endif // ALLOWEDCARDS_HH_
