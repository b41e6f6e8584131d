/** \file
 *
 * \brief Utilities for creating, shuffling and dealing the deck
 */

#ifndef DECK_HH_
#define DECK_HH_

#include "whoopie/Card.hh"
#include "whoopie/Random.hh"

#include <optional>
#include <vector>

namespace Whoopie {

/** \brief A sequence of cards drawn from the top
 */
using Deck = std::vector<Card>;

/** \brief The cards held by a player
 */
using Hand = std::vector<Card>;

/** \brief The outcome of dealCards()
 */
struct DealResult {
    std::vector<Hand> hands;  ///< \brief Hands indexed by seat
    Deck remainingDeck;       ///< \brief The cards left undealt, in order

    /// \brief Equality comparison
    bool operator==(const DealResult&) const = default;
};

/** \brief Create a fresh deck
 *
 * The deck contains the 52 suit cards (spades, hearts, diamonds, clubs, each
 * from ace down to two) followed by jokers 1 and 2. Each call returns the same
 * sequence.
 *
 * \return a new unshuffled deck of \ref N_CARDS cards
 */
Deck createDeck();

/** \brief Shuffle a deck
 *
 * \param deck the deck to shuffle
 * \param rng the random number generator
 *
 * \return a shuffled copy of \p deck
 */
Deck shuffleDeck(const Deck& deck, Rng& rng);

/** \brief Deal cards one at a time around the table
 *
 * Starting from \p startSeat, each seat in turn receives the next card from
 * the top of \p deck, for \p cardsPerPlayer rounds. At least one card must be
 * left in the deck to be turned up as the Whoopie defining card.
 *
 * \param deck the deck to deal from
 * \param numPlayers the number of seats
 * \param cardsPerPlayer the number of cards each seat receives
 * \param startSeat the seat that receives the first card
 *
 * \return the hands and the remaining deck
 *
 * \throw DeckExhausted if numPlayers * cardsPerPlayer + 1 > deck.size()
 * \throw std::invalid_argument if \p numPlayers or \p cardsPerPlayer is not
 * positive
 * \throw std::out_of_range if \p startSeat is not a valid seat
 */
DealResult dealCards(
    const Deck& deck, int numPlayers, int cardsPerPlayer, int startSeat = 0);

/** \brief Get the value of a card when cutting for dealer
 *
 * \return 15 for jokers, otherwise the rank value (14 for ace down to 2)
 */
int getCutValue(const Card& card);

/** \brief Compare two cards for the cut
 *
 * Suits do not matter in the cut. Jokers rank above aces, and joker 1 below
 * joker 2.
 *
 * \return negative if \p a is lower than \p b, positive if higher, zero if
 * they tie
 */
int compareCardsForCut(const Card& a, const Card& b);

/** \brief Determine the winner of the cut
 *
 * The lowest card wins the cut. Ties go to the lowest seat. A joker never
 * wins the cut.
 *
 * \param cutCards the cards cut, indexed by seat
 *
 * \return the winning seat, or none if every card is a joker and the cut
 * must be repeated
 */
std::optional<int> findCutWinner(const std::vector<Card>& cutCards);

/** \brief Determine if a card is a Whoopie card
 *
 * A Whoopie card has the Whoopie rank. Jokers share the Whoopie
 * denomination. No card is a Whoopie card before the rank is defined.
 */
bool isWhoopieCard(const Card& card, std::optional<Rank> whoopieRank);

/** \brief Determine if a card is trump in the given trump state
 *
 * Jokers are always trump. In J-Trump only the Whoopie cards are trump,
 * otherwise the cards of the trump suit and the Whoopie cards are.
 */
bool isTrump(
    const Card& card, std::optional<Suit> trumpSuit,
    std::optional<Rank> whoopieRank, bool jTrumpActive);

/** \brief Get the cards of a suit in a hand
 */
Hand getCardsOfSuit(const Hand& hand, Suit suit);

/** \brief Determine if a hand contains a card
 */
bool handContains(const Hand& hand, const Card& card);

/** \brief Sort hand for display
 *
 * Suit cards are sorted by suit in the order of \ref SUITS, and within a suit
 * from the highest to the lowest rank. Jokers are placed last.
 */
Hand sortHand(const Hand& hand);

/** \brief Sort hand for display with the trump suit first
 *
 * The trump suit is placed first, followed by the jokers and the rest of the
 * suits. Without a trump suit this is the same as sortHand().
 */
Hand sortHandWithTrump(const Hand& hand, std::optional<Suit> trumpSuit);

}

#endif // DECK_HH_
