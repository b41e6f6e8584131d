/** \file
 *
 * \brief Definition of the stanza size cycle and seat rotation
 */

#ifndef STANZAPROGRESSION_HH_
#define STANZAPROGRESSION_HH_

#include <boost/bimap/bimap.hpp>

#include <iosfwd>
#include <string>

namespace Whoopie {

/** \brief Direction of the stanza size cycle
 */
enum class Direction {
    UP,
    DOWN,
};

/** \brief Type of \ref DIRECTION_TO_STRING_MAP
 */
using DirectionToStringMap = boost::bimaps::bimap<Direction, std::string>;

/** \brief Two-way map between Direction enumerations and their names
 */
extern const DirectionToStringMap DIRECTION_TO_STRING_MAP;

/** \brief Size and direction of a stanza
 */
struct StanzaSize {
    int cardsPerPlayer {};              ///< \brief Cards dealt to each seat
    Direction direction {Direction::UP}; ///< \brief Direction of the cycle

    /// \brief Equality comparison
    bool operator==(const StanzaSize&) const = default;
};

/** \brief Get the maximum number of cards each seat can be dealt
 *
 * One card of the deck is reserved for the Whoopie defining card.
 *
 * \param numPlayers the number of seats
 *
 * \return floor(53 / numPlayers)
 *
 * \throw std::invalid_argument if \p numPlayers is not positive
 */
int getMaxCardsPerPlayer(int numPlayers);

/** \brief Get the number of stanzas in one full up and down cycle
 *
 * \param numPlayers the number of seats
 *
 * \return 2 * getMaxCardsPerPlayer(numPlayers) - 1
 */
int getTotalStanzasInCycle(int numPlayers);

/** \brief Get the size of the next stanza
 *
 * The number of cards increases by one while the direction is up until \p
 * maxCardsPerPlayer is reached, then decreases by one until one card is
 * reached, and then increases again.
 *
 * \param cardsPerPlayer the number of cards in the current stanza
 * \param direction the direction of the current stanza
 * \param maxCardsPerPlayer the maximum number of cards per seat
 *
 * \return the size and the direction of the next stanza
 */
StanzaSize getNextStanzaSize(
    int cardsPerPlayer, Direction direction, int maxCardsPerPlayer);

/** \brief Get the seat to the left of a seat
 */
int getNextSeat(int seat, int numPlayers);

/** \brief Get the seat that bids first in a stanza
 */
int getFirstBidderIndex(int dealerIndex, int numPlayers);

/** \brief Get the seat that leads the first trick of a stanza
 */
int getFirstLeaderIndex(int dealerIndex, int numPlayers);

/** \brief Determine if a stanza can be started
 *
 * \return true if there are between \ref MIN_PLAYERS and \ref MAX_PLAYERS
 * seats, at least one card per seat, and one card left for the Whoopie
 * defining card
 */
bool canStartStanza(int numPlayers, int cardsPerPlayer);

/** \brief Output a Direction to stream
 */
std::ostream& operator<<(std::ostream& os, Direction direction);

/** \brief Output a StanzaSize to stream
 */
std::ostream& operator<<(std::ostream& os, const StanzaSize& size);

}

#endif // STANZAPROGRESSION_HH_
