/** \file
 *
 * \brief Definition of fundamental Whoopie constants needed by several modules
 */

#ifndef WHOOPIECONSTANTS_HH_
#define WHOOPIECONSTANTS_HH_

/** \brief Top level namespace of the Whoopie rules engine
 *
 * The Whoopie namespace directly contains the card model and the rules of the
 * game. It also contains subnamespaces for the state machine, scoring,
 * serialization and the command line host.
 */
namespace Whoopie {

/** \brief Minimum number of players in a game
 */
constexpr auto MIN_PLAYERS = 2;

/** \brief Maximum number of players in a game
 */
constexpr auto MAX_PLAYERS = 10;

/** \brief Number of jokers in the deck
 */
constexpr auto N_JOKERS = 2;

/** \brief Number of cards in the deck
 *
 * 52 suit cards and two jokers
 */
constexpr auto N_CARDS = 52 + N_JOKERS;

/** \brief Points for making a bid, not counting the bid itself
 */
constexpr auto SCORE_MAKE_BID_BASE = 2;

/** \brief Points for missing a bid
 */
constexpr auto SCORE_MISS_BID = -1;

/** \brief Penalty for not calling Whoopie when playing a Whoopie card
 */
constexpr auto SCORE_MISSED_WHOOPIE_CALL = -1;

}

#endif // WHOOPIECONSTANTS_HH_
