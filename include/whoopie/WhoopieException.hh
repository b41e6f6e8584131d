/** \file
 *
 * \brief Definition of the exceptions signalling rejected game commands
 */

#ifndef WHOOPIEEXCEPTION_HH_
#define WHOOPIEEXCEPTION_HH_

#include <stdexcept>

namespace Whoopie {

/** \brief Base class of rule violations
 *
 * A rule violation is a synchronous rejection of a command. The engine never
 * modifies the state the command was applied to, so the caller may keep using
 * it after catching the exception.
 */
class WhoopieException : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/** \brief The command is not allowed in the current phase of the game
 */
class InvalidPhase : public WhoopieException {
public:
    using WhoopieException::WhoopieException;
};

/** \brief The command was submitted by a seat that does not have the turn
 */
class NotYourTurn : public WhoopieException {
public:
    using WhoopieException::WhoopieException;
};

/** \brief The bid is not among the valid bids of the seat
 */
class InvalidBid : public WhoopieException {
public:
    using WhoopieException::WhoopieException;
};

/** \brief The card is not in the hand or would not follow suit
 */
class InvalidPlay : public WhoopieException {
public:
    using WhoopieException::WhoopieException;
};

/** \brief There are too few (or too many) players for the command
 */
class InsufficientPlayers : public WhoopieException {
public:
    using WhoopieException::WhoopieException;
};

/** \brief The deck does not contain enough cards for the deal
 */
class DeckExhausted : public WhoopieException {
public:
    using WhoopieException::WhoopieException;
};

/** \brief The command refers to an unknown seat or player
 *
 * Unlike the other rule violations this indicates an integration bug in the
 * host rather than a player error.
 */
class PlayerNotFound : public WhoopieException {
public:
    using WhoopieException::WhoopieException;
};

/** \brief A player could not be seated (table full or duplicate identifier)
 */
class SeatingFailure : public WhoopieException {
public:
    using WhoopieException::WhoopieException;
};

}

#endif // WHOOPIEEXCEPTION_HH_
