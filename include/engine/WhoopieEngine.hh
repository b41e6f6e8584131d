/** \file
 *
 * \brief Definition of the commands of the Whoopie game engine
 *
 * Each command takes the current GameState and returns the new state together
 * with the events the command caused. The given state is never modified. If a
 * command is not allowed, it throws one of the exceptions in
 * WhoopieException.hh, and the caller may keep using the state it had.
 *
 * The engine does not serialize access. The host must apply the commands of a
 * game one at a time, each to the state returned by the previous command.
 */

#ifndef ENGINE_WHOOPIEENGINE_HH_
#define ENGINE_WHOOPIEENGINE_HH_

#include "engine/GameEvents.hh"
#include "engine/GameState.hh"
#include "whoopie/Random.hh"

#include <string>

namespace Whoopie {

/** \brief The Whoopie game engine
 */
namespace Engine {

/** \brief Outcome of a successful command
 */
struct CommandResult {
    GameState state;    ///< \brief The new state
    GameEvents events;  ///< \brief The events in the order they happened
};

/** \brief Reason attached to the StanzaRedealt event after a seat removal
 */
inline constexpr auto REDEAL_REASON_PLAYER_REMOVED = "Player removed from game";

/** \brief Create a new game waiting for players
 *
 * \param hostId the id of the player hosting the game
 * \param settings the game settings
 *
 * \return a new game in the waiting phase with a fresh id
 *
 * \throw std::invalid_argument if the settings allow fewer than \ref
 * MIN_PLAYERS or more than \ref MAX_PLAYERS players, or more players to
 * start than to sit
 */
GameState createGame(
    const std::string& hostId, const GameSettings& settings = {});

/** \brief Seat a player
 *
 * \throw InvalidPhase if the game is not waiting for players
 * \throw SeatingFailure if the table is full or the player is already seated
 */
CommandResult addPlayer(const GameState& state, const Player& player);

/** \brief Remove a player before the game starts
 *
 * \throw PlayerNotFound if the player is not seated
 * \throw InvalidPhase if the game is not waiting for players
 */
CommandResult removePlayer(const GameState& state, const std::string& playerId);

/** \brief Let another player take over the seat of a player
 *
 * The seat keeps its hand, bid, tricks and score. This is used to replace a
 * player that left a game in progress, e.g. by an AI player.
 *
 * \throw PlayerNotFound if the player is not seated
 * \throw InvalidPhase if the game is waiting for players or has ended
 * \throw SeatingFailure if the replacement is already seated in another seat
 */
CommandResult replacePlayer(
    const GameState& state, const std::string& playerId,
    const Player& replacement);

/** \brief Start the game
 *
 * Cuts for the first dealer, makes the seat to the left of the dealer the
 * scorekeeper, and deals the first stanza of one card per player.
 *
 * \throw InvalidPhase if the game is not waiting for players
 * \throw InsufficientPlayers if fewer players than required are seated
 */
CommandResult startGame(const GameState& state, Rng& rng);

/** \brief Deal a stanza from a freshly shuffled deck
 *
 * \sa dealStanza()
 */
CommandResult startStanza(
    const GameState& state, int dealerIndex, int cardsPerPlayer,
    Direction direction, Rng& rng);

/** \brief Deal a stanza from a given deck
 *
 * Deals \p cardsPerPlayer cards to each seat starting from the left of the
 * dealer, turns up the next card as the Whoopie defining card and derives the
 * initial trump state from it. The seat to the left of the dealer bids first.
 *
 * \param state the game state
 * \param dealerIndex the seat of the dealer
 * \param cardsPerPlayer the number of cards dealt to each seat
 * \param direction the direction of the stanza size cycle
 * \param shuffledDeck the deck to deal from, top card first
 *
 * \throw InvalidPhase if the game has ended
 * \throw InsufficientPlayers if the number of seats is not within limits
 * \throw DeckExhausted if the deck does not have enough cards
 * \throw std::out_of_range if \p dealerIndex is not a seat
 */
CommandResult dealStanza(
    const GameState& state, int dealerIndex, int cardsPerPlayer,
    Direction direction, const Deck& shuffledDeck);

/** \brief Place a bid
 *
 * After the last bid the seat to the left of the dealer leads the first
 * trick.
 *
 * \throw InvalidPhase if the game is not in the bidding phase
 * \throw NotYourTurn if \p seat is not in turn to bid
 * \throw InvalidBid if the bid is not allowed
 */
CommandResult placeBid(const GameState& state, int seat, int bid);

/** \brief Play a card
 *
 * \p calledWhoopie tells whether the player called Whoopie with the card. If
 * the card is a Whoopie card and the player did not call, a
 * WhoopieCallMissed event is emitted but the play is accepted.
 *
 * Completing a trick resolves its winner. If tricks remain, the game moves to
 * the trick end phase, otherwise the stanza is scored and the game moves to
 * the stanza end phase.
 *
 * \throw InvalidPhase if the game is not in the playing phase
 * \throw NotYourTurn if \p seat is not in turn to play
 * \throw InvalidPlay if the card is not in the hand or does not follow suit
 */
CommandResult playCard(
    const GameState& state, int seat, const Card& card, bool calledWhoopie);

/** \brief Clear the completed trick and let its winner lead
 *
 * \throw InvalidPhase if the game is not in the trick end phase
 */
CommandResult continueGame(const GameState& state);

/** \brief Deal the next stanza
 *
 * The deal passes to the left, and the number of cards follows the up and
 * down cycle.
 *
 * \throw InvalidPhase if the game is not in the stanza end phase
 */
CommandResult continueToNextStanza(const GameState& state, Rng& rng);

/** \brief Remove a seat from a game in progress and deal again
 *
 * The stanza in progress is abandoned and dealt again from a new deck with
 * the same number of cards. If the stanza had already ended, the next stanza
 * is dealt instead. The dealer and the scorekeeper keep their seats, or pass
 * to the left if their seat was removed. Before the game starts the player is
 * simply removed.
 *
 * \throw PlayerNotFound if \p seat is not a seat
 * \throw InvalidPhase if the game has ended
 * \throw InsufficientPlayers if fewer than \ref MIN_PLAYERS seats would remain
 */
CommandResult removePlayerAndRedeal(const GameState& state, int seat, Rng& rng);

/** \brief End the game
 *
 * \throw InvalidPhase if the game is not in the stanza end phase
 */
CommandResult endGame(const GameState& state);

}
}

#endif // ENGINE_WHOOPIEENGINE_HH_
