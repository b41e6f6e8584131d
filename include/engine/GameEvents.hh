/** \file
 *
 * \brief Definition of the events emitted by the game engine
 *
 * Each command in WhoopieEngine.hh returns the events it caused in the order
 * they happened. The host relays them to the players and to the persistence
 * layer.
 */

#ifndef ENGINE_GAMEEVENTS_HH_
#define ENGINE_GAMEEVENTS_HH_

#include "engine/GameState.hh"
#include "scoring/Rankings.hh"

#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace Whoopie {
namespace Engine {

/// \brief A player took a seat
struct PlayerJoined {
    Player player;
    bool operator==(const PlayerJoined&) const = default;
};

/** \brief A player left the game
 *
 * If the seat was taken over by another player, \ref replacement is the new
 * player.
 */
struct PlayerLeft {
    std::string playerId;
    std::string playerName;
    std::optional<Player> replacement;
    bool operator==(const PlayerLeft&) const = default;
};

/// \brief The game was started
struct GameStarted {
    bool operator==(const GameStarted&) const = default;
};

/// \brief Cards were cut to determine the first dealer
struct CutForDealer {
    std::vector<Card> cutCards;
    int dealerIndex {};
    bool operator==(const CutForDealer&) const = default;
};

/** \brief A stanza was dealt
 *
 * The event carries the full stanza including every hand. Hosts relaying it
 * to players should send each player its own view.
 */
struct StanzaStarted {
    StanzaState stanza;
    bool operator==(const StanzaStarted&) const = default;
};

/// \brief A bid was placed
struct BidPlaced {
    int playerIndex {};
    int bid {};
    bool operator==(const BidPlaced&) const = default;
};

/// \brief A card was played
struct CardPlayed {
    int playerIndex {};
    Card card;
    bool wasWhoopie {false};
    bool wasScramble {false};
    std::optional<Suit> newTrumpSuit;
    bool operator==(const CardPlayed&) const = default;
};

/// \brief A trick was completed
struct TrickCompleted {
    CompletedTrick trick;
    bool operator==(const TrickCompleted&) const = default;
};

/// \brief A stanza was completed and scored
struct StanzaCompleted {
    Scoring::Scores scoreChanges;
    Scoring::Scores newScores;
    bool operator==(const StanzaCompleted&) const = default;
};

/// \brief The game ended
struct GameEnded {
    Scoring::Scores finalScores;
    Scoring::Rankings rankings;
    bool operator==(const GameEnded&) const = default;
};

/** \brief A player played a Whoopie card without calling Whoopie
 *
 * The play itself is accepted.
 */
struct WhoopieCallMissed {
    int playerIndex {};
    bool operator==(const WhoopieCallMissed&) const = default;
};

/// \brief The stanza in progress was abandoned and dealt again
struct StanzaRedealt {
    std::string reason;
    bool operator==(const StanzaRedealt&) const = default;
};

/** \brief An event emitted by the game engine
 */
using GameEvent = std::variant<
    PlayerJoined, PlayerLeft, GameStarted, CutForDealer, StanzaStarted,
    BidPlaced, CardPlayed, TrickCompleted, StanzaCompleted, GameEnded,
    WhoopieCallMissed, StanzaRedealt>;

/** \brief Ordered events emitted by a command
 */
using GameEvents = std::vector<GameEvent>;

/** \brief Get the type name of an event
 *
 * \return the name of the event, e.g. “cardPlayed”
 */
std::string_view getEventType(const GameEvent& event);

/** \brief Output a GameEvent to stream
 *
 * Only the type of the event is written.
 */
std::ostream& operator<<(std::ostream& os, const GameEvent& event);

}
}

#endif // ENGINE_GAMEEVENTS_HH_
