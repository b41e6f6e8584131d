/** \file
 *
 * \brief Definition of the Whoopie game state
 */

#ifndef ENGINE_GAMESTATE_HH_
#define ENGINE_GAMESTATE_HH_

#include "scoring/StanzaScoring.hh"
#include "whoopie/AllowedBids.hh"
#include "whoopie/Card.hh"
#include "whoopie/Deck.hh"
#include "whoopie/Player.hh"
#include "whoopie/StanzaProgression.hh"
#include "whoopie/Trick.hh"
#include "whoopie/TrumpState.hh"
#include "whoopie/Uuid.hh"
#include "whoopie/WhoopieConstants.hh"

#include <boost/bimap/bimap.hpp>
#include <boost/operators.hpp>

#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace Whoopie {
namespace Engine {

/** \brief Phase of a Whoopie game
 */
enum class Phase {
    WAITING,
    RESUMING,
    BIDDING,
    PLAYING,
    TRICK_END,
    STANZA_END,
    GAME_END,
};

/** \brief Type of \ref PHASE_TO_STRING_MAP
 */
using PhaseToStringMap = boost::bimaps::bimap<Phase, std::string>;

/** \brief Two-way map between Phase enumerations and their names
 */
extern const PhaseToStringMap PHASE_TO_STRING_MAP;

/** \brief Settings of a game
 */
struct GameSettings {
    int maxPlayers {MAX_PLAYERS};         ///< \brief Size of the table
    int minPlayersToStart {MIN_PLAYERS};  ///< \brief Players needed to start
    bool isPublic {true};                 ///< \brief Listed in the lobby
    bool allowSpectators {true};          ///< \brief Spectators may join

    /// \brief Equality comparison
    bool operator==(const GameSettings&) const = default;
};

/** \brief State of the stanza in progress
 *
 * The cards of the stanza are always the full deck: the hands, the current
 * trick, the completed tricks, the defining card and the undealt cards
 * together contain every card exactly once. During the trick end and the
 * stanza end phases \ref currentTrick repeats the cards of the last completed
 * trick.
 */
struct StanzaState : private boost::equality_comparable<StanzaState> {

    /// \brief Number of the stanza, starting from 1
    int stanzaNumber {1};

    /// \brief Cards dealt to each seat
    int cardsPerPlayer {1};

    /// \brief Direction of the stanza size cycle
    Direction direction {Direction::UP};

    /// \brief Seat of the dealer
    int dealerIndex {};

    /// \brief The card turned up after dealing
    Card whoopieDefiningCard;

    /** \brief The Whoopie rank
     *
     * Pending if the defining card was a joker and no suit card has been led
     * since.
     */
    WhoopieDefinition whoopieDefinition;

    /// \brief Trump suit set by the defining card
    std::optional<Suit> initialTrumpSuit;

    /// \brief The live trump state
    TrumpState trump;

    /// \brief Bids indexed by seat
    Bids bids;

    /// \brief Number of the trick in progress, starting from 1
    int currentTrickNumber {1};

    /// \brief Cards played to the trick in progress
    TrickCards currentTrick;

    /// \brief Completed tricks in playing order
    std::vector<CompletedTrick> completedTricks;

    /// \brief Tricks taken indexed by seat
    std::vector<int> tricksTaken;

    /// \brief Hands indexed by seat
    std::vector<Hand> hands;

    /// \brief Cards left in the deck under the defining card
    Deck undealtCards;

    /// \brief Seat in turn to bid or play
    int currentPlayerIndex {};

    /** \brief Get the Whoopie rank
     *
     * \return the rank, or none if the definition is pending
     */
    std::optional<Rank> getWhoopieRank() const;
};

/** \brief Equality operator for stanza states
 */
bool operator==(const StanzaState&, const StanzaState&);

/** \brief Summary of a completed stanza
 */
struct CompletedStanzaRecord {
    int stanzaNumber {};                  ///< \brief Number of the stanza
    int cardsPerPlayer {};                ///< \brief Cards dealt to each seat
    int dealerIndex {};                   ///< \brief Seat of the dealer
    Card whoopieDefiningCard;             ///< \brief The defining card
    std::vector<int> bids;                ///< \brief Bids indexed by seat
    std::vector<int> tricksTaken;         ///< \brief Tricks indexed by seat
    Scoring::Scores scoreChanges;         ///< \brief Score changes by seat
    std::vector<std::string> playerIds;   ///< \brief Players seated

    /// \brief Equality comparison
    bool operator==(const CompletedStanzaRecord&) const = default;
};

/** \brief The complete state of a Whoopie game
 *
 * GameState is a value. The commands in WhoopieEngine.hh never modify a state
 * they are given, but return a new one.
 *
 * The seat of a player is its index in \ref players. The \ref scores have
 * one entry per seat.
 */
struct GameState : private boost::equality_comparable<GameState> {
    Uuid id {};                           ///< \brief Unique game id
    std::string hostId;                   ///< \brief Player hosting the game
    GameSettings settings;                ///< \brief Game settings
    Phase phase {Phase::WAITING};         ///< \brief Current phase
    std::vector<Player> players;          ///< \brief Seated players
    std::optional<int> scorekeeperIndex;  ///< \brief Seat keeping the score
    Scoring::Scores scores;               ///< \brief Cumulative scores

    /** \brief The stanza in progress
     *
     * None before the first deal.
     */
    std::optional<StanzaState> stanza;

    /// \brief Summaries of completed stanzas in playing order
    std::vector<CompletedStanzaRecord> completedStanzas;

    /// \brief Truncated average of the scores at the last stanza end
    int truncatedAverage {};
};

/** \brief Equality operator for game states
 */
bool operator==(const GameState&, const GameState&);

/** \brief Find the seat of a player
 *
 * \return the seat of the player with \p playerId, or none if not seated
 */
std::optional<int> findPlayerIndex(
    const GameState& state, const std::string& playerId);

/** \brief Output a Phase to stream
 */
std::ostream& operator<<(std::ostream& os, Phase phase);

/** \brief Output a GameSettings to stream
 */
std::ostream& operator<<(std::ostream& os, const GameSettings& settings);

/** \brief Output a StanzaState to stream
 */
std::ostream& operator<<(std::ostream& os, const StanzaState& stanza);

/** \brief Output a GameState to stream
 */
std::ostream& operator<<(std::ostream& os, const GameState& state);

}
}

#endif // ENGINE_GAMESTATE_HH_
