/** \file
 *
 * \brief Definition of the player specific view of a game
 */

#ifndef ENGINE_PLAYERVIEW_HH_
#define ENGINE_PLAYERVIEW_HH_

#include "engine/GameState.hh"

#include <optional>
#include <string>
#include <vector>

namespace Whoopie {
namespace Engine {

/** \brief The stanza as seen by one seat
 *
 * Contains everything in StanzaState except the hands of the other seats and
 * the undealt cards, which are only given as counts.
 */
struct StanzaView {
    int stanzaNumber {1};                        ///< \brief Stanza number
    int cardsPerPlayer {1};                      ///< \brief Cards per seat
    Direction direction {Direction::UP};         ///< \brief Cycle direction
    int dealerIndex {};                          ///< \brief Dealer seat
    Card whoopieDefiningCard;                    ///< \brief Defining card
    std::optional<Rank> whoopieRank;             ///< \brief Whoopie rank
    std::optional<Suit> initialTrumpSuit;        ///< \brief Initial trump
    TrumpState trump;                            ///< \brief Live trump
    Bids bids;                                   ///< \brief Bids by seat
    int currentTrickNumber {1};                  ///< \brief Trick number
    TrickCards currentTrick;                     ///< \brief Trick in progress
    std::vector<CompletedTrick> completedTricks; ///< \brief Completed tricks
    std::vector<int> tricksTaken;                ///< \brief Tricks by seat
    Hand myHand;                                 ///< \brief The seat's hand
    std::vector<int> handCounts;                 ///< \brief Hand sizes by seat
    int undealtCardCount {};                     ///< \brief Undealt cards
    int currentPlayerIndex {};                   ///< \brief Seat in turn

    /// \brief Equality comparison
    bool operator==(const StanzaView&) const = default;
};

/** \brief The game as seen by one seat
 */
struct PlayerView {
    Uuid id {};                                  ///< \brief Game id
    std::string hostId;                          ///< \brief Host player
    GameSettings settings;                       ///< \brief Settings
    Phase phase {Phase::WAITING};                ///< \brief Phase
    std::vector<Player> players;                 ///< \brief Seated players
    std::optional<int> scorekeeperIndex;         ///< \brief Scorekeeper
    Scoring::Scores scores;                      ///< \brief Scores
    std::optional<StanzaView> stanza;            ///< \brief Stanza view
    std::vector<CompletedStanzaRecord> completedStanzas;  ///< \brief History
    int truncatedAverage {};                     ///< \brief Average score
    int myIndex {};                              ///< \brief The viewing seat

    /// \brief Equality comparison
    bool operator==(const PlayerView&) const = default;
};

/** \brief Moves available to the seat in turn
 */
struct ValidActions {
    std::vector<int> bids;  ///< \brief Allowed bids, empty unless bidding
    Hand cards;             ///< \brief Allowed cards, empty unless playing

    /// \brief Equality comparison
    bool operator==(const ValidActions&) const = default;
};

/** \brief Get the view of a game for a seat
 *
 * The view contains the hand of \p seat, but only the number of cards in
 * every other hand and in the undealt deck.
 *
 * \throw PlayerNotFound if \p seat is not a seat
 */
PlayerView getPlayerView(const GameState& state, int seat);

/** \brief Get the moves available to the seat in turn
 *
 * \return the allowed bids in the bidding phase, the allowed cards in the
 * playing phase, and nothing otherwise
 */
ValidActions getValidActions(const GameState& state);

/** \brief Determine if a seat is in turn to bid or play
 */
bool isPlayersTurn(const GameState& state, int seat);

}
}

#endif // ENGINE_PLAYERVIEW_HH_
