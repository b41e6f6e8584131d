/** \file
 *
 * \brief Definition of tricks and trick winner resolution
 */

#ifndef TRICK_HH_
#define TRICK_HH_

#include "whoopie/Card.hh"

#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace Whoopie {

/** \brief Rank value of a joker led before the Whoopie rank is defined
 *
 * It is higher than the value of an ace, so that the joker wins the trick
 * automatically.
 */
constexpr auto PENDING_JOKER_RANK_VALUE = 16;

/** \brief A card played to a trick
 *
 * The trump state at the moment the card was played is frozen in \ref
 * trumpSuitAtPlay and \ref jTrumpActiveAtPlay. They never change afterwards,
 * even if a later card of the same trick changes the trump.
 */
struct PlayedCard {
    Card card;                         ///< \brief The card
    int playerIndex {};                ///< \brief Seat that played the card
    std::string playerId;              ///< \brief Player that played the card
    std::optional<Suit> trumpSuitAtPlay;  ///< \brief Trump suit at play
    bool jTrumpActiveAtPlay {false};   ///< \brief J-Trump at play
    bool wasWhoopie {false};           ///< \brief Did the card set trump
    bool wasScramble {false};          ///< \brief Was the card a joker

    /// \brief Equality comparison
    bool operator==(const PlayedCard&) const = default;
};

/** \brief Cards played to a trick, in playing order
 */
using TrickCards = std::vector<PlayedCard>;

/** \brief A completed trick
 */
struct CompletedTrick {
    TrickCards cards;               ///< \brief The cards in playing order
    int winnerIndex {};             ///< \brief Seat that won the trick
    std::string winnerId;           ///< \brief Player that won the trick
    std::optional<Suit> leadSuit;   ///< \brief Suit led, none if joker led

    /// \brief Equality comparison
    bool operator==(const CompletedTrick&) const = default;
};

/** \brief Get the suit led to a trick
 *
 * \return the suit of the first card, or none if the trick is empty or a
 * joker was led
 */
std::optional<Suit> getLeadSuit(const TrickCards& trick);

/** \brief Determine if a card was trump at the moment it was played
 *
 * Jokers and Whoopie cards are always trump. Other cards are judged against
 * the frozen trump snapshot of the card: without J-Trump a card is trump if
 * its suit was the trump suit. With J-Trump every card is trump if a joker was
 * led (\p leadSuit is none), otherwise the cards of the led suit are.
 *
 * \param playedCard the card
 * \param whoopieRank the Whoopie rank, if defined
 * \param leadSuit the suit led to the trick
 */
bool wasTrumpWhenPlayed(
    const PlayedCard& playedCard, std::optional<Rank> whoopieRank,
    std::optional<Suit> leadSuit);

/** \brief Get the rank value of a card for trick resolution
 *
 * Jokers have the value of the Whoopie rank, or \ref
 * PENDING_JOKER_RANK_VALUE if the rank is not defined.
 */
int getEffectiveRankValue(const Card& card, std::optional<Rank> whoopieRank);

/** \brief Determine if a card beats the current winner of a trick
 *
 * Trump beats non-trump. Between two trumps, the higher rank wins. Between two
 * non-trumps, only a card following the led suit can win, and the higher rank
 * wins. On equal rank the incumbent, which was played earlier, keeps winning.
 *
 * \param challenger the card played later
 * \param incumbent the card currently winning the trick
 * \param whoopieRank the Whoopie rank, if defined
 * \param leadSuit the suit led to the trick
 *
 * \return true if \p challenger takes over the trick
 */
bool cardBeatsCard(
    const PlayedCard& challenger, const PlayedCard& incumbent,
    std::optional<Rank> whoopieRank, std::optional<Suit> leadSuit);

/** \brief Resolve the winner of a trick
 *
 * \param trick the cards played to the trick
 * \param whoopieRank the Whoopie rank, if defined
 *
 * \return index of the winning card in \p trick
 *
 * \throw std::invalid_argument if \p trick is empty
 */
int resolveTrickWinner(
    const TrickCards& trick, std::optional<Rank> whoopieRank);

/** \brief Create a completed trick record
 *
 * \param trick the cards played to the trick
 * \param whoopieRank the Whoopie rank, if defined
 *
 * \return the completed trick including its winner
 *
 * \throw std::invalid_argument if \p trick is empty
 */
CompletedTrick makeCompletedTrick(
    const TrickCards& trick, std::optional<Rank> whoopieRank);

/** \brief Output a PlayedCard to stream
 */
std::ostream& operator<<(std::ostream& os, const PlayedCard& playedCard);

/** \brief Output a CompletedTrick to stream
 */
std::ostream& operator<<(std::ostream& os, const CompletedTrick& trick);

}

#endif // TRICK_HH_
