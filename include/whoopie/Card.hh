/** \file
 *
 * \brief Definition of Whoopie::Card and related concepts
 */

#ifndef CARD_HH_
#define CARD_HH_

#include <boost/bimap/bimap.hpp>

#include <array>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace Whoopie {

/** \brief Suit of a playing card
 *
 * The enumerators are listed in the display order used when sorting hands.
 */
enum class Suit {
    SPADES,
    HEARTS,
    DIAMONDS,
    CLUBS,
};

/** \brief Rank of a playing card
 *
 * The underlying value of each enumerator is its rank value, from two (2) up
 * to ace (14).
 */
enum class Rank {
    TWO = 2,
    THREE,
    FOUR,
    FIVE,
    SIX,
    SEVEN,
    EIGHT,
    NINE,
    TEN,
    JACK,
    QUEEN,
    KING,
    ACE,
};

/** \brief All suits in display order
 */
inline constexpr std::array SUITS {
    Suit::SPADES, Suit::HEARTS, Suit::DIAMONDS, Suit::CLUBS,
};

/** \brief All ranks from the highest to the lowest
 */
inline constexpr std::array RANKS {
    Rank::ACE, Rank::KING, Rank::QUEEN, Rank::JACK, Rank::TEN, Rank::NINE,
    Rank::EIGHT, Rank::SEVEN, Rank::SIX, Rank::FIVE, Rank::FOUR, Rank::THREE,
    Rank::TWO,
};

/** \brief Type of \ref SUIT_TO_STRING_MAP
 */
using SuitToStringMap = boost::bimaps::bimap<Suit, std::string>;

/** \brief Two-way map between suits and their string representation
 *
 * The strings are "spades", "hearts", "diamonds" and "clubs".
 */
extern const SuitToStringMap SUIT_TO_STRING_MAP;

/** \brief Type of \ref RANK_TO_STRING_MAP
 */
using RankToStringMap = boost::bimaps::bimap<Rank, std::string>;

/** \brief Two-way map between ranks and their string representation
 *
 * The strings are "A", "K", "Q", "J", "10", "9", ..., "2".
 */
extern const RankToStringMap RANK_TO_STRING_MAP;

/** \brief Numeric value of a rank
 *
 * \return value between 2 (two) and 14 (ace)
 */
constexpr int rankValue(Rank rank)
{
    return static_cast<int>(rank);
}

/** \brief A card belonging to one of the four suits
 */
struct SuitCard {
    Suit suit;  ///< \brief Suit of the card
    Rank rank;  ///< \brief Rank of the card

    /// \brief Three‐way comparison
    constexpr auto operator<=>(const SuitCard&) const = default;
};

/** \brief One of the two jokers
 *
 * Jokers have no intrinsic rank. When comparing cards in a trick a joker has
 * the rank of the Whoopie cards.
 */
struct Joker {
    int jokerNumber;  ///< \brief Either 1 or 2

    /// \brief Three‐way comparison
    constexpr auto operator<=>(const Joker&) const = default;
};

/** \brief A playing card
 *
 * Cards are equality comparable. Two suit cards are equal when both suit and
 * rank are equal, two jokers when their numbers are equal.
 */
using Card = std::variant<SuitCard, Joker>;

/** \brief Determine if a card is a joker
 */
bool isJoker(const Card& card);

/** \brief Get the suit of a card
 *
 * \return the suit of \p card, or none if it is a joker
 */
std::optional<Suit> getSuit(const Card& card);

/** \brief Get the rank of a card
 *
 * \return the rank of \p card, or none if it is a joker
 */
std::optional<Rank> getRank(const Card& card);

/** \brief Determine if two cards are the same card
 */
bool cardsEqual(const Card& lhs, const Card& rhs);

/** \brief Make display string of a card
 *
 * Suit cards are displayed as their rank followed by the suit symbol (for
 * example "A♠" or "10♥"), jokers as "Joker1" and "Joker2".
 *
 * \param card the card
 *
 * \return the display string
 */
std::string cardToString(const Card& card);

/** \brief Parse display string made by cardToString()
 *
 * \param str the display string
 *
 * \return the card, or none if \p str is not a valid card
 */
std::optional<Card> parseCardString(std::string_view str);

/** \brief Output a Suit to stream
 */
std::ostream& operator<<(std::ostream& os, Suit suit);

/** \brief Output a Rank to stream
 */
std::ostream& operator<<(std::ostream& os, Rank rank);

/** \brief Output a SuitCard to stream
 */
std::ostream& operator<<(std::ostream& os, const SuitCard& card);

/** \brief Output a Joker to stream
 */
std::ostream& operator<<(std::ostream& os, const Joker& joker);

}

#endif // CARD_HH_
