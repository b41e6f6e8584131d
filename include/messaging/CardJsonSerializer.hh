/** \file
 *
 * \brief Definition of JSON serializer for Whoopie::Card
 *
 * \page jsoncard Card JSON representation
 *
 * A Whoopie::Suit is represented by one of the strings "spades", "hearts",
 * "diamonds" or "clubs". A Whoopie::Rank is represented by one of the strings
 * "A", "K", "Q", "J", "10", "9", …, "2".
 *
 * A suit card is represented by an object with its type, suit and rank:
 *
 * \code{.json}
 * { "type": "suit", "suit": <suit>, "rank": <rank> }
 * \endcode
 *
 * A joker is represented by an object with its type and number (1 or 2):
 *
 * \code{.json}
 * { "type": "joker", "jokerNumber": <number> }
 * \endcode
 */

#ifndef MESSAGING_CARDJSONSERIALIZER_HH_
#define MESSAGING_CARDJSONSERIALIZER_HH_

#include "whoopie/Card.hh"

#include <nlohmann/json.hpp>

#include <string>

namespace Whoopie {

/** \brief Key for card type
 *
 * \sa \ref jsoncard
 */
extern const std::string CARD_TYPE_KEY;

/** \brief Tag for suit cards
 *
 * \sa \ref jsoncard
 */
extern const std::string CARD_SUIT_TAG;

/** \brief Tag for jokers
 *
 * \sa \ref jsoncard
 */
extern const std::string CARD_JOKER_TAG;

/** \brief Key for the suit of a suit card
 *
 * \sa \ref jsoncard
 */
extern const std::string CARD_SUIT_KEY;

/** \brief Key for the rank of a suit card
 *
 * \sa \ref jsoncard
 */
extern const std::string CARD_RANK_KEY;

/** \brief Key for the number of a joker
 *
 * \sa \ref jsoncard
 */
extern const std::string CARD_JOKER_NUMBER_KEY;

/** \brief Convert Suit to JSON
 */
void to_json(nlohmann::json& j, Suit suit);

/** \brief Convert JSON to Suit
 */
void from_json(const nlohmann::json& j, Suit& suit);

/** \brief Convert Rank to JSON
 */
void to_json(nlohmann::json& j, Rank rank);

/** \brief Convert JSON to Rank
 */
void from_json(const nlohmann::json& j, Rank& rank);

/** \brief Convert Card to JSON
 */
void to_json(nlohmann::json& j, const Card& card);

/** \brief Convert JSON to Card
 */
void from_json(const nlohmann::json& j, Card& card);

}

#endif // MESSAGING_CARDJSONSERIALIZER_HH_
