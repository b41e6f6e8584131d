/** \file
 *
 * \brief Definition of JSON serializer for played cards and tricks
 *
 * \page jsontrick Trick JSON representation
 *
 * A Whoopie::PlayedCard is represented by the following object:
 *
 * \code{.json}
 * {
 *     "card": <card>,
 *     "playerIndex": <seat>,
 *     "playerId": <id>,
 *     "trumpSuitAtPlay": <suit or null>,
 *     "jTrumpActiveAtPlay": <bool>,
 *     "wasWhoopie": <bool>,
 *     "wasScramble": <bool>
 * }
 * \endcode
 *
 * A Whoopie::CompletedTrick is represented by the following object:
 *
 * \code{.json}
 * {
 *     "cards": [ <played card>, ... ],
 *     "winnerIndex": <seat>,
 *     "winnerId": <id>,
 *     "leadSuit": <suit or null>
 * }
 * \endcode
 *
 * - &lt;card&gt; and &lt;suit&gt; are described in \ref jsoncard
 */

#ifndef MESSAGING_TRICKJSONSERIALIZER_HH_
#define MESSAGING_TRICKJSONSERIALIZER_HH_

#include "whoopie/Trick.hh"

#include <nlohmann/json.hpp>

namespace Whoopie {

/** \brief Convert PlayedCard to JSON
 */
void to_json(nlohmann::json& j, const PlayedCard& playedCard);

/** \brief Convert JSON to PlayedCard
 */
void from_json(const nlohmann::json& j, PlayedCard& playedCard);

/** \brief Convert CompletedTrick to JSON
 */
void to_json(nlohmann::json& j, const CompletedTrick& trick);

/** \brief Convert JSON to CompletedTrick
 */
void from_json(const nlohmann::json& j, CompletedTrick& trick);

}

#endif // MESSAGING_TRICKJSONSERIALIZER_HH_
