/** \file
 *
 * \brief Definition of JSON serializer for Whoopie::Engine::PlayerView
 *
 * \page jsonplayerview Player view JSON representation
 *
 * A Whoopie::Engine::PlayerView is represented like a game state (see \ref
 * jsongamestate) with an additional "myIndex" key holding the seat of the
 * viewing player. In the stanza object the "hands" and "undealtCards" keys are
 * replaced by the following:
 *
 * \code{.json}
 * {
 *     "myHand": [ <card>, ... ],
 *     "handCounts": [ <int>, ... ],
 *     "undealtCardCount": <int>
 * }
 * \endcode
 */

#ifndef MESSAGING_PLAYERVIEWJSONSERIALIZER_HH_
#define MESSAGING_PLAYERVIEWJSONSERIALIZER_HH_

#include "engine/PlayerView.hh"

#include <nlohmann/json.hpp>

namespace Whoopie {
namespace Engine {

/** \brief Convert StanzaView to JSON
 */
void to_json(nlohmann::json& j, const StanzaView& stanza);

/** \brief Convert JSON to StanzaView
 */
void from_json(const nlohmann::json& j, StanzaView& stanza);

/** \brief Convert PlayerView to JSON
 */
void to_json(nlohmann::json& j, const PlayerView& view);

/** \brief Convert JSON to PlayerView
 */
void from_json(const nlohmann::json& j, PlayerView& view);

}
}

#endif // MESSAGING_PLAYERVIEWJSONSERIALIZER_HH_
