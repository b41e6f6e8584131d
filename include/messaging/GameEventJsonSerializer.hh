/** \file
 *
 * \brief Definition of JSON serializer for Whoopie::Engine::GameEvent
 *
 * \page jsonevent Game event JSON representation
 *
 * A Whoopie::Engine::GameEvent is represented by an object with a "type" key
 * naming the event, and the fields of the event:
 *
 * | type              | fields                                            |
 * |-------------------|---------------------------------------------------|
 * | playerJoined      | player                                            |
 * | playerLeft        | playerId, playerName, replacement (optional)      |
 * | gameStarted       |                                                   |
 * | cutForDealer      | cutCards, dealerIndex                             |
 * | stanzaStarted     | stanza                                            |
 * | bidPlaced         | playerIndex, bid                                  |
 * | cardPlayed        | playerIndex, card, wasWhoopie, wasScramble,       |
 * |                   | newTrumpSuit                                      |
 * | trickCompleted    | trick                                             |
 * | stanzaCompleted   | scoreChanges, newScores                           |
 * | gameEnded         | finalScores, rankings                             |
 * | whoopieCallMissed | playerIndex                                       |
 * | stanzaRedealt     | reason                                            |
 *
 * Players, cards, tricks and stanzas are represented as described in \ref
 * jsonplayer, \ref jsoncard, \ref jsontrick and \ref jsongamestate.
 */

#ifndef MESSAGING_GAMEEVENTJSONSERIALIZER_HH_
#define MESSAGING_GAMEEVENTJSONSERIALIZER_HH_

#include "engine/GameEvents.hh"

#include <nlohmann/json.hpp>

#include <string>

namespace Whoopie {
namespace Engine {

/** \brief Key for event type
 *
 * \sa \ref jsonevent
 */
extern const std::string EVENT_TYPE_KEY;

/** \brief Convert GameEvent to JSON
 */
void to_json(nlohmann::json& j, const GameEvent& event);

/** \brief Convert JSON to GameEvent
 *
 * \throw SerializationFailureException if the type of the event is unknown
 */
void from_json(const nlohmann::json& j, GameEvent& event);

}
}

#endif // MESSAGING_GAMEEVENTJSONSERIALIZER_HH_
