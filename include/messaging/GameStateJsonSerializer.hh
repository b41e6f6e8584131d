/** \file
 *
 * \brief Definition of JSON serializer for Whoopie::Engine::GameState
 *
 * \page jsongamestate Game state JSON representation
 *
 * A Whoopie::Engine::GameState is represented by an object with the
 * following keys. It is the complete snapshot of a game, including every
 * hand, and is meant for the persistence layer, not for the players (see \ref
 * jsonplayerview).
 *
 * \code{.json}
 * {
 *     "id": <uuid>,
 *     "hostId": <string>,
 *     "settings": {
 *         "maxPlayers": <int>, "minPlayersToStart": <int>,
 *         "isPublic": <bool>, "allowSpectators": <bool>
 *     },
 *     "phase": <phase>,
 *     "players": [ <player>, ... ],
 *     "scorekeeperIndex": <seat or null>,
 *     "scores": [ <int>, ... ],
 *     "stanza": <stanza or null>,
 *     "completedStanzas": [ <completed stanza>, ... ],
 *     "truncatedAverage": <int>
 * }
 * \endcode
 *
 * - &lt;phase&gt; is one of "waiting", "resuming", "bidding", "playing",
 *   "trickEnd", "stanzaEnd" or "gameEnd"
 * - &lt;player&gt; is described in \ref jsonplayer
 *
 * A stanza is represented by the following object:
 *
 * \code{.json}
 * {
 *     "stanzaNumber": <int>,
 *     "cardsPerPlayer": <int>,
 *     "direction": "up" or "down",
 *     "dealerIndex": <seat>,
 *     "whoopieDefiningCard": <card>,
 *     "whoopieRank": <rank or null>,
 *     "initialTrumpSuit": <suit or null>,
 *     "currentTrumpSuit": <suit or null>,
 *     "jTrumpActive": <bool>,
 *     "bids": [ <int or null>, ... ],
 *     "currentTrickNumber": <int>,
 *     "currentTrick": [ <played card>, ... ],
 *     "completedTricks": [ <completed trick>, ... ],
 *     "tricksTaken": [ <int>, ... ],
 *     "hands": [ [ <card>, ... ], ... ],
 *     "undealtCards": [ <card>, ... ],
 *     "currentPlayerIndex": <seat>
 * }
 * \endcode
 *
 * A null "whoopieRank" means that the rank is still to be defined by a lead.
 * Cards and tricks are described in \ref jsoncard and \ref jsontrick.
 *
 * A completed stanza record is represented by the following object:
 *
 * \code{.json}
 * {
 *     "stanzaNumber": <int>, "cardsPerPlayer": <int>, "dealerIndex": <seat>,
 *     "whoopieDefiningCard": <card>, "bids": [ <int>, ... ],
 *     "tricksTaken": [ <int>, ... ], "scoreChanges": [ <int>, ... ],
 *     "playerIds": [ <string>, ... ]
 * }
 * \endcode
 */

#ifndef MESSAGING_GAMESTATEJSONSERIALIZER_HH_
#define MESSAGING_GAMESTATEJSONSERIALIZER_HH_

#include "engine/GameState.hh"

#include <nlohmann/json.hpp>

namespace Whoopie {

/** \brief Convert Direction to JSON
 */
void to_json(nlohmann::json& j, Direction direction);

/** \brief Convert JSON to Direction
 */
void from_json(const nlohmann::json& j, Direction& direction);

namespace Engine {

/** \brief Convert Phase to JSON
 */
void to_json(nlohmann::json& j, Phase phase);

/** \brief Convert JSON to Phase
 */
void from_json(const nlohmann::json& j, Phase& phase);

/** \brief Convert GameSettings to JSON
 */
void to_json(nlohmann::json& j, const GameSettings& settings);

/** \brief Convert JSON to GameSettings
 *
 * Missing keys take their default values.
 */
void from_json(const nlohmann::json& j, GameSettings& settings);

/** \brief Convert StanzaState to JSON
 */
void to_json(nlohmann::json& j, const StanzaState& stanza);

/** \brief Convert JSON to StanzaState
 */
void from_json(const nlohmann::json& j, StanzaState& stanza);

/** \brief Convert CompletedStanzaRecord to JSON
 */
void to_json(nlohmann::json& j, const CompletedStanzaRecord& record);

/** \brief Convert JSON to CompletedStanzaRecord
 */
void from_json(const nlohmann::json& j, CompletedStanzaRecord& record);

/** \brief Convert GameState to JSON
 */
void to_json(nlohmann::json& j, const GameState& state);

/** \brief Convert JSON to GameState
 *
 * \throw SerializationFailureException if the number of scores does not
 * match the number of players
 */
void from_json(const nlohmann::json& j, GameState& state);

}
}

#endif // MESSAGING_GAMESTATEJSONSERIALIZER_HH_
