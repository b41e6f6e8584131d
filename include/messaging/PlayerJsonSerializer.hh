/** \file
 *
 * \brief Definition of JSON serializer for Whoopie::Player
 *
 * \page jsonplayer Player JSON representation
 *
 * A human player is represented by the following object:
 *
 * \code{.json}
 * { "type": "human", "id": <id>, "name": <name>, "isConnected": <bool> }
 * \endcode
 *
 * An AI player is represented by the following object:
 *
 * \code{.json}
 * { "type": "ai", "id": <id>, "name": <name>, "difficulty": <difficulty> }
 * \endcode
 *
 * - &lt;difficulty&gt; is one of "beginner", "intermediate" or "expert"
 */

#ifndef MESSAGING_PLAYERJSONSERIALIZER_HH_
#define MESSAGING_PLAYERJSONSERIALIZER_HH_

#include "whoopie/Player.hh"

#include <nlohmann/json.hpp>

#include <string>

namespace Whoopie {

/** \brief Key for player type
 *
 * \sa \ref jsonplayer
 */
extern const std::string PLAYER_TYPE_KEY;

/** \brief Tag for human players
 *
 * \sa \ref jsonplayer
 */
extern const std::string PLAYER_HUMAN_TAG;

/** \brief Tag for AI players
 *
 * \sa \ref jsonplayer
 */
extern const std::string PLAYER_AI_TAG;

/** \brief Key for player id
 *
 * \sa \ref jsonplayer
 */
extern const std::string PLAYER_ID_KEY;

/** \brief Key for player name
 *
 * \sa \ref jsonplayer
 */
extern const std::string PLAYER_NAME_KEY;

/** \brief Key for the connection status of a human player
 *
 * \sa \ref jsonplayer
 */
extern const std::string PLAYER_IS_CONNECTED_KEY;

/** \brief Key for the difficulty of an AI player
 *
 * \sa \ref jsonplayer
 */
extern const std::string PLAYER_DIFFICULTY_KEY;

/** \brief Convert AiDifficulty to JSON
 */
void to_json(nlohmann::json& j, AiDifficulty difficulty);

/** \brief Convert JSON to AiDifficulty
 */
void from_json(const nlohmann::json& j, AiDifficulty& difficulty);

/** \brief Convert Player to JSON
 */
void to_json(nlohmann::json& j, const Player& player);

/** \brief Convert JSON to Player
 */
void from_json(const nlohmann::json& j, Player& player);

}

#endif // MESSAGING_PLAYERJSONSERIALIZER_HH_
