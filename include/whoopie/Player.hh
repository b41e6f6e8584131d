/** \file
 *
 * \brief Definition of Whoopie::Player and related concepts
 */

#ifndef PLAYER_HH_
#define PLAYER_HH_

#include <boost/bimap/bimap.hpp>

#include <iosfwd>
#include <string>
#include <variant>

namespace Whoopie {

/** \brief Playing strength of an AI player
 */
enum class AiDifficulty {
    BEGINNER,
    INTERMEDIATE,
    EXPERT,
};

/** \brief Type of \ref AI_DIFFICULTY_TO_STRING_MAP
 */
using AiDifficultyToStringMap = boost::bimaps::bimap<AiDifficulty, std::string>;

/** \brief Two-way map between AI difficulties and their string representation
 */
extern const AiDifficultyToStringMap AI_DIFFICULTY_TO_STRING_MAP;

/** \brief A human player
 */
struct HumanPlayer {
    std::string id;           ///< \brief Unique identifier of the player
    std::string name;         ///< \brief Display name
    bool isConnected {true};  ///< \brief Is the player currently connected

    /// \brief Equality comparison
    bool operator==(const HumanPlayer&) const = default;
};

/** \brief A computer controlled player
 *
 * The engine treats AI players like any other: the move selection happens
 * outside the engine.
 */
struct AiPlayer {
    std::string id;           ///< \brief Unique identifier of the player
    std::string name;         ///< \brief Display name
    AiDifficulty difficulty {AiDifficulty::BEGINNER};  ///< \brief Strength

    /// \brief Equality comparison
    bool operator==(const AiPlayer&) const = default;
};

/** \brief A player seated in a game
 */
using Player = std::variant<HumanPlayer, AiPlayer>;

/** \brief Get the identifier of a player
 */
const std::string& getPlayerId(const Player& player);

/** \brief Get the display name of a player
 */
const std::string& getPlayerName(const Player& player);

/** \brief Determine if a player is controlled by the computer
 */
bool isAi(const Player& player);

/** \brief Output an AiDifficulty to stream
 */
std::ostream& operator<<(std::ostream& os, AiDifficulty difficulty);

/** \brief Output a HumanPlayer to stream
 */
std::ostream& operator<<(std::ostream& os, const HumanPlayer& player);

/** \brief Output an AiPlayer to stream
 */
std::ostream& operator<<(std::ostream& os, const AiPlayer& player);

}

#endif // PLAYER_HH_
