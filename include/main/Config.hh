/** \file
 *
 * \brief Definition of Whoopie::Main::Config class
 */

#ifndef MAIN_CONFIG_HH_
#define MAIN_CONFIG_HH_

#include "engine/GameState.hh"
#include "whoopie/Player.hh"
#include "whoopie/Random.hh"

#include <iosfwd>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace Whoopie {

/** \brief The command line host
 */
namespace Main {

/** \brief Configuration file processing utility
 *
 * The configuration is a Lua script. After running the script, the following
 * global variables are read:
 *
 * - \c max_players, \c min_players_to_start (integers), \c is_public and \c
 *   allow_spectators (booleans): the game settings
 * - \c seed (integer): the seed of the random number generator. If missing,
 *   the generator is seeded from the OS random number source.
 * - \c stanzas (integer): the number of stanzas to play before the game is
 *   ended. If missing, one full up and down cycle is played.
 * - \c players (array of tables): the players seated in the game. Each table
 *   has the keys \c name, \c type (“human” or “ai”), optionally \c id, and for
 *   AI players optionally \c difficulty (“beginner”, “intermediate” or
 *   “expert”). If missing, four human players are seated.
 *
 * Missing variables take their default values. A variable of the wrong type
 * is an error.
 */
class Config {
public:

    /** \brief Create default configs
     */
    Config();

    /** \brief Create configuration from stream
     *
     * The constructor reads configuration script from stream \p in and
     * processes it. The processing involves reading the stream until EOF,
     * parsing the contents as Lua script and running the script.
     *
     * \throw std::runtime_error if reading the stream or processing the
     * script fails, or a variable has the wrong type
     */
    Config(std::istream& in);

    /** \brief Move constructor
     */
    Config(Config&&);

    ~Config();

    /** \brief Move assignment
     */
    Config& operator=(Config&&);

    /** \brief Get the game settings
     */
    const Engine::GameSettings& getGameSettings() const;

    /** \brief Get the players to seat
     */
    const std::vector<Player>& getPlayers() const;

    /** \brief Get the seed of the random number generator
     *
     * \return the seed, or none if the generator should be seeded from the OS
     * random number source
     */
    std::optional<Rng::result_type> getSeed() const;

    /** \brief Get the number of stanzas to play
     *
     * \return the number of stanzas, or none if one full cycle is to be played
     */
    std::optional<int> getStanzas() const;

private:

    struct Impl;
    std::unique_ptr<const Impl> impl;
};

/** \brief Create configuration from file
 *
 * Depending on the value the \p path, the function generates the config object
 * in different ways:
 * - If \p path is empty, default configuration is returned
 * - If \p path is hyphen (“-”), configuration is read from stdin
 * - Otherwise \p path is interpreted as path to the configuration file
 *
 * \param path the path of the configuration file
 *
 * \return config object based on the file
 */
Config configFromPath(std::string_view path);

}
}

#endif // MAIN_CONFIG_HH_
