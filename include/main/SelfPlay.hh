/** \file
 *
 * \brief Definition of Whoopie::Main::SelfPlay class
 */

#ifndef MAIN_SELFPLAY_HH_
#define MAIN_SELFPLAY_HH_

#include "engine/GameState.hh"
#include "engine/WhoopieEngine.hh"
#include "whoopie/Card.hh"
#include "whoopie/Random.hh"

#include <iosfwd>
#include <optional>

namespace Whoopie {

namespace Main {

class Config;

/** \brief Decide whether playing a card requires calling “Whoopie”
 *
 * The Whoopie rank used is the one in effect after \p card is played, so a
 * suit card led while the definition is pending is its own Whoopie card.
 *
 * \param stanza the stanza state before the play
 * \param card the card to be played
 *
 * \return true if \p card is a Whoopie suit card, false otherwise
 */
bool requiresWhoopieCall(const Engine::StanzaState& stanza, const Card& card);

/** \brief Host that plays a whole game with simple automatic players
 *
 * The host seats the configured players, starts the game and drives it to
 * the end. Every player bids the first valid bid and plays the first valid
 * card, always calling “Whoopie” when required. Each event emitted by the
 * engine is written to the output stream as one line of JSON.
 */
class SelfPlay {
public:

    /** \brief Create self play host
     *
     * \param config the configuration
     * \param out the stream the events are written to
     */
    SelfPlay(const Config& config, std::ostream& out);

    /** \brief Play the game until it ends
     *
     * \return the final state of the game
     *
     * \throw WhoopieException if the engine rejects a command
     */
    Engine::GameState run();

private:

    Engine::GameState apply(Engine::CommandResult result);
    Engine::GameState step(const Engine::GameState& state);

    const Config& config;
    std::ostream& out;
    Rng rng;
    int stanzasPlayed {};
};

}
}

#endif // MAIN_SELFPLAY_HH_
