#include "main/SelfPlay.hh"

#include "engine/PlayerView.hh"
#include "main/Config.hh"
#include "messaging/GameEventJsonSerializer.hh"
#include "whoopie/Deck.hh"
#include "whoopie/StanzaProgression.hh"
#include "whoopie/TrumpState.hh"
#include "whoopie/WhoopieException.hh"
#include "Logging.hh"
#include "Utility.hh"

#include <nlohmann/json.hpp>

#include <ostream>
#include <utility>

namespace Whoopie {
namespace Main {

using Engine::GameState;
using Engine::Phase;

bool requiresWhoopieCall(const Engine::StanzaState& stanza, const Card& card)
{
    if (isJoker(card)) {
        return false;
    }
    auto whoopie_rank = stanza.getWhoopieRank();
    if (stanza.currentTrick.empty()) {
        const auto lead = defineFromLead(
            stanza.whoopieDefinition, stanza.trump, card);
        whoopie_rank = getWhoopieRank(lead.definition);
    }
    return isWhoopieCard(card, whoopie_rank);
}

SelfPlay::SelfPlay(const Config& config, std::ostream& out) :
    config {config},
    out {out},
    rng {makeRng(config.getSeed())}
{
}

GameState SelfPlay::run()
{
    const auto& players = config.getPlayers();
    if (players.empty()) {
        throw InsufficientPlayers {"No players configured"};
    }
    auto state = Engine::createGame(
        getPlayerId(players.front()), config.getGameSettings());
    for (const auto& player : players) {
        state = apply(Engine::addPlayer(state, player));
    }
    state = apply(Engine::startGame(state, rng));
    while (state.phase != Phase::GAME_END) {
        state = step(state);
    }
    log(LogLevel::INFO, "Game over after %d stanzas", stanzasPlayed);
    return state;
}

GameState SelfPlay::apply(Engine::CommandResult result)
{
    for (const auto& event : result.events) {
        log(LogLevel::DEBUG, "Event: %s", event);
        out << nlohmann::json(event).dump() << std::endl;
    }
    return std::move(result.state);
}

GameState SelfPlay::step(const GameState& state)
{
    switch (state.phase) {
    case Phase::BIDDING:
    {
        const auto& stanza = dereference(state.stanza);
        const auto actions = Engine::getValidActions(state);
        return apply(
            Engine::placeBid(
                state, stanza.currentPlayerIndex, actions.bids.at(0)));
    }
    case Phase::PLAYING:
    {
        const auto& stanza = dereference(state.stanza);
        const auto actions = Engine::getValidActions(state);
        const auto& card = actions.cards.at(0);
        return apply(
            Engine::playCard(
                state, stanza.currentPlayerIndex, card,
                requiresWhoopieCall(stanza, card)));
    }
    case Phase::TRICK_END:
        return apply(Engine::continueGame(state));
    case Phase::STANZA_END:
    {
        ++stanzasPlayed;
        const auto stanzas = config.getStanzas().value_or(
            getTotalStanzasInCycle(isize(state.players)));
        if (stanzasPlayed >= stanzas) {
            return apply(Engine::endGame(state));
        }
        return apply(Engine::continueToNextStanza(state, rng));
    }
    default:
        log(LogLevel::ERROR, "Self play cannot proceed in phase %s", state.phase);
        throw InvalidPhase {"Unexpected phase in self play"};
    }
}

}
}
