#include "engine/WhoopieEngine.hh"

#include "scoring/Rankings.hh"
#include "scoring/StanzaScoring.hh"
#include "whoopie/AllowedBids.hh"
#include "whoopie/AllowedCards.hh"
#include "whoopie/UuidGenerator.hh"
#include "whoopie/WhoopieException.hh"
#include "IoUtility.hh"
#include "Logging.hh"
#include "Utility.hh"

#include <boost/uuid/uuid_io.hpp>

#include <algorithm>
#include <stdexcept>

namespace Whoopie {
namespace Engine {

using Whoopie::operator<<;

namespace {

void requirePhase(const GameState& state, const Phase phase)
{
    if (state.phase != phase) {
        log(LogLevel::DEBUG, "Rejected command in phase %s, expected %s",
            state.phase, phase);
        throw InvalidPhase {"Command not allowed in the current phase"};
    }
}

StanzaState& activeStanza(GameState& state)
{
    if (!state.stanza) {
        throw InvalidPhase {"No stanza in progress"};
    }
    return *state.stanza;
}

void requireTurn(const StanzaState& stanza, const int seat)
{
    if (seat != stanza.currentPlayerIndex) {
        log(LogLevel::DEBUG, "Rejected command from seat %d, %d in turn",
            seat, stanza.currentPlayerIndex);
        throw NotYourTurn {"Not in turn"};
    }
}

int getSeat(const GameState& state, const std::string& playerId)
{
    const auto seat = findPlayerIndex(state, playerId);
    if (!seat) {
        throw PlayerNotFound {"Player not in game: " + playerId};
    }
    return *seat;
}

// Seat index after removing the seat removedSeat. The seat following a
// removed seat takes its place.
int getSeatAfterRemoval(
    const int seat, const int removedSeat, const int numPlayersAfter)
{
    if (seat < removedSeat) {
        return seat;
    } else if (seat == removedSeat) {
        return seat % numPlayersAfter;
    }
    return seat - 1;
}

template<typename T>
std::vector<T> eraseSeat(const std::vector<T>& v, const int seat)
{
    auto ret = v;
    ret.erase(ret.begin() + seat);
    return ret;
}

void dealInto(
    GameState& state, const int dealerIndex, const int cardsPerPlayer,
    const Direction direction, const Deck& shuffledDeck, GameEvents& events)
{
    const auto n_players = isize(state.players);
    if (n_players < MIN_PLAYERS || n_players > MAX_PLAYERS) {
        throw InsufficientPlayers {"Invalid number of players for a stanza"};
    }
    if (!canStartStanza(n_players, cardsPerPlayer)) {
        throw DeckExhausted {"Not enough cards for the stanza"};
    }
    checkIndex(dealerIndex, n_players);

    const auto first_seat = getNextSeat(dealerIndex, n_players);
    auto deal = dealCards(shuffledDeck, n_players, cardsPerPlayer, first_seat);
    const auto& defining_card = deal.remainingDeck.front();
    const auto initial = makeInitialTrump(defining_card);

    auto stanza = StanzaState {};
    stanza.stanzaNumber = isize(state.completedStanzas) + 1;
    stanza.cardsPerPlayer = cardsPerPlayer;
    stanza.direction = direction;
    stanza.dealerIndex = dealerIndex;
    stanza.whoopieDefiningCard = defining_card;
    stanza.whoopieDefinition = initial.definition;
    stanza.initialTrumpSuit = initial.trump.trumpSuit;
    stanza.trump = initial.trump;
    stanza.bids = Bids(n_players);
    stanza.tricksTaken = std::vector<int>(n_players);
    stanza.hands = std::move(deal.hands);
    stanza.undealtCards.assign(
        deal.remainingDeck.begin() + 1, deal.remainingDeck.end());
    stanza.currentPlayerIndex = getFirstBidderIndex(dealerIndex, n_players);

    log(LogLevel::DEBUG,
        "Stanza %d dealt: %d cards, dealer %d, defining card %s",
        stanza.stanzaNumber, cardsPerPlayer, dealerIndex, defining_card);

    state.phase = Phase::BIDDING;
    state.stanza = stanza;
    events.emplace_back(StanzaStarted {std::move(stanza)});
}

void completeStanza(GameState& state, GameEvents& events)
{
    auto& stanza = activeStanza(state);
    auto bids = std::vector<int> {};
    for (const auto& bid : stanza.bids) {
        bids.push_back(dereference(bid));
    }
    const auto score_changes =
        Scoring::calculateStanzaScores(bids, stanza.tricksTaken);
    state.scores = Scoring::applyScoreChanges(state.scores, score_changes);
    state.truncatedAverage = Scoring::calculateTruncatedAverage(state.scores);

    auto player_ids = std::vector<std::string> {};
    for (const auto& player : state.players) {
        player_ids.push_back(getPlayerId(player));
    }
    state.completedStanzas.push_back({
        stanza.stanzaNumber, stanza.cardsPerPlayer, stanza.dealerIndex,
        stanza.whoopieDefiningCard, bids, stanza.tricksTaken, score_changes,
        std::move(player_ids)});
    state.phase = Phase::STANZA_END;

    log(LogLevel::DEBUG,
        "Stanza %d completed: bids %s, tricks %s, score changes %s",
        stanza.stanzaNumber, bids, stanza.tricksTaken, score_changes);
    events.emplace_back(StanzaCompleted {score_changes, state.scores});
}

void completeTrick(GameState& state, GameEvents& events)
{
    auto& stanza = activeStanza(state);
    auto trick = makeCompletedTrick(
        stanza.currentTrick, stanza.getWhoopieRank());
    const auto winner = trick.winnerIndex;
    ++stanza.tricksTaken.at(winner);
    stanza.completedTricks.push_back(trick);
    stanza.currentPlayerIndex = winner;
    events.emplace_back(TrickCompleted {std::move(trick)});

    if (stanza.currentTrickNumber >= stanza.cardsPerPlayer) {
        completeStanza(state, events);
    } else {
        ++stanza.currentTrickNumber;
        state.phase = Phase::TRICK_END;
    }
}

}

GameState createGame(const std::string& hostId, const GameSettings& settings)
{
    if (settings.maxPlayers < MIN_PLAYERS ||
        settings.maxPlayers > MAX_PLAYERS) {
        throw std::invalid_argument {"Invalid maximum number of players"};
    }
    if (settings.minPlayersToStart < MIN_PLAYERS ||
        settings.minPlayersToStart > settings.maxPlayers) {
        throw std::invalid_argument {
            "Invalid minimum number of players to start"};
    }
    auto state = GameState {};
    state.id = generateUuid();
    state.hostId = hostId;
    state.settings = settings;
    log(LogLevel::DEBUG, "Game %s created by %s", state.id, hostId);
    return state;
}

CommandResult addPlayer(const GameState& state, const Player& player)
{
    requirePhase(state, Phase::WAITING);
    if (isize(state.players) >= state.settings.maxPlayers) {
        throw SeatingFailure {"Game is full"};
    }
    const auto& player_id = getPlayerId(player);
    if (findPlayerIndex(state, player_id)) {
        throw SeatingFailure {"Player already in game: " + player_id};
    }

    auto ret = CommandResult {state, {}};
    ret.state.players.push_back(player);
    ret.state.scores.push_back(0);
    ret.events.emplace_back(PlayerJoined {player});
    return ret;
}

CommandResult removePlayer(const GameState& state, const std::string& playerId)
{
    const auto seat = getSeat(state, playerId);
    requirePhase(state, Phase::WAITING);

    auto ret = CommandResult {state, {}};
    ret.state.players = eraseSeat(state.players, seat);
    ret.state.scores = eraseSeat(state.scores, seat);
    ret.events.emplace_back(
        PlayerLeft {playerId, getPlayerName(state.players[seat]), {}});
    return ret;
}

CommandResult replacePlayer(
    const GameState& state, const std::string& playerId,
    const Player& replacement)
{
    const auto seat = getSeat(state, playerId);
    if (state.phase == Phase::WAITING || state.phase == Phase::GAME_END) {
        throw InvalidPhase {"Players can only be replaced in a game in progress"};
    }
    const auto replacement_seat =
        findPlayerIndex(state, getPlayerId(replacement));
    if (replacement_seat && *replacement_seat != seat) {
        throw SeatingFailure {"Replacement already in game"};
    }

    auto ret = CommandResult {state, {}};
    ret.state.players[seat] = replacement;
    ret.events.emplace_back(
        PlayerLeft {
            playerId, getPlayerName(state.players[seat]), replacement});
    log(LogLevel::DEBUG, "Seat %d taken over by %s", seat,
        getPlayerId(replacement));
    return ret;
}

CommandResult startGame(const GameState& state, Rng& rng)
{
    requirePhase(state, Phase::WAITING);
    const auto n_players = isize(state.players);
    if (n_players < std::max(MIN_PLAYERS, state.settings.minPlayersToStart)) {
        throw InsufficientPlayers {"Not enough players to start the game"};
    }

    // Cut in rounds of one card per seat until some seat cuts a suit card
    auto cut_deck = Deck {};
    auto cut_cards = std::vector<Card> {};
    auto dealer = std::optional<int> {};
    while (!dealer) {
        if (isize(cut_deck) < n_players) {
            cut_deck = shuffleDeck(createDeck(), rng);
        }
        cut_cards.assign(cut_deck.end() - n_players, cut_deck.end());
        cut_deck.erase(cut_deck.end() - n_players, cut_deck.end());
        dealer = findCutWinner(cut_cards);
    }
    log(LogLevel::DEBUG, "Cut for dealer: %s, dealer %d", cut_cards, *dealer);

    auto ret = CommandResult {state, {}};
    ret.state.scorekeeperIndex = getNextSeat(*dealer, n_players);
    ret.events.emplace_back(GameStarted {});
    ret.events.emplace_back(CutForDealer {cut_cards, *dealer});
    dealInto(
        ret.state, *dealer, 1, Direction::UP,
        shuffleDeck(createDeck(), rng), ret.events);
    return ret;
}

CommandResult startStanza(
    const GameState& state, const int dealerIndex, const int cardsPerPlayer,
    const Direction direction, Rng& rng)
{
    return dealStanza(
        state, dealerIndex, cardsPerPlayer, direction,
        shuffleDeck(createDeck(), rng));
}

CommandResult dealStanza(
    const GameState& state, const int dealerIndex, const int cardsPerPlayer,
    const Direction direction, const Deck& shuffledDeck)
{
    if (state.phase == Phase::GAME_END) {
        throw InvalidPhase {"Game has ended"};
    }
    auto ret = CommandResult {state, {}};
    dealInto(
        ret.state, dealerIndex, cardsPerPlayer, direction, shuffledDeck,
        ret.events);
    return ret;
}

CommandResult placeBid(const GameState& state, const int seat, const int bid)
{
    requirePhase(state, Phase::BIDDING);
    auto ret = CommandResult {state, {}};
    auto& stanza = activeStanza(ret.state);
    requireTurn(stanza, seat);
    if (!isValidBid(
            seat, stanza.dealerIndex, stanza.cardsPerPlayer, stanza.bids,
            bid)) {
        log(LogLevel::DEBUG, "Rejected bid %d from seat %d", bid, seat);
        throw InvalidBid {"Bid not allowed"};
    }

    stanza.bids[seat] = bid;
    ret.events.emplace_back(BidPlaced {seat, bid});

    const auto n_players = isize(ret.state.players);
    const auto all_placed = std::all_of(
        stanza.bids.begin(), stanza.bids.end(),
        [](const auto& b) { return b.has_value(); });
    if (all_placed) {
        ret.state.phase = Phase::PLAYING;
        stanza.currentPlayerIndex =
            getFirstLeaderIndex(stanza.dealerIndex, n_players);
    } else {
        stanza.currentPlayerIndex = getNextSeat(seat, n_players);
    }
    return ret;
}

CommandResult playCard(
    const GameState& state, const int seat, const Card& card,
    const bool calledWhoopie)
{
    requirePhase(state, Phase::PLAYING);
    auto ret = CommandResult {state, {}};
    auto& stanza = activeStanza(ret.state);
    requireTurn(stanza, seat);
    auto& hand = stanza.hands.at(seat);
    if (!isValidPlay(hand, stanza.currentTrick, card)) {
        log(LogLevel::DEBUG, "Rejected play %s from seat %d", card, seat);
        throw InvalidPlay {"Card not allowed"};
    }

    const auto is_lead = stanza.currentTrick.empty();
    const auto lead_suit = getLeadSuit(stanza.currentTrick);
    if (is_lead) {
        const auto lead = defineFromLead(
            stanza.whoopieDefinition, stanza.trump, card);
        stanza.whoopieDefinition = lead.definition;
        stanza.trump = lead.trump;
        if (lead.autoWin) {
            log(LogLevel::DEBUG,
                "Joker led before Whoopie rank defined, seat %d wins", seat);
        }
    }

    const auto whoopie_rank = stanza.getWhoopieRank();
    const auto change = getTrumpStateAfterPlay(
        card, stanza.trump, whoopie_rank, lead_suit, is_lead);
    const auto should_call = !isJoker(card) && isWhoopieCard(card, whoopie_rank);
    if (should_call && !calledWhoopie) {
        ret.events.emplace_back(WhoopieCallMissed {seat});
    }

    stanza.currentTrick.push_back({
        card, seat, getPlayerId(ret.state.players.at(seat)),
        stanza.trump.trumpSuit, stanza.trump.jTrumpActive, change.wasWhoopie,
        change.wasScramble});
    stanza.trump = change.getTrumpState();
    hand.erase(std::find(hand.begin(), hand.end(), card));
    ret.events.emplace_back(
        CardPlayed {
            seat, card, change.wasWhoopie, change.wasScramble,
            change.newTrumpSuit});

    const auto n_players = isize(ret.state.players);
    if (isize(stanza.currentTrick) == n_players) {
        completeTrick(ret.state, ret.events);
    } else {
        stanza.currentPlayerIndex = getNextSeat(seat, n_players);
    }
    return ret;
}

CommandResult continueGame(const GameState& state)
{
    requirePhase(state, Phase::TRICK_END);
    auto ret = CommandResult {state, {}};
    auto& stanza = activeStanza(ret.state);
    stanza.currentTrick.clear();
    ret.state.phase = Phase::PLAYING;
    return ret;
}

CommandResult continueToNextStanza(const GameState& state, Rng& rng)
{
    requirePhase(state, Phase::STANZA_END);
    const auto& stanza = dereference(state.stanza);
    const auto n_players = isize(state.players);
    const auto next = getNextStanzaSize(
        stanza.cardsPerPlayer, stanza.direction,
        getMaxCardsPerPlayer(n_players));
    return startStanza(
        state, getNextSeat(stanza.dealerIndex, n_players),
        next.cardsPerPlayer, next.direction, rng);
}

CommandResult removePlayerAndRedeal(
    const GameState& state, const int seat, Rng& rng)
{
    const auto n_players = isize(state.players);
    if (seat < 0 || seat >= n_players) {
        throw PlayerNotFound {"No such seat"};
    }
    const auto& player = state.players[seat];
    auto left = PlayerLeft {getPlayerId(player), getPlayerName(player), {}};

    if (state.phase == Phase::WAITING) {
        auto ret = removePlayer(state, left.playerId);
        ret.events = {std::move(left)};
        return ret;
    }
    if (state.phase == Phase::GAME_END || !state.stanza) {
        throw InvalidPhase {"No stanza in progress"};
    }
    if (n_players <= MIN_PLAYERS) {
        throw InsufficientPlayers {"Too few players would remain"};
    }

    const auto n_after = n_players - 1;
    const auto& stanza = *state.stanza;
    auto dealer = getSeatAfterRemoval(stanza.dealerIndex, seat, n_after);
    auto size = StanzaSize {stanza.cardsPerPlayer, stanza.direction};
    if (state.phase == Phase::STANZA_END) {
        dealer = getSeatAfterRemoval(
            getNextSeat(stanza.dealerIndex, n_players), seat, n_after);
        size = getNextStanzaSize(
            stanza.cardsPerPlayer, stanza.direction,
            getMaxCardsPerPlayer(n_after));
    }

    auto ret = CommandResult {state, {}};
    ret.state.players = eraseSeat(state.players, seat);
    ret.state.scores = eraseSeat(state.scores, seat);
    if (const auto scorekeeper = state.scorekeeperIndex) {
        ret.state.scorekeeperIndex = (*scorekeeper == seat) ?
            getNextSeat(dealer, n_after) :
            getSeatAfterRemoval(*scorekeeper, seat, n_after);
    }
    ret.state.stanza.reset();
    ret.events.emplace_back(std::move(left));
    ret.events.emplace_back(StanzaRedealt {REDEAL_REASON_PLAYER_REMOVED});

    log(LogLevel::DEBUG, "Seat %d removed, redealing %s with dealer %d",
        seat, size, dealer);
    dealInto(
        ret.state, dealer, size.cardsPerPlayer, size.direction,
        shuffleDeck(createDeck(), rng), ret.events);
    return ret;
}

CommandResult endGame(const GameState& state)
{
    requirePhase(state, Phase::STANZA_END);
    auto ret = CommandResult {state, {}};
    ret.state.phase = Phase::GAME_END;
    auto rankings = Scoring::calculateRankings(state.scores);
    log(LogLevel::DEBUG, "Game ended: scores %s, rankings %s", state.scores,
        rankings);
    ret.events.emplace_back(GameEnded {state.scores, std::move(rankings)});
    return ret;
}

}
}
