#include "whoopie/Deck.hh"

#include "whoopie/WhoopieConstants.hh"
#include "whoopie/WhoopieException.hh"
#include "Utility.hh"

#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <string>
#include <tuple>

namespace Whoopie {

namespace {

constexpr auto JOKER_CUT_VALUE = 15;

int suitOrder(const Suit suit)
{
    return static_cast<int>(
        std::find(SUITS.begin(), SUITS.end(), suit) - SUITS.begin());
}

// Sort key of a card for display: smaller goes first. Bucket 0 is the trump
// suit (if any), bucket 1 jokers and buckets 2.. the suits in display order.
std::tuple<int, int, int> sortKey(
    const Card& card, const std::optional<Suit> trumpSuit, const int jokerBucket)
{
    if (const auto* joker = std::get_if<Joker>(&card)) {
        return {jokerBucket, 0, joker->jokerNumber};
    }
    const auto& suit_card = std::get<SuitCard>(card);
    const auto bucket = (suit_card.suit == trumpSuit) ?
        0 : 2 + suitOrder(suit_card.suit);
    return {bucket, -rankValue(suit_card.rank), 0};
}

Hand sortWithJokerBucket(
    const Hand& hand, const std::optional<Suit> trumpSuit, const int jokerBucket)
{
    auto ret = hand;
    std::stable_sort(
        ret.begin(), ret.end(),
        [trumpSuit, jokerBucket](const auto& a, const auto& b)
        {
            return sortKey(a, trumpSuit, jokerBucket) <
                sortKey(b, trumpSuit, jokerBucket);
        });
    return ret;
}

}

Deck createDeck()
{
    auto deck = Deck {};
    deck.reserve(N_CARDS);
    for (const auto suit : SUITS) {
        for (const auto rank : RANKS) {
            deck.emplace_back(SuitCard {suit, rank});
        }
    }
    for (const auto n : from_to(1, N_JOKERS + 1)) {
        deck.emplace_back(Joker {n});
    }
    return deck;
}

Deck shuffleDeck(const Deck& deck, Rng& rng)
{
    auto ret = deck;
    std::shuffle(ret.begin(), ret.end(), rng);
    return ret;
}

DealResult dealCards(
    const Deck& deck, const int numPlayers, const int cardsPerPlayer,
    const int startSeat)
{
    if (numPlayers <= 0 || cardsPerPlayer <= 0) {
        throw std::invalid_argument {"Invalid deal size"};
    }
    checkIndex(startSeat, numPlayers);
    const auto n_dealt = numPlayers * cardsPerPlayer;
    if (n_dealt + 1 > isize(deck)) {
        throw DeckExhausted {
            "Not enough cards for " + std::to_string(cardsPerPlayer) +
            " per player"};
    }

    auto hands = std::vector<Hand>(numPlayers);
    for (auto& hand : hands) {
        hand.reserve(cardsPerPlayer);
    }
    auto iter = deck.begin();
    for ([[maybe_unused]] const auto round : to(cardsPerPlayer)) {
        for (const auto p : to(numPlayers)) {
            hands[(startSeat + p) % numPlayers].push_back(*iter++);
        }
    }
    return {std::move(hands), Deck(iter, deck.end())};
}

int getCutValue(const Card& card)
{
    if (const auto rank = getRank(card)) {
        return rankValue(*rank);
    }
    return JOKER_CUT_VALUE;
}

int compareCardsForCut(const Card& a, const Card& b)
{
    const auto* joker_a = std::get_if<Joker>(&a);
    const auto* joker_b = std::get_if<Joker>(&b);
    if (joker_a && joker_b) {
        return joker_a->jokerNumber - joker_b->jokerNumber;
    }
    return getCutValue(a) - getCutValue(b);
}

std::optional<int> findCutWinner(const std::vector<Card>& cutCards)
{
    auto winner = std::optional<int> {};
    for (const auto seat : to(isize(cutCards))) {
        const auto& card = cutCards[seat];
        if (isJoker(card)) {
            continue;
        }
        if (!winner || getCutValue(card) < getCutValue(cutCards[*winner])) {
            winner = seat;
        }
    }
    return winner;
}

bool isWhoopieCard(const Card& card, const std::optional<Rank> whoopieRank)
{
    if (!whoopieRank) {
        return false;
    }
    if (const auto rank = getRank(card)) {
        return *rank == *whoopieRank;
    }
    return true;
}

bool isTrump(
    const Card& card, const std::optional<Suit> trumpSuit,
    const std::optional<Rank> whoopieRank, const bool jTrumpActive)
{
    if (isJoker(card)) {
        return true;
    }
    const auto& suit_card = std::get<SuitCard>(card);
    const auto is_whoopie = (suit_card.rank == whoopieRank);
    if (jTrumpActive) {
        return is_whoopie;
    }
    return suit_card.suit == trumpSuit || is_whoopie;
}

Hand getCardsOfSuit(const Hand& hand, const Suit suit)
{
    auto ret = Hand {};
    std::copy_if(
        hand.begin(), hand.end(), std::back_inserter(ret),
        [suit](const auto& card) { return getSuit(card) == suit; });
    return ret;
}

bool handContains(const Hand& hand, const Card& card)
{
    return std::find(hand.begin(), hand.end(), card) != hand.end();
}

Hand sortHand(const Hand& hand)
{
    return sortWithJokerBucket(hand, std::nullopt, 2 + isize(SUITS));
}

Hand sortHandWithTrump(const Hand& hand, const std::optional<Suit> trumpSuit)
{
    if (!trumpSuit) {
        return sortHand(hand);
    }
    return sortWithJokerBucket(hand, trumpSuit, 1);
}

}
