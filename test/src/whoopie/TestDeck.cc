#include "whoopie/Deck.hh"
#include "whoopie/WhoopieConstants.hh"
#include "whoopie/WhoopieException.hh"

#include <gtest/gtest.h>

#include <algorithm>
#include <stdexcept>

using Whoopie::Card;
using Whoopie::Hand;
using Whoopie::Joker;
using Whoopie::Rank;
using Whoopie::Suit;
using Whoopie::SuitCard;

namespace {

Whoopie::Deck sorted(Whoopie::Deck deck)
{
    std::sort(deck.begin(), deck.end());
    return deck;
}

}

TEST(DeckTest, testCreateDeckContainsEveryCardOnce)
{
    const auto deck = Whoopie::createDeck();
    ASSERT_EQ(Whoopie::N_CARDS, static_cast<int>(deck.size()));
    EXPECT_EQ(2, std::count_if(deck.begin(), deck.end(), Whoopie::isJoker));
    auto unique = sorted(deck);
    EXPECT_EQ(unique.end(), std::adjacent_find(unique.begin(), unique.end()));
}

TEST(DeckTest, testShufflePreservesCards)
{
    auto rng = Whoopie::makeRng(1234);
    const auto deck = Whoopie::createDeck();
    const auto shuffled = Whoopie::shuffleDeck(deck, rng);
    EXPECT_EQ(sorted(deck), sorted(shuffled));
}

TEST(DeckTest, testShuffleIsDeterministicForSeed)
{
    auto rng1 = Whoopie::makeRng(42);
    auto rng2 = Whoopie::makeRng(42);
    const auto deck = Whoopie::createDeck();
    EXPECT_EQ(
        Whoopie::shuffleDeck(deck, rng1), Whoopie::shuffleDeck(deck, rng2));
}

TEST(DeckTest, testDealRoundRobin)
{
    const auto deck = Whoopie::createDeck();
    const auto result = Whoopie::dealCards(deck, 3, 2, 1);
    ASSERT_EQ(3u, result.hands.size());
    EXPECT_EQ((Hand {deck[0], deck[3]}), result.hands[1]);
    EXPECT_EQ((Hand {deck[1], deck[4]}), result.hands[2]);
    EXPECT_EQ((Hand {deck[2], deck[5]}), result.hands[0]);
    EXPECT_EQ(Whoopie::Deck(deck.begin() + 6, deck.end()), result.remainingDeck);
}

TEST(DeckTest, testDealConservesCards)
{
    auto rng = Whoopie::makeRng(7);
    const auto deck = Whoopie::shuffleDeck(Whoopie::createDeck(), rng);
    const auto result = Whoopie::dealCards(deck, 5, 10, 0);
    auto all = result.remainingDeck;
    for (const auto& hand : result.hands) {
        EXPECT_EQ(10u, hand.size());
        all.insert(all.end(), hand.begin(), hand.end());
    }
    EXPECT_EQ(sorted(deck), sorted(all));
}

TEST(DeckTest, testDealLeavesDefiningCard)
{
    const auto deck = Whoopie::createDeck();
    EXPECT_NO_THROW(Whoopie::dealCards(deck, 53, 1));
    EXPECT_THROW(Whoopie::dealCards(deck, 54, 1), Whoopie::DeckExhausted);
    EXPECT_THROW(Whoopie::dealCards(deck, 4, 14), Whoopie::DeckExhausted);
}

TEST(DeckTest, testDealInvalidSize)
{
    const auto deck = Whoopie::createDeck();
    EXPECT_THROW(Whoopie::dealCards(deck, 0, 1), std::invalid_argument);
    EXPECT_THROW(Whoopie::dealCards(deck, 4, 0), std::invalid_argument);
}

TEST(DeckTest, testCutValues)
{
    EXPECT_EQ(2, Whoopie::getCutValue(SuitCard {Suit::CLUBS, Rank::TWO}));
    EXPECT_EQ(14, Whoopie::getCutValue(SuitCard {Suit::CLUBS, Rank::ACE}));
    EXPECT_GT(Whoopie::getCutValue(Joker {1}), 14);
}

TEST(DeckTest, testCompareCardsForCut)
{
    EXPECT_LT(
        Whoopie::compareCardsForCut(
            SuitCard {Suit::SPADES, Rank::THREE},
            SuitCard {Suit::HEARTS, Rank::KING}), 0);
    EXPECT_EQ(
        0, Whoopie::compareCardsForCut(
            SuitCard {Suit::SPADES, Rank::FIVE},
            SuitCard {Suit::HEARTS, Rank::FIVE}));
    EXPECT_LT(Whoopie::compareCardsForCut(Joker {1}, Joker {2}), 0);
}

TEST(DeckTest, testCutWinnerIsLowestCard)
{
    const auto cut = std::vector<Card> {
        SuitCard {Suit::SPADES, Rank::KING},
        SuitCard {Suit::HEARTS, Rank::FOUR},
        SuitCard {Suit::CLUBS, Rank::NINE},
    };
    EXPECT_EQ(1, Whoopie::findCutWinner(cut));
}

TEST(DeckTest, testCutWinnerTieGoesToFirstSeat)
{
    const auto cut = std::vector<Card> {
        SuitCard {Suit::SPADES, Rank::KING},
        SuitCard {Suit::HEARTS, Rank::FOUR},
        SuitCard {Suit::CLUBS, Rank::FOUR},
    };
    EXPECT_EQ(1, Whoopie::findCutWinner(cut));
}

TEST(DeckTest, testCutWinnerIgnoresJokers)
{
    const auto cut = std::vector<Card> {
        Joker {1}, SuitCard {Suit::HEARTS, Rank::ACE}};
    EXPECT_EQ(1, Whoopie::findCutWinner(cut));
    EXPECT_EQ(
        std::nullopt,
        Whoopie::findCutWinner(std::vector<Card> {Joker {1}, Joker {2}}));
}

TEST(DeckTest, testIsWhoopieCard)
{
    EXPECT_TRUE(
        Whoopie::isWhoopieCard(SuitCard {Suit::CLUBS, Rank::SEVEN}, Rank::SEVEN));
    EXPECT_FALSE(
        Whoopie::isWhoopieCard(SuitCard {Suit::CLUBS, Rank::EIGHT}, Rank::SEVEN));
    EXPECT_TRUE(Whoopie::isWhoopieCard(Joker {1}, Rank::SEVEN));
    EXPECT_FALSE(Whoopie::isWhoopieCard(Joker {1}, std::nullopt));
    EXPECT_FALSE(
        Whoopie::isWhoopieCard(
            SuitCard {Suit::CLUBS, Rank::SEVEN}, std::nullopt));
}

TEST(DeckTest, testIsTrump)
{
    const auto seven_clubs = Card {SuitCard {Suit::CLUBS, Rank::SEVEN}};
    const auto two_hearts = Card {SuitCard {Suit::HEARTS, Rank::TWO}};
    EXPECT_TRUE(Whoopie::isTrump(two_hearts, Suit::HEARTS, Rank::SEVEN, false));
    EXPECT_TRUE(Whoopie::isTrump(seven_clubs, Suit::HEARTS, Rank::SEVEN, false));
    EXPECT_FALSE(Whoopie::isTrump(two_hearts, Suit::SPADES, Rank::SEVEN, false));
    EXPECT_FALSE(Whoopie::isTrump(two_hearts, Suit::HEARTS, Rank::SEVEN, true));
    EXPECT_TRUE(Whoopie::isTrump(Joker {2}, std::nullopt, std::nullopt, false));
}

TEST(DeckTest, testGetCardsOfSuitAndContains)
{
    const auto hand = Hand {
        SuitCard {Suit::CLUBS, Rank::TWO}, Joker {1},
        SuitCard {Suit::HEARTS, Rank::ACE}, SuitCard {Suit::CLUBS, Rank::KING}};
    EXPECT_EQ(
        (Hand {
            SuitCard {Suit::CLUBS, Rank::TWO},
            SuitCard {Suit::CLUBS, Rank::KING}}),
        Whoopie::getCardsOfSuit(hand, Suit::CLUBS));
    EXPECT_TRUE(Whoopie::handContains(hand, Joker {1}));
    EXPECT_FALSE(Whoopie::handContains(hand, Joker {2}));
}

TEST(DeckTest, testSortHand)
{
    const auto hand = Hand {
        Joker {2}, SuitCard {Suit::CLUBS, Rank::TWO},
        SuitCard {Suit::SPADES, Rank::THREE}, SuitCard {Suit::SPADES, Rank::ACE},
        Joker {1}};
    EXPECT_EQ(
        (Hand {
            SuitCard {Suit::SPADES, Rank::ACE},
            SuitCard {Suit::SPADES, Rank::THREE},
            SuitCard {Suit::CLUBS, Rank::TWO}, Joker {1}, Joker {2}}),
        Whoopie::sortHand(hand));
}

TEST(DeckTest, testSortHandWithTrump)
{
    const auto hand = Hand {
        SuitCard {Suit::SPADES, Rank::ACE}, Joker {1},
        SuitCard {Suit::CLUBS, Rank::TWO}};
    EXPECT_EQ(
        (Hand {
            SuitCard {Suit::CLUBS, Rank::TWO}, Joker {1},
            SuitCard {Suit::SPADES, Rank::ACE}}),
        Whoopie::sortHandWithTrump(hand, Suit::CLUBS));
}
