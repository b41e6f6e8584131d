#include "whoopie/StanzaProgression.hh"

#include "whoopie/WhoopieConstants.hh"
#include "Utility.hh"

#include <ostream>
#include <stdexcept>

namespace Whoopie {

namespace {

DirectionToStringMap makeDirectionToStringMap()
{
    using Relation = DirectionToStringMap::value_type;
    auto ret = DirectionToStringMap {};
    ret.insert(Relation {Direction::UP,   "up"});
    ret.insert(Relation {Direction::DOWN, "down"});
    return ret;
}

}

const DirectionToStringMap DIRECTION_TO_STRING_MAP =
    makeDirectionToStringMap();

int getMaxCardsPerPlayer(const int numPlayers)
{
    if (numPlayers <= 0) {
        throw std::invalid_argument {"Number of players must be positive"};
    }
    return (N_CARDS - 1) / numPlayers;
}

int getTotalStanzasInCycle(const int numPlayers)
{
    return 2 * getMaxCardsPerPlayer(numPlayers) - 1;
}

StanzaSize getNextStanzaSize(
    const int cardsPerPlayer, const Direction direction,
    const int maxCardsPerPlayer)
{
    if (direction == Direction::UP) {
        if (cardsPerPlayer >= maxCardsPerPlayer) {
            return {maxCardsPerPlayer - 1, Direction::DOWN};
        }
        return {cardsPerPlayer + 1, Direction::UP};
    }
    if (cardsPerPlayer <= 1) {
        return {2, Direction::UP};
    }
    return {cardsPerPlayer - 1, Direction::DOWN};
}

int getNextSeat(const int seat, const int numPlayers)
{
    return (checkIndex(seat, numPlayers) + 1) % numPlayers;
}

int getFirstBidderIndex(const int dealerIndex, const int numPlayers)
{
    return getNextSeat(dealerIndex, numPlayers);
}

int getFirstLeaderIndex(const int dealerIndex, const int numPlayers)
{
    return getNextSeat(dealerIndex, numPlayers);
}

bool canStartStanza(const int numPlayers, const int cardsPerPlayer)
{
    return numPlayers >= MIN_PLAYERS && numPlayers <= MAX_PLAYERS &&
        cardsPerPlayer >= 1 && numPlayers * cardsPerPlayer + 1 <= N_CARDS;
}

std::ostream& operator<<(std::ostream& os, const Direction direction)
{
    return os << DIRECTION_TO_STRING_MAP.left.at(direction);
}

std::ostream& operator<<(std::ostream& os, const StanzaSize& size)
{
    return os << size.cardsPerPlayer << " " << size.direction;
}

}
