#include "whoopie/AllowedCards.hh"

#include <iterator>

namespace Whoopie {

Hand getValidCards(const Hand& hand, const TrickCards& currentTrick)
{
    auto ret = Hand {};
    getValidCards(hand, currentTrick, std::back_inserter(ret));
    return ret;
}

bool isValidPlay(
    const Hand& hand, const TrickCards& currentTrick, const Card& card)
{
    return handContains(getValidCards(hand, currentTrick), card);
}

}
