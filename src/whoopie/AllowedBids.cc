#include "whoopie/AllowedBids.hh"

#include <iterator>

namespace Whoopie {

std::optional<int> getHookedBid(
    const int dealerSeat, const int cardsPerPlayer, const Bids& existingBids)
{
    auto others = 0;
    for (const auto seat : to(isize(existingBids))) {
        if (seat != dealerSeat && existingBids[seat]) {
            others += *existingBids[seat];
        }
    }
    const auto hooked = cardsPerPlayer - others;
    if (hooked < 0) {
        return std::nullopt;
    }
    return hooked;
}

std::vector<int> getValidBids(
    const int seat, const int dealerSeat, const int cardsPerPlayer,
    const Bids& existingBids)
{
    auto ret = std::vector<int> {};
    getValidBids(
        seat, dealerSeat, cardsPerPlayer, existingBids,
        std::back_inserter(ret));
    return ret;
}

bool isValidBid(
    const int seat, const int dealerSeat, const int cardsPerPlayer,
    const Bids& existingBids, const int bid)
{
    if (bid < 0 || bid > cardsPerPlayer) {
        return false;
    }
    return seat != dealerSeat ||
        bid != getHookedBid(dealerSeat, cardsPerPlayer, existingBids);
}

}
