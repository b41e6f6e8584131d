/** \file
 *
 * \brief Definition of Whoopie::getValidBids
 */

#ifndef ALLOWEDBIDS_HH_
#define ALLOWEDBIDS_HH_

#include "Utility.hh"

#include <optional>
#include <vector>

namespace Whoopie {

/** \brief Bids placed in a stanza, indexed by seat
 *
 * A seat that has not bid yet holds none.
 */
using Bids = std::vector<std::optional<int>>;

/** \brief Get the bid the dealer is not allowed to make
 *
 * The sum of the bids may not equal the number of tricks in the stanza, so
 * the dealer, bidding last, may not bid the difference between the number of
 * tricks and the bids of the other seats.
 *
 * \param dealerSeat the seat of the dealer
 * \param cardsPerPlayer the number of cards dealt to each seat
 * \param existingBids the bids placed so far
 *
 * \return the forbidden bid, or none if every bid is allowed
 */
std::optional<int> getHookedBid(
    int dealerSeat, int cardsPerPlayer, const Bids& existingBids);

/** \brief Get valid bids
 *
 * Writes all bids that \p seat is allowed to make to \p out, in increasing
 * order. A seat may bid anything from zero to \p cardsPerPlayer, except that
 * the dealer may not make the bid returned by getHookedBid().
 *
 * \param seat the seat making the bid
 * \param dealerSeat the seat of the dealer
 * \param cardsPerPlayer the number of cards dealt to each seat
 * \param existingBids the bids placed so far
 * \param out the output iterator the bids are written to
 *
 * \return one past the position the last bid was written to
 */
template<typename OutputIterator>
OutputIterator getValidBids(
    const int seat, const int dealerSeat, const int cardsPerPlayer,
    const Bids& existingBids, OutputIterator out)
{
    const auto hooked = seat == dealerSeat ?
        getHookedBid(dealerSeat, cardsPerPlayer, existingBids) : std::nullopt;
    for (const auto bid : to(cardsPerPlayer + 1)) {
        if (bid != hooked) {
            *out++ = bid;
        }
    }
    return out;
}

/** \brief Get valid bids as a vector
 *
 * \sa getValidBids(int, int, int, const Bids&, OutputIterator)
 */
std::vector<int> getValidBids(
    int seat, int dealerSeat, int cardsPerPlayer, const Bids& existingBids);

/** \brief Determine if a bid is valid
 *
 * \return true if \p bid is among the bids returned by getValidBids()
 */
bool isValidBid(
    int seat, int dealerSeat, int cardsPerPlayer, const Bids& existingBids,
    int bid);

}

#endif // ALLOWEDBIDS_HH_
