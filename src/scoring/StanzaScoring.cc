#include "scoring/StanzaScoring.hh"

#include "whoopie/WhoopieConstants.hh"
#include "Utility.hh"

#include <numeric>
#include <stdexcept>

namespace Whoopie {
namespace Scoring {

int calculatePlayerStanzaScore(const int bid, const int tricksTaken)
{
    if (tricksTaken == bid) {
        return SCORE_MAKE_BID_BASE + bid;
    }
    return SCORE_MISS_BID;
}

Scores calculateStanzaScores(
    const std::vector<int>& bids, const std::vector<int>& tricksTaken)
{
    if (bids.size() != tricksTaken.size()) {
        throw std::invalid_argument {
            "Bids and tricks taken must have the same size"};
    }
    auto ret = Scores {};
    ret.reserve(bids.size());
    for (const auto i : to(isize(bids))) {
        ret.push_back(calculatePlayerStanzaScore(bids[i], tricksTaken[i]));
    }
    return ret;
}

Scores applyScoreChanges(const Scores& scores, const Scores& scoreChanges)
{
    if (scores.size() != scoreChanges.size()) {
        throw std::invalid_argument {
            "Scores and score changes must have the same size"};
    }
    auto ret = scores;
    for (const auto i : to(isize(ret))) {
        ret[i] += scoreChanges[i];
    }
    return ret;
}

int getMissedWhoopieCallPenalty()
{
    return SCORE_MISSED_WHOOPIE_CALL;
}

int calculateTruncatedAverage(const Scores& scores)
{
    if (scores.empty()) {
        return 0;
    }
    const auto sum = std::accumulate(scores.begin(), scores.end(), 0);
    const auto n = isize(scores);
    // Integer division truncates towards zero, floor is wanted
    auto quotient = sum / n;
    if (sum % n != 0 && sum < 0) {
        --quotient;
    }
    return quotient;
}

}
}
