#include "scoring/Rankings.hh"

#include "Utility.hh"

#include <algorithm>
#include <numeric>
#include <ostream>
#include <stdexcept>

namespace Whoopie {
namespace Scoring {

Rankings calculateRankings(const Scores& scores)
{
    auto order = std::vector<int>(scores.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(
        order.begin(), order.end(),
        [&scores](const auto a, const auto b) {
            return scores[a] > scores[b];
        });

    auto ret = Rankings(scores.size());
    for (const auto position : to(isize(order))) {
        const auto seat = order[position];
        if (position > 0 && scores[seat] == scores[order[position - 1]]) {
            ret[seat] = ret[order[position - 1]];
        } else {
            ret[seat] = position + 1;
        }
    }
    return ret;
}

std::vector<Standing> getStandings(
    const std::vector<std::string>& playerIds,
    const std::vector<std::string>& playerNames, const Scores& scores)
{
    if (playerIds.size() != scores.size() ||
        playerNames.size() != scores.size()) {
        throw std::invalid_argument {
            "Player ids, names and scores must have the same size"};
    }
    const auto rankings = calculateRankings(scores);
    auto ret = std::vector<Standing> {};
    ret.reserve(scores.size());
    for (const auto i : to(isize(scores))) {
        ret.push_back({playerIds[i], playerNames[i], scores[i], rankings[i]});
    }
    std::stable_sort(
        ret.begin(), ret.end(),
        [](const auto& a, const auto& b) { return a.rank < b.rank; });
    return ret;
}

std::vector<int> getPointAwardPositions(const int numPlayers)
{
    if (numPlayers <= 4) {
        return {1};
    } else if (numPlayers <= 7) {
        return {1, 2};
    }
    return {1, 2, 3};
}

bool rankGetsPoints(const int rank, const int numPlayers)
{
    const auto positions = getPointAwardPositions(numPlayers);
    return std::find(positions.begin(), positions.end(), rank) !=
        positions.end();
}

ScoreStats getScoreStats(const Scores& scores)
{
    if (scores.empty()) {
        return {};
    }
    const auto [lowest, highest] =
        std::minmax_element(scores.begin(), scores.end());
    const auto sum = std::accumulate(scores.begin(), scores.end(), 0);
    return {
        *highest, *lowest, static_cast<double>(sum) / isize(scores),
        *highest - *lowest};
}

std::ostream& operator<<(std::ostream& os, const Standing& standing)
{
    return os << standing.rank << ". " << standing.playerName << " (" <<
        standing.playerId << "): " << standing.score;
}

}
}
