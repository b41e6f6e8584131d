/** \file
 *
 * \brief Definition of final rankings and standings
 */

#ifndef SCORING_RANKINGS_HH_
#define SCORING_RANKINGS_HH_

#include "scoring/StanzaScoring.hh"

#include <iosfwd>
#include <string>
#include <vector>

namespace Whoopie {
namespace Scoring {

/** \brief Rank of each seat, indexed by seat
 */
using Rankings = std::vector<int>;

/** \brief Calculate rankings from scores
 *
 * The seats are ranked by descending score, the best seat having rank 1.
 * Tied seats share a rank, and the next distinct score is ranked by its
 * position. For example scores {10, 25, 15, 25} give rankings {4, 1, 3, 1}.
 *
 * \param scores the scores indexed by seat
 *
 * \return the rankings indexed by seat
 */
Rankings calculateRankings(const Scores& scores);

/** \brief Standing of a player
 */
struct Standing {
    std::string playerId;     ///< \brief Player id
    std::string playerName;   ///< \brief Player name
    int score {};             ///< \brief Score
    int rank {};              ///< \brief Rank

    /// \brief Equality comparison
    bool operator==(const Standing&) const = default;
};

/** \brief Get standings ordered by rank
 *
 * Seats with the same rank keep their seat order.
 *
 * \throw std::invalid_argument if the arguments differ in size
 */
std::vector<Standing> getStandings(
    const std::vector<std::string>& playerIds,
    const std::vector<std::string>& playerNames, const Scores& scores);

/** \brief Get the ranks that are awarded points at the end of a game
 *
 * \param numPlayers the number of players
 *
 * \return {1} for up to four players, {1, 2} for up to seven players,
 * otherwise {1, 2, 3}
 */
std::vector<int> getPointAwardPositions(int numPlayers);

/** \brief Determine if a rank is awarded points
 */
bool rankGetsPoints(int rank, int numPlayers);

/** \brief Summary statistics of scores
 */
struct ScoreStats {
    int highest {};         ///< \brief Highest score
    int lowest {};          ///< \brief Lowest score
    double average {};      ///< \brief Mean score
    int spread {};          ///< \brief Highest minus lowest score

    /// \brief Equality comparison
    bool operator==(const ScoreStats&) const = default;
};

/** \brief Calculate score statistics
 *
 * \return the statistics, or all zeros if \p scores is empty
 */
ScoreStats getScoreStats(const Scores& scores);

/** \brief Output a Standing to stream
 */
std::ostream& operator<<(std::ostream& os, const Standing& standing);

}
}

#endif // SCORING_RANKINGS_HH_
