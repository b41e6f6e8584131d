/** \file
 *
 * \brief Definition of utilities to calculate Whoopie stanza scores
 */

#ifndef SCORING_STANZASCORING_HH_
#define SCORING_STANZASCORING_HH_

#include <vector>

namespace Whoopie {

/** \brief Services related to Whoopie scoring
 */
namespace Scoring {

/** \brief Scores or score changes, indexed by seat
 */
using Scores = std::vector<int>;

/** \brief Calculate the score of a seat in a stanza
 *
 * \param bid the bid of the seat
 * \param tricksTaken the number of tricks the seat took
 *
 * \return 2 + \p bid if the seat took exactly the number of tricks it bid,
 * otherwise -1
 */
int calculatePlayerStanzaScore(int bid, int tricksTaken);

/** \brief Calculate the scores of all seats in a stanza
 *
 * \throw std::invalid_argument if \p bids and \p tricksTaken differ in size
 */
Scores calculateStanzaScores(
    const std::vector<int>& bids, const std::vector<int>& tricksTaken);

/** \brief Add score changes to scores
 *
 * \throw std::invalid_argument if \p scores and \p scoreChanges differ in
 * size
 */
Scores applyScoreChanges(const Scores& scores, const Scores& scoreChanges);

/** \brief Get the penalty for failing to call Whoopie
 */
int getMissedWhoopieCallPenalty();

/** \brief Calculate the truncated average of scores
 *
 * The truncated average is the baseline score of a player joining a game in
 * progress.
 *
 * \return the average of \p scores rounded down, or zero if \p scores is
 * empty
 */
int calculateTruncatedAverage(const Scores& scores);

}
}

#endif // SCORING_STANZASCORING_HH_
