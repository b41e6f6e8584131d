/** \file
 *
 * \brief The common random number generator
 */

#ifndef RANDOM_HH_
#define RANDOM_HH_

#include <optional>
#include <random>

namespace Whoopie {

/** \brief The preferred random number generator for the Whoopie project
 *
 * Every operation that shuffles takes a reference to an Rng, so a host (or a
 * test) that wants reproducible deals supplies its own seeded engine.
 */
using Rng = std::mt19937;

/** \brief Get reference to the global random number generator
 *
 * \return Reference to the global random number generator, seeded from the OS
 * random number source
 */
Rng& getRng();

/** \brief Create a random number generator
 *
 * \param seed the seed, or none to seed from the OS random number source
 *
 * \return a new random number generator
 */
Rng makeRng(std::optional<Rng::result_type> seed);

}

#endif // RANDOM_HH_
