/** \file
 *
 * \brief Definition of UUID generator utilities
 */

#ifndef UUIDGENERATOR_HH_
#define UUIDGENERATOR_HH_

#include "whoopie/Random.hh"
#include "whoopie/Uuid.hh"

#include <boost/uuid/random_generator.hpp>

namespace Whoopie {

/** \brief The preferred UUID generator for the Whoopie project
 */
using UuidGenerator = boost::uuids::basic_random_generator<Rng>;

/** \brief Generate new UUID using the global random number generator
 *
 * \return A newly created UUID
 */
Uuid generateUuid();

}

#endif // UUIDGENERATOR_HH_
