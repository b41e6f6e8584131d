/** \file
 *
 * \brief Definition of Whoopie::Uuid
 */
#ifndef UUID_HH_
#define UUID_HH_

#include <boost/uuid/uuid.hpp>

namespace Whoopie {

/** \brief The identifier type of games
 */
using Uuid = boost::uuids::uuid;

}

#endif // UUID_HH_
