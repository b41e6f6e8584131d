/** \file
 *
 * \brief Definition of JSON serializer for Whoopie::Uuid
 *
 * \page jsonuuid UUID JSON representation
 *
 * A UUID is represented by its canonical string form, e.g.
 * "9c2a5b8e-4f1d-4e7a-a0b3-5d6c7e8f9a0b".
 */

#ifndef MESSAGING_UUIDJSONSERIALIZER_HH_
#define MESSAGING_UUIDJSONSERIALIZER_HH_

#include "whoopie/Uuid.hh"

#include <nlohmann/json.hpp>

namespace nlohmann {

/** \brief Explicit specialization of adl_serializer for Uuid
 */
template<>
struct adl_serializer<Whoopie::Uuid> {

    /** \brief Convert UUID to JSON
     */
    static void to_json(json&, const Whoopie::Uuid&);

    /** \brief Convert JSON to UUID
     */
    static void from_json(const json&, Whoopie::Uuid&);

};

}

#endif // MESSAGING_UUIDJSONSERIALIZER_HH_
