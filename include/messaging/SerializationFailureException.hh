/** \file
 *
 * \brief Definition of Whoopie::Messaging::SerializationFailureException class
 */

#ifndef MESSAGING_SERIALIZATIONFAILUREEXCEPTION_HH_
#define MESSAGING_SERIALIZATIONFAILUREEXCEPTION_HH_

#include <exception>

namespace Whoopie {

/** \brief JSON representation of the game objects
 */
namespace Messaging {

/** \brief Exception to indicate error in serialization or deserialization
 *
 * This exception is thrown by the JSON converters when the JSON does not
 * describe a valid object, e.g. a card with an unknown suit or an event with an
 * unknown type.
 */
class SerializationFailureException : public std::exception {
public:
    /** \brief Get the description of the error
     */
    const char* what() const noexcept override
    {
        return "Serialization failure";
    }
};

}
}

#endif // MESSAGING_SERIALIZATIONFAILUREEXCEPTION_HH_
