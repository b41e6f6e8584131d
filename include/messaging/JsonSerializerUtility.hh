/** \file
 *
 * \brief Definition of JSON serialization utilities
 */

#ifndef MESSAGING_JSONSERIALIZERUTILITY_HH_
#define MESSAGING_JSONSERIALIZERUTILITY_HH_

#include "messaging/SerializationFailureException.hh"

#include <nlohmann/json.hpp>

#include <functional>
#include <optional>
#include <string>
#include <utility>

namespace nlohmann {

/** \brief JSON converter for optional types
 *
 * An empty optional is represented by null.
 */
template<typename T>
struct adl_serializer<std::optional<T>>
{
    /** \brief Convert optional type to JSON
     */
    static void to_json(json&, const std::optional<T>&);

    /** \brief Convert JSON to optional type
     */
    static void from_json(const json&, std::optional<T>&);
};

template<typename T>
void adl_serializer<std::optional<T>>::to_json(
    json& j, const std::optional<T>& t)
{
    if (t) {
        j = *t;
    } else {
        j = nullptr;
    }
}

template<typename T>
void adl_serializer<std::optional<T>>::from_json(
    const json& j, std::optional<T>& t)
{
    if (j.is_null()) {
        t = std::nullopt;
    } else {
        t = j.get<T>();
    }
}

}

namespace Whoopie {
namespace Messaging {

/** \brief Convert enumeration to JSON string
 *
 * \param e the enumeration
 * \param map the left view of a bimap from enumerations to strings
 *
 * \return the name of \p e as JSON string
 */
template<typename Enum, typename LeftMap>
nlohmann::json enumToJson(const Enum e, const LeftMap& map)
{
    return map.at(e);
}

/** \brief Convert JSON string to enumeration
 *
 * \param j the JSON value
 * \param map the right view of a bimap from enumerations to strings
 *
 * \return the enumeration named by \p j
 *
 * \throw SerializationFailureException if \p j is not a string naming an
 * enumeration in \p map
 */
template<typename Enum, typename RightMap>
Enum jsonToEnum(const nlohmann::json& j, const RightMap& map)
{
    if (!j.is_string()) {
        throw SerializationFailureException {};
    }
    const auto iter = map.find(j.get<std::string>());
    if (iter == map.end()) {
        throw SerializationFailureException {};
    }
    return iter->second;
}

/** \brief Validate a deserialized value
 *
 * This function is intended to be used for an deserialized object when
 * additional validation is needed.
 *
 * \tparam Preds Predicates that can be invoked with \p t and whose return value
 * is convertible to bool.
 *
 * \param t the object to validate
 * \param preds the predicates used to validate \p t
 *
 * \return the object \p t if all predicates evaluate to true
 *
 * \throw SerializationFailureException if any predicate evaluates to false
 */
template<typename T, typename... Preds>
T validate(T&& t, Preds&&... preds)
{
    if ( ( ... && std::invoke(std::forward<Preds>(preds), t) ) ) {
        return t;
    }
    throw SerializationFailureException {};
}

/** \brief Convert JSON to object, ignoring errors
 *
 * This function tries to convert JSON object to an object of type \c T, except
 * it catches any exceptions and returns empty value instead on error.
 *
 * \param j the JSON object to covert
 *
 * \return \p j converted to object of type \c T, or none if exception is thrown
 * while converting
 */
template<typename T>
std::optional<T> tryFromJson(const nlohmann::json& j)
{
    try {
        return j.get<T>();
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

}
}

#endif // MESSAGING_JSONSERIALIZERUTILITY_HH_
