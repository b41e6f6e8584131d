#include "messaging/UuidJsonSerializer.hh"

#include "messaging/SerializationFailureException.hh"

#include <boost/uuid/uuid_io.hpp>
#include <boost/uuid/string_generator.hpp>

namespace nlohmann {

void adl_serializer<Whoopie::Uuid>::to_json(json& j, const Whoopie::Uuid& uuid)
{
    j = to_string(uuid);
}

void adl_serializer<Whoopie::Uuid>::from_json(const json& j, Whoopie::Uuid& uuid)
{
    if (!j.is_string()) {
        throw Whoopie::Messaging::SerializationFailureException {};
    }
    auto gen = boost::uuids::string_generator {};
    const auto& s = j.get_ref<const std::string&>();
    try {
        uuid = gen(s);
    } catch (const std::exception&) {
        // Boost UUID does not document the exception thrown for a malformed
        // string
        throw Whoopie::Messaging::SerializationFailureException {};
    }
}

}
