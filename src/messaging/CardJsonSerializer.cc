#include "messaging/CardJsonSerializer.hh"

#include "messaging/JsonSerializerUtility.hh"
#include "whoopie/WhoopieConstants.hh"

using nlohmann::json;

namespace Whoopie {

const std::string CARD_TYPE_KEY {"type"};
const std::string CARD_SUIT_TAG {"suit"};
const std::string CARD_JOKER_TAG {"joker"};
const std::string CARD_SUIT_KEY {"suit"};
const std::string CARD_RANK_KEY {"rank"};
const std::string CARD_JOKER_NUMBER_KEY {"jokerNumber"};

namespace {

class JsonSerializerVisitor {
public:
    JsonSerializerVisitor(json& j) : j {j} {}

    auto operator()(const SuitCard& card) const
    {
        j[CARD_SUIT_KEY] = card.suit;
        j[CARD_RANK_KEY] = card.rank;
        return CARD_SUIT_TAG;
    }

    auto operator()(const Joker& joker) const
    {
        j[CARD_JOKER_NUMBER_KEY] = joker.jokerNumber;
        return CARD_JOKER_TAG;
    }

private:
    json& j;
};

}

void to_json(json& j, const Suit suit)
{
    j = Messaging::enumToJson(suit, SUIT_TO_STRING_MAP.left);
}

void from_json(const json& j, Suit& suit)
{
    suit = Messaging::jsonToEnum<Suit>(j, SUIT_TO_STRING_MAP.right);
}

void to_json(json& j, const Rank rank)
{
    j = Messaging::enumToJson(rank, RANK_TO_STRING_MAP.left);
}

void from_json(const json& j, Rank& rank)
{
    rank = Messaging::jsonToEnum<Rank>(j, RANK_TO_STRING_MAP.right);
}

void to_json(json& j, const Card& card)
{
    j = json::object();
    const auto tag = std::visit(JsonSerializerVisitor {j}, card);
    j[CARD_TYPE_KEY] = tag;
}

void from_json(const json& j, Card& card)
{
    const auto& type = j.at(CARD_TYPE_KEY);
    if (type == CARD_SUIT_TAG) {
        card = SuitCard {
            j.at(CARD_SUIT_KEY).get<Suit>(), j.at(CARD_RANK_KEY).get<Rank>()};
    } else if (type == CARD_JOKER_TAG) {
        card = Joker {
            Messaging::validate(
                j.at(CARD_JOKER_NUMBER_KEY).get<int>(),
                [](const auto n) { return n >= 1 && n <= N_JOKERS; })};
    } else {
        throw Messaging::SerializationFailureException {};
    }
}

}
