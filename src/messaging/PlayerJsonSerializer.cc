#include "messaging/PlayerJsonSerializer.hh"

#include "messaging/JsonSerializerUtility.hh"

using nlohmann::json;

namespace Whoopie {

const std::string PLAYER_TYPE_KEY {"type"};
const std::string PLAYER_HUMAN_TAG {"human"};
const std::string PLAYER_AI_TAG {"ai"};
const std::string PLAYER_ID_KEY {"id"};
const std::string PLAYER_NAME_KEY {"name"};
const std::string PLAYER_IS_CONNECTED_KEY {"isConnected"};
const std::string PLAYER_DIFFICULTY_KEY {"difficulty"};

namespace {

class JsonSerializerVisitor {
public:
    JsonSerializerVisitor(json& j) : j {j} {}

    auto operator()(const HumanPlayer& player) const
    {
        j[PLAYER_IS_CONNECTED_KEY] = player.isConnected;
        return PLAYER_HUMAN_TAG;
    }

    auto operator()(const AiPlayer& player) const
    {
        j[PLAYER_DIFFICULTY_KEY] = player.difficulty;
        return PLAYER_AI_TAG;
    }

private:
    json& j;
};

}

void to_json(json& j, const AiDifficulty difficulty)
{
    j = Messaging::enumToJson(difficulty, AI_DIFFICULTY_TO_STRING_MAP.left);
}

void from_json(const json& j, AiDifficulty& difficulty)
{
    difficulty = Messaging::jsonToEnum<AiDifficulty>(
        j, AI_DIFFICULTY_TO_STRING_MAP.right);
}

void to_json(json& j, const Player& player)
{
    j = json::object();
    j[PLAYER_TYPE_KEY] = std::visit(JsonSerializerVisitor {j}, player);
    j[PLAYER_ID_KEY] = getPlayerId(player);
    j[PLAYER_NAME_KEY] = getPlayerName(player);
}

void from_json(const json& j, Player& player)
{
    const auto& type = j.at(PLAYER_TYPE_KEY);
    auto id = j.at(PLAYER_ID_KEY).get<std::string>();
    auto name = j.at(PLAYER_NAME_KEY).get<std::string>();
    if (type == PLAYER_HUMAN_TAG) {
        player = HumanPlayer {
            std::move(id), std::move(name),
            j.value(PLAYER_IS_CONNECTED_KEY, true)};
    } else if (type == PLAYER_AI_TAG) {
        player = AiPlayer {
            std::move(id), std::move(name),
            j.at(PLAYER_DIFFICULTY_KEY).get<AiDifficulty>()};
    } else {
        throw Messaging::SerializationFailureException {};
    }
}

}
