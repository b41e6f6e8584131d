#include "whoopie/Player.hh"

#include <ostream>

namespace Whoopie {

namespace {

AiDifficultyToStringMap makeAiDifficultyToStringMap()
{
    using Relation = AiDifficultyToStringMap::value_type;
    auto ret = AiDifficultyToStringMap {};
    ret.insert(Relation {AiDifficulty::BEGINNER,     "beginner"});
    ret.insert(Relation {AiDifficulty::INTERMEDIATE, "intermediate"});
    ret.insert(Relation {AiDifficulty::EXPERT,       "expert"});
    return ret;
}

}

const AiDifficultyToStringMap AI_DIFFICULTY_TO_STRING_MAP =
    makeAiDifficultyToStringMap();

const std::string& getPlayerId(const Player& player)
{
    return std::visit(
        [](const auto& p) -> const std::string& { return p.id; }, player);
}

const std::string& getPlayerName(const Player& player)
{
    return std::visit(
        [](const auto& p) -> const std::string& { return p.name; }, player);
}

bool isAi(const Player& player)
{
    return std::holds_alternative<AiPlayer>(player);
}

std::ostream& operator<<(std::ostream& os, const AiDifficulty difficulty)
{
    return os << AI_DIFFICULTY_TO_STRING_MAP.left.at(difficulty);
}

std::ostream& operator<<(std::ostream& os, const HumanPlayer& player)
{
    return os << player.name << " (" << player.id << ")";
}

std::ostream& operator<<(std::ostream& os, const AiPlayer& player)
{
    return os << player.name << " (" << player.id << ", ai " <<
        player.difficulty << ")";
}

}
