#include "engine/GameEvents.hh"

#include <ostream>

namespace Whoopie {
namespace Engine {

namespace {

struct EventTypeVisitor {
    std::string_view operator()(const PlayerJoined&) const
    {
        return "playerJoined";
    }
    std::string_view operator()(const PlayerLeft&) const
    {
        return "playerLeft";
    }
    std::string_view operator()(const GameStarted&) const
    {
        return "gameStarted";
    }
    std::string_view operator()(const CutForDealer&) const
    {
        return "cutForDealer";
    }
    std::string_view operator()(const StanzaStarted&) const
    {
        return "stanzaStarted";
    }
    std::string_view operator()(const BidPlaced&) const
    {
        return "bidPlaced";
    }
    std::string_view operator()(const CardPlayed&) const
    {
        return "cardPlayed";
    }
    std::string_view operator()(const TrickCompleted&) const
    {
        return "trickCompleted";
    }
    std::string_view operator()(const StanzaCompleted&) const
    {
        return "stanzaCompleted";
    }
    std::string_view operator()(const GameEnded&) const
    {
        return "gameEnded";
    }
    std::string_view operator()(const WhoopieCallMissed&) const
    {
        return "whoopieCallMissed";
    }
    std::string_view operator()(const StanzaRedealt&) const
    {
        return "stanzaRedealt";
    }
};

}

std::string_view getEventType(const GameEvent& event)
{
    return std::visit(EventTypeVisitor {}, event);
}

std::ostream& operator<<(std::ostream& os, const GameEvent& event)
{
    return os << getEventType(event);
}

}
}
