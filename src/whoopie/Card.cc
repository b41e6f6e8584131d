#include "whoopie/Card.hh"

#include <boost/bimap/bimap.hpp>

#include <algorithm>
#include <ostream>
#include <utility>

namespace Whoopie {

namespace {

const auto SUIT_SYMBOLS = std::array<std::pair<Suit, std::string_view>, 4> {{
    { Suit::SPADES,   "♠" },
    { Suit::HEARTS,   "♥" },
    { Suit::DIAMONDS, "♦" },
    { Suit::CLUBS,    "♣" },
}};

const auto JOKER_PREFIX = std::string_view {"Joker"};

template<typename Map, typename Pairs>
Map makeBimap(const Pairs& pairs)
{
    auto ret = Map {};
    for (const auto& p : pairs) {
        ret.insert(typename Map::value_type {p.first, p.second});
    }
    return ret;
}

}

const SuitToStringMap SUIT_TO_STRING_MAP =
    makeBimap<SuitToStringMap>(std::array<std::pair<Suit, std::string>, 4> {{
        { Suit::SPADES,   "spades"   },
        { Suit::HEARTS,   "hearts"   },
        { Suit::DIAMONDS, "diamonds" },
        { Suit::CLUBS,    "clubs"    },
    }});

const RankToStringMap RANK_TO_STRING_MAP =
    makeBimap<RankToStringMap>(std::array<std::pair<Rank, std::string>, 13> {{
        { Rank::ACE,   "A"  },
        { Rank::KING,  "K"  },
        { Rank::QUEEN, "Q"  },
        { Rank::JACK,  "J"  },
        { Rank::TEN,   "10" },
        { Rank::NINE,  "9"  },
        { Rank::EIGHT, "8"  },
        { Rank::SEVEN, "7"  },
        { Rank::SIX,   "6"  },
        { Rank::FIVE,  "5"  },
        { Rank::FOUR,  "4"  },
        { Rank::THREE, "3"  },
        { Rank::TWO,   "2"  },
    }});

bool isJoker(const Card& card)
{
    return std::holds_alternative<Joker>(card);
}

std::optional<Suit> getSuit(const Card& card)
{
    if (const auto* suit_card = std::get_if<SuitCard>(&card)) {
        return suit_card->suit;
    }
    return std::nullopt;
}

std::optional<Rank> getRank(const Card& card)
{
    if (const auto* suit_card = std::get_if<SuitCard>(&card)) {
        return suit_card->rank;
    }
    return std::nullopt;
}

bool cardsEqual(const Card& lhs, const Card& rhs)
{
    return lhs == rhs;
}

std::string cardToString(const Card& card)
{
    if (const auto* joker = std::get_if<Joker>(&card)) {
        return std::string {JOKER_PREFIX} + std::to_string(joker->jokerNumber);
    }
    const auto& suit_card = std::get<SuitCard>(card);
    const auto symbol = std::find_if(
        SUIT_SYMBOLS.begin(), SUIT_SYMBOLS.end(),
        [&suit_card](const auto& p) { return p.first == suit_card.suit; });
    return RANK_TO_STRING_MAP.left.at(suit_card.rank) +
        std::string {symbol->second};
}

std::optional<Card> parseCardString(const std::string_view str)
{
    if (str.starts_with(JOKER_PREFIX)) {
        const auto number = str.substr(JOKER_PREFIX.size());
        if (number == "1") {
            return Joker {1};
        } else if (number == "2") {
            return Joker {2};
        }
        return std::nullopt;
    }
    for (const auto& [suit, symbol] : SUIT_SYMBOLS) {
        if (str.ends_with(symbol)) {
            const auto rank_str =
                std::string {str.substr(0, str.size() - symbol.size())};
            const auto iter = RANK_TO_STRING_MAP.right.find(rank_str);
            if (iter == RANK_TO_STRING_MAP.right.end()) {
                return std::nullopt;
            }
            return SuitCard {suit, iter->second};
        }
    }
    return std::nullopt;
}

std::ostream& operator<<(std::ostream& os, const Suit suit)
{
    return os << SUIT_TO_STRING_MAP.left.at(suit);
}

std::ostream& operator<<(std::ostream& os, const Rank rank)
{
    return os << RANK_TO_STRING_MAP.left.at(rank);
}

std::ostream& operator<<(std::ostream& os, const SuitCard& card)
{
    return os << card.rank << " " << card.suit;
}

std::ostream& operator<<(std::ostream& os, const Joker& joker)
{
    return os << "joker " << joker.jokerNumber;
}

}
