//
// Structure.cpp
//

#include "Structure.hpp"

#include <algorithm>
#include <map>

namespace gunzi::core
{
    auto Classify(std::span<CardSP const> cards) -> Structure
    {
        if (cards.empty() || cards.size() > constants::MaxStructure) return Structure::Invalid;
        Card const& first = *cards.front();
        bool const identical = std::ranges::all_of(cards, [&first](CardSP const& c) { return *c == first; });
        return identical ? static_cast<Structure>(cards.size()) : Structure::Invalid;
    }

    auto LargestGroup(std::span<CardSP const> cards) -> size_t
    {
        std::map<std::pair<Suit, Rank>, size_t> groups;
        size_t best{0};
        for (CardSP const& c : cards)
            best = std::max(best, ++groups[{c->suit, c->rank}]);
        return best;
    }
}
