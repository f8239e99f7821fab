//
// Structure.hpp
//

#ifndef GUNZI_STRUCTURE_HPP
#define GUNZI_STRUCTURE_HPP

#include <span>
#include "Types.hpp"

namespace gunzi::core
{
    // Value is the card count of the structure
    enum class Structure : uint8_t
    {
        Invalid = 0,
        Single = 1,
        Pair = 2,
        Triple = 3,
        Quad = 4
    };

    // Valid iff 1..4 cards, all identical by suit and rank
    auto Classify(std::span<CardSP const> cards) -> Structure;

    constexpr auto SizeOf(Structure const s) noexcept -> size_t { return static_cast<size_t>(s); }

    // Size of the biggest group of identical cards; 0 when empty
    auto LargestGroup(std::span<CardSP const> cards) -> size_t;
}

#endif //GUNZI_STRUCTURE_HPP
