//
// Deck.hpp
//

#ifndef GUNZI_DECK_HPP
#define GUNZI_DECK_HPP

#include <random>
#include <span>
#include "Types.hpp"

namespace gunzi::core
{
    // Builds the 216-card match deck. Ids are assigned in construction order, then shuffled.
    auto BuildDeck(std::mt19937_64& rng) -> std::vector<CardSP>;

    // Throws error::Code::State when the deck is not exactly 4 copies of every card with unique ids.
    auto VerifyDeck(std::span<CardSP const> deck) -> void;

    constexpr auto PointValue(Rank const r) noexcept -> uint16_t
    {
        switch (r)
        {
        case Rank::Five: return 5;
        case Rank::Ten:
        case Rank::King: return 10;
        default: return 0;
        }
    }

    auto PointsOf(std::span<CardSP const> cards) -> uint16_t;
}

#endif //GUNZI_DECK_HPP
