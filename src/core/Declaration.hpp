//
// Declaration.hpp
//

#ifndef GUNZI_DECLARATION_HPP
#define GUNZI_DECLARATION_HPP

#include <expected>
#include <span>
#include "Types.hpp"
#include "Exception.hpp"

namespace gunzi::core
{
    struct Declaration
    {
        SeatIdxT seat{};
        std::optional<Suit> suit;
        uint16_t strength{};
        std::vector<CardId> cards;
    };

    // Level cards: 10 per card. Three/four small jokers: 50/70, big jokers: 60/80.
    // Returns 0 when the cards cannot declare.
    auto DeclarationStrength(std::span<CardSP const> cards, Rank level) -> uint16_t;

    // Suit declared by a valid presentation. Level cards fix their own suit;
    // jokers take the requested natural suit.
    auto ResolveDeclaredSuit(std::span<CardSP const> cards, std::optional<Suit> requested)
        -> std::expected<Suit, error::RuleViolation>;

    // Main suit when nobody declared: suit of the highest non-joker bottom card, first on ties
    auto SuitFromBottom(std::span<CardSP const> bottom) -> std::optional<Suit>;
}

#endif //GUNZI_DECLARATION_HPP
