//
// Declaration.cpp
//

#include "Declaration.hpp"

#include "Structure.hpp"

namespace gunzi::core
{
    auto DeclarationStrength(std::span<CardSP const> cards, Rank const level) -> uint16_t
    {
        if (Classify(cards) == Structure::Invalid) return 0;
        auto const n = static_cast<uint16_t>(cards.size());
        Rank const r = cards.front()->rank;

        if (r == Rank::SmallJoker)
            return n == 3 ? 50 : n == 4 ? 70 : 0;
        if (r == Rank::BigJoker)
            return n == 3 ? 60 : n == 4 ? 80 : 0;
        if (r == level)
            return static_cast<uint16_t>(10 * n);
        return 0;
    }

    auto ResolveDeclaredSuit(std::span<CardSP const> cards, std::optional<Suit> const requested)
        -> std::expected<Suit, error::RuleViolation>
    {
        using RVC = error::RuleViolationCode;
        if (cards.empty())
            return std::unexpected(error::Viol(RVC::InvalidDeclaration));

        Suit const natural = cards.front()->suit;
        if (natural == Suit::Joker)
        {
            if (!requested || *requested == Suit::Joker)
                return std::unexpected(error::Viol(RVC::InvalidDeclaration));
            return *requested;
        }
        if (requested && *requested != natural)
            return std::unexpected(error::Viol(RVC::InvalidDeclaration).with_card(cards.front()->id));
        return natural;
    }

    auto SuitFromBottom(std::span<CardSP const> bottom) -> std::optional<Suit>
    {
        CardSP best{};
        for (CardSP const& c : bottom)
        {
            if (c->suit == Suit::Joker) continue;
            if (!best || c->rank > best->rank) best = c;
        }
        if (!best) return std::nullopt;
        return best->suit;
    }
}
