//
// Trump.hpp
//

#ifndef GUNZI_TRUMP_HPP
#define GUNZI_TRUMP_HPP

#include "Types.hpp"

namespace gunzi::core
{
    // Suit used for following: natural suit, or Main for every trump card
    enum class LogicSuit : uint8_t
    {
        Spades = 0,
        Hearts,
        Clubs,
        Diamonds,
        Main
    };

    struct TrumpContext
    {
        std::optional<Suit> main_suit;
        Rank level{Rank::Two};
    };

    // Power bands, weakest first; value * 100 is the band base
    enum class CardClass : uint8_t
    {
        Plain = 0,
        MainSuit = 2,
        OffTwo = 4,
        MainTwo = 5,
        OffLevel = 6,
        MainLevel = 7,
        SmallJoker = 8,
        BigJoker = 9
    };

    constexpr auto IsMain(Card const& c, std::optional<Suit> const main_suit, Rank const level) noexcept -> bool
    {
        if (c.suit == Suit::Joker) return true;
        if (c.rank == level || c.rank == Rank::Two) return true;
        return main_suit.has_value() && c.suit == *main_suit;
    }

    constexpr auto IsMain(Card const& c, TrumpContext const& ctx) noexcept -> bool
    {
        return IsMain(c, ctx.main_suit, ctx.level);
    }

    constexpr auto EffectiveSuit(Card const& c, TrumpContext const& ctx) noexcept -> LogicSuit
    {
        return IsMain(c, ctx) ? LogicSuit::Main : static_cast<LogicSuit>(c.suit);
    }

    constexpr auto ClassOf(Card const& c, TrumpContext const& ctx) noexcept -> CardClass
    {
        if (c.rank == Rank::BigJoker) return CardClass::BigJoker;
        if (c.rank == Rank::SmallJoker) return CardClass::SmallJoker;

        bool const in_main_suit = ctx.main_suit.has_value() && c.suit == *ctx.main_suit;
        // a level of Two makes every 2 a level card
        if (c.rank == ctx.level) return in_main_suit ? CardClass::MainLevel : CardClass::OffLevel;
        if (c.rank == Rank::Two) return in_main_suit ? CardClass::MainTwo : CardClass::OffTwo;
        return in_main_suit ? CardClass::MainSuit : CardClass::Plain;
    }

    // Total order used by trick resolution. Only meaningful between cards of one effective suit.
    constexpr auto PowerOf(Card const& c, TrumpContext const& ctx) noexcept -> uint16_t
    {
        CardClass const cls = ClassOf(c, ctx);
        auto const base = static_cast<uint16_t>(static_cast<uint16_t>(cls) * 100);
        if (cls == CardClass::Plain || cls == CardClass::MainSuit)
            return static_cast<uint16_t>(base + static_cast<uint16_t>(c.rank));
        return base;
    }
}

#endif //GUNZI_TRUMP_HPP
