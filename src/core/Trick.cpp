//
// Trick.cpp
//

#include "Trick.hpp"

#include <algorithm>
#include <iterator>
#include "Deck.hpp"
#include "Exception.hpp"
#include "Structure.hpp"
#include "Util.hpp"

namespace gunzi::core
{
    // Power of an entry able to win, or nullopt when it cannot
    static auto EntryPower(TrickPlay const& play, Structure const lead_structure,
                           LogicSuit const lead_suit, TrumpContext const& ctx) -> std::optional<uint32_t>
    {
        if (Classify(play.cards) != lead_structure) return std::nullopt;
        LogicSuit const suit = EffectiveSuit(*play.cards.front(), ctx);
        if (suit != lead_suit && suit != LogicSuit::Main) return std::nullopt;
        // identical cards share suit and power; Main ranks above any natural suit
        uint32_t const band = suit == LogicSuit::Main ? 10'000u : 0u;
        return band + PowerOf(*play.cards.front(), ctx);
    }

    auto ResolveWinner(std::span<TrickPlay const> plays, TrumpContext const& ctx) -> SeatIdxT
    {
        GZ_ASSERT(!plays.empty(), "Resolving an empty trick");
        TrickPlay const& lead = plays.front();
        Structure const lead_structure = Classify(lead.cards);
        GZ_ASSERT(lead_structure != Structure::Invalid, "Trick lead is not a valid structure");
        LogicSuit const lead_suit = EffectiveSuit(*lead.cards.front(), ctx);

        SeatIdxT best_seat = lead.seat;
        uint32_t best_power = *EntryPower(lead, lead_structure, lead_suit, ctx);
        size_t best_order = 0;

        for (TrickPlay const& p : plays.subspan(1))
        {
            std::optional<uint32_t> const power = EntryPower(p, lead_structure, lead_suit, ctx);
            if (!power) continue;
            size_t const order = util::SeatDistance(lead.seat, p.seat);
            if (*power > best_power || (*power == best_power && order < best_order))
            {
                best_power = *power;
                best_seat = p.seat;
                best_order = order;
            }
        }
        return best_seat;
    }

    auto Trick::Add(SeatIdxT const seat, std::vector<CardSP> cards) -> void
    {
        GZ_ASSERT(!Full(), "Trick already full");
        GZ_ASSERT(!cards.empty(), "Empty play added to trick");
        GZ_ASSERT(std::ranges::none_of(plays_, [seat](TrickPlay const& p) { return p.seat == seat; }),
                  "Seat played twice in one trick");
        plays_.push_back(TrickPlay{seat, std::move(cards)});
    }

    auto Trick::Leader() const -> TrickPlay const&
    {
        GZ_ASSERT(!plays_.empty(), "Trick has no leader");
        return plays_.front();
    }

    auto Trick::Points() const -> uint16_t
    {
        uint16_t total{0};
        for (TrickPlay const& p : plays_) total = static_cast<uint16_t>(total + PointsOf(p.cards));
        return total;
    }

    auto Trick::Winner(TrumpContext const& ctx) const -> SeatIdxT
    {
        return ResolveWinner(plays_, ctx);
    }

    auto Trick::Release() -> std::vector<CardSP>
    {
        std::vector<CardSP> out;
        for (TrickPlay& p : plays_)
            std::ranges::move(p.cards, std::back_inserter(out));
        plays_.clear();
        return out;
    }
}
