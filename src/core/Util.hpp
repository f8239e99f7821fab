//
// Util.hpp
//

#ifndef GUNZI_UTIL_HPP
#define GUNZI_UTIL_HPP

#include <algorithm>
#include <iterator>
#include <bitset>
#include <span>
#include <memory>
#include <vector>
#include "Types.hpp"

namespace gunzi::core::util
{
    class IdUniqueChecker
    {
    public:
        IdUniqueChecker():
            seen_{}, contains_dup_(false), out_of_range_(false) {}
        auto Add(CardId const id) -> void
        {
            if (id >= constants::DeckSize)
            {
                out_of_range_ = true;
                return;
            }
            contains_dup_ |= seen_.test(id);
            seen_.set(id);
        }
        [[nodiscard]]
        auto ContainsDup() const -> bool
        {
            return contains_dup_;
        }
        [[nodiscard]]
        auto OutOfRange() const -> bool
        {
            return out_of_range_;
        }
    private:
        std::bitset<constants::DeckSize> seen_;
        bool contains_dup_;
        bool out_of_range_;
    };

    inline auto ToVal(Card const& c) -> CardVal
    {
        return CardVal{c.id, c.suit, c.rank};
    }

    inline auto ToVals(std::span<CardSP const> cards) -> std::vector<CardVal>
    {
        std::vector<CardVal> out;
        out.reserve(cards.size());
        std::ranges::transform(cards, std::back_inserter(out),
                               [](CardSP const& c) { return ToVal(*c); });
        return out;
    }

    inline auto NextSeat(SeatIdxT const idx) noexcept -> SeatIdxT
    {
        return static_cast<SeatIdxT>((idx + 1) % constants::SeatCount);
    }

    // Clockwise distance from `from` to `to`
    inline auto SeatDistance(SeatIdxT const from, SeatIdxT const to) noexcept -> std::size_t
    {
        return (to + constants::SeatCount - from) % constants::SeatCount;
    }
}

#endif //GUNZI_UTIL_HPP
