//
// Invariants.hpp
//

#ifndef GUNZI_INVARIANTS_HPP
#define GUNZI_INVARIANTS_HPP

#include "../core/Room.hpp"
#include "../core/Deck.hpp"
#include "Inspector.hpp"
#include <algorithm>
#include <numeric>
#include <ranges>
#include <array>
#include <unordered_set>
#include <vector>

namespace gunzi::core::debug
{
    // A second layer of checks run by the self-play tests after every accepted step.
    // Throws AssertionError on the first broken invariant.
    inline auto CheckInvariants(RoomImpl const& r) -> void
    {
#if GZ_ENABLE_TEST_HOOKS == false
        (void)r;
#else
    Inspector::SnapshotAll const s = Inspector::Gather(r);

    // 1) Trick never exceeds one entry per seat, and no seat plays twice
    GZ_ASSERT(s.trick.size() <= constants::MaxTrickEntries, "Trick holds more than six entries");
    {
        std::unordered_set<SeatIdxT> seats;
        for (auto const& [seat, cards] : s.trick)
            GZ_ASSERT(seats.insert(seat).second, "Seat appears twice in trick");
    }

    // 2) Turn-bound phases always have exactly one seat to act
    if (s.phase == Phase::Drawing || s.phase == Phase::Exchanging || s.phase == Phase::Playing)
        GZ_ASSERT(s.turn.has_value(), "No current turn in a turn-bound phase");
    if (s.phase == Phase::Exchanging || s.phase == Phase::Playing)
        GZ_ASSERT(s.dealer.has_value(), "No dealer after drawing");

    // 3) Hand sizes stay level
    {
        auto const sizes = s.hands | std::views::transform([](auto const& h) { return h.size(); });
        auto const [lo, hi] = std::ranges::minmax(sizes);
        if (s.phase == Phase::Drawing)
            GZ_ASSERT(hi - lo <= 1, "Dealing skipped a seat");
        if (s.phase == Phase::Playing && s.trick.empty())
            GZ_ASSERT(hi == lo, "Uneven hands between tricks");
    }

    if (!s.round_dealt) return;

    // 4) Deep: no duplicate Card* or id across zones + total equals 216
    {
        std::unordered_set<Card const*> seen;
        std::unordered_set<CardId> ids;
        seen.reserve(constants::DeckSize);

        uint32_t loose_points{0};
        auto push_unique = [&](Card const* p, bool const counts_loose)
        {
            GZ_ASSERT(p != nullptr, "Null card in a zone");
            GZ_ASSERT(seen.insert(p).second, "Duplicate card pointer across zones");
            GZ_ASSERT(ids.insert(p->id).second, "Duplicate card id across zones");
            if (counts_loose) loose_points += PointValue(p->rank);
        };

        for (auto p : s.deck)   push_unique(p, true);
        for (auto p : s.bottom) push_unique(p, true);
        for (auto p : s.played) push_unique(p, false);
        for (auto const& h : s.hands) for (auto const p : h) push_unique(p, true);
        for (auto const& t : s.trick) for (auto const p : t.second) push_unique(p, true);

        GZ_ASSERT(seen.size() == constants::DeckSize, "Materialized card count != 216");

        // 5) Points: credited trick points plus every uncredited card add up to the deck total
        uint32_t const credited = std::accumulate(s.team_points.begin(), s.team_points.end(), 0u);
        GZ_ASSERT(credited + loose_points == constants::TotalPoints, "Point conservation broken");
    }
#endif // GZ_ENABLE_TEST_HOOKS == true
    }
}
#endif //GUNZI_INVARIANTS_HPP
