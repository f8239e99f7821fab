//
// Inspector.hpp
//

#ifndef GUNZI_INSPECTOR_HPP
#define GUNZI_INSPECTOR_HPP

#include <algorithm>
#include <vector>
#include <array>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <ranges>
#include <utility>

#include "../core/Types.hpp"
#include "../core/Room.hpp"

namespace gunzi::core::debug
{
    struct Inspector
    {
        struct SnapshotAll
        {
            std::vector<Card const*> deck;
            std::vector<Card const*> bottom;
            std::vector<Card const*> played;
            std::array<std::vector<Card const*>, constants::SeatCount> hands{};
            std::vector<std::pair<SeatIdxT, std::vector<Card const*>>> trick;

            Phase phase{};
            uint32_t round{};
            std::optional<SeatIdxT> dealer;
            std::optional<SeatIdxT> turn;
            TeamScores team_points{};
            bool round_dealt{false}; // a deck exists for this round
        };

        static inline auto Gather(RoomImpl const& r) -> SnapshotAll
        {
            auto const raw = [](std::vector<CardSP> const& src, std::vector<Card const*>& dst)
            {
                dst.reserve(src.size());
                std::ranges::transform(src, std::back_inserter(dst),
                                       [](CardSP const& c) -> Card const* { return c.get(); });
            };

            SnapshotAll ret{};
            ret.phase = r.phase_;
            ret.round = r.round_;
            ret.dealer = r.dealer_;
            ret.turn = r.turn_;
            ret.team_points = r.team_points_;
            ret.round_dealt = r.phase_ != Phase::Waiting;

            raw(r.deck_, ret.deck);
            raw(r.bottom_, ret.bottom);
            raw(r.played_, ret.played);
            for (size_t i{}; i < constants::SeatCount; ++i)
                raw(r.hands_[i].Cards(), ret.hands[i]);
            for (TrickPlay const& p : r.trick_.Plays())
            {
                ret.trick.emplace_back(p.seat, std::vector<Card const*>{});
                raw(p.cards, ret.trick.back().second);
            }
            return ret;
        }

#if GZ_ENABLE_TEST_HOOKS
        // Test hooks: put a room straight into a chosen position, bypassing the deck.
        // The caller owns card-id uniqueness.
        struct Rig
        {
            Phase phase{Phase::Playing};
            std::optional<SeatIdxT> dealer{0}; // nullopt: first round, still drawing
            SeatIdxT turn{0};
            Rank level{Rank::Two};
            std::optional<Suit> main_suit;
            std::array<std::vector<CardSP>, constants::SeatCount> hands{};
            std::vector<CardSP> bottom;
            std::vector<CardSP> deck;      // undealt, dealt from the back
            TeamScores team_points{};
        };

        static inline auto Seat(RoomImpl& r, std::array<char const*, constants::SeatCount> const& names) -> void
        {
            for (size_t i{}; i < constants::SeatCount; ++i)
                r.seats_[i] = SeatState{true, names[i]};
        }

        static inline auto Apply(RoomImpl& r, Rig rig) -> void
        {
            r.ResetRound();
            r.phase_ = rig.phase;
            r.dealer_ = rig.dealer;
            r.turn_ = rig.turn;
            r.level_ = rig.level;
            r.draw_seat_ = rig.turn;
            if (rig.dealer) r.team_levels_[TeamOf(*rig.dealer)] = rig.level;
            r.main_suit_ = rig.main_suit;
            r.team_points_ = rig.team_points;
            for (size_t i{}; i < constants::SeatCount; ++i)
            {
                for (CardSP& c : rig.hands[i]) r.hands_[i].Add(std::move(c));
            }
            r.bottom_ = std::move(rig.bottom);
            r.deck_ = std::move(rig.deck);
            (void)r.DrainEvents();
        }

        static inline auto SetLevels(RoomImpl& r, TeamLevels const& levels) -> void
        {
            r.team_levels_ = levels;
        }
#endif
    };
}

#endif //GUNZI_INSPECTOR_HPP
