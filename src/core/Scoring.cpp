//
// Scoring.cpp
//

#include "Scoring.hpp"

#include <algorithm>
#include <format>
#include "Exception.hpp"
#include "Util.hpp"

namespace gunzi::core
{
    auto CatchingScore(TeamScores const& points, TeamIdxT const dealer_team) -> uint16_t
    {
        uint16_t best{0};
        for (TeamIdxT t{0}; t < constants::TeamCount; ++t)
        {
            if (t == dealer_team) continue;
            best = std::max(best, points[t]);
        }
        return best;
    }

    // First seat of `team` strictly clockwise after `from`
    static auto NextSeatOfTeam(SeatIdxT const from, TeamIdxT const team) -> SeatIdxT
    {
        SeatIdxT s = util::NextSeat(from);
        for (size_t i{0}; i < constants::SeatCount; ++i, s = util::NextSeat(s))
        {
            if (TeamOf(s) == team) return s;
        }
        GZ_THROW(error::Code::Rules, std::format("No seat for team {}", static_cast<int>(team)));
    }

    auto Settle(TeamScores const& trick_points,
                uint16_t const bottom_points,
                SeatIdxT const final_trick_winner,
                SeatIdxT const dealer,
                TeamLevels const& levels,
                RoomConfig const& cfg) -> RoundSettlement
    {
        GZ_ASSERT(dealer < constants::SeatCount, "Dealer seat out of range");
        GZ_ASSERT(final_trick_winner < constants::SeatCount, "Final trick winner out of range");

        RoundSettlement out{};
        out.dealer_team = TeamOf(dealer);
        out.bottom_points = bottom_points;
        out.team_points = trick_points;
        out.levels_after = levels;

        TeamIdxT const final_team = TeamOf(final_trick_winner);
        out.kou_di_bonus = KouDiBonus(bottom_points, final_team, out.dealer_team, cfg.kou_di_multiplier);
        out.team_points[final_team] = static_cast<uint16_t>(out.team_points[final_team] + out.kou_di_bonus);

        // Catching teams in clockwise order from the dealer, so ties go to the earlier one
        std::optional<TeamIdxT> winner;
        SeatIdxT s = util::NextSeat(dealer);
        for (size_t i{1}; i < constants::TeamCount + 1; ++i, s = util::NextSeat(s))
        {
            TeamIdxT const t = TeamOf(s);
            if (t == out.dealer_team) continue;
            uint16_t const pts = out.team_points[t];
            if (pts < cfg.catch_threshold) continue;
            if (!winner || pts > out.team_points[*winner]) winner = t;
        }

        if (!winner)
        {
            out.next_dealer = NextSeatOfTeam(dealer, out.dealer_team);
            auto const raised = static_cast<int>(levels[out.dealer_team]) + cfg.level_step;
            if (raised > static_cast<int>(Rank::Ace))
            {
                out.match_winner = out.dealer_team;
                out.levels_after[out.dealer_team] = Rank::Ace;
            }
            else
            {
                out.levels_after[out.dealer_team] = static_cast<Rank>(raised);
            }
        }
        else
        {
            out.catching_winner = winner;
            out.next_dealer = NextSeatOfTeam(dealer, *winner);
        }
        out.next_level = out.levels_after[TeamOf(out.next_dealer)];
        return out;
    }
}
