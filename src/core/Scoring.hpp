//
// Scoring.hpp
//

#ifndef GUNZI_SCORING_HPP
#define GUNZI_SCORING_HPP

#include "Types.hpp"

namespace gunzi::core
{
    struct RoundSettlement
    {
        TeamScores team_points{};      // trick points plus Kou Di bonus
        uint16_t bottom_points{};
        uint16_t kou_di_bonus{};
        TeamIdxT dealer_team{};
        std::optional<TeamIdxT> catching_winner; // set when a catching team reached the threshold
        SeatIdxT next_dealer{};
        TeamLevels levels_after{};
        Rank next_level{Rank::Two};    // level in play next round
        std::optional<TeamIdxT> match_winner;
    };

    // Bonus credited to the final trick's winner. Zero when the dealer's team takes the final trick.
    // Saturates at constants::MaxKouDiBonus.
    constexpr auto KouDiBonus(uint16_t const bottom_points, TeamIdxT const final_winner_team,
                              TeamIdxT const dealer_team, uint16_t const multiplier) noexcept -> uint16_t
    {
        if (final_winner_team == dealer_team) return 0;
        uint32_t const bonus = static_cast<uint32_t>(bottom_points) * multiplier;
        return bonus > constants::MaxKouDiBonus ? constants::MaxKouDiBonus : static_cast<uint16_t>(bonus);
    }

    // Best score among the non-dealer teams
    auto CatchingScore(TeamScores const& points, TeamIdxT dealer_team) -> uint16_t;

    // `trick_points` are the per-team tallies credited during play.
    auto Settle(TeamScores const& trick_points,
                uint16_t bottom_points,
                SeatIdxT final_trick_winner,
                SeatIdxT dealer,
                TeamLevels const& levels,
                RoomConfig const& cfg) -> RoundSettlement;
}

#endif //GUNZI_SCORING_HPP
