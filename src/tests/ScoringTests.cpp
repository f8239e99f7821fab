//
// ScoringTests.cpp
//
#include <gtest/gtest.h>

#include "../core/Scoring.hpp"

using namespace gunzi::core;

namespace
{
    auto Levels(Rank const r) -> TeamLevels { return TeamLevels{r, r, r}; }
}

TEST(Scoring, KouDiBonusOnlyForCatchingTeams)
{
    EXPECT_EQ(KouDiBonus(25, 0, 0, 2), 0);
    EXPECT_EQ(KouDiBonus(25, 1, 0, 2), 50);
    EXPECT_EQ(KouDiBonus(0, 2, 0, 2), 0);
    EXPECT_EQ(CatchingScore(TeamScores{300, 40, 90}, 0), 90);
}

TEST(Scoring, DealerDefendsAndLevelsUp)
{
    RoomConfig const cfg{};
    RoundSettlement const s = Settle(TeamScores{200, 100, 80}, 20, 3, 0, Levels(Rank::Two), cfg);

    EXPECT_EQ(s.kou_di_bonus, 0);
    EXPECT_FALSE(s.catching_winner.has_value());
    EXPECT_EQ(s.levels_after[0], Rank::Three);
    EXPECT_EQ(s.levels_after[1], Rank::Two);
    EXPECT_EQ(s.next_dealer, 3);
    EXPECT_EQ(s.next_level, Rank::Three);
    EXPECT_FALSE(s.match_winner.has_value());
}

TEST(Scoring, ThresholdIsInclusive)
{
    RoomConfig const cfg{};
    RoundSettlement const s = Settle(TeamScores{170, 130, 100}, 0, 0, 0, Levels(Rank::Four), cfg);

    ASSERT_TRUE(s.catching_winner.has_value());
    EXPECT_EQ(*s.catching_winner, 1);
    EXPECT_EQ(s.next_dealer, 1);
    EXPECT_EQ(s.levels_after, Levels(Rank::Four));
    EXPECT_EQ(s.next_level, Rank::Four);
}

TEST(Scoring, KouDiBonusCanDecideTheRound)
{
    RoomConfig const cfg{};
    // team 1 takes the final trick: 100 + 20 * 2
    RoundSettlement const s = Settle(TeamScores{180, 100, 100}, 20, 4, 3, Levels(Rank::Six), cfg);

    EXPECT_EQ(s.kou_di_bonus, 40);
    EXPECT_EQ(s.team_points[1], 140);
    ASSERT_TRUE(s.catching_winner.has_value());
    EXPECT_EQ(*s.catching_winner, 1);
    // dealer 3, next team-1 seat clockwise is 4
    EXPECT_EQ(s.next_dealer, 4);
}

TEST(Scoring, TiedCatchersFavourFirstAfterDealer)
{
    RoomConfig const cfg{};
    RoundSettlement const from0 = Settle(TeamScores{100, 150, 150}, 0, 0, 0, Levels(Rank::Two), cfg);
    EXPECT_EQ(from0.catching_winner, TeamIdxT{1});

    // dealer 2: seat 3 (team 0) comes before seat 4 (team 1)
    RoundSettlement const from2 = Settle(TeamScores{150, 150, 100}, 0, 2, 2, Levels(Rank::Two), cfg);
    EXPECT_EQ(from2.catching_winner, TeamIdxT{0});
    EXPECT_EQ(from2.next_dealer, 3);

    RoundSettlement const higher = Settle(TeamScores{100, 140, 160}, 0, 0, 0, Levels(Rank::Two), cfg);
    EXPECT_EQ(higher.catching_winner, TeamIdxT{2});
    EXPECT_EQ(higher.next_dealer, 2);
}

TEST(Scoring, PassingAceEndsTheMatch)
{
    RoomConfig cfg{};
    RoundSettlement const s = Settle(TeamScores{50, 50, 300}, 0, 5, 5, Levels(Rank::Ace), cfg);
    EXPECT_EQ(s.match_winner, TeamIdxT{2});
    EXPECT_EQ(s.levels_after[2], Rank::Ace);

    cfg.level_step = 2;
    RoundSettlement const jump = Settle(TeamScores{50, 300, 50}, 0, 1, 1, Levels(Rank::King), cfg);
    EXPECT_EQ(jump.match_winner, TeamIdxT{1});

    RoundSettlement const to_ace = Settle(TeamScores{50, 300, 50}, 0, 1, 1, Levels(Rank::Queen), cfg);
    EXPECT_FALSE(to_ace.match_winner.has_value());
    EXPECT_EQ(to_ace.levels_after[1], Rank::Ace);
}

TEST(Scoring, CustomThresholdAndMultiplier)
{
    RoomConfig cfg{};
    cfg.catch_threshold = 60;
    cfg.kou_di_multiplier = 4;
    RoundSettlement const s = Settle(TeamScores{300, 40, 50}, 5, 2, 0, Levels(Rank::Two), cfg);
    EXPECT_EQ(s.kou_di_bonus, 20);
    EXPECT_EQ(s.team_points[2], 70);
    EXPECT_EQ(s.catching_winner, TeamIdxT{2});
}

TEST(Scoring, KouDiBonusSaturates)
{
    EXPECT_EQ(KouDiBonus(60, 1, 0, 2000), constants::MaxKouDiBonus);
    EXPECT_EQ(KouDiBonus(60, 1, 0, 1000), 60000);

    RoomConfig cfg{};
    cfg.kou_di_multiplier = 60000;
    RoundSettlement const s = Settle(TeamScores{100, 180, 60}, 60, 1, 0, Levels(Rank::Two), cfg);
    EXPECT_EQ(s.kou_di_bonus, constants::MaxKouDiBonus);
    EXPECT_EQ(s.team_points[1], 180 + constants::MaxKouDiBonus);
    EXPECT_GT(s.team_points[1], s.team_points[0]);
    EXPECT_EQ(s.catching_winner, TeamIdxT{1});
}
