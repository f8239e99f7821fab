//
// TrickTests.cpp
//
#include <gtest/gtest.h>

#include "../core/Trick.hpp"
#include "../core/Exception.hpp"
#include "TestCards.hpp"

using namespace gunzi::core;
using gunzi::test::CardFactory;

namespace
{
    TrumpContext const kCtx{Suit::Hearts, Rank::Five};

    auto Single(CardFactory& f, SeatIdxT const seat, Suit const s, Rank const r) -> TrickPlay
    {
        return TrickPlay{seat, {f.Make(s, r)}};
    }
}

TEST(Trick, LeaderKeepsUnbeatenTrick)
{
    CardFactory f;
    std::vector<TrickPlay> const plays{
        Single(f, 2, Suit::Clubs, Rank::Nine),
        Single(f, 3, Suit::Clubs, Rank::Three),
        Single(f, 4, Suit::Spades, Rank::Ace), // off-suit discard
    };
    EXPECT_EQ(ResolveWinner(plays, kCtx), 2);
}

TEST(Trick, HigherSameSuitAndTrumpsWin)
{
    CardFactory f;
    std::vector<TrickPlay> const follow{
        Single(f, 0, Suit::Clubs, Rank::Nine),
        Single(f, 1, Suit::Clubs, Rank::Ace),
        Single(f, 2, Suit::Clubs, Rank::Ten),
    };
    EXPECT_EQ(ResolveWinner(follow, kCtx), 1);

    std::vector<TrickPlay> const trumped{
        Single(f, 0, Suit::Clubs, Rank::Nine),
        Single(f, 1, Suit::Clubs, Rank::Ace),
        Single(f, 2, Suit::Hearts, Rank::Three),
    };
    EXPECT_EQ(ResolveWinner(trumped, kCtx), 2);
}

TEST(Trick, LevelCardsRankAboveMainSuit)
{
    CardFactory f;
    std::vector<TrickPlay> const plays{
        Single(f, 0, Suit::Clubs, Rank::King),
        Single(f, 1, Suit::Hearts, Rank::Ace),
        Single(f, 2, Suit::Spades, Rank::Five),
        Single(f, 3, Suit::Hearts, Rank::Five),
        Single(f, 4, Suit::Diamonds, Rank::Two),
    };
    EXPECT_EQ(ResolveWinner(plays, kCtx), 3);
}

TEST(Trick, StructureMustMatchToWin)
{
    CardFactory f;
    std::vector<TrickPlay> const plays{
        TrickPlay{0, f.Copies(Suit::Clubs, Rank::Four, 2)},
        // two different trumps are not a pair
        TrickPlay{1, {f.Joker(Rank::BigJoker), f.Joker(Rank::SmallJoker)}},
        TrickPlay{2, f.Copies(Suit::Clubs, Rank::Three, 2)},
    };
    EXPECT_EQ(ResolveWinner(plays, kCtx), 0);

    std::vector<TrickPlay> const trump_pair{
        TrickPlay{0, f.Copies(Suit::Clubs, Rank::Four, 2)},
        TrickPlay{1, f.Copies(Suit::Hearts, Rank::Three, 2)},
    };
    EXPECT_EQ(ResolveWinner(trump_pair, kCtx), 1);
}

TEST(Trick, IdenticalCardsGoToSeatClosestToLeader)
{
    CardFactory f;
    // leader 4; seat 5 is one step away, seat 0 two steps; stored out of seat order
    std::vector<TrickPlay> const plays{
        Single(f, 4, Suit::Spades, Rank::Nine),
        Single(f, 0, Suit::Spades, Rank::Ace),
        Single(f, 5, Suit::Spades, Rank::Ace),
    };
    EXPECT_EQ(ResolveWinner(plays, kCtx), 5);

    std::vector<TrickPlay> const off_levels{
        Single(f, 1, Suit::Clubs, Rank::Nine),
        Single(f, 2, Suit::Spades, Rank::Five),
        Single(f, 3, Suit::Diamonds, Rank::Five),
    };
    EXPECT_EQ(ResolveWinner(off_levels, kCtx), 2);
}

TEST(Trick, TracksEntriesAndPoints)
{
    CardFactory f;
    Trick t;
    EXPECT_TRUE(t.Empty());

    t.Add(3, {f.Make(Suit::Clubs, Rank::King)});
    t.Add(4, {f.Make(Suit::Clubs, Rank::Five)});
    t.Add(5, {f.Make(Suit::Clubs, Rank::Ten)});
    t.Add(0, {f.Make(Suit::Clubs, Rank::Two)});
    t.Add(1, {f.Make(Suit::Clubs, Rank::Three)});
    EXPECT_FALSE(t.Full());
    EXPECT_THROW(t.Add(3, {f.Make(Suit::Clubs, Rank::Four)}), error::AssertionError);
    t.Add(2, {f.Make(Suit::Clubs, Rank::Ace)});

    EXPECT_TRUE(t.Full());
    EXPECT_EQ(t.Leader().seat, 3);
    EXPECT_EQ(t.Points(), 25);
    // at level Five both C5 and C2 are main; the off-suit level card outranks the off-suit two
    EXPECT_EQ(t.Winner(kCtx), 4);
    EXPECT_THROW(t.Add(4, {f.Make(Suit::Clubs, Rank::Four)}), error::AssertionError);

    std::vector<CardSP> const released = t.Release();
    EXPECT_EQ(released.size(), 6u);
    EXPECT_TRUE(t.Empty());
}
