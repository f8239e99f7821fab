//
// TrumpTests.cpp
//
#include <gtest/gtest.h>
#include <array>

#include "../core/Trump.hpp"

using namespace gunzi::core;

namespace
{
    auto C(Suit const s, Rank const r) -> Card { return Card{0, s, r}; }
}

TEST(Trump, MainMembership)
{
    TrumpContext const ctx{Suit::Hearts, Rank::Seven};

    EXPECT_TRUE(IsMain(C(Suit::Joker, Rank::BigJoker), ctx));
    EXPECT_TRUE(IsMain(C(Suit::Joker, Rank::SmallJoker), ctx));
    EXPECT_TRUE(IsMain(C(Suit::Spades, Rank::Seven), ctx));
    EXPECT_TRUE(IsMain(C(Suit::Clubs, Rank::Two), ctx));
    EXPECT_TRUE(IsMain(C(Suit::Hearts, Rank::Four), ctx));
    EXPECT_FALSE(IsMain(C(Suit::Spades, Rank::Ace), ctx));
    EXPECT_FALSE(IsMain(C(Suit::Diamonds, Rank::Eight), ctx));

    EXPECT_EQ(EffectiveSuit(C(Suit::Spades, Rank::Seven), ctx), LogicSuit::Main);
    EXPECT_EQ(EffectiveSuit(C(Suit::Spades, Rank::Eight), ctx), LogicSuit::Spades);
}

TEST(Trump, NoMainSuitStillHasFixedTrumps)
{
    TrumpContext const ctx{std::nullopt, Rank::Nine};
    EXPECT_TRUE(IsMain(C(Suit::Diamonds, Rank::Nine), ctx));
    EXPECT_TRUE(IsMain(C(Suit::Diamonds, Rank::Two), ctx));
    EXPECT_FALSE(IsMain(C(Suit::Hearts, Rank::Ace), ctx));
    EXPECT_EQ(ClassOf(C(Suit::Diamonds, Rank::Nine), ctx), CardClass::OffLevel);
}

TEST(Trump, PowerOrderWithinMain)
{
    TrumpContext const ctx{Suit::Hearts, Rank::Seven};

    // strongest first
    std::array<Card, 8> const ladder{
        C(Suit::Joker, Rank::BigJoker),
        C(Suit::Joker, Rank::SmallJoker),
        C(Suit::Hearts, Rank::Seven),
        C(Suit::Spades, Rank::Seven),
        C(Suit::Hearts, Rank::Two),
        C(Suit::Clubs, Rank::Two),
        C(Suit::Hearts, Rank::Ace),
        C(Suit::Hearts, Rank::Three),
    };
    for (size_t i{1}; i < ladder.size(); ++i)
        EXPECT_GT(PowerOf(ladder[i - 1], ctx), PowerOf(ladder[i], ctx)) << "position " << i;

    // off-suit level cards tie with each other
    EXPECT_EQ(PowerOf(C(Suit::Spades, Rank::Seven), ctx), PowerOf(C(Suit::Clubs, Rank::Seven), ctx));
    EXPECT_EQ(PowerOf(C(Suit::Spades, Rank::Two), ctx), PowerOf(C(Suit::Diamonds, Rank::Two), ctx));
}

TEST(Trump, LevelTwoMergesTwosIntoLevelCards)
{
    TrumpContext const ctx{Suit::Spades, Rank::Two};
    EXPECT_EQ(ClassOf(C(Suit::Spades, Rank::Two), ctx), CardClass::MainLevel);
    EXPECT_EQ(ClassOf(C(Suit::Hearts, Rank::Two), ctx), CardClass::OffLevel);
    EXPECT_GT(PowerOf(C(Suit::Hearts, Rank::Two), ctx), PowerOf(C(Suit::Spades, Rank::Ace), ctx));
}

TEST(Trump, PlainCardsFollowRank)
{
    TrumpContext const ctx{Suit::Hearts, Rank::Seven};
    EXPECT_GT(PowerOf(C(Suit::Spades, Rank::Ace), ctx), PowerOf(C(Suit::Spades, Rank::King), ctx));
    EXPECT_GT(PowerOf(C(Suit::Spades, Rank::Four), ctx), PowerOf(C(Suit::Spades, Rank::Three), ctx));
    EXPECT_EQ(ClassOf(C(Suit::Clubs, Rank::Ace), ctx), CardClass::Plain);
}
