//
// DeclarationTests.cpp
//
#include <gtest/gtest.h>

#include "../core/Declaration.hpp"
#include "TestCards.hpp"

using namespace gunzi::core;
using gunzi::test::CardFactory;
using RVC = error::RuleViolationCode;

TEST(Declaration, StrengthTable)
{
    CardFactory f;
    Rank const level = Rank::Eight;

    EXPECT_EQ(DeclarationStrength(f.Copies(Suit::Clubs, Rank::Eight, 1), level), 10);
    EXPECT_EQ(DeclarationStrength(f.Copies(Suit::Clubs, Rank::Eight, 2), level), 20);
    EXPECT_EQ(DeclarationStrength(f.Copies(Suit::Clubs, Rank::Eight, 4), level), 40);
    EXPECT_EQ(DeclarationStrength(f.Copies(Suit::Joker, Rank::SmallJoker, 3), level), 50);
    EXPECT_EQ(DeclarationStrength(f.Copies(Suit::Joker, Rank::BigJoker, 3), level), 60);
    EXPECT_EQ(DeclarationStrength(f.Copies(Suit::Joker, Rank::SmallJoker, 4), level), 70);
    EXPECT_EQ(DeclarationStrength(f.Copies(Suit::Joker, Rank::BigJoker, 4), level), 80);
}

TEST(Declaration, NonDeclaringPresentations)
{
    CardFactory f;
    Rank const level = Rank::Eight;

    EXPECT_EQ(DeclarationStrength(f.Copies(Suit::Clubs, Rank::Nine, 2), level), 0);
    EXPECT_EQ(DeclarationStrength(f.Copies(Suit::Joker, Rank::BigJoker, 2), level), 0);
    std::vector<CardSP> const mixed{f.Make(Suit::Clubs, Rank::Eight), f.Make(Suit::Spades, Rank::Eight)};
    EXPECT_EQ(DeclarationStrength(mixed, level), 0);
    EXPECT_EQ(DeclarationStrength(std::span<CardSP const>{}, level), 0);
}

TEST(Declaration, SuitResolution)
{
    CardFactory f;
    std::vector<CardSP> const level_cards = f.Copies(Suit::Diamonds, Rank::Eight, 2);
    std::vector<CardSP> const jokers = f.Copies(Suit::Joker, Rank::BigJoker, 3);

    EXPECT_EQ(ResolveDeclaredSuit(level_cards, std::nullopt).value(), Suit::Diamonds);
    EXPECT_EQ(ResolveDeclaredSuit(level_cards, Suit::Diamonds).value(), Suit::Diamonds);
    EXPECT_EQ(ResolveDeclaredSuit(level_cards, Suit::Spades).error().code, RVC::InvalidDeclaration);

    EXPECT_EQ(ResolveDeclaredSuit(jokers, Suit::Clubs).value(), Suit::Clubs);
    EXPECT_EQ(ResolveDeclaredSuit(jokers, std::nullopt).error().code, RVC::InvalidDeclaration);
    EXPECT_EQ(ResolveDeclaredSuit(jokers, Suit::Joker).error().code, RVC::InvalidDeclaration);
}

TEST(Declaration, SuitFromBottomTakesHighestNaturalCard)
{
    CardFactory f;
    std::vector<CardSP> const bottom{
        f.Joker(Rank::BigJoker), f.Make(Suit::Clubs, Rank::Queen), f.Make(Suit::Spades, Rank::Four),
        f.Make(Suit::Hearts, Rank::Queen), f.Make(Suit::Diamonds, Rank::Jack), f.Joker(Rank::SmallJoker)};
    // first queen wins the tie
    EXPECT_EQ(SuitFromBottom(bottom), Suit::Clubs);

    std::vector<CardSP> const only_jokers = f.Copies(Suit::Joker, Rank::SmallJoker, 6);
    EXPECT_FALSE(SuitFromBottom(only_jokers).has_value());
}
