#include <gtest/gtest.h>
#include <algorithm>
#include <array>
#include <fmt/format.h>

#include "../core/Cards.hpp"
#include "../core/Types.hpp"

using namespace tressette::core;

TEST(Cards, TrickStrengthOrder)
{
    std::array<Rank, constants::RankCount> const weakest_first{
        Rank::Four, Rank::Five, Rank::Six, Rank::Seven, Rank::Jack,
        Rank::Knight, Rank::King, Rank::Ace, Rank::Two, Rank::Three
    };
    for (size_t i{1}; i < weakest_first.size(); ++i)
    {
        EXPECT_TRUE(StrongerThan(weakest_first[i], weakest_first[i - 1]));
        EXPECT_FALSE(StrongerThan(weakest_first[i - 1], weakest_first[i]));
    }
    EXPECT_FALSE(StrongerThan(Rank::Ace, Rank::Ace));
}

TEST(Cards, PointValues)
{
    EXPECT_EQ(PointValue(Rank::Ace), Points(1));
    for (Rank const r : {Rank::Two, Rank::Three, Rank::Jack, Rank::Knight, Rank::King})
        EXPECT_EQ(PointValue(r), Points(1, 3));
    for (Rank const r : {Rank::Four, Rank::Five, Rank::Six, Rank::Seven})
        EXPECT_EQ(PointValue(r), Points(0));

    Points total{0};
    for (Suit const s : AllSuits)
        for (Rank const r : AllRanks)
            total += PointValue(Card{s, r});
    EXPECT_EQ(total, Points(32, 3));
}

TEST(Cards, CanonicalOrderIsSuitMajor)
{
    EXPECT_EQ(CanonicalIndex(Card{Suit::Hearts, Rank::Ace}), 0u);
    EXPECT_EQ(CanonicalIndex(Card{Suit::Hearts, Rank::King}), 9u);
    EXPECT_EQ(CanonicalIndex(Card{Suit::Diamonds, Rank::Ace}), 10u);
    EXPECT_EQ(CanonicalIndex(Card{Suit::Spades, Rank::King}), 39u);
    EXPECT_TRUE(CanonicalLess(Card{Suit::Hearts, Rank::King}, Card{Suit::Diamonds, Rank::Ace}));
    EXPECT_FALSE(CanonicalLess(Card{Suit::Clubs, Rank::Two}, Card{Suit::Clubs, Rank::Two}));
}

TEST(Cards, ValueEquality)
{
    Card const a{Suit::Clubs, Rank::Knight};
    Card const b{Suit::Clubs, Rank::Knight};
    EXPECT_EQ(a, b);
    EXPECT_FALSE(a == (Card{Suit::Spades, Rank::Knight}));
}

TEST(Cards, Rendering)
{
    EXPECT_EQ(ToString(Card{Suit::Hearts, Rank::Ace}), "1H");
    EXPECT_EQ(ToString(Card{Suit::Spades, Rank::King}), "10S");
    EXPECT_EQ(ToString(Card{Suit::Diamonds, Rank::Jack}), "8D");
    EXPECT_EQ(fmt::format("{}", Card{Suit::Clubs, Rank::Seven}), "7C");

    EXPECT_EQ(ToString(Points(5, 3)), "5/3");
    EXPECT_EQ(ToString(Points(3, 3)), "1");
    EXPECT_EQ(FaceValue(Rank::Knight), 9);
}

TEST(Cards, FrenchAndJokerRendering)
{
    EXPECT_EQ(ToString(FrenchCard{Suit::Hearts, FrenchRank::Ace}), "1H");
    EXPECT_EQ(ToString(FrenchCard{Suit::Clubs, FrenchRank::Queen}), "12C");
    EXPECT_EQ(ToString(Joker{}), "JK");

    FrenchOrJoker const ten{FrenchCard{Suit::Diamonds, FrenchRank::Ten}};
    FrenchOrJoker const joker{Joker{}};
    EXPECT_EQ(fmt::format("{} {}", ten, joker), "10D JK");
    EXPECT_FALSE(IsJoker(ten));
    EXPECT_TRUE(IsJoker(joker));
    EXPECT_TRUE(joker == FrenchOrJoker{Joker{}});
    EXPECT_EQ(CanonicalIndex(FrenchCard{Suit::Spades, FrenchRank::King}), constants::FrenchDeckSize - 1);
}
