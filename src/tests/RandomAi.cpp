#include <gtest/gtest.h>
#include <algorithm>
#include <memory>
#include <set>

#include "../core/Cards.hpp"
#include "../core/Game.hpp"
#include "../core/RandomAi.hpp"
#include "Support.hpp"

using namespace tressette::core;
using namespace tressette::test;

TEST(RandomAi, AlwaysPicksALegalCard)
{
    Game g = DealtIdentityGame();
    std::vector<std::unique_ptr<Player>> seats;
    for (uint64_t i{}; i < 4; ++i) seats.emplace_back(std::make_unique<RandomAI>(100 + i));

    while (g.PhaseNow() == Phase::InProgress)
    {
        PlyrIdxT const seat = g.NextToPlay();
        auto const snap = *g.SnapshotFor(seat);
        Card const choice = seats[seat]->Play(snap);

        EXPECT_NE(std::ranges::find(snap->playable, choice), snap->playable.end());
        ASSERT_TRUE(g.Play(seat, choice).has_value());
    }
    EXPECT_EQ(g.PhaseNow(), Phase::GameComplete);
}

TEST(RandomAi, SpreadsOverLegalCards)
{
    Game const g = DealtIdentityGame();
    auto const snap = *g.SnapshotFor(0);
    ASSERT_EQ(snap->playable.size(), 10u);

    RandomAI ai{5};
    std::set<size_t> seen;
    for (int i{}; i < 400; ++i)
    {
        seen.insert(CanonicalIndex(ai.Play(snap)));
    }
    EXPECT_EQ(seen.size(), 10u);
}

TEST(RandomAi, SameSeedSameChoices)
{
    Game const g = DealtIdentityGame();
    auto const snap = *g.SnapshotFor(0);
    RandomAI a{77}, b{77};
    for (int i{}; i < 20; ++i)
    {
        EXPECT_EQ(a.Play(snap), b.Play(snap));
    }
}

TEST(RandomAi, RefusesToMoveOffTurn)
{
    Game const g = DealtIdentityGame();
    RandomAI ai{1};
    EXPECT_THROW((void)ai.Play(*g.SnapshotFor(1)), error::AssertionError);
}
