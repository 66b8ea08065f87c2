#include <gtest/gtest.h>
#include <algorithm>
#include <vector>

#include "../core/Deck.hpp"
#include "../core/Exception.hpp"
#include "../core/Tracker.hpp"
#include "Support.hpp"

using namespace tressette::core;
using namespace tressette::test;

namespace
{
auto IdentityTracker() -> TrickTracker
{
    TrickTracker t{4, 0};
    Deck d;
    auto hands = d.Deal(4);
    if (!hands.has_value())
        TRS_THROW(error::Code::State, error::describe(hands.error()));
    t.TakeHands(std::move(*hands));
    return t;
}

auto CodeOf(error::ValidateResult const& r) -> error::GameErrorCode
{
    return r.error().code;
}
} // anonymous namespace

TEST(Tracker, RejectionsInOrder)
{
    TrickTracker t = IdentityTracker();

    auto const bad_seat = t.Play(7, C(Suit::Hearts, Rank::Ace), true);
    ASSERT_FALSE(bad_seat.has_value());
    EXPECT_EQ(CodeOf(bad_seat), error::GameErrorCode::InvalidSeat);

    auto const not_turn = t.Play(2, C(Suit::Hearts, Rank::Three), true);
    ASSERT_FALSE(not_turn.has_value());
    EXPECT_EQ(CodeOf(not_turn), error::GameErrorCode::NotPlayerTurn);
    EXPECT_EQ(not_turn.error().expected_actor, PlyrIdxT{0});

    auto const missing = t.Play(0, C(Suit::Spades, Rank::King), true);
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(CodeOf(missing), error::GameErrorCode::CardNotInHand);

    ASSERT_TRUE(t.Play(0, C(Suit::Hearts, Rank::Ace), true).has_value());

    auto const renege = t.Play(1, C(Suit::Diamonds, Rank::Four), true);
    ASSERT_FALSE(renege.has_value());
    EXPECT_EQ(CodeOf(renege), error::GameErrorCode::IllegalPlay);
    EXPECT_EQ(renege.error().led_suit, Suit::Hearts);

    // Without the follow-suit rule the same card is fine
    EXPECT_TRUE(t.CheckPlay(1, C(Suit::Diamonds, Rank::Four), false).has_value());
}

TEST(Tracker, RejectedPlayChangesNothing)
{
    TrickTracker t = IdentityTracker();
    ASSERT_TRUE(t.Play(0, C(Suit::Hearts, Rank::Ace), true).has_value());

    std::vector<Card> const before(t.HandOf(1).begin(), t.HandOf(1).end());
    ASSERT_FALSE(t.Play(1, C(Suit::Diamonds, Rank::Four), true).has_value());

    EXPECT_TRUE(std::ranges::equal(before, t.HandOf(1)));
    EXPECT_EQ(t.CurrentTrick().Size(), 1u);
    EXPECT_EQ(t.NextToPlay(), 1);
    EXPECT_EQ(t.CardsInHands(), 39u);
}

TEST(Tracker, PlayableFollowsLedSuit)
{
    TrickTracker t = IdentityTracker();
    EXPECT_EQ(t.Playable(0, true).size(), 10u);

    ASSERT_TRUE(t.Play(0, C(Suit::Hearts, Rank::Ace), true).has_value());
    std::vector<Card> const legal = t.Playable(1, true);
    std::vector<Card> const hearts{
        C(Suit::Hearts, Rank::Two), C(Suit::Hearts, Rank::Six), C(Suit::Hearts, Rank::King)
    };
    EXPECT_EQ(legal, hearts);
    EXPECT_EQ(t.Playable(1, false).size(), 10u);
}

TEST(Tracker, VoidSeatMayDiscard)
{
    TrickTracker t{2, 0};
    t.TakeHands({
        {C(Suit::Hearts, Rank::Four), C(Suit::Diamonds, Rank::Two)},
        {C(Suit::Spades, Rank::Three), C(Suit::Clubs, Rank::Ace)}
    });
    ASSERT_TRUE(t.Play(0, C(Suit::Hearts, Rank::Four), true).has_value());
    EXPECT_EQ(t.Playable(1, true).size(), 2u);
    EXPECT_TRUE(t.Play(1, C(Suit::Spades, Rank::Three), true).has_value());
    EXPECT_TRUE(t.CurrentTrick().IsComplete());
}

TEST(Tracker, CollectTrickPassesTheLead)
{
    TrickTracker t = IdentityTracker();
    EXPECT_THROW(t.CollectTrick(0, Points{0}), error::StateError);

    ASSERT_TRUE(t.Play(0, C(Suit::Hearts, Rank::Ace), true).has_value());
    ASSERT_TRUE(t.Play(1, C(Suit::Hearts, Rank::Two), true).has_value());
    ASSERT_TRUE(t.Play(2, C(Suit::Hearts, Rank::Three), true).has_value());
    ASSERT_TRUE(t.Play(3, C(Suit::Hearts, Rank::Four), true).has_value());

    auto const full = t.CheckPlay(0, C(Suit::Hearts, Rank::Five), true);
    ASSERT_FALSE(full.has_value());
    EXPECT_EQ(CodeOf(full), error::GameErrorCode::InvalidGameState);

    CompletedTrick const& done = t.CollectTrick(2, Points(5, 3));
    EXPECT_EQ(done.taker, 2);
    EXPECT_EQ(done.points, Points(5, 3));
    EXPECT_EQ(done.trick.Leader(), 0);

    EXPECT_EQ(t.NextToPlay(), 2);
    EXPECT_TRUE(t.CurrentTrick().IsEmpty());
    EXPECT_EQ(t.TakenBy(2).size(), 4u);
    EXPECT_TRUE(t.TakenBy(0).empty());
    EXPECT_EQ(t.CardsInHands(), 36u);

    EXPECT_THROW(t.TakeHands(std::vector<std::vector<Card>>(4)), error::StateError);
}

TEST(Trick, OneCardPerSeat)
{
    Trick trick{1, 4};
    EXPECT_FALSE(trick.LedSuit().has_value());
    EXPECT_EQ(trick.NextSeat(), 1);

    trick.Add(1, C(Suit::Clubs, Rank::Seven));
    EXPECT_EQ(trick.LedSuit(), Suit::Clubs);
    EXPECT_EQ(trick.NextSeat(), 2);
    EXPECT_THROW(trick.Add(1, C(Suit::Clubs, Rank::Six)), error::StateError);

    trick.Add(2, C(Suit::Clubs, Rank::Six));
    trick.Add(3, C(Suit::Spades, Rank::Six));
    trick.Add(0, C(Suit::Hearts, Rank::Six));
    EXPECT_TRUE(trick.IsComplete());
    EXPECT_TRUE(trick.Contains(C(Suit::Spades, Rank::Six)));
    EXPECT_THROW(trick.Add(2, C(Suit::Clubs, Rank::Five)), error::StateError);
}
