#include <gtest/gtest.h>

#include "../core/Exception.hpp"
#include "../core/Score.hpp"

using namespace tressette::core;

TEST(Score, TeamsSitOpposite)
{
    EXPECT_EQ(TeamOf(0), 0);
    EXPECT_EQ(TeamOf(1), 1);
    EXPECT_EQ(TeamOf(2), 0);
    EXPECT_EQ(TeamOf(3), 1);
}

TEST(Score, ExactThirds)
{
    ScoreBoard board{4};
    for (int i{}; i < 3; ++i) board.Credit(2, Points(1, 3));
    board.Credit(0, Points(1, 3));

    EXPECT_EQ(board.OfSeat(2), Points(1));
    EXPECT_EQ(board.OfTeam(0), Points(4, 3));
    EXPECT_EQ(board.OfTeam(1), Points(0));
    EXPECT_EQ(board.Total(), Points(4, 3));
    EXPECT_EQ(board.Leader(), TeamIdxT{0});
    EXPECT_EQ(WholePoints(board.OfTeam(0)), 1);
}

TEST(Score, TieHasNoLeader)
{
    ScoreBoard board{2};
    EXPECT_FALSE(board.Leader().has_value());
    board.Credit(0, Points(2, 3));
    board.Credit(1, Points(2, 3));
    EXPECT_FALSE(board.Leader().has_value());
}

TEST(Score, MisuseThrows)
{
    ScoreBoard board{4};
    EXPECT_THROW(board.Credit(4, Points(1)), error::AssertionError);
    EXPECT_THROW(board.Credit(0, Points(-1, 3)), error::AssertionError);
    EXPECT_THROW((void)board.OfSeat(9), error::AssertionError);
}

TEST(Score, HandResultWinner)
{
    HandResult r{};
    r.points = {5, 6};
    EXPECT_EQ(r.Winner(), TeamIdxT{1});
    r.points = {6, 5};
    EXPECT_EQ(r.Winner(), TeamIdxT{0});
}
