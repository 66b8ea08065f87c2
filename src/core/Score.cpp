#include "Score.hpp"

#include <numeric>
#include "Exception.hpp"

namespace tressette::core
{
    ScoreBoard::ScoreBoard(uint8_t const n_players) :
        seats_(n_players, Points{0})
    {
        TRS_ASSERT(n_players > 0, "Score board without seats");
    }

    auto ScoreBoard::Credit(PlyrIdxT const seat, Points const p) -> void
    {
        TRS_ASSERT(seat < seats_.size(), "Crediting a seat outside the table");
        TRS_ASSERT(p >= 0, "Negative trick value");
        seats_[seat] += p;
    }

    auto ScoreBoard::OfSeat(PlyrIdxT const seat) const -> Points
    {
        TRS_ASSERT(seat < seats_.size(), "Seat outside the table");
        return seats_[seat];
    }

    auto ScoreBoard::OfTeam(TeamIdxT const team) const -> Points
    {
        Points sum{0};
        for (size_t seat{}; seat < seats_.size(); ++seat)
        {
            if (TeamOf(static_cast<PlyrIdxT>(seat)) == team) sum += seats_[seat];
        }
        return sum;
    }

    auto ScoreBoard::Total() const -> Points
    {
        return std::accumulate(seats_.cbegin(), seats_.cend(), Points{0});
    }

    auto ScoreBoard::Leader() const -> std::optional<TeamIdxT>
    {
        Points const a = OfTeam(0);
        Points const b = OfTeam(1);
        if (a == b) return std::nullopt;
        return a > b ? TeamIdxT{0} : TeamIdxT{1};
    }
}
