#ifndef TRESSETTE_SCORE_HPP
#define TRESSETTE_SCORE_HPP

#include <array>
#include <optional>
#include <span>
#include <vector>
#include "Types.hpp"

namespace tressette::core
{
    using TeamScore = std::array<int, constants::TeamCount>;

    // Partners sit opposite each other.
    constexpr auto TeamOf(PlyrIdxT const seat) noexcept -> TeamIdxT
    {
        return static_cast<TeamIdxT>(seat % constants::TeamCount);
    }

    // Card points taken during one hand, kept exact.
    class ScoreBoard
    {
    public:
        explicit ScoreBoard(uint8_t n_players);

        auto Credit(PlyrIdxT seat, Points p) -> void;

        auto OfSeat(PlyrIdxT seat) const -> Points;
        auto OfTeam(TeamIdxT team) const -> Points;
        auto Total() const -> Points;
        auto Seats() const noexcept -> std::span<Points const> { return seats_; }
        // Team holding the most points, nullopt on a tie.
        auto Leader() const -> std::optional<TeamIdxT>;

    private:
        std::vector<Points> seats_;
    };

    // Whole points a hand is worth to each team, last trick bonus included.
    struct HandResult
    {
        TeamScore points{};
        TeamIdxT last_trick_team{};

        auto Total() const noexcept -> int { return points[0] + points[1]; }
        auto Winner() const noexcept -> std::optional<TeamIdxT>
        {
            if (points[0] == points[1]) return std::nullopt;
            return points[0] > points[1] ? TeamIdxT{0} : TeamIdxT{1};
        }
    };

    // Drops the thirds a team did not complete into a whole point.
    inline auto WholePoints(Points const& p) -> int
    {
        return p.numerator() / p.denominator();
    }
}

#endif //TRESSETTE_SCORE_HPP
