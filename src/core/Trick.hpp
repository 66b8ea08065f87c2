#ifndef TRESSETTE_TRICK_HPP
#define TRESSETTE_TRICK_HPP

#include <optional>
#include <span>
#include <vector>
#include "Types.hpp"

namespace tressette::core
{
    struct TrickPlay
    {
        PlyrIdxT seat{};
        Card card;
    };
    inline auto operator==(TrickPlay const& a, TrickPlay const& b) -> bool
    {
        return a.seat == b.seat && a.card == b.card;
    }

    // Cards laid during one round, in play order. One card per seat at most.
    class Trick
    {
    public:
        Trick(PlyrIdxT leader, uint8_t n_players);

        // Throws StateError when the trick is full or the seat already played.
        auto Add(PlyrIdxT seat, Card c) -> void;

        auto Leader() const noexcept -> PlyrIdxT { return leader_; }
        auto LedSuit() const noexcept -> std::optional<Suit>;
        auto Plays() const noexcept -> std::span<TrickPlay const> { return plays_; }
        auto Size() const noexcept -> size_t { return plays_.size(); }
        auto IsEmpty() const noexcept -> bool { return plays_.empty(); }
        auto IsComplete() const noexcept -> bool { return plays_.size() == n_players_; }
        auto HasPlayed(PlyrIdxT seat) const -> bool;
        auto Contains(Card const& c) const -> bool;
        // Seat expected to play next, assuming clockwise rotation from the leader.
        auto NextSeat() const noexcept -> PlyrIdxT;

    private:
        PlyrIdxT leader_;
        uint8_t n_players_;
        std::vector<TrickPlay> plays_;
    };

    struct CompletedTrick
    {
        Trick trick;
        PlyrIdxT taker{};
        Points points{};
    };
}

#endif //TRESSETTE_TRICK_HPP
