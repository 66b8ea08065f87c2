#ifndef TRESSETTE_TRACKER_HPP
#define TRESSETTE_TRACKER_HPP

#include <span>
#include <vector>
#include "Types.hpp"
#include "Exception.hpp"
#include "Trick.hpp"

namespace tressette::core
{
    // Hands held by each seat, the trick on the table and the tricks already
    // taken. Every card of the deal lives in exactly one of those places.
    class TrickTracker
    {
    public:
        TrickTracker(uint8_t n_players, PlyrIdxT leader);

        // Replaces every hand; throws if the table is not fresh.
        auto TakeHands(std::vector<std::vector<Card>> hands) -> void;

        [[nodiscard]]
        auto CheckPlay(PlyrIdxT seat, Card const& c, bool follow_suit) const -> error::ValidateResult;
        // Moves the card from the hand onto the trick. Rejected plays change nothing.
        auto Play(PlyrIdxT seat, Card const& c, bool follow_suit) -> error::ValidateResult;
        auto Playable(PlyrIdxT seat, bool follow_suit) const -> std::vector<Card>;

        // Archives the complete trick for `taker`, who leads the next one.
        auto CollectTrick(PlyrIdxT taker, Points points) -> CompletedTrick const&;

        auto CurrentTrick() const noexcept -> Trick const& { return trick_; }
        auto HandOf(PlyrIdxT seat) const -> std::span<Card const>;
        auto NextToPlay() const noexcept -> PlyrIdxT { return trick_.NextSeat(); }
        auto Completed() const noexcept -> std::span<CompletedTrick const> { return completed_; }
        auto TakenBy(PlyrIdxT seat) const -> std::vector<Card>;
        auto CardsInHands() const -> size_t;
        auto AllHandsEmpty() const -> bool { return CardsInHands() == 0; }
        auto PlayerCount() const noexcept -> uint8_t { return n_players_; }

    private:
        auto HoldsSuit(PlyrIdxT seat, Suit s) const -> bool;

        uint8_t n_players_;
        std::vector<std::vector<Card>> hands_;
        Trick trick_;
        std::vector<CompletedTrick> completed_;
    };
}

#endif //TRESSETTE_TRACKER_HPP
