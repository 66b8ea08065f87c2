#include "Trick.hpp"

#include <algorithm>
#include "Exception.hpp"

namespace tressette::core
{
    Trick::Trick(PlyrIdxT const leader, uint8_t const n_players) :
        leader_(leader),
        n_players_(n_players)
    {
        TRS_ASSERT(n_players_ > 0 && leader_ < n_players_, "Trick leader outside the table");
        plays_.reserve(n_players_);
    }

    auto Trick::Add(PlyrIdxT const seat, Card const c) -> void
    {
        if (IsComplete())
            TRS_THROW(error::Code::State, "Trick already holds a card from every seat");
        if (HasPlayed(seat))
            TRS_THROW(error::Code::State, "Seat already played in this trick");
        plays_.push_back(TrickPlay{seat, c});
    }

    auto Trick::LedSuit() const noexcept -> std::optional<Suit>
    {
        if (plays_.empty()) return std::nullopt;
        return plays_.front().card.suit;
    }

    auto Trick::HasPlayed(PlyrIdxT const seat) const -> bool
    {
        return std::ranges::any_of(plays_, [seat](TrickPlay const& p) { return p.seat == seat; });
    }

    auto Trick::Contains(Card const& c) const -> bool
    {
        return std::ranges::any_of(plays_, [&c](TrickPlay const& p) { return p.card == c; });
    }

    auto Trick::NextSeat() const noexcept -> PlyrIdxT
    {
        return static_cast<PlyrIdxT>((leader_ + plays_.size()) % n_players_);
    }
}
