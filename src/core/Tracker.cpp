#include "Tracker.hpp"

#include <algorithm>
#include <iterator>
#include <numeric>
#include <utility>

namespace tressette::core
{
    TrickTracker::TrickTracker(uint8_t const n_players, PlyrIdxT const leader) :
        n_players_(n_players),
        hands_(n_players),
        trick_(leader, n_players)
    {
    }

    auto TrickTracker::TakeHands(std::vector<std::vector<Card>> hands) -> void
    {
        TRS_ASSERT(hands.size() == n_players_, "One hand per seat required");
        if (!trick_.IsEmpty() || !completed_.empty())
            TRS_THROW(error::Code::State, "Hands dealt onto a table already in play");
        hands_ = std::move(hands);
    }

    auto TrickTracker::HoldsSuit(PlyrIdxT const seat, Suit const s) const -> bool
    {
        return std::ranges::any_of(hands_[seat], [s](Card const& c) { return c.suit == s; });
    }

    auto TrickTracker::CheckPlay(PlyrIdxT const seat, Card const& c, bool const follow_suit) const
        -> error::ValidateResult
    {
        using error::GameErrorCode;
        if (seat >= n_players_)
            return std::unexpected(error::Err(GameErrorCode::InvalidSeat)
                                   .with_actor(seat).with_players(n_players_));

        if (trick_.IsComplete())
            return std::unexpected(error::Err(GameErrorCode::InvalidGameState)
                                   .with_phase(Phase::TrickComplete).with_actor(seat));

        if (seat != trick_.NextSeat())
            return std::unexpected(error::Err(GameErrorCode::NotPlayerTurn)
                                   .with_actor(seat).with_expected(trick_.NextSeat()));

        auto const& hand = hands_[seat];
        if (std::ranges::find(hand, c) == std::end(hand))
            return std::unexpected(error::Err(GameErrorCode::CardNotInHand)
                                   .with_actor(seat).with_card(c));

        if (auto const led = trick_.LedSuit(); follow_suit && led && c.suit != *led && HoldsSuit(seat, *led))
            return std::unexpected(error::Err(GameErrorCode::IllegalPlay)
                                   .with_actor(seat).with_card(c).with_led(*led));

        return {};
    }

    auto TrickTracker::Play(PlyrIdxT const seat, Card const& c, bool const follow_suit) -> error::ValidateResult
    {
        if (auto ok = CheckPlay(seat, c, follow_suit); !ok.has_value())
            return ok;

        auto& hand = hands_[seat];
        auto const it = std::ranges::find(hand, c);
        TRS_ASSERT(it != std::end(hand), "Validated card vanished from hand");
        trick_.Add(seat, *it);
        hand.erase(it);
        return {};
    }

    auto TrickTracker::Playable(PlyrIdxT const seat, bool const follow_suit) const -> std::vector<Card>
    {
        if (seat >= n_players_) return {};
        auto const& hand = hands_[seat];
        auto const led = trick_.LedSuit();
        if (!follow_suit || !led || !HoldsSuit(seat, *led))
            return hand;

        std::vector<Card> out;
        std::ranges::copy_if(hand, std::back_inserter(out), [s = *led](Card const& c) { return c.suit == s; });
        return out;
    }

    auto TrickTracker::CollectTrick(PlyrIdxT const taker, Points const points) -> CompletedTrick const&
    {
        if (!trick_.IsComplete())
            TRS_THROW(error::Code::State, "Collecting a trick that is still open");
        TRS_ASSERT(trick_.HasPlayed(taker), "Taker did not play in the trick");

        completed_.push_back(CompletedTrick{std::move(trick_), taker, points});
        trick_ = Trick(taker, n_players_);
        return completed_.back();
    }

    auto TrickTracker::HandOf(PlyrIdxT const seat) const -> std::span<Card const>
    {
        TRS_ASSERT(seat < n_players_, "Seat outside the table");
        return hands_[seat];
    }

    auto TrickTracker::TakenBy(PlyrIdxT const seat) const -> std::vector<Card>
    {
        std::vector<Card> out;
        for (CompletedTrick const& ct : completed_)
        {
            if (ct.taker != seat) continue;
            for (TrickPlay const& p : ct.trick.Plays()) out.push_back(p.card);
        }
        return out;
    }

    auto TrickTracker::CardsInHands() const -> size_t
    {
        return std::accumulate(hands_.cbegin(), hands_.cend(), size_t{0},
                               [](size_t acc, std::vector<Card> const& h) { return acc + h.size(); });
    }
}
