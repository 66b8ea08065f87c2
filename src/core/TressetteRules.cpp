#include "TressetteRules.hpp"

#include "Game.hpp"
#include "Cards.hpp"
#include <variant>

namespace tressette::core
{
    auto TressetteRules::Beats(Card const& a, Card const& b, Suit const led) -> bool
    {
        if (a.suit != led) return false;
        if (b.suit != led) return true;
        return StrongerThan(a.rank, b.rank);
    }

    auto TressetteRules::IsCompleted(TeamScore const& score, int const target) -> bool
    {
        auto const [a, b] = score;
        return (a >= target && a > b) || (b >= target && b > a);
    }

    auto TressetteRules::AcceptsPlayerCount(uint8_t const n_players) const -> bool
    {
        return n_players == constants::TablePlayers;
    }

    auto TressetteRules::Validate(Game const& game, PlayAction const& a) const -> CheckResult
    {
        using error::GameErrorCode;
        if (!std::holds_alternative<state::InProgress>(game.state_))
            return std::unexpected(error::Err(GameErrorCode::InvalidGameState)
                                   .with_phase(PhaseOf(game.state_)).with_actor(a.seat));

        return game.tracker_.CheckPlay(a.seat, a.card, MustFollowSuit());
    }

    auto TressetteRules::Apply(Game& game, PlayAction const& a) -> void
    {
        if (auto const ok = game.tracker_.Play(a.seat, a.card, MustFollowSuit()); !ok.has_value())
            TRS_THROW(error::Code::Rules, "Apply on an unvalidated play: " + error::describe(ok.error()));

        if (game.tracker_.CurrentTrick().IsComplete())
            game.state_ = state::TrickComplete{};
    }

    auto TressetteRules::Advance(Game& game) -> MoveOutcome
    {
        if (std::holds_alternative<state::InProgress>(game.state_)) return MoveOutcome::Applied;
        if (!std::holds_alternative<state::TrickComplete>(game.state_))
            TRS_THROW(error::Code::State, "Advance called outside of trick play");

        Trick const& trick = game.tracker_.CurrentTrick();
        PlyrIdxT const taker = TakerOf(trick);

        Points points{0};
        for (TrickPlay const& p : trick.Plays()) points += ValueOf(p.card);

        game.tracker_.CollectTrick(taker, points);
        game.scores_.Credit(taker, points);

        if (game.tracker_.AllHandsEmpty())
        {
            game.state_ = state::GameComplete{taker};
            return MoveOutcome::GameEnded;
        }
        game.state_ = state::InProgress{};
        return MoveOutcome::TrickEnded;
    }

    auto TressetteRules::TakerOf(Trick const& t) const -> PlyrIdxT
    {
        TRS_ASSERT(!t.IsEmpty(), "Cannot take an empty trick");
        Suit const led = *t.LedSuit();

        TrickPlay const* best = &t.Plays().front();
        for (TrickPlay const& p : t.Plays())
        {
            if (Beats(p.card, best->card, led)) best = &p;
        }
        return best->seat;
    }

    auto TressetteRules::ValueOf(Card const& c) const -> Points
    {
        return PointValue(c);
    }

    auto TressetteRules::ScoreHand(ScoreBoard const& scores, PlyrIdxT const last_taker) const -> HandResult
    {
        HandResult r{};
        for (TeamIdxT t{}; t < constants::TeamCount; ++t)
        {
            r.points[t] = WholePoints(scores.OfTeam(t));
        }
        r.last_trick_team = TeamOf(last_taker);
        r.points[r.last_trick_team] += constants::LastTrickBonus;
        return r;
    }
}
