#include "Match.hpp"

#include <algorithm>
#include <type_traits>
#include <utility>
#include <variant>
#include <fmt/format.h>
#include "TressetteRules.hpp"

namespace tressette::core
{
    namespace
    {
        constexpr uint64_t HandSeedStep = 0x9E3779B97F4A7C15ull;
    }

    Match::Match(Config const& config, std::vector<std::unique_ptr<Player>> players) :
        cfg_(config),
        players_(std::move(players))
    {
        TRS_ASSERT(!std::ranges::any_of(players_,
                                        [](std::unique_ptr<Player> const& p) { return !p; }), "Invalid player in match");
    }

    auto Match::Create(Config const& config, std::vector<std::unique_ptr<Player>> players)
        -> error::GameResult<Match>
    {
        using error::GameErrorCode;
        if (players.size() != config.n_players || !TressetteRules{}.AcceptsPlayerCount(config.n_players))
            return std::unexpected(error::Err(GameErrorCode::InvalidPlayerCount)
                                   .with_players(static_cast<uint8_t>(players.size())));

        if (config.first_player >= config.n_players)
            return std::unexpected(error::Err(GameErrorCode::InvalidSeat)
                                   .with_actor(config.first_player).with_players(config.n_players));

        return Match(config, std::move(players));
    }

    auto Match::HandConfig() const -> Config
    {
        uint64_t const hand_no = history_.size();
        Config c = cfg_;
        c.seed = cfg_.seed + hand_no * HandSeedStep;
        c.first_player = static_cast<PlyrIdxT>((cfg_.first_player + hand_no) % cfg_.n_players);
        return c;
    }

    auto Match::StartHand() -> error::ValidateResult
    {
        if (IsCompleted())
            return std::unexpected(error::Err(error::GameErrorCode::InvalidGameState));
        if (game_ && game_->PhaseNow() != Phase::GameComplete)
            return std::unexpected(error::Err(error::GameErrorCode::InvalidGameState).with_phase(game_->PhaseNow()));

        auto created = Game::Create(HandConfig());
        if (!created.has_value())
            return std::unexpected(created.error());

        game_.emplace(std::move(*created));
        last_play_.reset();
        last_outcome_.reset();
        return game_->Deal();
    }

    auto Match::Step() -> MoveOutcome
    {
        if (IsCompleted()) return MoveOutcome::MatchEnded;

        if (!game_ || game_->PhaseNow() == Phase::GameComplete)
        {
            if (auto const ok = StartHand(); !ok.has_value())
                TRS_THROW(error::Code::State, "Could not deal the next hand: " + error::describe(ok.error()));
        }

        PlyrIdxT const actor = game_->NextToPlay();
        Player& player = *players_[actor];

        for (uint8_t attempt{}; attempt <= cfg_.max_retries; ++attempt)
        {
            auto const snap = game_->SnapshotFor(actor);
            if (!snap.has_value())
                TRS_THROW(error::Code::State, "No view for the seat on turn: " + error::describe(snap.error()));
            Card const choice = player.Play(*snap);
            auto played = game_->Play(actor, choice);
            if (played.has_value())
                return Record(actor, choice, std::move(*played));

            ++rejections_;
            fmt::print("P{} rejected ({}): {}\n", static_cast<int>(actor), choice,
                       error::describe(played.error()));
        }

        // Out of retries: the engine plays the first legal card for the seat.
        std::vector<Card> const legal = game_->Playable(actor);
        TRS_ASSERT(!legal.empty(), "Seat on turn holds no legal card");

        auto played = game_->Play(actor, legal.front());
        if (!played.has_value())
            TRS_THROW(error::Code::Rules, "Fallback play rejected: " + error::describe(played.error()));
        return Record(actor, legal.front(), std::move(*played));
    }

    auto Match::Record(PlyrIdxT const seat, Card const& card, TrickOutcome outcome) -> MoveOutcome
    {
        last_play_ = TrickPlay{seat, card};

        MoveOutcome const res = std::visit([&]<typename T0>(T0 const& o) -> MoveOutcome
        {
            using T = std::decay_t<T0>;
            if constexpr (std::is_same_v<T, Ongoing>) return MoveOutcome::Applied;
            else if constexpr (std::is_same_v<T, TrickResolved>) return MoveOutcome::TrickEnded;
            else
            {
                for (TeamIdxT t{}; t < constants::TeamCount; ++t)
                {
                    totals_[t] += o.hand.points[t];
                }
                history_.push_back(HandRecord{
                    .seed = game_->Seed(),
                    .first_player = game_->Completed().front().trick.Leader(),
                    .result = o.hand,
                    .totals_after = totals_
                });
                return IsCompleted() ? MoveOutcome::MatchEnded : MoveOutcome::GameEnded;
            }
        }, outcome);

        last_outcome_ = std::move(outcome);
        return res;
    }

    auto Match::PlayHand() -> HandResult
    {
        if (IsCompleted())
            TRS_THROW(error::Code::State, "Match already decided");

        size_t const before = history_.size();
        while (history_.size() == before)
        {
            Step();
        }
        return history_.back().result;
    }

    auto Match::Run() -> TeamIdxT
    {
        while (Step() != MoveOutcome::MatchEnded) {}

        auto const winner = Winner();
        TRS_ASSERT(winner.has_value(), "Finished match without a winner");
        return *winner;
    }

    auto Match::IsCompleted() const -> bool
    {
        return TressetteRules::IsCompleted(totals_, cfg_.score_to_win);
    }

    auto Match::Winner() const -> std::optional<TeamIdxT>
    {
        if (!IsCompleted()) return std::nullopt;
        return totals_[0] > totals_[1] ? TeamIdxT{0} : TeamIdxT{1};
    }

    auto Match::CurrentGame() const -> Game const&
    {
        TRS_ASSERT(game_.has_value(), "No hand has been dealt yet");
        return *game_;
    }

    auto Match::PlayerAt(PlyrIdxT const seat) const -> Player*
    {
        TRS_ASSERT(seat < players_.size(), "Seat out of range");
        return players_[seat].get();
    }
}
