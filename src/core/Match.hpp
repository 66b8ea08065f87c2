#ifndef TRESSETTE_MATCH_HPP
#define TRESSETTE_MATCH_HPP

#include <memory>
#include <optional>
#include <span>
#include <vector>
#include "Types.hpp"
#include "Actions.hpp"
#include "Exception.hpp"
#include "Game.hpp"
#include "Player.hpp"
#include "Score.hpp"

namespace tressette::core
{
    struct HandRecord
    {
        uint64_t seed{};
        PlyrIdxT first_player{};
        HandResult result{};
        TeamScore totals_after{};
    };

    // Consecutive hands of tressette until a team reaches the target score.
    class Match
    {
    public:
        Match() = delete;

        // Fails with InvalidPlayerCount when the seats do not match a playable table.
        static auto Create(Config const& config, std::vector<std::unique_ptr<Player>> players)
            -> error::GameResult<Match>;

        // Deals the next hand. The lead moves one seat to the left each hand.
        auto StartHand() -> error::ValidateResult;

        // Asks the seat on turn for a card and plays it, dealing a new hand first if none is running.
        auto Step() -> MoveOutcome;
        // Steps until the current hand is over.
        auto PlayHand() -> HandResult;
        // Plays hands until the match is decided. Returns the winning team.
        auto Run() -> TeamIdxT;

        auto IsCompleted() const -> bool;
        auto Winner() const -> std::optional<TeamIdxT>;
        auto Totals() const noexcept -> TeamScore const& { return totals_; }
        auto History() const noexcept -> std::span<HandRecord const> { return history_; }
        auto HandsPlayed() const noexcept -> size_t { return history_.size(); }
        auto HasGame() const noexcept -> bool { return game_.has_value(); }
        auto CurrentGame() const -> Game const&;
        auto PlayerAt(PlyrIdxT seat) const -> Player*;
        auto PlayerCount() const noexcept -> uint8_t { return cfg_.n_players; }
        auto Cfg() const noexcept -> Config const& { return cfg_; }

        // Last card the engine accepted and what it led to.
        auto LastPlay() const noexcept -> std::optional<TrickPlay> const& { return last_play_; }
        auto LastOutcome() const noexcept -> std::optional<TrickOutcome> const& { return last_outcome_; }
        // Rejected choices since the match began.
        auto Rejections() const noexcept -> size_t { return rejections_; }

    private:
        Match(Config const& config, std::vector<std::unique_ptr<Player>> players);

        auto HandConfig() const -> Config;
        auto Record(PlyrIdxT seat, Card const& card, TrickOutcome outcome) -> MoveOutcome;

    private:
        Config cfg_;
        std::vector<std::unique_ptr<Player>> players_;
        std::optional<Game> game_;

        TeamScore totals_{};
        std::vector<HandRecord> history_;

        std::optional<TrickPlay> last_play_;
        std::optional<TrickOutcome> last_outcome_;
        size_t rejections_{};
    };
}

#endif //TRESSETTE_MATCH_HPP
