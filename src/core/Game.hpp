#ifndef TRESSETTE_GAME_HPP
#define TRESSETTE_GAME_HPP

#include <memory>
#include <optional>
#include <span>
#include <variant>
#include <vector>
#include "Types.hpp"
#include "Actions.hpp"
#include "Deck.hpp"
#include "Exception.hpp"
#include "Rules.hpp"
#include "Score.hpp"
#include "Shuffler.hpp"
#include "State.hpp"
#include "Tracker.hpp"
#include "TressetteRules.hpp"

namespace tressette::core::debug {struct Inspector;}
namespace tressette::core
{
    struct Ongoing
    {
        PlyrIdxT next_to_play{};
    };

    struct TrickResolved
    {
        PlyrIdxT winner{};
        Points points_awarded{};
        uint8_t trick_number{};
        std::vector<TrickPlay> plays;
    };

    struct GameOver
    {
        TrickResolved last_trick;
        ScoreBoard final_scores;
        HandResult hand;
        // by whole hand points with the last-trick bonus, nullopt on a tie
        std::optional<TeamIdxT> winner;
        // by exact card points alone, nullopt on a tie
        std::optional<TeamIdxT> card_leader;
    };

    using TrickOutcome = std::variant<Ongoing, TrickResolved, GameOver>;

    // One hand of tressette: a single deal of the 40 cards played out trick by trick.
    class Game
    {
    public:
        Game() = delete;

        static auto Create(Config const& config,
                           std::unique_ptr<RandomSource> rng,
                           std::unique_ptr<Rules> rules = std::make_unique<TressetteRules>())
            -> error::GameResult<Game>;
        // Shuffles with a Mersenne Twister seeded from config.seed.
        static auto Create(Config const& config) -> error::GameResult<Game>;

        // AwaitingDeal -> InProgress: shuffle once, then deal every card.
        auto Deal() -> error::ValidateResult;

        // One state-machine step: validate/apply/advance.
        auto Play(PlyrIdxT seat, Card const& card) -> error::GameResult<TrickOutcome>;

        auto HandOf(PlyrIdxT seat) const -> error::GameResult<std::vector<Card>>;
        auto SnapshotFor(PlyrIdxT seat) const -> error::GameResult<std::shared_ptr<SeatSnapshot const>>;
        auto Playable(PlyrIdxT seat) const -> std::vector<Card>;

        auto CurrentTrick() const noexcept -> Trick const& { return tracker_.CurrentTrick(); }
        auto Completed() const noexcept -> std::span<CompletedTrick const> { return tracker_.Completed(); }
        auto Scores() const noexcept -> ScoreBoard const& { return scores_; }
        auto NextToPlay() const noexcept -> PlyrIdxT { return tracker_.NextToPlay(); }
        auto StateNow() const noexcept -> GameState const& { return state_; }
        auto PhaseNow() const -> Phase { return PhaseOf(state_); }
        auto PlayerCount() const noexcept -> uint8_t { return cfg_.n_players; }
        auto Seed() const noexcept -> uint64_t { return cfg_.seed; }
        auto RulesInUse() const noexcept -> Rules const& { return *rules_; }
        // Final result once the last trick is resolved.
        auto Result() const -> std::optional<GameOver>;

        //allows class to directly access private data on an instance
        friend class TressetteRules;
        friend struct debug::Inspector;

    private:
        Game(Config const& config, std::unique_ptr<Rules> rules, std::unique_ptr<RandomSource> rng);

        auto MakeResolved(CompletedTrick const& ct) const -> TrickResolved;
        auto MakeGameOver() const -> GameOver;

    private:
        Config cfg_;
        std::unique_ptr<Rules> rules_;
        std::unique_ptr<RandomSource> rng_;

        // Authoritative state
        Deck deck_;                 // full until dealt, empty afterwards
        TrickTracker tracker_;      // hands, open trick, taken tricks
        ScoreBoard scores_;
        GameState state_{state::AwaitingDeal{}};
    };
}
#endif //TRESSETTE_GAME_HPP
