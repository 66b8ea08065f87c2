#include "Game.hpp"

#include <utility>

namespace tressette::core
{
    Game::Game(Config const& config,
               std::unique_ptr<Rules> rules,
               std::unique_ptr<RandomSource> rng) :
        cfg_(config),
        rules_(std::move(rules)),
        rng_(std::move(rng)),
        deck_(),
        tracker_(cfg_.n_players, cfg_.first_player),
        scores_(cfg_.n_players)
    {
    }

    auto Game::Create(Config const& config,
                      std::unique_ptr<RandomSource> rng,
                      std::unique_ptr<Rules> rules) -> error::GameResult<Game>
    {
        using error::GameErrorCode;
        TRS_ASSERT(rules != nullptr, "Game created without rules");
        TRS_ASSERT(rng != nullptr, "Game created without a random source");

        if (!rules->AcceptsPlayerCount(config.n_players))
            return std::unexpected(error::Err(GameErrorCode::InvalidPlayerCount).with_players(config.n_players));

        size_t const per_seat = constants::DeckSize / config.n_players;
        if (config.deal_packet == 0 || per_seat % config.deal_packet != 0)
            return std::unexpected(error::Err(GameErrorCode::InvalidPlayerCount).with_players(config.n_players));

        if (config.first_player >= config.n_players)
            return std::unexpected(error::Err(GameErrorCode::InvalidSeat)
                                   .with_actor(config.first_player).with_players(config.n_players));

        return Game(config, std::move(rules), std::move(rng));
    }

    auto Game::Create(Config const& config) -> error::GameResult<Game>
    {
        return Create(config, std::make_unique<Mt19937Source>(config.seed));
    }

    auto Game::Deal() -> error::ValidateResult
    {
        if (!std::holds_alternative<state::AwaitingDeal>(state_))
            return std::unexpected(error::Err(error::GameErrorCode::InvalidGameState).with_phase(PhaseNow()));

        if (auto const shuffled = deck_.Shuffle(*rng_); !shuffled.has_value())
            return shuffled;

        auto hands = deck_.Deal(cfg_.n_players, cfg_.deal_packet);
        if (!hands.has_value())
            return std::unexpected(hands.error());

        tracker_.TakeHands(std::move(*hands));
        state_ = state::InProgress{};
        return {};
    }

    auto Game::Play(PlyrIdxT const seat, Card const& card) -> error::GameResult<TrickOutcome>
    {
        PlayAction const action{seat, card};
        if (auto const ok = rules_->Validate(*this, action); !ok.has_value())
            return std::unexpected(ok.error());

        rules_->Apply(*this, action);

        switch (rules_->Advance(*this))
        {
        case MoveOutcome::Applied:
            return Ongoing{tracker_.NextToPlay()};
        case MoveOutcome::TrickEnded:
            return MakeResolved(tracker_.Completed().back());
        case MoveOutcome::GameEnded:
            return MakeGameOver();
        case MoveOutcome::Invalid:
        case MoveOutcome::MatchEnded:
            break;
        }
        TRS_THROW(error::Code::Rules, "Rules advanced a single game to an impossible outcome");
    }

    auto Game::HandOf(PlyrIdxT const seat) const -> error::GameResult<std::vector<Card>>
    {
        if (seat >= cfg_.n_players)
            return std::unexpected(error::Err(error::GameErrorCode::InvalidSeat)
                                   .with_actor(seat).with_players(cfg_.n_players));
        auto const hand = tracker_.HandOf(seat);
        return std::vector<Card>(hand.begin(), hand.end());
    }

    auto Game::Playable(PlyrIdxT const seat) const -> std::vector<Card>
    {
        if (!std::holds_alternative<state::InProgress>(state_)) return {};
        if (seat != tracker_.NextToPlay()) return {};
        return tracker_.Playable(seat, rules_->MustFollowSuit());
    }

    auto Game::SnapshotFor(PlyrIdxT const seat) const -> error::GameResult<std::shared_ptr<SeatSnapshot const>>
    {
        if (seat >= cfg_.n_players)
            return std::unexpected(error::Err(error::GameErrorCode::InvalidSeat)
                                   .with_actor(seat).with_players(cfg_.n_players));

        std::shared_ptr<SeatSnapshot> snap = std::make_shared<SeatSnapshot>();
        Trick const& trick = tracker_.CurrentTrick();
        snap->n_players = cfg_.n_players;
        snap->seat = seat;
        snap->phase = PhaseNow();
        snap->leader = trick.Leader();
        snap->next_to_play = trick.NextSeat();
        snap->led_suit = trick.LedSuit();
        snap->trick.assign(trick.Plays().begin(), trick.Plays().end());

        auto const hand = tracker_.HandOf(seat);
        snap->my_hand.assign(hand.begin(), hand.end());
        snap->playable = Playable(seat);

        for (PlyrIdxT i{}; i < cfg_.n_players; ++i)
        {
            snap->hand_counts.push_back(static_cast<uint8_t>(tracker_.HandOf(i).size()));
        }
        snap->scores.assign(scores_.Seats().begin(), scores_.Seats().end());
        snap->tricks_played = static_cast<uint8_t>(tracker_.Completed().size());
        return std::shared_ptr<SeatSnapshot const>(std::move(snap));
    }

    auto Game::Result() const -> std::optional<GameOver>
    {
        if (!std::holds_alternative<state::GameComplete>(state_)) return std::nullopt;
        return MakeGameOver();
    }

    auto Game::MakeResolved(CompletedTrick const& ct) const -> TrickResolved
    {
        TrickResolved r{};
        r.winner = ct.taker;
        r.points_awarded = ct.points;
        r.trick_number = static_cast<uint8_t>(tracker_.Completed().size());
        r.plays.assign(ct.trick.Plays().begin(), ct.trick.Plays().end());
        return r;
    }

    auto Game::MakeGameOver() const -> GameOver
    {
        auto const* done = std::get_if<state::GameComplete>(&state_);
        TRS_ASSERT(done != nullptr, "Game over requested before the last trick");
        TRS_ASSERT(!tracker_.Completed().empty(), "Finished game without tricks");

        HandResult const hand = rules_->ScoreHand(scores_, done->last_taker);
        return GameOver{
            .last_trick = MakeResolved(tracker_.Completed().back()),
            .final_scores = scores_,
            .hand = hand,
            .winner = hand.Winner(),
            .card_leader = scores_.Leader()
        };
    }
}
