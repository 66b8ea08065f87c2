#ifndef TRESSETTE_TEST_SUPPORT_HPP
#define TRESSETTE_TEST_SUPPORT_HPP

#include <cstddef>
#include <memory>
#include <utility>
#include <vector>

#include "../core/Deck.hpp"
#include "../core/Game.hpp"
#include "../core/Player.hpp"
#include "../core/Shuffler.hpp"
#include "../core/Types.hpp"

namespace tressette::test
{
    using namespace tressette::core;

    // Always answers bound-1: Fisher-Yates swaps every card with itself and the
    // deck stays in canonical order.
    class IdentitySource final : public RandomSource
    {
    public:
        auto NextIndex(size_t const bound) -> error::GameResult<size_t> override
        {
            if (bound == 0)
                return std::unexpected(error::Err(error::GameErrorCode::RandomSourceFailed));
            ++calls;
            return bound - 1;
        }

        size_t calls{};
    };

    // Answers 0 a few times, then fails.
    class FailingSource final : public RandomSource
    {
    public:
        explicit FailingSource(size_t const fail_after) : fail_after_(fail_after) {}

        auto NextIndex(size_t const bound) -> error::GameResult<size_t> override
        {
            if (bound == 0 || calls_ >= fail_after_)
                return std::unexpected(error::Err(error::GameErrorCode::RandomSourceFailed));
            ++calls_;
            return size_t{0};
        }

    private:
        size_t fail_after_;
        size_t calls_{};
    };

    // Broken generator handing out an index outside [0, bound).
    class OutOfRangeSource final : public RandomSource
    {
    public:
        auto NextIndex(size_t const bound) -> error::GameResult<size_t> override
        {
            return bound;
        }
    };

    // Steers Fisher-Yates so a fresh deck comes out in the requested order.
    class ArrangingSource final : public RandomSource
    {
    public:
        explicit ArrangingSource(std::vector<Card> target) : target_(std::move(target))
        {
            Deck const fresh;
            deck_.assign(fresh.Cards().begin(), fresh.Cards().end());
        }

        auto NextIndex(size_t const bound) -> error::GameResult<size_t> override
        {
            if (bound == 0 || bound > deck_.size() || target_.size() != deck_.size())
                return std::unexpected(error::Err(error::GameErrorCode::RandomSourceFailed));
            size_t const i = bound - 1;
            for (size_t j{}; j <= i; ++j)
            {
                if (deck_[j] == target_[i])
                {
                    std::swap(deck_[i], deck_[j]);
                    return j;
                }
            }
            return std::unexpected(error::Err(error::GameErrorCode::RandomSourceFailed));
        }

    private:
        std::vector<Card> target_;
        std::vector<Card> deck_;
    };

    // Deck order that a one-card round-robin deal turns into these hands.
    inline auto DeckForHands(std::vector<std::vector<Card>> const& hands) -> std::vector<Card>
    {
        std::vector<Card> deck;
        for (size_t k{}; k < hands.front().size(); ++k)
        {
            for (auto const& h : hands) deck.push_back(h[k]);
        }
        return deck;
    }

    // Always plays the same card, legal or not.
    class StubbornPlayer final : public Player
    {
    public:
        explicit StubbornPlayer(Card c) : card_(c) {}

        auto Play(std::shared_ptr<const SeatSnapshot> snapshot) -> Card override
        {
            (void)snapshot;
            ++asked;
            return card_;
        }

        size_t asked{};

    private:
        Card card_;
    };

    // Plays the first legal card.
    class FirstLegalPlayer final : public Player
    {
    public:
        auto Play(std::shared_ptr<const SeatSnapshot> snapshot) -> Card override
        {
            return snapshot->playable.front();
        }
    };

    constexpr auto C(Suit const s, Rank const r) -> Card
    {
        return Card{s, r};
    }

    // Game dealt from an unshuffled deck: seat s holds canonical cards s, s+n, s+2n, ...
    inline auto DealtIdentityGame(uint8_t const n_players = 4, PlyrIdxT const first = 0,
                                  uint8_t const packet = 1) -> Game
    {
        Config const cfg{
            .n_players    = n_players,
            .first_player = first,
            .deal_packet  = packet,
            .seed         = 0
        };
        auto created = Game::Create(cfg, std::make_unique<IdentitySource>());
        if (!created.has_value())
            TRS_THROW(error::Code::State, error::describe(created.error()));
        Game g = std::move(*created);
        if (auto const ok = g.Deal(); !ok.has_value())
            TRS_THROW(error::Code::State, error::describe(ok.error()));
        return g;
    }
}

#endif //TRESSETTE_TEST_SUPPORT_HPP
