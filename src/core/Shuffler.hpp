#ifndef TRESSETTE_SHUFFLER_HPP
#define TRESSETTE_SHUFFLER_HPP

#include <algorithm>
#include <cstddef>
#include <random>
#include <span>
#include <utility>
#include <vector>
#include "Types.hpp"
#include "Exception.hpp"

namespace tressette::core
{
    // Anything able to hand out a uniform index in [0, bound).
    class RandomSource
    {
    public:
        virtual ~RandomSource() = default;

        // Fails with RandomSourceFailed when the source cannot produce a value
        // (bound == 0 included).
        virtual auto NextIndex(size_t bound) -> error::GameResult<size_t> = 0;
    };

    class Mt19937Source final : public RandomSource
    {
    public:
        explicit Mt19937Source(uint64_t seed);

        auto NextIndex(size_t bound) -> error::GameResult<size_t> override;

    private:
        std::mt19937_64 rng_;
    };

    class Shuffler
    {
    public:
        // In-place Fisher-Yates, N-1 draws. On failure the sequence is restored.
        template <class CardT>
        static auto Shuffle(std::span<CardT> cards, RandomSource& rng) -> error::ValidateResult
        {
            if (cards.size() < 2) return {};

            std::vector<CardT> const backup(cards.begin(), cards.end());

            for (size_t i = cards.size() - 1; i > 0; --i)
            {
                auto const j = rng.NextIndex(i + 1);
                if (!j.has_value() || *j > i)
                {
                    std::ranges::copy(backup, cards.begin());
                    return std::unexpected(error::Err(error::GameErrorCode::RandomSourceFailed));
                }
                std::swap(cards[i], cards[*j]);
            }
            return {};
        }
    };
}

#endif //TRESSETTE_SHUFFLER_HPP
