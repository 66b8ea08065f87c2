#ifndef TRESSETTE_RANDOMAI_HPP
#define TRESSETTE_RANDOMAI_HPP

#include <random>
#include "Player.hpp"
#include "State.hpp"
#include "Types.hpp"

namespace tressette::core
{
    // Picks uniformly among the legal cards.
    class RandomAI final : public Player
    {
    public:
        explicit RandomAI(uint64_t rng_seed);

        auto Play(std::shared_ptr<const SeatSnapshot> snapshot) -> Card override;

    private:
        template <class Vec>
        auto pick(Vec const& v) -> size_t
        {
            return std::uniform_int_distribution<size_t>{0, v.size() - 1}(rng_);
        }

    private:
        std::mt19937 rng_;
    };
}

#endif //TRESSETTE_RANDOMAI_HPP
