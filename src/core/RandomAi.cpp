#include "RandomAi.hpp"

#include <span>
#include "Exception.hpp"
#include "Util.hpp"

namespace tressette::core
{
    RandomAI::RandomAI(uint64_t rng_seed):
        rng_(rng_seed) {}

    auto RandomAI::Play(std::shared_ptr<const SeatSnapshot> snapshot) -> Card
    {
        TRS_ASSERT(snapshot != nullptr, "Player asked to move without a snapshot");
        SeatSnapshot const& s = *snapshot;

        TRS_ASSERT(s.phase == Phase::InProgress, "Player asked to move outside of trick play");
        TRS_ASSERT(!s.playable.empty(), "Seat on turn has no legal card");

        util::CardUniqueChecker hand;
        hand.AddAll(std::span<Card const>{s.my_hand});
        TRS_ASSERT(!hand.ContainsDup(), "Duplicate card in hand");

        return s.playable[pick(s.playable)];
    }
}
