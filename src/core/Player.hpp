#ifndef TRESSETTE_PLAYER_HPP
#define TRESSETTE_PLAYER_HPP

#include <memory>
#include "Types.hpp"
#include "State.hpp"

namespace tressette::core
{
    class Player
    {
    public:
        virtual ~Player() = default;

        // Called by the authoritative match loop with the seat's own view of the table.
        // A card outside snapshot->playable is rejected and the seat is asked again.
        virtual auto Play(std::shared_ptr<const SeatSnapshot> snapshot) -> Card = 0;
    };
}
#endif //TRESSETTE_PLAYER_HPP
