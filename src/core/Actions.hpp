#ifndef TRESSETTE_ACTIONS_HPP
#define TRESSETTE_ACTIONS_HPP

#include "Types.hpp"

namespace tressette::core
{
    // The only move in a hand of tressette: a seat lays one card on the trick.
    struct PlayAction
    {
        PlyrIdxT seat{};
        Card card;
    };

    enum class MoveOutcome : uint8_t
    {
        Invalid,
        Applied,
        TrickEnded,
        GameEnded,
        MatchEnded
    };

    enum class Phase : uint8_t
    {
        AwaitingDeal,
        InProgress,
        TrickComplete,
        GameComplete
    };
} // namespace tressette::core

#endif //TRESSETTE_ACTIONS_HPP
