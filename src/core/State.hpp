#ifndef TRESSETTE_STATE_HPP
#define TRESSETTE_STATE_HPP

#include <optional>
#include <type_traits>
#include <variant>
#include <vector>
#include "Types.hpp"
#include "Actions.hpp"
#include "Trick.hpp"

namespace tressette::core
{
    namespace state
    {
        struct AwaitingDeal {};
        struct InProgress {};
        // Every seat played into the trick, waiting for Advance to resolve it.
        struct TrickComplete {};
        struct GameComplete
        {
            PlyrIdxT last_taker{};
        };
    }

    using GameState = std::variant<state::AwaitingDeal,
                                   state::InProgress,
                                   state::TrickComplete,
                                   state::GameComplete>;

    inline auto PhaseOf(GameState const& s) -> Phase
    {
        return std::visit([]<typename T0>(T0 const&) -> Phase
        {
            using T = std::decay_t<T0>;
            if constexpr (std::is_same_v<T, state::AwaitingDeal>) return Phase::AwaitingDeal;
            else if constexpr (std::is_same_v<T, state::InProgress>) return Phase::InProgress;
            else if constexpr (std::is_same_v<T, state::TrickComplete>) return Phase::TrickComplete;
            else return Phase::GameComplete;
        }, s);
    }

    // Immutable per-seat snapshot: reveals the seat's own hand, counts for others
    struct SeatSnapshot
    {
        uint8_t n_players{};
        PlyrIdxT seat{};
        Phase phase{Phase::AwaitingDeal};

        PlyrIdxT leader{};
        PlyrIdxT next_to_play{};
        std::optional<Suit> led_suit{};
        std::vector<TrickPlay> trick;

        std::vector<Card> my_hand;
        std::vector<Card> playable;
        std::vector<uint8_t> hand_counts;

        std::vector<Points> scores;
        uint8_t tricks_played{};
    };

} // namespace tressette::core

#endif //TRESSETTE_STATE_HPP
