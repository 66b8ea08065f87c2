#ifndef TRESSETTE_RULES_HPP
#define TRESSETTE_RULES_HPP

#include "Actions.hpp"
#include "Types.hpp"
#include "Exception.hpp"
#include "Score.hpp"
#include "Trick.hpp"

namespace tressette::core
{
    //forward declaration
    class Game;

    class Rules
    {
    public:
        using CheckResult = error::ValidateResult;

        virtual ~Rules() = default;

        virtual auto AcceptsPlayerCount(uint8_t n_players) const -> bool = 0;
        virtual auto MustFollowSuit() const -> bool = 0;

        // Returns unexpected(reason) for ordinary rule violations (NOT exceptions).
        // Throw only for engine misuse / broken invariants.
        virtual auto Validate(Game const& game, PlayAction const& a) const -> CheckResult = 0;

        // Mutate authoritative state (hand -> trick).
        virtual auto Apply(Game& game, PlayAction const& a) -> void = 0;

        // Resolves a complete trick and moves the state machine on.
        virtual auto Advance(Game& game) -> MoveOutcome = 0;

        virtual auto TakerOf(Trick const& t) const -> PlyrIdxT = 0;
        virtual auto ValueOf(Card const& c) const -> Points = 0;
        virtual auto ScoreHand(ScoreBoard const& scores, PlyrIdxT last_taker) const -> HandResult = 0;
    };
}

#endif //TRESSETTE_RULES_HPP
