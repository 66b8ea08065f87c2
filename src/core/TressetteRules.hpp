#ifndef TRESSETTE_TRESSETTERULES_HPP
#define TRESSETTE_TRESSETTERULES_HPP
#include "Rules.hpp"

namespace tressette::core
{
    // No trumps, follow suit when able, match to 31.
    class TressetteRules final : public Rules
    {
    public:
        auto AcceptsPlayerCount(uint8_t n_players) const -> bool override;
        auto MustFollowSuit() const -> bool override { return true; }
        auto Validate(Game const& game, PlayAction const& a) const -> CheckResult override;
        auto Apply(Game& game, PlayAction const& a) -> void override;
        auto Advance(Game& game) -> MoveOutcome override;
        auto TakerOf(Trick const& t) const -> PlyrIdxT override;
        auto ValueOf(Card const& c) const -> Points override;
        auto ScoreHand(ScoreBoard const& scores, PlyrIdxT last_taker) const -> HandResult override;

        // True when `a` takes the trick over `b` given the led suit.
        static bool Beats(Card const& a, Card const& b, Suit const led);
        // A team wins once it reaches the target and is strictly ahead.
        static auto IsCompleted(TeamScore const& score, int target = constants::ScoreToWin) -> bool;
    };
}

#endif //TRESSETTE_TRESSETTERULES_HPP
