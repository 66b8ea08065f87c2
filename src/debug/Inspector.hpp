#ifndef TRESSETTE_INSPECTOR_HPP
#define TRESSETTE_INSPECTOR_HPP

#include <vector>
#include <cstddef>
#include <cstdint>
#include <utility>

#include "../core/Types.hpp"
#include "../core/Game.hpp"

namespace tressette::core::debug
{
    struct Inspector
    {
        // Everything the game holds, hidden hands included.
        struct SnapshotAll
        {
            std::vector<Card> deck;
            std::vector<std::vector<Card>> hands;
            std::vector<TrickPlay> trick;
            std::vector<CompletedTrick> completed;
            std::vector<Points> scores;
            uint8_t n_players{};
            Phase phase{};
            PlyrIdxT next_to_play{};
        };

        static inline auto Gather(Game const& g) -> SnapshotAll
        {
            SnapshotAll ret{};
            ret.n_players = g.cfg_.n_players;
            ret.phase = PhaseOf(g.state_);
            ret.next_to_play = g.tracker_.NextToPlay();

            ret.deck.assign(g.deck_.Cards().begin(), g.deck_.Cards().end());

            ret.hands.resize(ret.n_players);
            for (PlyrIdxT i{}; i < ret.n_players; ++i)
            {
                auto const src = g.tracker_.HandOf(i);
                ret.hands[i].assign(src.begin(), src.end());
            }

            auto const plays = g.tracker_.CurrentTrick().Plays();
            ret.trick.assign(plays.begin(), plays.end());

            auto const done = g.tracker_.Completed();
            ret.completed.assign(done.begin(), done.end());

            auto const seats = g.scores_.Seats();
            ret.scores.assign(seats.begin(), seats.end());
            return ret;
        }
    };
}

#endif //TRESSETTE_INSPECTOR_HPP
