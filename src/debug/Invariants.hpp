#ifndef TRESSETTE_INVARIANTS_HPP
#define TRESSETTE_INVARIANTS_HPP

#include "../core/Game.hpp"
#include "../core/Cards.hpp"
#include "../core/Util.hpp"
#include "Inspector.hpp"
#include <algorithm>
#include <span>

namespace tressette::core::debug
{
    // A second layer of checks over the whole table, hidden hands included.
    // Throws AssertionError on the first broken invariant.
    inline auto CheckInvariants(Game const& g) -> void
    {
#if TRS_ENABLE_TEST_HOOKS == false
        (void)g;
#else
    Inspector::SnapshotAll const s = Inspector::Gather(g);

    // 1) Conservation: deck + hands + trick + taken tricks hold each card exactly once
    {
        util::CardUniqueChecker seen;
        seen.AddAll(std::span<Card const>{s.deck});
        for (auto const& h : s.hands) seen.AddAll(std::span<Card const>{h});
        for (auto const& p : s.trick) seen.Add(p.card);
        for (auto const& ct : s.completed)
            for (auto const& p : ct.trick.Plays()) seen.Add(p.card);

        TRS_ASSERT(!seen.ContainsDup(), "Duplicate card across zones");
        TRS_ASSERT(seen.IsFullDeck(), "Materialized card count != deck size");
    }

    // 2) The deck is only ever full (before the deal) or empty (after it)
    if (s.phase == Phase::AwaitingDeal)
        TRS_ASSERT(s.deck.size() == constants::DeckSize, "Cards left the deck before the deal");
    else
        TRS_ASSERT(s.deck.empty(), "Cards left in the deck after the deal");

    // 3) Open trick: at most one card per seat, never full between steps
    TRS_ASSERT(s.trick.size() < s.n_players || s.phase == Phase::TrickComplete, "Complete trick left unresolved");
    for (auto const& ct : s.completed)
        TRS_ASSERT(ct.trick.IsComplete(), "Taken trick missing a card");

    // 4) Hand sizes: seats that already played this trick hold one card fewer
    if (s.phase != Phase::AwaitingDeal)
    {
        size_t const per_seat = constants::DeckSize / s.n_players - s.completed.size();
        for (PlyrIdxT i{}; i < s.n_players; ++i)
        {
            bool const played = std::ranges::any_of(s.trick, [i](TrickPlay const& p) { return p.seat == i; });
            TRS_ASSERT(s.hands[i].size() == per_seat - (played ? size_t{1} : size_t{0}), "Hand size out of step with the trick count");
        }
    }

    // 5) Score: seat totals equal the value of the tricks they took, and never exceed the deck
    {
        std::vector<Points> owed(s.n_players, Points{0});
        Points total{0};
        for (auto const& ct : s.completed)
        {
            Points trick_value{0};
            for (auto const& p : ct.trick.Plays()) trick_value += PointValue(p.card);
            TRS_ASSERT(trick_value == ct.points, "Recorded trick value disagrees with its cards");
            owed[ct.taker] += ct.points;
            total += ct.points;
        }
        TRS_ASSERT(owed == s.scores, "Score board out of sync with taken tricks");
        TRS_ASSERT(total <= Points(32, 3), "More points than the deck holds");
        if (s.phase == Phase::GameComplete)
            TRS_ASSERT(total == Points(32, 3), "Finished hand does not account for every point");
    }
#endif // TRS_ENABLE_TEST_HOOKS == true
    }
}
#endif //TRESSETTE_INVARIANTS_HPP
