#ifndef TRESSETTE_UTIL_HPP
#define TRESSETTE_UTIL_HPP

#include <bit>
#include <cstdint>
#include <span>
#include "Cards.hpp"

namespace tressette::core::util
{
    inline auto CardToUID(Card const& c) -> uint64_t
    {
        return static_cast<uint64_t>(CanonicalIndex(c));
    }
    inline auto CardToUID(FrenchCard const& c) -> uint64_t
    {
        return static_cast<uint64_t>(CanonicalIndex(c));
    }

    template <class CardT, size_t FullSize>
    class BasicUniqueChecker
    {
        static_assert(FullSize <= 64, "BasicUniqueChecker packs the deck into one word");
    public:
        BasicUniqueChecker():
            cards_(0), contains_dup_(false) {}
        auto Add(CardT const& c) -> void
        {
            uint64_t const card = uint64_t{1} << CardToUID(c);
            contains_dup_ |= static_cast<bool>(cards_ & card);
            cards_ |= card;
        }
        auto AddAll(std::span<CardT const> cards) -> void
        {
            for (CardT const& c : cards) Add(c);
        }
        [[nodiscard]]
        auto ContainsDup() const -> bool
        {
            return contains_dup_;
        }
        [[nodiscard]]
        auto Contains(CardT const& c) const -> bool
        {
            return static_cast<bool>(cards_ & (uint64_t{1} << CardToUID(c)));
        }
        // distinct cards seen so far
        [[nodiscard]]
        auto Count() const -> size_t
        {
            return static_cast<size_t>(std::popcount(cards_));
        }
        [[nodiscard]]
        auto IsFullDeck() const -> bool
        {
            return !contains_dup_ && Count() == FullSize;
        }
    private:
        uint64_t cards_;
        bool contains_dup_;
    };

    using CardUniqueChecker = BasicUniqueChecker<Card, constants::DeckSize>;
    using FrenchUniqueChecker = BasicUniqueChecker<FrenchCard, constants::FrenchDeckSize>;
}

#endif //TRESSETTE_UTIL_HPP
