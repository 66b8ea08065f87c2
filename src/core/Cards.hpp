#ifndef TRESSETTE_CARDS_HPP
#define TRESSETTE_CARDS_HPP

#include <array>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <fmt/format.h>
#include "Types.hpp"

namespace tressette::core
{
    inline constexpr std::array<Suit, constants::SuitCount> AllSuits{
        Suit::Hearts, Suit::Diamonds, Suit::Clubs, Suit::Spades
    };

    inline constexpr std::array<Rank, constants::RankCount> AllRanks{
        Rank::Ace, Rank::Two, Rank::Three, Rank::Four, Rank::Five,
        Rank::Six, Rank::Seven, Rank::Jack, Rank::Knight, Rank::King
    };

    inline constexpr std::array<FrenchRank, constants::FrenchRankCount> AllFrenchRanks{
        FrenchRank::Ace, FrenchRank::Two, FrenchRank::Three, FrenchRank::Four, FrenchRank::Five,
        FrenchRank::Six, FrenchRank::Seven, FrenchRank::Eight, FrenchRank::Nine, FrenchRank::Ten,
        FrenchRank::Jack, FrenchRank::Queen, FrenchRank::King
    };

    // Position of the card in a fresh deck (suit-major).
    constexpr auto CanonicalIndex(Card const& c) noexcept -> size_t
    {
        return static_cast<size_t>(std::to_underlying(c.suit)) * constants::RankCount
               + static_cast<size_t>(std::to_underlying(c.rank));
    }

    constexpr auto CanonicalIndex(FrenchCard const& c) noexcept -> size_t
    {
        return static_cast<size_t>(std::to_underlying(c.suit)) * constants::FrenchRankCount
               + static_cast<size_t>(std::to_underlying(c.rank));
    }

    constexpr auto IsJoker(FrenchOrJoker const& c) noexcept -> bool
    {
        return std::holds_alternative<Joker>(c);
    }

    constexpr auto CanonicalLess(Card const& a, Card const& b) noexcept -> bool
    {
        return CanonicalIndex(a) < CanonicalIndex(b);
    }

    // Strength within a suit: Four is the weakest, Three the strongest.
    constexpr auto TrickStrength(Rank r) noexcept -> uint8_t
    {
        switch (r)
        {
        case Rank::Four: return 0;
        case Rank::Five: return 1;
        case Rank::Six: return 2;
        case Rank::Seven: return 3;
        case Rank::Jack: return 4;
        case Rank::Knight: return 5;
        case Rank::King: return 6;
        case Rank::Ace: return 7;
        case Rank::Two: return 8;
        case Rank::Three: return 9;
        }
        return 0;
    }

    constexpr auto StrongerThan(Rank a, Rank b) noexcept -> bool
    {
        return TrickStrength(a) > TrickStrength(b);
    }

    // Number printed on the card, 1 (Ace) to 10 (King).
    constexpr auto FaceValue(Rank r) noexcept -> int
    {
        return static_cast<int>(std::to_underlying(r)) + 1;
    }

    // Ace is worth a point, Two, Three and the figures a third, the rest nothing.
    auto PointValue(Rank r) -> Points;
    auto PointValue(Card const& c) -> Points;

    auto ToString(Suit s) -> std::string_view;
    auto ToString(Rank r) -> std::string_view;
    auto ToString(Card const& c) -> std::string;
    auto ToString(Points const& p) -> std::string;

    // "13S" for the King of Spades, "JK" for a joker.
    auto ToString(FrenchRank r) -> std::string_view;
    auto ToString(FrenchCard const& c) -> std::string;
    auto ToString(Joker const& j) -> std::string_view;
    auto ToString(FrenchOrJoker const& c) -> std::string;
}

template <>
struct fmt::formatter<tressette::core::Card> : fmt::formatter<std::string_view>
{
    template <class FormatContext>
    auto format(tressette::core::Card const& c, FormatContext& ctx) const
    {
        return fmt::formatter<std::string_view>::format(tressette::core::ToString(c), ctx);
    }
};

template <>
struct fmt::formatter<tressette::core::FrenchCard> : fmt::formatter<std::string_view>
{
    template <class FormatContext>
    auto format(tressette::core::FrenchCard const& c, FormatContext& ctx) const
    {
        return fmt::formatter<std::string_view>::format(tressette::core::ToString(c), ctx);
    }
};

template <>
struct fmt::formatter<tressette::core::FrenchOrJoker> : fmt::formatter<std::string_view>
{
    template <class FormatContext>
    auto format(tressette::core::FrenchOrJoker const& c, FormatContext& ctx) const
    {
        return fmt::formatter<std::string_view>::format(tressette::core::ToString(c), ctx);
    }
};

#endif //TRESSETTE_CARDS_HPP
