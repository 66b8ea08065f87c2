#include "Cards.hpp"

namespace tressette::core
{
    auto PointValue(Rank const r) -> Points
    {
        switch (r)
        {
        case Rank::Ace:
            return Points{3, 3};
        case Rank::Two:
        case Rank::Three:
        case Rank::Jack:
        case Rank::Knight:
        case Rank::King:
            return Points{1, 3};
        case Rank::Four:
        case Rank::Five:
        case Rank::Six:
        case Rank::Seven:
            return Points{0, 3};
        }
        return Points{0};
    }

    auto PointValue(Card const& c) -> Points
    {
        return PointValue(c.rank);
    }

    auto ToString(Suit const s) -> std::string_view
    {
        switch (s)
        {
        case Suit::Hearts: return "H";
        case Suit::Diamonds: return "D";
        case Suit::Clubs: return "C";
        case Suit::Spades: return "S";
        }
        return "?";
    }

    auto ToString(Rank const r) -> std::string_view
    {
        static constexpr std::array<std::string_view, constants::RankCount> map{
            "1", "2", "3", "4", "5", "6", "7", "8", "9", "10"
        };
        return map[static_cast<size_t>(r)];
    }

    auto ToString(Card const& c) -> std::string
    {
        return fmt::format("{}{}", ToString(c.rank), ToString(c.suit));
    }

    auto ToString(Points const& p) -> std::string
    {
        if (p.denominator() == 1) return fmt::format("{}", p.numerator());
        return fmt::format("{}/{}", p.numerator(), p.denominator());
    }

    auto ToString(FrenchRank const r) -> std::string_view
    {
        static constexpr std::array<std::string_view, constants::FrenchRankCount> map{
            "1", "2", "3", "4", "5", "6", "7", "8", "9", "10", "11", "12", "13"
        };
        return map[static_cast<size_t>(r)];
    }

    auto ToString(FrenchCard const& c) -> std::string
    {
        return fmt::format("{}{}", ToString(c.rank), ToString(c.suit));
    }

    auto ToString(Joker const&) -> std::string_view
    {
        return "JK";
    }

    auto ToString(FrenchOrJoker const& c) -> std::string
    {
        return std::visit([](auto const& card) { return std::string(ToString(card)); }, c);
    }
}
