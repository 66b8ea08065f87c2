#ifndef TRESSETTE_TYPES_HPP
#define TRESSETTE_TYPES_HPP

#define TRS_ENABLE_TEST_HOOKS true

#include <cstddef>
#include <cstdint>
#include <random>
#include <variant>
#include <boost/rational.hpp>

namespace tressette::core::constants
{
    inline constexpr size_t SuitCount = 4;
    inline constexpr size_t RankCount = 10;
    inline constexpr size_t DeckSize = SuitCount * RankCount;
    inline constexpr size_t FrenchRankCount = 13;
    inline constexpr size_t FrenchDeckSize = SuitCount * FrenchRankCount;
    inline constexpr uint8_t TablePlayers = 4;
    inline constexpr uint8_t TeamCount = 2;
    inline constexpr int LastTrickBonus = 1;
    inline constexpr int ScoreToWin = 31;
}
namespace tressette::core
{
    enum class Suit : uint8_t
    {
        Hearts = 0, // Cups
        Diamonds,   // Coins
        Clubs,      // Batons
        Spades      // Swords
    };
    // Declaration order is the canonical (face value) order, not trick strength.
    enum class Rank : uint8_t
    {
        Ace = 0,
        Two,
        Three,
        Four,
        Five,
        Six,
        Seven,
        Jack,
        Knight,
        King
    };
    struct Card
    {
        Card() = delete;
        constexpr Card(Suit suit, Rank rank) : suit(suit), rank(rank) {}

        Suit suit;
        Rank rank;
    };
    constexpr auto operator==(Card const& a, Card const& b) -> bool { return a.suit == b.suit && a.rank == b.rank; }

    // 52 card pack: Ace to Ten, then the three court cards.
    enum class FrenchRank : uint8_t
    {
        Ace = 0,
        Two,
        Three,
        Four,
        Five,
        Six,
        Seven,
        Eight,
        Nine,
        Ten,
        Jack,
        Queen,
        King
    };
    struct FrenchCard
    {
        FrenchCard() = delete;
        constexpr FrenchCard(Suit suit, FrenchRank rank) : suit(suit), rank(rank) {}

        Suit suit;
        FrenchRank rank;
    };
    constexpr auto operator==(FrenchCard const& a, FrenchCard const& b) -> bool
    {
        return a.suit == b.suit && a.rank == b.rank;
    }

    // Jokers are interchangeable.
    struct Joker {};
    constexpr auto operator==(Joker const&, Joker const&) -> bool { return true; }

    using FrenchOrJoker = std::variant<FrenchCard, Joker>;

    // Exact thirds of a point
    using Points = boost::rational<int>;
    using PlyrIdxT = uint8_t;
    using TeamIdxT = uint8_t;

    struct Config
    {
        uint8_t  n_players{4};
        PlyrIdxT first_player{0};
        // consecutive cards given to a seat per dealing pass
        uint8_t  deal_packet{1};
        uint64_t seed{std::random_device{}()};
        int      score_to_win{constants::ScoreToWin};
        // rejected choices tolerated per turn before the engine plays for the seat
        uint8_t  max_retries{3};
    };
}

#endif //TRESSETTE_TYPES_HPP
