#ifndef TRESSETTE_DECK_HPP
#define TRESSETTE_DECK_HPP

#include <optional>
#include <span>
#include <utility>
#include <vector>
#include "Types.hpp"
#include "Exception.hpp"
#include "Shuffler.hpp"

namespace tressette::core
{
    template <class CardT>
    using BasicHands = std::vector<std::vector<CardT>>;
    using DealtHands = BasicHands<Card>;

    // Ordered card sequence. Index 0 is the bottom, Back() is the top.
    // Instantiated for Card, FrenchCard and FrenchOrJoker.
    template <class CardT>
    class BasicDeck
    {
    public:
        // Every card of the pack once, in canonical order. No jokers.
        BasicDeck();

        static auto Empty() -> BasicDeck;
        static auto FromCards(std::vector<CardT> cards) -> BasicDeck;

        auto Shuffle(RandomSource& rng) -> error::ValidateResult;

        // Round-robin deal from the bottom of the deck: seat 0 receives the
        // first `packet` cards, seat 1 the next, and so on. Empties the deck
        // on success, leaves it untouched on failure.
        auto Deal(uint8_t num_players, uint8_t packet = 1) -> error::GameResult<BasicHands<CardT>>;

        // Takes the top card, nullopt when the deck is empty.
        auto Draw() -> std::optional<CardT>;
        auto Push(CardT c) -> void;
        // Places the card strictly between the bottom and the top card.
        // A lone card only leaves the slot above it.
        auto InsertAtRandom(CardT c, RandomSource& rng) -> error::ValidateResult;

        auto Size() const noexcept -> size_t { return cards_.size(); }
        auto IsEmpty() const noexcept -> bool { return cards_.empty(); }
        auto Cards() const noexcept -> std::span<CardT const> { return cards_; }

    private:
        explicit BasicDeck(std::vector<CardT> cards) : cards_(std::move(cards)) {}

        std::vector<CardT> cards_;
    };

    using Deck = BasicDeck<Card>;
    using FrenchDeck = BasicDeck<FrenchCard>;
    using JokerDeck = BasicDeck<FrenchOrJoker>;

    // 40 card Italian deck.
    auto MakeItalianDeck() -> Deck;
    // 52 card French deck.
    auto MakeFrenchDeck() -> FrenchDeck;
    // 52 French cards followed by `jokers` jokers on top.
    auto MakeFrenchDeckWithJokers(uint8_t jokers) -> JokerDeck;
}

#endif //TRESSETTE_DECK_HPP
