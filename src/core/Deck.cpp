#include "Deck.hpp"

#include <type_traits>
#include <utility>
#include "Cards.hpp"

namespace tressette::core
{
    template <class CardT>
    BasicDeck<CardT>::BasicDeck()
    {
        if constexpr (std::is_same_v<CardT, Card>)
        {
            cards_.reserve(constants::DeckSize);
            for (Suit const s : AllSuits)
            {
                for (Rank const r : AllRanks)
                {
                    cards_.emplace_back(s, r);
                }
            }
        }
        else
        {
            cards_.reserve(constants::FrenchDeckSize);
            for (Suit const s : AllSuits)
            {
                for (FrenchRank const r : AllFrenchRanks)
                {
                    cards_.push_back(FrenchCard{s, r});
                }
            }
        }
    }

    template <class CardT>
    auto BasicDeck<CardT>::Empty() -> BasicDeck
    {
        return BasicDeck{std::vector<CardT>{}};
    }

    template <class CardT>
    auto BasicDeck<CardT>::FromCards(std::vector<CardT> cards) -> BasicDeck
    {
        return BasicDeck{std::move(cards)};
    }

    template <class CardT>
    auto BasicDeck<CardT>::Shuffle(RandomSource& rng) -> error::ValidateResult
    {
        return Shuffler::Shuffle(std::span<CardT>{cards_}, rng);
    }

    template <class CardT>
    auto BasicDeck<CardT>::Deal(uint8_t const num_players, uint8_t const packet)
        -> error::GameResult<BasicHands<CardT>>
    {
        using error::GameErrorCode;
        if (num_players == 0 || cards_.size() % num_players != 0)
            return std::unexpected(error::Err(GameErrorCode::InvalidPlayerCount).with_players(num_players));

        size_t const per_seat = cards_.size() / num_players;
        if (packet == 0 || per_seat % packet != 0)
            return std::unexpected(error::Err(GameErrorCode::InvalidPlayerCount).with_players(num_players));

        BasicHands<CardT> hands(num_players);
        for (auto& h : hands) h.reserve(per_seat);

        for (size_t i{}; i < cards_.size(); ++i)
        {
            size_t const seat = (i / packet) % num_players;
            hands[seat].push_back(cards_[i]);
        }
        cards_.clear();
        return hands;
    }

    template <class CardT>
    auto BasicDeck<CardT>::Draw() -> std::optional<CardT>
    {
        if (cards_.empty()) return std::nullopt;
        CardT const top = cards_.back();
        cards_.pop_back();
        return top;
    }

    template <class CardT>
    auto BasicDeck<CardT>::Push(CardT const c) -> void
    {
        cards_.push_back(c);
    }

    template <class CardT>
    auto BasicDeck<CardT>::InsertAtRandom(CardT const c, RandomSource& rng) -> error::ValidateResult
    {
        if (cards_.size() < 2)
        {
            cards_.push_back(c);
            return {};
        }
        // positions 1..size-1: above the bottom card, below the top one
        size_t const slots = cards_.size() - 1;
        auto const pos = rng.NextIndex(slots);
        if (!pos.has_value())
            return std::unexpected(pos.error());
        if (*pos >= slots)
            return std::unexpected(error::Err(error::GameErrorCode::RandomSourceFailed));
        cards_.insert(cards_.begin() + static_cast<std::ptrdiff_t>(*pos + 1), c);
        return {};
    }

    template class BasicDeck<Card>;
    template class BasicDeck<FrenchCard>;
    template class BasicDeck<FrenchOrJoker>;

    auto MakeItalianDeck() -> Deck
    {
        return Deck{};
    }

    auto MakeFrenchDeck() -> FrenchDeck
    {
        return FrenchDeck{};
    }

    auto MakeFrenchDeckWithJokers(uint8_t const jokers) -> JokerDeck
    {
        std::vector<FrenchOrJoker> cards;
        cards.reserve(constants::FrenchDeckSize + jokers);
        FrenchDeck const french = MakeFrenchDeck();
        for (FrenchCard const& c : french.Cards())
        {
            cards.emplace_back(c);
        }
        for (uint8_t i{}; i < jokers; ++i)
        {
            cards.emplace_back(Joker{});
        }
        return JokerDeck::FromCards(std::move(cards));
    }
}
