#ifndef TRESSETTE_EXCEPTION_HPP
#define TRESSETTE_EXCEPTION_HPP

#include "OmegaException.hpp"

#include <expected>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <fmt/format.h>
#include "Types.hpp"
#include "Actions.hpp"
#include "Cards.hpp"

namespace tressette::core::error
{
    enum class Code : unsigned
    {
        Unknown, // unknown error
        Rules, // rules engine misuse (not user invalid move)
        State, // state engine misuse (not user invalid move)
        Assertion // internal assertion failed
    };

    struct UnknownError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct RulesError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct StateError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct AssertionError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    [[noreturn]]
    inline auto fail(Code c, std::string msg,
                     std::source_location const& loc = std::source_location::current()) -> void
    {
        switch (c)
        {
        case Code::Unknown: throw UnknownError(std::move(msg), c, loc);
        case Code::Rules: throw RulesError(std::move(msg), c, loc);
        case Code::State: throw StateError(std::move(msg), c, loc);
        case Code::Assertion: throw AssertionError(std::move(msg), c, loc);
        }
        throw std::runtime_error(msg);
    }

#define TRS_THROW(code_enum, msg) ::tressette::core::error::fail((code_enum), (msg))
#define TRS_ASSERT(cond, msg) do { if(!(cond)) ::tressette::core::error::fail(::tressette::core::error::Code::Assertion, (msg)); } while(0)

    // Caller mistakes. Returned as values, engine state is left untouched.
    enum class GameErrorCode : std::uint8_t
    {
        InvalidPlayerCount,
        InvalidSeat,
        NotPlayerTurn,
        CardNotInHand,
        IllegalPlay,
        InvalidGameState,
        RandomSourceFailed
    };

    // Compact, optional context carried with the error.
    struct GameError
    {
        GameErrorCode code{};
        std::optional<Phase> phase{};
        std::optional<PlyrIdxT> actor{};
        std::optional<PlyrIdxT> expected_actor{};
        std::optional<std::uint8_t> player_count{};
        std::optional<Card> card{};
        std::optional<Suit> led_suit{};

        auto with_phase(Phase p) -> GameError&
        {
            phase = p;
            return *this;
        }

        auto with_actor(PlyrIdxT s) -> GameError&
        {
            actor = s;
            return *this;
        }

        auto with_expected(PlyrIdxT s) -> GameError&
        {
            expected_actor = s;
            return *this;
        }

        auto with_players(std::uint8_t n) -> GameError&
        {
            player_count = n;
            return *this;
        }

        auto with_card(Card c) -> GameError&
        {
            card = c;
            return *this;
        }

        auto with_led(Suit s) -> GameError&
        {
            led_suit = s;
            return *this;
        }
    };

    inline auto Err(GameErrorCode code) -> GameError
    {
        return GameError{.code = code};
    }

    inline auto to_string(GameErrorCode c) -> std::string_view
    {
        using E = GameErrorCode;
        switch (c)
        {
        case E::InvalidPlayerCount: return "Invalid player count";
        case E::InvalidSeat: return "Seat out of range";
        case E::NotPlayerTurn: return "Not this seat's turn";
        case E::CardNotInHand: return "Card not in hand";
        case E::IllegalPlay: return "Illegal play (must follow the led suit)";
        case E::InvalidGameState: return "Operation not allowed in current state";
        case E::RandomSourceFailed: return "Random source failed";
        }
        return "Unknown";
    }

    inline auto to_string(Phase p) -> std::string_view
    {
        switch (p)
        {
        case Phase::AwaitingDeal: return "AwaitingDeal";
        case Phase::InProgress: return "InProgress";
        case Phase::TrickComplete: return "TrickComplete";
        case Phase::GameComplete: return "GameComplete";
        }
        return "?";
    }

    inline auto describe(GameError const& e) -> std::string
    {
        // Build a compact, reproducible message for logs/tests.
        auto s = fmt::format("{}", to_string(e.code));
        if (e.phase) s += fmt::format(" | phase={}", to_string(*e.phase));
        if (e.actor) s += fmt::format(" | actor=P{}", static_cast<int>(*e.actor));
        if (e.expected_actor) s += fmt::format(" | turn=P{}", static_cast<int>(*e.expected_actor));
        if (e.player_count) s += fmt::format(" | players={}", static_cast<int>(*e.player_count));
        if (e.card) s += fmt::format(" | card={}", ToString(*e.card));
        if (e.led_suit) s += fmt::format(" | led={}", ToString(*e.led_suit));
        return s;
    }

    template <typename T>
    using GameResult = std::expected<T, GameError>;
    using ValidateResult = std::expected<void, GameError>;
}

#endif //TRESSETTE_EXCEPTION_HPP
