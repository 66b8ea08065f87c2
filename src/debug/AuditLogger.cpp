#include "AuditLogger.hpp"

#include <span>
#include <string_view>
#include <fmt/format.h>

#include "../core/Cards.hpp"

using namespace tressette::core;

namespace
{

auto s_cards(std::span<Card const> cards) -> std::string
{
    std::string body;
    for (size_t i{}; i < cards.size(); ++i)
    {
        body += (i ? "," : "");
        body += ToString(cards[i]);
    }
    return body;
}

auto s_plays(std::span<TrickPlay const> plays) -> std::string
{
    std::string body;
    for (size_t i{}; i < plays.size(); ++i)
    {
        body += (i ? "," : "");
        body += fmt::format("P{}:{}", static_cast<int>(plays[i].seat), plays[i].card);
    }
    return body;
}

auto s_outcome(MoveOutcome const m) -> std::string_view
{
    switch (m)
    {
        case MoveOutcome::Invalid:    return "Invalid";
        case MoveOutcome::Applied:    return "Applied";
        case MoveOutcome::TrickEnded: return "TrickEnded";
        case MoveOutcome::GameEnded:  return "GameEnded";
        case MoveOutcome::MatchEnded: return "MatchEnded";
    }
    return "?";
}

} // anonymous namespace

namespace tressette::core::debug
{

AuditLogger::AuditLogger(std::string path)
    : out_(std::move(path), std::ios::out | std::ios::trunc)
{
}

AuditLogger::~AuditLogger() = default;

auto AuditLogger::start(Match const& match) -> void
{
    out_ << fmt::format("Seed={}\n", match.Cfg().seed);
    out_ << fmt::format("Players={}\n", static_cast<int>(match.PlayerCount()));
    out_ << fmt::format("Target={}\n", match.Cfg().score_to_win);
    out_.flush();
}

auto AuditLogger::deal(Game const& game) -> void
{
    out_ << fmt::format("Hand seed={} lead=P{}\n", game.Seed(), static_cast<int>(game.NextToPlay()));
    for (PlyrIdxT i{}; i < game.PlayerCount(); ++i)
    {
        auto const hand = game.HandOf(i);
        out_ << fmt::format("  P{}=[{}]\n", static_cast<int>(i),
                            hand.has_value() ? s_cards(*hand) : error::describe(hand.error()));
    }
}

auto AuditLogger::play(TrickPlay const& p) -> void
{
    out_ << fmt::format("Play P{} {}\n", static_cast<int>(p.seat), p.card);
}

auto AuditLogger::outcome(MoveOutcome const m) -> void
{
    out_ << fmt::format("Outcome: {}\n", s_outcome(m));
}

auto AuditLogger::trick(TrickResolved const& t) -> void
{
    out_ << fmt::format("Trick #{} [{}] taker=P{} points={}\n",
                        static_cast<int>(t.trick_number),
                        s_plays(t.plays),
                        static_cast<int>(t.winner),
                        ToString(t.points_awarded));
}

auto AuditLogger::hand(GameOver const& over, TeamScore const& totals) -> void
{
    std::string seats;
    auto const s = over.final_scores.Seats();
    for (size_t i{}; i < s.size(); ++i)
    {
        seats += fmt::format("{}P{}:{}", (i ? "," : ""), i, ToString(s[i]));
    }

    out_ << fmt::format("Hand: cards=[{}] points={}-{} last=T{} winner={} totals={}-{}\n",
                        seats,
                        over.hand.points[0], over.hand.points[1],
                        static_cast<int>(over.hand.last_trick_team),
                        over.winner ? fmt::format("T{}", *over.winner) : std::string("tie"),
                        totals[0], totals[1]);
    out_.flush();
}

auto AuditLogger::end(Match const& match) -> void
{
    auto const w = match.Winner();
    out_ << fmt::format("Winner={} hands={}\n", w ? static_cast<int>(*w) : -1, match.HandsPlayed());
    out_.flush();
}

auto AuditLogger::flush() -> void
{
    out_.flush();
}

} // namespace tressette::core::debug
