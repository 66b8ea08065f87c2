#ifndef TRESSETTE_AUDITLOGGER_HPP
#define TRESSETTE_AUDITLOGGER_HPP

#include <cstdint>
#include <fstream>
#include <string>

#include "../core/Game.hpp"
#include "../core/Match.hpp"
#include "../core/Actions.hpp"
#include "../core/Types.hpp"

namespace tressette::core::debug
{
    // Plain text transcript of a match, enough to replay it from the seed.
    class AuditLogger
    {
    public:
        explicit AuditLogger(std::string path);
        ~AuditLogger();

        AuditLogger(AuditLogger const&) = delete;
        auto operator=(AuditLogger const&) -> AuditLogger& = delete;

        AuditLogger(AuditLogger&&) noexcept = default;
        auto operator=(AuditLogger&&) noexcept -> AuditLogger& = default;

        // Session header (seed, player count, target)
        auto start(Match const& match) -> void;

        // Hand header: seed, lead and every dealt hand
        auto deal(Game const& game) -> void;

        // One accepted card
        auto play(TrickPlay const& p) -> void;

        // Per step outcome
        auto outcome(MoveOutcome m) -> void;

        auto trick(TrickResolved const& t) -> void;

        // Hand footer: exact card points, whole points, running totals
        auto hand(GameOver const& over, TeamScore const& totals) -> void;

        // Match footer (winning team; -1 if none)
        auto end(Match const& match) -> void;

        // Manual flush
        auto flush() -> void;

    private:
        std::ofstream out_;
    };
}

#endif //TRESSETTE_AUDITLOGGER_HPP
