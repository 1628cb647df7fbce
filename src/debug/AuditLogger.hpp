//
// AuditLogger.hpp
//

#ifndef RUMMIKUB_AUDITLOGGER_HPP
#define RUMMIKUB_AUDITLOGGER_HPP

#include <cstdint>
#include <fstream>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "../core/Game.hpp"
#include "../core/State.hpp"
#include "../core/Actions.hpp"
#include "../core/Types.hpp"

namespace rummikub::core::debug
{
    // Line-oriented game transcript, one file per game.
    class AuditLogger
    {
    public:
        explicit AuditLogger(std::string path);
        ~AuditLogger();

        AuditLogger(AuditLogger const&) = delete;
        auto operator=(AuditLogger const&) -> AuditLogger& = delete;

        AuditLogger(AuditLogger&&) noexcept = default;
        auto operator=(AuditLogger&&) noexcept -> AuditLogger& = default;

        // Session header (seed, player count, hands, draw pile)
        auto start(GameImpl const& game, std::uint64_t seed) -> void;

        // Per turn: snapshot the actor saw and the proposal it returned
        auto turn(GameSnapshot const& s,
                  PlyrIdxT actor,
                  Proposal const& p) -> void;

        // Per step outcome; a rejection carries its reason
        auto outcome(TurnOutcome o,
                     std::optional<error::RuleViolation> const& why = std::nullopt) -> void;

        // Game end footer (winner seat or none, final hand sizes)
        auto end(GameImpl const& game) -> void;

        auto flush() -> void;

    private:
        std::ofstream out_;
    };

    // Shared notation: R5, [R5 R6 R7], [..],[..]
    auto FormatTiles(std::span<TileSP const> tiles) -> std::string;
    auto FormatBoard(Board const& b) -> std::string;
    auto FormatProposal(Proposal const& p) -> std::string;
    auto to_string(TurnOutcome o) -> std::string_view;
}

#endif //RUMMIKUB_AUDITLOGGER_HPP
