#ifndef KLONDIKE_AUDITLOGGER_HPP
#define KLONDIKE_AUDITLOGGER_HPP

#include <cstdint>
#include <fstream>
#include <string>

#include "../core/Game.hpp"
#include "../core/State.hpp"
#include "../core/Actions.hpp"
#include "../core/Types.hpp"

namespace klondike::core::debug
{
    // Plain-text transcript of a session, one block per turn.
    class AuditLogger
    {
    public:
        explicit AuditLogger(std::string path);
        ~AuditLogger();

        AuditLogger(AuditLogger const&) = delete;
        auto operator=(AuditLogger const&) -> AuditLogger& = delete;

        AuditLogger(AuditLogger&&) noexcept = default;
        auto operator=(AuditLogger&&) noexcept -> AuditLogger& = default;

        // Session header (seed, draw mode)
        auto start(Game const& game, std::uint64_t seed) -> void;

        // Per turn (before Step): snapshot and the input about to be applied
        auto turn(GameSnapshot const& s, Input const& input) -> void;

        // Per turn (fallback when the input is unavailable in black-box tests)
        auto turn(GameSnapshot const& s) -> void;

        // Per step outcome (after Step)
        auto outcome(TurnOutcome o, std::string const& status) -> void;

        // Game end footer (foundation heights, won or not)
        auto end(Game const& game) -> void;

        auto flush() -> void;

        [[nodiscard]] auto good() const -> bool { return out_.good(); }

    private:
        std::ofstream out_;
    };
}

#endif //KLONDIKE_AUDITLOGGER_HPP
