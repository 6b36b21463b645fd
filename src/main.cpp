//
// main.cpp: headless driver, deals a game and lets the random player press keys
//

#include <charconv>
#include <cstdint>
#include <cstring>
#include <memory>
#include <optional>
#include <string>

#include <fmt/format.h>

#include "core/Game.hpp"
#include "core/Cards.hpp"
#include "core/RandomAi.hpp"
#include "core/Exception.hpp"
#include "debug/AuditLogger.hpp"

namespace
{
    struct DriverConfig
    {
        klondike::core::Config game{};
        std::uint64_t max_turns{20000};
        std::optional<std::string> log_path{};
    };

    auto ParseArgs(int argc, char** argv) -> DriverConfig
    {
        DriverConfig cfg{};

        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];

            auto next_uint = [&](std::uint64_t& out)
            {
                if (i + 1 >= argc) { return false; }
                char const* s = argv[++i];
                auto res = std::from_chars(s, s + std::strlen(s), out);
                return res.ec == std::errc{};
            };

            if (arg == "--seed")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.game.seed = v; }
            }
            else if (arg == "--mode")
            {
                std::uint64_t v{};
                if (next_uint(v))
                {
                    cfg.game.mode = (v == 3) ? klondike::core::GameMode::DrawThree
                                             : klondike::core::GameMode::DrawOne;
                }
            }
            else if (arg == "--turns")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.max_turns = v; }
            }
            else if (arg == "--log")
            {
                if (i + 1 < argc) { cfg.log_path = argv[++i]; }
            }
            else if (arg == "--debug")
            {
                cfg.game.debug_mode = true;
            }
            else if (arg == "--no-auto-draw")
            {
                cfg.game.auto_draw = false;
            }
            else
            {
                fmt::print(stderr, "[klondike] ignoring unknown argument {}\n", arg);
            }
        }
        return cfg;
    }

    void PrintBoard(klondike::core::GameSnapshot const& s)
    {
        using namespace klondike::core;

        std::string top = fmt::format("stock:{:>2}  waste:", s.stock_size);
        for (Card const& c : s.waste_visible) top += fmt::format(" {}", c);
        top += "   foundations:";
        for (auto const& f : s.foundation_tops) top += f ? fmt::format(" {}", *f) : std::string(" --");
        fmt::print("{}\n", top);

        for (size_t i{}; i < s.columns.size(); ++i)
        {
            std::string line = fmt::format("  {}:", i + 1);
            for (ColumnEntry const& e : s.columns[i])
            {
                line += e.state == CardState::FaceUp ? fmt::format(" {}", e.card) : std::string(" ##");
            }
            fmt::print("{}\n", line);
        }
    }
}

int main(int argc, char** argv)
{
    using namespace klondike;
    using namespace klondike::core;

    DriverConfig const dc = ParseArgs(argc, argv);

    fmt::print("[klondike] seed {} draw-{}{}\n",
               dc.game.seed,
               DrawCount(dc.game.mode),
               dc.game.debug_mode ? " (debug)" : "");

    try
    {
        Game game(dc.game);
        RandomAI ai(dc.game.seed ^ 0x9e3779b97f4a7c15ULL);

        std::unique_ptr<debug::AuditLogger> log;
        if (dc.log_path)
        {
            log = std::make_unique<debug::AuditLogger>(*dc.log_path);
            if (!log->good())
            {
                fmt::print(stderr, "[klondike] cannot open {} for writing\n", *dc.log_path);
                return 1;
            }
            log->start(game, dc.game.seed);
        }

        TurnOutcome outcome = TurnOutcome::Continue;
        std::uint64_t turn{};

        for (; turn < dc.max_turns && outcome != TurnOutcome::Victory; ++turn)
        {
            auto const snap = game.Snapshot();
            Input const input = ai.NextInput(snap);
            if (log) log->turn(*snap, input);

            outcome = game.Step(input);
            if (log) log->outcome(outcome, game.Status());
        }

        if (log) log->end(game);

        PrintBoard(*game.Snapshot());
        fmt::print("[klondike] {} after {} turn(s)\n",
                   outcome == TurnOutcome::Victory ? "won" : "stopped", turn);
        return outcome == TurnOutcome::Victory ? 0 : 2;
    }
    catch (OmegaException<error::Code> const& e)
    {
        fmt::print(stderr, "[klondike] {}", e);
        return 1;
    }
}
