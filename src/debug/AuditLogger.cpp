#include "AuditLogger.hpp"

#include <string_view>
#include <utility>
#include <type_traits>
#include <variant>

#include <fmt/format.h>

#include "../core/Cards.hpp"

using namespace klondike::core;

namespace
{

auto s_mode(GameMode const m) -> std::string_view
{
    return m == GameMode::DrawOne ? "draw-1" : "draw-3";
}

auto s_input(Input const& in) -> std::string
{
    return std::visit(
        [&]<typename T0>(T0 const& i) -> std::string
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, CursorInput>)
            {
                return fmt::format("Cursor({})", to_string(i.action));
            }
            else if constexpr (std::is_same_v<T, SelectInput>)
            {
                return "Select";
            }
            else if constexpr (std::is_same_v<T, HitInput>)
            {
                return "Hit";
            }
            else if constexpr (std::is_same_v<T, ClearSelectionInput>)
            {
                return "Clear";
            }
            else if constexpr (std::is_same_v<T, ToggleDebugInput>)
            {
                return "ToggleDebug";
            }
            else if constexpr (std::is_same_v<T, UncheckedMoveInput>)
            {
                return "UncheckedMove";
            }
            else
            {
                return "CheckValid";
            }
        },
        in
    );
}

auto serialize_columns(GameSnapshot const& s) -> std::string
{
    std::string serial;

    for (size_t i{}; i < s.columns.size(); ++i)
    {
        serial += (i ? " | " : "");

        for (ColumnEntry const& e : s.columns[i])
        {
            serial += e.state == CardState::FaceUp ? to_string(e.card) : std::string("##");
            serial += ' ';
        }
    }

    return serial;
}

auto serialize_foundations(GameSnapshot const& s) -> std::string
{
    std::string serial;

    for (size_t i{}; i < s.foundation_tops.size(); ++i)
    {
        serial += fmt::format(
            "{}{}",
            (i ? "," : ""),
            s.foundation_tops[i] ? to_string(*s.foundation_tops[i]) : std::string("--")
        );
    }

    return serial;
}

auto serialize_waste(GameSnapshot const& s) -> std::string
{
    std::string serial;

    for (size_t i{}; i < s.waste_visible.size(); ++i)
    {
        serial += (i ? "," : "");
        serial += to_string(s.waste_visible[i]);
    }

    return serial;
}

auto write_turn_header(std::ofstream& out, GameSnapshot const& s) -> void
{
    out << fmt::format(
        "Turn cursor={} held={} stock={} waste=[{}] found=[{}]\n",
        to_string(s.cursor),
        s.selected ? to_string(*s.selected) : std::string("-"),
        s.stock_size,
        serialize_waste(s),
        serialize_foundations(s)
    );
    out << fmt::format("Tableau: {}\n", serialize_columns(s));
}

} // anonymous namespace

namespace klondike::core::debug
{

AuditLogger::AuditLogger(std::string path)
    : out_(std::move(path), std::ios::out | std::ios::trunc)
{
}

AuditLogger::~AuditLogger() = default;

auto AuditLogger::start(Game const& game, uint64_t seed) -> void
{
    out_ << fmt::format("Seed={}\n", seed);
    out_ << fmt::format("Mode={}\n", s_mode(game.State().Mode()));
    out_ << fmt::format("AutoDraw={}\n", game.Settings().auto_draw);
    out_.flush();
}

auto AuditLogger::turn(GameSnapshot const& s, Input const& input) -> void
{
    write_turn_header(out_, s);
    out_ << fmt::format("Input: {}\n", s_input(input));
}

auto AuditLogger::turn(GameSnapshot const& s) -> void
{
    write_turn_header(out_, s);
    out_ << "Input: <omitted>\n";
}

auto AuditLogger::outcome(TurnOutcome const o, std::string const& status) -> void
{
    char const* txt = (o == TurnOutcome::Victory ? "Victory" : "Continue");
    if (status.empty())
    {
        out_ << fmt::format("Outcome: {}\n", txt);
        return;
    }
    out_ << fmt::format("Outcome: {} ({})\n", txt, status);
}

auto AuditLogger::end(Game const& game) -> void
{
    std::string body;
    size_t placed{};

    for (size_t i{}; i < constants::FoundationCount; ++i)
    {
        size_t const n = game.State().Foundation(i).Size();
        placed += n;
        body += fmt::format("{}{}:{}", (i ? "," : ""), to_string(GameState::FoundationSuit(i)), n);
    }

    out_ << fmt::format("Foundations=[{}] placed={}\n", body, placed);
    out_ << fmt::format("Won={}\n", game.State().IsVictory());
    out_.flush();
}

auto AuditLogger::flush() -> void
{
    out_.flush();
}

} // namespace klondike::core::debug
