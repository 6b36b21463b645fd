#include "Selection.hpp"

#include <algorithm>
#include <type_traits>

#include <fmt/format.h>

#include "GameState.hpp"

namespace klondike::core
{
    // Landing on a column picks its top card, or nothing if the column is empty.
    static auto ColumnAt(uint8_t const index, GameState const& state) -> Selection
    {
        uint8_t const count = state.Column(index).Empty() ? 0 : 1;
        return ColumnSelection{index, count};
    }

    auto SameCollection(Selection const& a, Selection const& b) -> bool
    {
        if (a.index() != b.index()) return false;
        if (auto const* ca = std::get_if<ColumnSelection>(&a))
            return ca->index == std::get<ColumnSelection>(b).index;
        if (auto const* pa = std::get_if<PileSelection>(&a))
            return pa->index == std::get<PileSelection>(b).index;
        return true;
    }

    auto CardCount(Selection const& s) -> size_t
    {
        if (auto const* c = std::get_if<ColumnSelection>(&s)) return c->card_count;
        return 1;
    }

    auto MoveLeft(Selection const& s, GameState const& state) -> Selection
    {
        return std::visit([&]<typename T0>(T0 const& sel) -> Selection
        {
            using T = std::decay_t<T0>;
            if constexpr (std::is_same_v<T, DeckSelection>)
                return sel;
            else if constexpr (std::is_same_v<T, ColumnSelection>)
                return sel.index > 0 ? ColumnAt(sel.index - 1, state) : Selection{DeckSelection{}};
            else
                return ColumnAt(constants::ColumnCount - 1, state);
        }, s);
    }

    auto MoveRight(Selection const& s, GameState const& state) -> Selection
    {
        return std::visit([&]<typename T0>(T0 const& sel) -> Selection
        {
            using T = std::decay_t<T0>;
            if constexpr (std::is_same_v<T, DeckSelection>)
                return ColumnAt(0, state);
            else if constexpr (std::is_same_v<T, ColumnSelection>)
                return sel.index + 1 < constants::ColumnCount ? ColumnAt(sel.index + 1, state)
                                                              : Selection{PileSelection{0}};
            else
                return sel;
        }, s);
    }

    auto ExtendUp(Selection const& s) -> Selection
    {
        return std::visit([]<typename T0>(T0 const& sel) -> Selection
        {
            using T = std::decay_t<T0>;
            if constexpr (std::is_same_v<T, ColumnSelection>)
            {
                uint8_t const count = sel.card_count < constants::DeckSize ? sel.card_count + 1 : sel.card_count;
                return ColumnSelection{sel.index, count};
            }
            else if constexpr (std::is_same_v<T, PileSelection>)
                return PileSelection{static_cast<uint8_t>(sel.index > 0 ? sel.index - 1 : 0)};
            else
                return sel;
        }, s);
    }

    auto ExtendDown(Selection const& s) -> Selection
    {
        return std::visit([]<typename T0>(T0 const& sel) -> Selection
        {
            using T = std::decay_t<T0>;
            if constexpr (std::is_same_v<T, ColumnSelection>)
                return ColumnSelection{sel.index, static_cast<uint8_t>(sel.card_count > 0 ? sel.card_count - 1 : 0)};
            else if constexpr (std::is_same_v<T, PileSelection>)
                return PileSelection{static_cast<uint8_t>(
                    std::min<size_t>(sel.index + 1, constants::FoundationCount - 1))};
            else
                return sel;
        }, s);
    }

    auto ApplyColumnSelectionRules(Selection const& s, GameState const& state, bool const debug_mode) -> Selection
    {
        auto const* sel = std::get_if<ColumnSelection>(&s);
        if (!sel) return s;

        CardColumn const& column = state.Column(sel->index);
        size_t count = sel->card_count;

        if (!column.Empty() && count == 0)
            count = 1;

        size_t const max_count = debug_mode ? column.Size() : column.FaceUpCount();
        return ColumnSelection{sel->index, static_cast<uint8_t>(std::min(count, max_count))};
    }

    auto ApplyCursorAction(CursorAction const action, GameState const& state, Selection const& s,
                           bool const debug_mode) -> Selection
    {
        Selection next = s;
        switch (action)
        {
        case CursorAction::MoveLeft: next = MoveLeft(s, state); break;
        case CursorAction::MoveRight: next = MoveRight(s, state); break;
        case CursorAction::ExtendUp: next = ExtendUp(s); break;
        case CursorAction::ExtendDown: next = ExtendDown(s); break;
        case CursorAction::JumpToDeck: next = DeckSelection{}; break;
        case CursorAction::JumpToLastPile: next = PileSelection{0}; break;
        }
        return ApplyColumnSelectionRules(next, state, debug_mode);
    }

    auto to_string(Selection const& s) -> std::string
    {
        return std::visit([]<typename T0>(T0 const& sel) -> std::string
        {
            using T = std::decay_t<T0>;
            if constexpr (std::is_same_v<T, DeckSelection>)
                return "Deck";
            else if constexpr (std::is_same_v<T, ColumnSelection>)
                return fmt::format("Column{}x{}", sel.index, sel.card_count);
            else
                return fmt::format("Pile{}", sel.index);
        }, s);
    }

    auto to_string(CursorAction const a) -> std::string_view
    {
        switch (a)
        {
        case CursorAction::MoveLeft:       return "Left";
        case CursorAction::MoveRight:      return "Right";
        case CursorAction::ExtendUp:       return "Up";
        case CursorAction::ExtendDown:     return "Down";
        case CursorAction::JumpToDeck:     return "Home";
        case CursorAction::JumpToLastPile: return "End";
        }
        return "?";
    }
}
