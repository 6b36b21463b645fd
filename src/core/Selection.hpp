#ifndef KLONDIKE_SELECTION_HPP
#define KLONDIKE_SELECTION_HPP

#include <string>
#include <string_view>
#include <variant>

#include "Types.hpp"

namespace klondike::core
{
    //forward declaration
    class GameState;

    struct DeckSelection
    {
        friend constexpr auto operator==(DeckSelection const&, DeckSelection const&) -> bool = default;
    };
    struct ColumnSelection
    {
        uint8_t index{};
        uint8_t card_count{};
        friend constexpr auto operator==(ColumnSelection const&, ColumnSelection const&) -> bool = default;
    };
    struct PileSelection
    {
        uint8_t index{};
        friend constexpr auto operator==(PileSelection const&, PileSelection const&) -> bool = default;
    };

    // Location plus run length; carries nothing about how it is drawn.
    using Selection = std::variant<DeckSelection, ColumnSelection, PileSelection>;

    enum class CursorAction : uint8_t
    {
        MoveLeft,
        MoveRight,
        ExtendUp,
        ExtendDown,
        JumpToDeck,
        JumpToLastPile
    };

    // Same variant and, for columns and piles, the same index. Run length is ignored.
    auto SameCollection(Selection const& a, Selection const& b) -> bool;
    // Cards a selection moves: the run length for columns, otherwise one.
    auto CardCount(Selection const& s) -> size_t;

    auto MoveLeft(Selection const& s, GameState const& state) -> Selection;
    auto MoveRight(Selection const& s, GameState const& state) -> Selection;
    auto ExtendUp(Selection const& s) -> Selection;
    auto ExtendDown(Selection const& s) -> Selection;

    // Raises an empty selection on a non-empty column to one card, then clamps the count
    // to the face-up run (or to the whole column in debug mode).
    auto ApplyColumnSelectionRules(Selection const& s, GameState const& state, bool debug_mode) -> Selection;

    auto ApplyCursorAction(CursorAction action, GameState const& state, Selection const& s,
                           bool debug_mode = false) -> Selection;

    auto to_string(Selection const& s) -> std::string;
    auto to_string(CursorAction a) -> std::string_view;
}

#endif //KLONDIKE_SELECTION_HPP
