#ifndef KLONDIKE_ACTIONS_HPP
#define KLONDIKE_ACTIONS_HPP

#include <variant>

#include "Types.hpp"
#include "Selection.hpp"

namespace klondike::core
{
    // One user input per turn.
    struct CursorInput         { CursorAction action; };
    // pick up at the cursor, or drop what is held onto the cursor
    struct SelectInput         {};
    // deck: draw; column: try to move the top card to a foundation
    struct HitInput            {};
    struct ClearSelectionInput {};
    struct ToggleDebugInput    {};
    // debug only: move without rule validation
    struct UncheckedMoveInput  {};
    // debug only: report whether held -> cursor would be legal
    struct CheckValidInput     {};

    using Input = std::variant<
      CursorInput, SelectInput, HitInput, ClearSelectionInput,
      ToggleDebugInput, UncheckedMoveInput, CheckValidInput>;

    enum class TurnOutcome : uint8_t
    {
        Continue,
        Victory
    };

    enum class Phase : uint8_t
    {
        Game,
        Victory
    };
} // namespace klondike::core

#endif //KLONDIKE_ACTIONS_HPP
