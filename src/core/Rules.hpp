#ifndef KLONDIKE_RULES_HPP
#define KLONDIKE_RULES_HPP

#include "Types.hpp"
#include "Exception.hpp"
#include "Selection.hpp"

namespace klondike::core
{
    //forward declaration
    class GameState;

    class Rules
    {
    public:
        using CheckResult = error::ValidateResult;

        virtual ~Rules() = default;

        // Returns unexpected(reason) for ordinary illegal moves (NOT exceptions).
        // Throw only for engine misuse / broken invariants. Never mutates state.
        virtual auto Validate(GameState const& state, Selection const& from, Selection const& to) const
            -> CheckResult = 0;
    };
}

#endif //KLONDIKE_RULES_HPP
