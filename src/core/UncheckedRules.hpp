#ifndef KLONDIKE_UNCHECKEDRULES_HPP
#define KLONDIKE_UNCHECKEDRULES_HPP

#include "Rules.hpp"
#include "KlondikeRules.hpp"

namespace klondike::core
{
    // Debug-mode rules: anything goes as long as the piles can physically hand the cards over.
    class UncheckedRules final : public Rules
    {
    public:
        auto Validate(GameState const& state, Selection const& from, Selection const& to) const
            -> CheckResult override
        {
            if (auto const run = KlondikeRules::MovingRun(state, from, to); !run.has_value())
                return std::unexpected(run.error());
            return {};
        }
    };
}

#endif //KLONDIKE_UNCHECKEDRULES_HPP
