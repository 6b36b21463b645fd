#ifndef KLONDIKE_KLONDIKERULES_HPP
#define KLONDIKE_KLONDIKERULES_HPP
#include "Rules.hpp"
#include "Collections.hpp"

namespace klondike::core
{
    class KlondikeRules final : public Rules
    {
    public:
        auto Validate(GameState const& state, Selection const& from, Selection const& to) const
            -> CheckResult override;

        // Checks shared by every rule set: distinct piles, no deck destination, and a source
        // holding the selected run. Returns that run bottom-first.
        static auto MovingRun(GameState const& state, Selection const& from, Selection const& to)
            -> std::expected<CardRun, error::RuleViolation>;
        // King onto an empty column, or one rank below and opposite colour to the top card.
        static auto CanLandOnColumn(Card const& c, CardColumn const& column) -> CheckResult;
        // Ace of the pile's suit onto an empty pile, or the next rank of that suit.
        static auto CanLandOnFoundation(Card const& c, FoundationPile const& pile, uint8_t pile_index) -> CheckResult;
    };

    // Pure Klondike check of moving `from` onto `to`.
    auto ValidMove(Selection const& from, Selection const& to, GameState const& state) -> error::ValidateResult;
}

#endif //KLONDIKE_KLONDIKERULES_HPP
