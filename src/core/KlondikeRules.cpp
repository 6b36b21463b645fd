#include "KlondikeRules.hpp"

#include "GameState.hpp"
#include <type_traits>
#include <variant>

namespace
{
    inline auto Viol(klondike::core::error::RuleViolationCode code) -> klondike::core::error::RuleViolation
    {
        return klondike::core::error::RuleViolation{ .code = code };
    }
}

namespace klondike::core
{
    auto KlondikeRules::MovingRun(GameState const& state, Selection const& from, Selection const& to)
        -> std::expected<CardRun, error::RuleViolation>
    {
        using RVC = ::klondike::core::error::RuleViolationCode;

        if (SameCollection(from, to))
            return std::unexpected(Viol(RVC::SameCollection));

        if (std::holds_alternative<DeckSelection>(to))
            return std::unexpected(Viol(RVC::DestinationIsDeck));

        size_t const count = CardCount(from);
        if (count == 0)
            return std::unexpected(Viol(RVC::SelectionEmpty));

        std::optional<CardRun> run = state.PeekRun(from);
        if (!run)
        {
            size_t const available = std::visit([](auto const* c) { return c->Size(); }, state.CollectionAt(from));
            if (available == 0)
                return std::unexpected(Viol(RVC::SourceEmpty));
            return std::unexpected(Viol(RVC::SelectionExceedsColumn)
                                   .with_attempted(static_cast<std::uint8_t>(count))
                                   .with_available(static_cast<std::uint8_t>(available)));
        }
        return std::move(*run);
    }

    auto KlondikeRules::CanLandOnColumn(Card const& c, CardColumn const& column) -> CheckResult
    {
        using RVC = ::klondike::core::error::RuleViolationCode;

        std::optional<Card> const top = column.Peek();
        if (!top)
        {
            if (c.rank != Rank::King)
                return std::unexpected(Viol(RVC::Column_NeedsKing).with_card(c));
            return {};
        }
        if (!IsOppositeColour(c.suit, top->suit))
            return std::unexpected(Viol(RVC::Column_SameColour).with_card(c).with_target(*top));
        if (c.Value() + 1 != top->Value())
            return std::unexpected(Viol(RVC::Column_RankNotBelow).with_card(c).with_target(*top));
        return {};
    }

    auto KlondikeRules::CanLandOnFoundation(Card const& c, FoundationPile const& pile, uint8_t const pile_index)
        -> CheckResult
    {
        using RVC = ::klondike::core::error::RuleViolationCode;

        if (c.suit != GameState::FoundationSuit(pile_index))
            return std::unexpected(Viol(RVC::Foundation_SuitMismatch).with_card(c).with_foundation(pile_index));

        std::optional<Card> const top = pile.Peek();
        if (!top)
        {
            if (c.rank != Rank::Ace)
                return std::unexpected(Viol(RVC::Foundation_NeedsAce).with_card(c).with_foundation(pile_index));
            return {};
        }
        if (c.Value() != top->Value() + 1)
            return std::unexpected(Viol(RVC::Foundation_RankNotNext)
                                   .with_card(c).with_target(*top).with_foundation(pile_index));
        return {};
    }

    auto KlondikeRules::Validate(GameState const& state, Selection const& from, Selection const& to) const
        -> CheckResult
    {
        using RVC = ::klondike::core::error::RuleViolationCode;

        auto const run = MovingRun(state, from, to);
        if (!run.has_value())
            return std::unexpected(run.error());

        // bottom card of the run is the one that has to fit
        Card const& moving = run->front();

        return std::visit([&]<typename T0>(T0 const& dst) -> CheckResult
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, PileSelection>)
            {
                if (std::holds_alternative<PileSelection>(from))
                    return std::unexpected(Viol(RVC::Foundation_FromFoundation).with_foundation(dst.index));

                if (run->size() != 1)
                    return std::unexpected(Viol(RVC::Foundation_MultipleCards)
                                           .with_attempted(static_cast<std::uint8_t>(run->size())));

                return CanLandOnFoundation(moving, state.Foundation(dst.index), dst.index);
            }
            else if constexpr (std::is_same_v<T, ColumnSelection>)
            {
                return CanLandOnColumn(moving, state.Column(dst.index));
            }
            else
            {
                return std::unexpected(Viol(RVC::DestinationIsDeck));
            }
        }, to);
    }

    auto ValidMove(Selection const& from, Selection const& to, GameState const& state) -> error::ValidateResult
    {
        return KlondikeRules{}.Validate(state, from, to);
    }
}
