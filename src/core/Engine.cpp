#include "Engine.hpp"

#include <utility>

#include "KlondikeRules.hpp"

namespace klondike::core
{
    auto RestartGame(std::vector<Card> seed_deck, GameMode const mode) -> GameState
    {
        return GameState::Init(std::move(seed_deck), mode);
    }

    auto AttemptMove(Rules const& rules, Selection const& from, Selection const& to, GameState& state)
        -> error::ValidateResult
    {
        if (auto const ok = rules.Validate(state, from, to); !ok.has_value())
            return ok;
        return state.Transfer(from, to);
    }

    auto AttemptMove(Selection const& from, Selection const& to, GameState& state) -> error::ValidateResult
    {
        return AttemptMove(KlondikeRules{}, from, to, state);
    }

    auto DrawFromDeck(GameState& state) -> DrawOutcome
    {
        return state.Draw();
    }

    auto AutoPlaceToFoundation(Rules const& rules, uint8_t const column_index, GameState& state)
        -> error::ValidateResult
    {
        using RVC = ::klondike::core::error::RuleViolationCode;

        std::optional<Card> const top = state.Column(column_index).Peek();
        if (!top)
            return std::unexpected(error::RuleViolation{ .code = RVC::SourceEmpty });

        Selection const from = ColumnSelection{column_index, 1};
        for (uint8_t i{}; i < constants::FoundationCount; ++i)
        {
            Selection const to = PileSelection{i};
            if (rules.Validate(state, from, to).has_value())
            {
                return state.Transfer(from, to);
            }
        }
        return std::unexpected(error::RuleViolation{ .code = RVC::AutoPlace_NoFoundationAccepts }.with_card(*top));
    }

    auto AutoPlaceToFoundation(uint8_t const column_index, GameState& state) -> error::ValidateResult
    {
        return AutoPlaceToFoundation(KlondikeRules{}, column_index, state);
    }

    auto RestoreInvariants(GameState& state, bool const auto_draw) -> void
    {
        state.RevealColumnTops();

        // an empty stock with cards in the waste waits for an explicit draw to recycle
        if (auto_draw && state.Waste().Empty() && !state.Stock().Empty())
        {
            state.Draw();
        }
    }

    auto RunTurnPipeline(GameState& state, bool const auto_draw) -> TurnOutcome
    {
        RestoreInvariants(state, auto_draw);
        return state.IsVictory() ? TurnOutcome::Victory : TurnOutcome::Continue;
    }
}
