#ifndef KLONDIKE_ENGINE_HPP
#define KLONDIKE_ENGINE_HPP

#include <random>
#include <vector>

#include "Types.hpp"
#include "Actions.hpp"
#include "Cards.hpp"
#include "Exception.hpp"
#include "GameState.hpp"
#include "Rules.hpp"
#include "Selection.hpp"

// Operations the screen-flow/rendering side calls into. All are synchronous and
// leave the state consistent when they reject.
namespace klondike::core
{
    template <std::uniform_random_bit_generator G>
    auto NewGame(GameMode const mode, G& rng) -> GameState
    {
        return GameState::Init(ShuffledDeck(rng), mode);
    }

    // Redeal from a deck ordering captured when a game started.
    auto RestartGame(std::vector<Card> seed_deck, GameMode mode) -> GameState;

    // Validates, then transfers. A rejected move touches nothing.
    auto AttemptMove(Rules const& rules, Selection const& from, Selection const& to, GameState& state)
        -> error::ValidateResult;
    auto AttemptMove(Selection const& from, Selection const& to, GameState& state) -> error::ValidateResult;

    auto DrawFromDeck(GameState& state) -> DrawOutcome;

    // Offers the top card of a column to each foundation in turn and stops at the first that takes it.
    auto AutoPlaceToFoundation(Rules const& rules, uint8_t column_index, GameState& state) -> error::ValidateResult;
    auto AutoPlaceToFoundation(uint8_t column_index, GameState& state) -> error::ValidateResult;

    // Face-up repair of column tops, then the optional auto-draw.
    auto RestoreInvariants(GameState& state, bool auto_draw) -> void;
    // RestoreInvariants followed by the victory check.
    auto RunTurnPipeline(GameState& state, bool auto_draw = true) -> TurnOutcome;
}

#endif //KLONDIKE_ENGINE_HPP
