#include "RandomAi.hpp"

#include <array>
#include <variant>

namespace klondike::core
{
    RandomAI::RandomAI(uint64_t rng_seed):
        rng_(static_cast<std::mt19937::result_type>(rng_seed)) {}

    auto RandomAI::NavigateInput() -> Input
    {
        static constexpr std::array<CursorAction, 6> actions{
            CursorAction::MoveLeft, CursorAction::MoveRight,
            CursorAction::ExtendUp, CursorAction::ExtendDown,
            CursorAction::JumpToDeck, CursorAction::JumpToLastPile
        };
        std::discrete_distribution<size_t> dist{4, 4, 2, 2, 1, 1};
        return CursorInput{actions[pick(dist)]};
    }

    auto RandomAI::NextInput(std::shared_ptr<GameSnapshot const> snapshot) -> Input
    {
        // nothing to do once the game is over; the driver decides what happens next
        if (snapshot->phase == Phase::Victory) return ClearSelectionInput{};

        bool const on_deck = std::holds_alternative<DeckSelection>(snapshot->cursor);
        bool const holding = snapshot->selected.has_value();

        // weights: navigate, select/drop, hit, clear
        std::discrete_distribution<size_t> dist{
            6.0,
            holding ? 3.0 : 2.0,
            on_deck ? 3.0 : 1.5,
            holding ? 0.5 : 0.0
        };

        switch (pick(dist))
        {
        case 0: return NavigateInput();
        case 1: return SelectInput{};
        case 2: return HitInput{};
        default: return ClearSelectionInput{};
        }
    }
}
