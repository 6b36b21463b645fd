#ifndef KLONDIKE_STATE_HPP
#define KLONDIKE_STATE_HPP

#include <array>
#include <optional>
#include <string>
#include <vector>

#include "Types.hpp"
#include "Actions.hpp"
#include "Collections.hpp"
#include "Selection.hpp"

namespace klondike::core
{
    // Immutable snapshot exposed to the renderer / players (copies, no references into the game)
    struct GameSnapshot
    {
        GameMode mode{GameMode::DrawOne};
        Phase    phase{Phase::Game};

        Selection cursor{DeckSelection{}};
        std::optional<Selection> selected{};
        bool debug_mode{false};

        std::string context_help;
        std::string status;

        size_t stock_size{};
        std::vector<Card> waste_visible; // bottom-first
        std::array<std::vector<ColumnEntry>, constants::ColumnCount> columns{};
        std::array<size_t, constants::FoundationCount> foundation_sizes{};
        std::array<std::optional<Card>, constants::FoundationCount> foundation_tops{};
    };

} // namespace klondike::core

#endif //KLONDIKE_STATE_HPP
