#ifndef KLONDIKE_INSPECTOR_HPP
#define KLONDIKE_INSPECTOR_HPP

#include <vector>
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <utility>

#include "../core/Types.hpp"
#include "../core/Collections.hpp"
#include "../core/GameState.hpp"
#include "../core/Game.hpp"

namespace klondike::core::debug
{
    struct Inspector
    {
        struct SnapshotAll
        {
            std::vector<Card> stock;
            std::vector<Card> waste;
            std::array<std::vector<ColumnEntry>, constants::ColumnCount> columns{};
            std::array<std::vector<Card>, constants::FoundationCount> foundations{};
            GameMode mode{};
        };

        static inline auto Gather(GameState const& g) -> SnapshotAll
        {
            SnapshotAll ret{};
            ret.mode = g.mode_;

            auto const stock = g.stock_.Cards();
            ret.stock.assign(stock.begin(), stock.end());
            auto const waste = g.waste_.Cards();
            ret.waste.assign(waste.begin(), waste.end());

            for (size_t i{}; i < g.columns_.size(); ++i)
            {
                auto const src = g.columns_[i].Entries();
                ret.columns[i].assign(src.begin(), src.end());
            }
            for (size_t i{}; i < g.foundations_.size(); ++i)
            {
                auto const src = g.foundations_[i].Cards();
                ret.foundations[i].assign(src.begin(), src.end());
            }
            return ret;
        }

        static inline auto Gather(Game const& g) -> SnapshotAll
        {
            return Gather(g.state_);
        }

        // Session-side selections, for checks that the clamp held after a turn.
        static inline auto Selections(Game const& g) -> std::pair<Selection, std::optional<Selection>>
        {
            return {g.cursor_, g.selected_};
        }

#if KLD_ENABLE_TEST_HOOKS == true
        // Swap in a prepared position, then finish the turn the way Step does.
        static inline auto Load(Game& g, GameState state) -> TurnOutcome
        {
            g.state_ = std::move(state);
            return g.RunTurn();
        }
#endif
    };
}

#endif //KLONDIKE_INSPECTOR_HPP
