#ifndef KLONDIKE_INVARIANTS_HPP
#define KLONDIKE_INVARIANTS_HPP

#include "../core/Game.hpp"
#include "../core/Exception.hpp"
#include "../core/Util.hpp"
#include "Inspector.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <variant>

namespace klondike::core::debug
{
    // A second layer of checks over the authoritative state. Throws AssertionError on the
    // first broken invariant so tests can EXPECT_NO_THROW around it.
    inline auto CheckInvariants(GameState const& g) -> void
    {
#if KLD_ENABLE_TEST_HOOKS == false
        (void)g;
#else
    Inspector::SnapshotAll const s = Inspector::Gather(g);

    // 1) Every card in exactly one collection, 52 in total
    {
        util::CardUniqueChecker checker{};
        for (Card const& c : s.stock) checker.Add(c);
        for (Card const& c : s.waste) checker.Add(c);
        for (auto const& col : s.columns) for (ColumnEntry const& e : col) checker.Add(e.card);
        for (auto const& pile : s.foundations) for (Card const& c : pile) checker.Add(c);

        KLD_ASSERT(!checker.ContainsDup(), "Duplicate card across collections");
        KLD_ASSERT(checker.Count() == constants::DeckSize,
                   fmt::format("Materialized card count {} != deck size", checker.Count()));
        KLD_ASSERT(checker.IsFullDeck(), "Cards across collections are not one full deck");
    }

    // 2) Foundations: own suit only, Ace upward without gaps
    for (size_t i{}; i < s.foundations.size(); ++i)
    {
        auto const& pile = s.foundations[i];
        for (size_t k{}; k < pile.size(); ++k)
        {
            KLD_ASSERT(pile[k].suit == GameState::FoundationSuit(i),
                       fmt::format("Foundation {} holds {} of the wrong suit", i, pile[k]));
            KLD_ASSERT(pile[k].Value() == k + 1,
                       fmt::format("Foundation {} out of sequence at {}", i, pile[k]));
        }
    }

    // 3) Column tops are face-up once a turn has finished
    for (size_t i{}; i < s.columns.size(); ++i)
    {
        auto const& col = s.columns[i];
        KLD_ASSERT(col.empty() || col.back().state == CardState::FaceUp,
                   fmt::format("Column {} ends face-down", i));
    }
#endif // KLD_ENABLE_TEST_HOOKS == true
    }

    inline auto CheckInvariants(Game const& g) -> void
    {
#if KLD_ENABLE_TEST_HOOKS == false
        (void)g;
#else
    CheckInvariants(g.State());

    // 4) Column selections never exceed what is selectable
    auto const check_sel = [&](Selection const& sel)
    {
        auto const* col = std::get_if<ColumnSelection>(&sel);
        if (!col) return;
        CardColumn const& column = g.State().Column(col->index);
        size_t const max_count = g.DebugMode() ? column.Size() : column.FaceUpCount();
        KLD_ASSERT(col->card_count <= max_count,
                   fmt::format("Selection {} exceeds {} selectable cards", to_string(sel), max_count));
        KLD_ASSERT(column.Empty() || col->card_count > 0 || max_count == 0,
                   fmt::format("Selection {} is empty on a non-empty column", to_string(sel)));
    };

    auto const [cursor, selected] = Inspector::Selections(g);
    check_sel(cursor);
    if (selected) check_sel(*selected);

    // 5) Victory phase exactly when every foundation is complete
    KLD_ASSERT((g.PhaseNow() == Phase::Victory) == g.State().IsVictory(), "Phase disagrees with victory check");
#endif // KLD_ENABLE_TEST_HOOKS == true
    }
}
#endif //KLONDIKE_INVARIANTS_HPP
