#include <gtest/gtest.h>

#include "../core/Cards.hpp"
#include "../core/Engine.hpp"
#include "../core/GameState.hpp"
#include "../core/Selection.hpp"

using namespace klondike::core;

namespace
{
    // Dealt and with column tops revealed: every column shows exactly one face-up card.
    auto DealtOrdered() -> GameState
    {
        GameState g = GameState::Init(OrderedDeck());
        RestoreInvariants(g, true);
        return g;
    }
}

TEST(Selection_Navigate, Left_Right_Walk_Deck_Columns_Piles)
{
    GameState const g = DealtOrdered();

    Selection s = DeckSelection{};
    EXPECT_EQ(MoveLeft(s, g), Selection{DeckSelection{}});

    s = MoveRight(s, g);
    EXPECT_EQ(s, (Selection{ColumnSelection{0, 1}}));

    for (int i = 0; i < 6; ++i) s = MoveRight(s, g);
    EXPECT_EQ(s, (Selection{ColumnSelection{6, 1}}));

    s = MoveRight(s, g);
    EXPECT_EQ(s, (Selection{PileSelection{0}}));
    EXPECT_EQ(MoveRight(s, g), s);

    EXPECT_EQ(MoveLeft(PileSelection{3}, g), (Selection{ColumnSelection{6, 1}}));
    EXPECT_EQ(MoveLeft(ColumnSelection{0, 1}, g), Selection{DeckSelection{}});
}

TEST(Selection_Navigate, Landing_On_Empty_Column_Selects_Nothing)
{
    GameState const g = GameState::AlmostVictory();
    EXPECT_EQ(MoveRight(ColumnSelection{0, 1}, g), (Selection{ColumnSelection{1, 0}}));
    EXPECT_EQ(MoveRight(DeckSelection{}, g), (Selection{ColumnSelection{0, 1}}));
}

TEST(Selection_Navigate, Up_Down_Resize_Or_Cycle_Piles)
{
    EXPECT_EQ(ExtendUp(ColumnSelection{2, 1}), (Selection{ColumnSelection{2, 2}}));
    EXPECT_EQ(ExtendDown(ColumnSelection{2, 1}), (Selection{ColumnSelection{2, 0}}));
    EXPECT_EQ(ExtendDown(ColumnSelection{2, 0}), (Selection{ColumnSelection{2, 0}}));

    EXPECT_EQ(ExtendUp(PileSelection{0}), (Selection{PileSelection{0}}));
    EXPECT_EQ(ExtendUp(PileSelection{2}), (Selection{PileSelection{1}}));
    EXPECT_EQ(ExtendDown(PileSelection{1}), (Selection{PileSelection{2}}));
    EXPECT_EQ(ExtendDown(PileSelection{3}), (Selection{PileSelection{3}}));

    EXPECT_EQ(ExtendUp(DeckSelection{}), Selection{DeckSelection{}});
}

TEST(Selection_Clamp, FaceUp_Run_Bounds_Column_Selection)
{
    GameState const g = DealtOrdered();

    // column 3 holds four cards, one face-up
    EXPECT_EQ(ApplyColumnSelectionRules(ColumnSelection{3, 4}, g, false), (Selection{ColumnSelection{3, 1}}));
    EXPECT_EQ(ApplyColumnSelectionRules(ColumnSelection{3, 0}, g, false), (Selection{ColumnSelection{3, 1}}));

    // debug mode reaches the face-down cards too
    EXPECT_EQ(ApplyColumnSelectionRules(ColumnSelection{3, 9}, g, true), (Selection{ColumnSelection{3, 4}}));

    // deck and piles are untouched
    EXPECT_EQ(ApplyColumnSelectionRules(PileSelection{2}, g, false), (Selection{PileSelection{2}}));
}

TEST(Selection_Clamp, Is_Idempotent)
{
    GameState const g = DealtOrdered();
    for (uint8_t col{}; col < constants::ColumnCount; ++col)
    {
        for (uint8_t n{}; n < 10; ++n)
        {
            for (bool const debug : {false, true})
            {
                Selection const once = ApplyColumnSelectionRules(ColumnSelection{col, n}, g, debug);
                EXPECT_EQ(ApplyColumnSelectionRules(once, g, debug), once);
            }
        }
    }
}

TEST(Selection_Clamp, Empty_Column_Stays_Zero)
{
    GameState const g = GameState::AlmostVictory();
    EXPECT_EQ(ApplyColumnSelectionRules(ColumnSelection{4, 3}, g, false), (Selection{ColumnSelection{4, 0}}));
}

TEST(Selection_Cursor, Actions_Apply_Clamp)
{
    GameState const g = DealtOrdered();

    EXPECT_EQ(ApplyCursorAction(CursorAction::ExtendUp, g, ColumnSelection{5, 1}),
              (Selection{ColumnSelection{5, 1}}));
    EXPECT_EQ(ApplyCursorAction(CursorAction::ExtendUp, g, ColumnSelection{5, 1}, true),
              (Selection{ColumnSelection{5, 2}}));
    EXPECT_EQ(ApplyCursorAction(CursorAction::ExtendDown, g, ColumnSelection{5, 1}),
              (Selection{ColumnSelection{5, 1}}));

    EXPECT_EQ(ApplyCursorAction(CursorAction::JumpToDeck, g, ColumnSelection{5, 1}), Selection{DeckSelection{}});
    EXPECT_EQ(ApplyCursorAction(CursorAction::JumpToLastPile, g, DeckSelection{}), (Selection{PileSelection{0}}));
}

TEST(Selection_Helpers, Same_Collection_And_Count)
{
    EXPECT_TRUE(SameCollection(DeckSelection{}, DeckSelection{}));
    EXPECT_TRUE(SameCollection(ColumnSelection{2, 1}, ColumnSelection{2, 3}));
    EXPECT_FALSE(SameCollection(ColumnSelection{2, 1}, ColumnSelection{3, 1}));
    EXPECT_FALSE(SameCollection(PileSelection{1}, PileSelection{2}));
    EXPECT_FALSE(SameCollection(DeckSelection{}, PileSelection{0}));

    EXPECT_EQ(CardCount(DeckSelection{}), 1u);
    EXPECT_EQ(CardCount(PileSelection{3}), 1u);
    EXPECT_EQ(CardCount(ColumnSelection{0, 4}), 4u);

    EXPECT_EQ(to_string(Selection{ColumnSelection{3, 2}}), "Column3x2");
    EXPECT_EQ(to_string(Selection{PileSelection{1}}), "Pile1");
}
