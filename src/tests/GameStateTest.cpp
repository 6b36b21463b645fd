#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <variant>
#include <vector>

#include "../core/Cards.hpp"
#include "../core/GameState.hpp"
#include "../debug/Inspector.hpp"
#include "../debug/Invariants.hpp"

using namespace klondike::core;
using RVC = error::RuleViolationCode;

TEST(GameState_Init, Deals_Triangle_FaceDown_Rest_To_Stock)
{
    auto const deck = OrderedDeck();
    GameState const g = GameState::Init(deck);

    for (size_t i{}; i < constants::ColumnCount; ++i)
    {
        CardColumn const& c = g.Column(i);
        EXPECT_EQ(c.Size(), i + 1);
        EXPECT_EQ(c.FaceUpCount(), 0u);
    }
    EXPECT_EQ(g.Stock().Size(), constants::DeckSize - constants::TableauDealSize);
    EXPECT_TRUE(g.Waste().Empty());
    for (size_t i{}; i < constants::FoundationCount; ++i) EXPECT_TRUE(g.Foundation(i).Empty());

    // dealt from the back of the deck: column 0 gets the last card
    EXPECT_EQ(g.Column(0).Peek(), deck[51]);
    EXPECT_EQ(g.Column(6).Peek(), deck[24]);
    EXPECT_EQ(g.Stock().Peek(), deck[23]);
    EXPECT_EQ(g.TotalCards(), constants::DeckSize);
}

TEST(GameState_Init, Short_Deck_Throws)
{
    std::vector<Card> deck = OrderedDeck();
    deck.resize(20);
    EXPECT_THROW(GameState::Init(deck), error::AssertionError);
}

TEST(GameState_Draw, DrawOne_Moves_Top_Of_Stock)
{
    GameState g = GameState::Init(OrderedDeck());

    EXPECT_EQ(g.Draw(), DrawOutcome::Drew);
    EXPECT_EQ(g.Waste().Peek(), (Card{Suit::Spades, Rank::Jack}));
    EXPECT_EQ(g.Stock().Size(), 23u);
    EXPECT_EQ(g.VisibleWaste().size(), 1u);
}

TEST(GameState_Draw, DrawThree_Exhaust_Then_Recycle)
{
    GameState g = GameState::Init(OrderedDeck(), GameMode::DrawThree);
    std::vector<Card> const initial_stock(g.Stock().Cards().begin(), g.Stock().Cards().end());

    EXPECT_EQ(g.Draw(), DrawOutcome::Drew);
    ASSERT_EQ(g.VisibleWaste().size(), 3u);
    EXPECT_EQ(g.VisibleWaste()[0], (Card{Suit::Spades, Rank::Jack}));
    EXPECT_EQ(g.VisibleWaste()[2], (Card{Suit::Spades, Rank::Nine}));

    while (!g.Stock().Empty())
    {
        EXPECT_EQ(g.Draw(), DrawOutcome::Drew);
        EXPECT_EQ(g.TotalCards(), constants::DeckSize);
    }
    EXPECT_EQ(g.Waste().Size(), 24u);
    EXPECT_EQ(g.Waste().Peek(), (Card{Suit::Hearts, Rank::Ace}));

    EXPECT_EQ(g.Draw(), DrawOutcome::Recycled);
    EXPECT_TRUE(g.Waste().Empty());
    std::vector<Card> const recycled(g.Stock().Cards().begin(), g.Stock().Cards().end());
    EXPECT_EQ(recycled, initial_stock);
}

TEST(GameState_Draw, DrawThree_Short_Stock_Takes_What_Is_Left)
{
    std::vector<Card> deck = OrderedDeck();
    deck.erase(deck.begin(), deck.begin() + 22); // 30 cards: 28 dealt, 2 in stock
    GameState g = GameState::Init(deck, GameMode::DrawThree);

    ASSERT_EQ(g.Stock().Size(), 2u);
    EXPECT_EQ(g.Draw(), DrawOutcome::Drew);
    EXPECT_EQ(g.Waste().Size(), 2u);
    EXPECT_TRUE(g.Stock().Empty());
}

TEST(GameState_Draw, Nothing_When_Both_Empty)
{
    GameState g = GameState::Victory();
    EXPECT_EQ(g.Draw(), DrawOutcome::Nothing);
}

TEST(GameState_Reveal, Flips_Each_Column_Top_Once)
{
    GameState g = GameState::Init(OrderedDeck());
    EXPECT_EQ(g.RevealColumnTops(), constants::ColumnCount);
    EXPECT_EQ(g.RevealColumnTops(), 0u);
    for (size_t i{}; i < constants::ColumnCount; ++i)
    {
        EXPECT_EQ(g.Column(i).FaceUpCount(), 1u);
    }
}

TEST(GameState_Fixtures, Victory_And_AlmostVictory)
{
    GameState const won = GameState::Victory();
    EXPECT_TRUE(won.IsVictory());
    EXPECT_EQ(won.TotalCards(), constants::DeckSize);
    EXPECT_NO_THROW(klondike::core::debug::CheckInvariants(won));

    EXPECT_FALSE(GameState::Init(OrderedDeck()).IsVictory());

    GameState const almost = GameState::AlmostVictory();
    EXPECT_FALSE(almost.IsVictory());
    EXPECT_EQ(almost.Column(0).Peek(), (Card{Suit::Hearts, Rank::King}));
    EXPECT_EQ(almost.Column(0).FaceUpCount(), 1u);
    EXPECT_EQ(almost.Foundation(0).Size(), 12u);
    EXPECT_NO_THROW(klondike::core::debug::CheckInvariants(almost));
}

TEST(GameState_Transfer, Moves_Run_And_Keeps_Count)
{
    GameState g = GameState::Init(OrderedDeck());
    g.RevealColumnTops();

    // any pair of distinct piles; legality is not checked here
    ASSERT_TRUE(g.Transfer(ColumnSelection{6, 3}, ColumnSelection{0, 1}).has_value());
    EXPECT_EQ(g.Column(6).Size(), 4u);
    EXPECT_EQ(g.Column(0).Size(), 4u);
    EXPECT_EQ(g.Column(0).FaceUpCount(), 4u);
    EXPECT_EQ(g.TotalCards(), constants::DeckSize);
}

TEST(GameState_Transfer, Rejects_Before_Mutating)
{
    GameState g = GameState::Init(OrderedDeck());
    auto const before = klondike::core::debug::Inspector::Gather(g);

    auto const same = g.Transfer(ColumnSelection{2, 1}, ColumnSelection{2, 1});
    ASSERT_FALSE(same.has_value());
    EXPECT_EQ(same.error().code, RVC::SameCollection);

    auto const too_many = g.Transfer(ColumnSelection{2, 9}, ColumnSelection{3, 1});
    ASSERT_FALSE(too_many.has_value());
    EXPECT_EQ(too_many.error().code, RVC::Take_TooMany);

    auto const empty_waste = g.Transfer(DeckSelection{}, PileSelection{0});
    ASSERT_FALSE(empty_waste.has_value());
    EXPECT_EQ(empty_waste.error().code, RVC::Take_TooMany);

    auto const to_waste = g.Transfer(ColumnSelection{2, 2}, DeckSelection{});
    ASSERT_FALSE(to_waste.has_value());
    EXPECT_EQ(to_waste.error().code, RVC::Receive_MultipleCards);

    auto const after = klondike::core::debug::Inspector::Gather(g);
    for (size_t i{}; i < constants::ColumnCount; ++i) EXPECT_EQ(after.columns[i], before.columns[i]);
    EXPECT_EQ(after.stock, before.stock);
    EXPECT_TRUE(after.waste.empty());
}

TEST(GameState_Access, Out_Of_Range_Index_Throws)
{
    GameState const g = GameState::Init(OrderedDeck());
    EXPECT_THROW((void)g.Column(7), error::AssertionError);
    EXPECT_THROW((void)g.Foundation(4), error::AssertionError);
    EXPECT_THROW((void)g.PeekRun(PileSelection{9}), error::AssertionError);
}

TEST(GameState_Access, Const_And_Mutable_CollectionAt_Agree)
{
    GameState g = GameState::Init(OrderedDeck());
    GameState const& cg = g;

    auto const waste = cg.CollectionAt(DeckSelection{});
    ASSERT_TRUE(std::holds_alternative<CardStack const*>(waste));
    EXPECT_EQ(std::get<CardStack const*>(waste), &cg.Waste());

    auto const column = cg.CollectionAt(ColumnSelection{3, 1});
    ASSERT_TRUE(std::holds_alternative<CardColumn const*>(column));
    EXPECT_EQ(std::get<CardColumn const*>(column), &cg.Column(3));
    EXPECT_EQ(std::get<CardColumn*>(g.CollectionAt(ColumnSelection{3, 1})), &cg.Column(3));

    auto const pile = cg.CollectionAt(PileSelection{2});
    ASSERT_TRUE(std::holds_alternative<FoundationPile const*>(pile));
    EXPECT_EQ(std::get<FoundationPile const*>(pile), &cg.Foundation(2));

    EXPECT_THROW((void)cg.CollectionAt(ColumnSelection{7, 1}), error::AssertionError);
    EXPECT_THROW((void)g.CollectionAt(PileSelection{4}), error::AssertionError);
}

TEST(GameState_Errors, Fail_Raises_Exception_Matching_Code)
{
    EXPECT_THROW(error::fail(error::Code::TransferFailed, "take failed"), error::TransferError);
    EXPECT_THROW(error::fail(error::Code::Assertion, "bad index"), error::AssertionError);

    try
    {
        KLD_THROW(error::Code::TransferFailed, std::string("receive failed"));
        FAIL() << "KLD_THROW returned";
    }
    catch (error::TransferError const& e)
    {
        EXPECT_EQ(e.data(), error::Code::TransferFailed);
        EXPECT_EQ(e.what(), "receive failed");
    }
}
