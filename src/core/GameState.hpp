#ifndef KLONDIKE_GAMESTATE_HPP
#define KLONDIKE_GAMESTATE_HPP

#include <array>
#include <optional>
#include <span>
#include <type_traits>
#include <variant>
#include <vector>

#include "Types.hpp"
#include "Collections.hpp"
#include "Exception.hpp"
#include "Selection.hpp"

namespace klondike::core::debug {struct Inspector;}
namespace klondike::core
{
    using CollectionPtr = std::variant<CardStack*, CardColumn*, FoundationPile*>;
    using ConstCollectionPtr = std::variant<CardStack const*, CardColumn const*, FoundationPile const*>;

    enum class DrawOutcome : uint8_t
    {
        Drew,
        Recycled,
        Nothing
    };

    // Sole owner of all 52 cards: stock, waste, seven columns and four foundations.
    class GameState
    {
    public:
        GameState() = default;

        // Deals column i with i+1 face-down cards from the back of the deck; the rest is the stock.
        static auto Init(std::vector<Card> deck, GameMode mode = GameMode::DrawOne) -> GameState;
        // Every foundation complete, every other pile empty.
        static auto Victory() -> GameState;
        // Victory() with the King of Hearts moved back onto column 0.
        static auto AlmostVictory() -> GameState;

        // Moves one batch from stock to waste, or recycles the waste when the stock is empty.
        auto Draw() -> DrawOutcome;
        // Forces every non-empty column's top card face-up. Returns how many were flipped.
        auto RevealColumnTops() -> size_t;
        auto IsVictory() const -> bool;

        // Takes CardCount(from) cards from one collection and gives them to another.
        // Both sides are checked before either is touched.
        auto Transfer(Selection const& from, Selection const& to) -> error::ValidateResult;

        auto CollectionAt(Selection const& s) -> CollectionPtr;
        auto CollectionAt(Selection const& s) const -> ConstCollectionPtr;
        // The cards a selection refers to, bottom-first; nothing if the pile is too short.
        auto PeekRun(Selection const& s) const -> std::optional<CardRun>;

        auto Mode() const noexcept -> GameMode { return mode_; }
        auto Stock() const noexcept -> CardStack const& { return stock_; }
        auto Waste() const noexcept -> CardStack const& { return waste_; }
        auto Column(size_t idx) const -> CardColumn const&;
        auto Foundation(size_t idx) const -> FoundationPile const&;
        // Top waste cards on display: one in DrawOne, up to three in DrawThree.
        auto VisibleWaste() const -> std::span<Card const>;
        auto TotalCards() const -> size_t;

        static auto FoundationSuit(size_t idx) -> Suit;

        friend struct debug::Inspector;

    private:
        template <typename Self>
        static auto CollectionAtImpl(Self& self, Selection const& s)
            -> std::conditional_t<std::is_const_v<Self>, ConstCollectionPtr, CollectionPtr>;

        CardStack stock_;
        CardStack waste_;
        std::array<CardColumn, constants::ColumnCount> columns_{};
        std::array<FoundationPile, constants::FoundationCount> foundations_{};
        GameMode mode_{GameMode::DrawOne};
    };
}
#endif //KLONDIKE_GAMESTATE_HPP
