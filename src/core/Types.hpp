#ifndef KLONDIKE_TYPES_HPP
#define KLONDIKE_TYPES_HPP

#define KLD_ENABLE_TEST_HOOKS true

#include <cstdint>
#include <cstddef>
#include <array>
#include <random>
#include <utility>

namespace klondike::core::constants
{
    inline constexpr size_t ColumnCount = 7;
    inline constexpr size_t FoundationCount = 4;
    inline constexpr size_t RanksPerSuit = 13;
    inline constexpr size_t DeckSize = FoundationCount * RanksPerSuit;
    // cards dealt into the tableau: 1 + 2 + ... + 7
    inline constexpr size_t TableauDealSize = ColumnCount * (ColumnCount + 1) / 2;
    inline constexpr size_t DrawThreeCount = 3;
}
namespace klondike::core
{
    enum class Suit : uint8_t
    {
        Hearts = 0,
        Spades,
        Diamonds,
        Clubs
    };
    inline constexpr std::array<Suit, constants::FoundationCount> AllSuits{
        Suit::Hearts, Suit::Spades, Suit::Diamonds, Suit::Clubs
    };

    enum class Rank : uint8_t
    {
        Ace = 1,
        Two,
        Three,
        Four,
        Five,
        Six,
        Seven,
        Eight,
        Nine,
        Ten,
        Jack,
        Queen,
        King
    };

    inline constexpr auto IsRed(Suit const s) noexcept -> bool
    {
        return s == Suit::Hearts || s == Suit::Diamonds;
    }

    inline constexpr auto IsOppositeColour(Suit const a, Suit const b) noexcept -> bool
    {
        return IsRed(a) != IsRed(b);
    }

    struct Card
    {
        Suit suit;
        Rank rank;

        [[nodiscard]]
        constexpr auto IsRed() const noexcept -> bool { return core::IsRed(suit); }
        [[nodiscard]]
        constexpr auto Value() const noexcept -> uint8_t { return std::to_underlying(rank); }

        friend constexpr auto operator==(Card const&, Card const&) -> bool = default;
    };

    enum class CardState : uint8_t
    {
        FaceUp,
        FaceDown
    };

    enum class GameMode : uint8_t
    {
        DrawOne,
        DrawThree
    };

    inline constexpr auto DrawCount(GameMode const m) noexcept -> size_t
    {
        return m == GameMode::DrawOne ? 1 : constants::DrawThreeCount;
    }

    struct Config
    {
        GameMode mode{GameMode::DrawOne};
        uint64_t seed{std::random_device{}()};
        // draw a batch whenever the waste runs empty while the stock still has cards
        bool     auto_draw{true};
        // allows selecting face-down cards and unchecked moves
        bool     debug_mode{false};
    };
}

#endif //KLONDIKE_TYPES_HPP
