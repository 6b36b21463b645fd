#ifndef KLONDIKE_COLLECTIONS_HPP
#define KLONDIKE_COLLECTIONS_HPP

#include <concepts>
#include <expected>
#include <optional>
#include <span>
#include <utility>
#include <vector>

#include "Types.hpp"
#include "Exception.hpp"

namespace klondike::core
{
    using CardRun = std::vector<Card>;
    using TakeResult = std::expected<CardRun, error::RuleViolation>;

    // Every pile type offers the same four operations; legality differs per type.
    template <typename T>
    concept CardCollection = requires(T& c, T const& cc, size_t n, CardRun cards)
    {
        { cc.CanTake(n) } -> std::same_as<error::ValidateResult>;
        { cc.CanReceive(n) } -> std::same_as<error::ValidateResult>;
        { c.Take(n) } -> std::same_as<TakeResult>;
        { c.Receive(std::move(cards)) } -> std::same_as<error::ValidateResult>;
        { cc.Peek() } -> std::same_as<std::optional<Card>>;
        { cc.PeekN(n) } -> std::same_as<std::optional<CardRun>>;
        { cc.Size() } -> std::convertible_to<size_t>;
    };

    // Deck (stock) and waste. Takes any run from the top, receives one card per call.
    class CardStack
    {
    public:
        CardStack() = default;
        explicit CardStack(CardRun cards) : cards_(std::move(cards)) {}

        auto CanTake(size_t n) const -> error::ValidateResult;
        auto CanReceive(size_t n) const -> error::ValidateResult;
        auto Take(size_t n) -> TakeResult;
        auto Receive(CardRun cards) -> error::ValidateResult;
        auto Peek() const -> std::optional<Card>;
        auto PeekN(size_t n) const -> std::optional<CardRun>;

        auto Size() const noexcept -> size_t { return cards_.size(); }
        auto Empty() const noexcept -> bool { return cards_.empty(); }
        auto Cards() const noexcept -> std::span<Card const> { return cards_; }

        // Raw stack access for dealing and drawing; bypasses the one-card receive limit.
        auto Push(Card const& c) -> void { cards_.push_back(c); }
        auto Pop() -> Card;

    private:
        CardRun cards_;
    };

    struct ColumnEntry
    {
        Card card;
        CardState state{CardState::FaceUp};

        friend constexpr auto operator==(ColumnEntry const&, ColumnEntry const&) -> bool = default;
    };

    // Tableau column, bottom-to-top. Received cards always land face-up.
    class CardColumn
    {
    public:
        auto CanTake(size_t n) const -> error::ValidateResult;
        auto CanReceive(size_t n) const -> error::ValidateResult;
        auto Take(size_t n) -> TakeResult;
        auto Receive(CardRun cards) -> error::ValidateResult;
        auto Peek() const -> std::optional<Card>;
        auto PeekN(size_t n) const -> std::optional<CardRun>;

        auto Size() const noexcept -> size_t { return entries_.size(); }
        auto Empty() const noexcept -> bool { return entries_.empty(); }
        auto Entries() const noexcept -> std::span<ColumnEntry const> { return entries_; }

        // Length of the contiguous face-up run counted from the top.
        auto FaceUpCount() const noexcept -> size_t;
        // Turns the top card face-up; true if it was face-down.
        auto RevealTop() -> bool;
        auto Deal(Card const& c, CardState state) -> void { entries_.push_back(ColumnEntry{c, state}); }

    private:
        std::vector<ColumnEntry> entries_;
    };

    // Foundation pile. One card in, one card out.
    class FoundationPile
    {
    public:
        auto CanTake(size_t n) const -> error::ValidateResult;
        auto CanReceive(size_t n) const -> error::ValidateResult;
        auto Take(size_t n) -> TakeResult;
        auto Receive(CardRun cards) -> error::ValidateResult;
        auto Peek() const -> std::optional<Card>;
        auto PeekN(size_t n) const -> std::optional<CardRun>;

        auto Size() const noexcept -> size_t { return cards_.size(); }
        auto Empty() const noexcept -> bool { return cards_.empty(); }
        auto Cards() const noexcept -> std::span<Card const> { return cards_; }

    private:
        CardRun cards_;
    };

    static_assert(CardCollection<CardStack>);
    static_assert(CardCollection<CardColumn>);
    static_assert(CardCollection<FoundationPile>);
}

#endif //KLONDIKE_COLLECTIONS_HPP
