#ifndef KLONDIKE_EXCEPTION_HPP
#define KLONDIKE_EXCEPTION_HPP

#include "OmegaException.hpp"

#include <expected>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

#include "Types.hpp"
#include "Cards.hpp"

namespace klondike::core::error
{
    enum class Code : unsigned
    {
        TransferFailed, // collection take/receive that must not fail did
        Assertion // internal assertion failed
    };

    struct TransferError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct AssertionError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    [[noreturn]]
    inline auto fail(Code c, std::string msg,
                     std::source_location const& loc = std::source_location::current()) -> void
    {
        switch (c)
        {
        case Code::TransferFailed: throw TransferError(std::move(msg), c, loc);
        case Code::Assertion: throw AssertionError(std::move(msg), c, loc);
        }
        throw std::runtime_error(msg);
    }

#define KLD_THROW(code_enum, msg) ::klondike::core::error::fail((code_enum), (msg))
#define KLD_ASSERT(cond, msg) do { if(!(cond)) ::klondike::core::error::fail(::klondike::core::error::Code::Assertion, (msg)); } while(0)

    // Fine-grained reasons; grouped by where the move was rejected.
    enum class RuleViolationCode : std::uint16_t
    {
        // Generic
        SameCollection,
        DestinationIsDeck,
        SourceEmpty,
        SelectionEmpty,
        SelectionExceedsColumn,

        // Foundation destination
        Foundation_FromFoundation,
        Foundation_MultipleCards,
        Foundation_SuitMismatch,
        Foundation_NeedsAce,
        Foundation_RankNotNext,

        // Column destination
        Column_NeedsKing,
        Column_SameColour,
        Column_RankNotBelow,

        // Smart move to stack
        AutoPlace_NoFoundationAccepts,

        // Collection transfer
        Take_ZeroCards,
        Take_TooMany,
        Take_MultipleFromFoundation,
        Receive_Empty,
        Receive_MultipleCards
    };

    // What the caller is told; the code above is only for logs and tests.
    enum class MoveErrorKind : std::uint8_t
    {
        InvalidMove,
        CollectionTransferFailed
    };

    inline auto kind_of(RuleViolationCode const c) -> MoveErrorKind
    {
        using E = RuleViolationCode;
        switch (c)
        {
        case E::Take_ZeroCards:
        case E::Take_TooMany:
        case E::Take_MultipleFromFoundation:
        case E::Receive_Empty:
        case E::Receive_MultipleCards:
            return MoveErrorKind::CollectionTransferFailed;
        default:
            return MoveErrorKind::InvalidMove;
        }
    }

    // Compact, optional context carried with the violation.
    struct RuleViolation
    {
        RuleViolationCode code{};

        std::optional<Card> card{}; // card being moved (bottom of a run)
        std::optional<Card> target{}; // top card of the destination
        std::optional<std::uint8_t> attempted_count{};
        std::optional<std::uint8_t> available_count{};
        std::optional<std::uint8_t> foundation{};

        [[nodiscard]]
        auto kind() const -> MoveErrorKind { return kind_of(code); }

        auto with_card(Card const& c) -> RuleViolation&
        {
            card = c;
            return *this;
        }

        auto with_target(Card const& c) -> RuleViolation&
        {
            target = c;
            return *this;
        }

        auto with_attempted(std::uint8_t v) -> RuleViolation&
        {
            attempted_count = v;
            return *this;
        }

        auto with_available(std::uint8_t v) -> RuleViolation&
        {
            available_count = v;
            return *this;
        }

        auto with_foundation(std::uint8_t v) -> RuleViolation&
        {
            foundation = v;
            return *this;
        }
    };

    inline auto to_string(RuleViolationCode c) -> std::string_view
    {
        using E = RuleViolationCode;
        switch (c)
        {
        case E::SameCollection: return "Source and destination are the same pile";
        case E::DestinationIsDeck: return "Cards cannot be moved onto the deck";
        case E::SourceEmpty: return "Source pile is empty";
        case E::SelectionEmpty: return "No cards selected";
        case E::SelectionExceedsColumn: return "Selection larger than column";

        case E::Foundation_FromFoundation: return "Foundation: cannot move between foundations";
        case E::Foundation_MultipleCards: return "Foundation: only one card at a time";
        case E::Foundation_SuitMismatch: return "Foundation: suit does not match";
        case E::Foundation_NeedsAce: return "Foundation: empty pile needs an ace";
        case E::Foundation_RankNotNext: return "Foundation: rank is not next in sequence";

        case E::Column_NeedsKing: return "Column: empty column needs a king";
        case E::Column_SameColour: return "Column: colours must alternate";
        case E::Column_RankNotBelow: return "Column: rank must be one below";

        case E::AutoPlace_NoFoundationAccepts: return "No foundation accepts the card";

        case E::Take_ZeroCards: return "Take: zero cards requested";
        case E::Take_TooMany: return "Take: more cards requested than present";
        case E::Take_MultipleFromFoundation: return "Take: foundation gives one card at a time";
        case E::Receive_Empty: return "Receive: no cards given";
        case E::Receive_MultipleCards: return "Receive: pile accepts one card at a time";
        }
        return "Unknown";
    }

    inline auto describe(RuleViolation const& v) -> std::string
    {
        // Build a compact, reproducible message for logs/tests.
        auto s = fmt::format("{}", to_string(v.code));
        if (v.card) s += fmt::format(" | card={}", *v.card);
        if (v.target) s += fmt::format(" | onto={}", *v.target);
        if (v.foundation) s += fmt::format(" | pile={}", *v.foundation);
        if (v.attempted_count) s += fmt::format(" | attempted={}", *v.attempted_count);
        if (v.available_count) s += fmt::format(" | available={}", *v.available_count);
        return s;
    }

    using ValidateResult = std::expected<void, RuleViolation>;
}

#endif //KLONDIKE_EXCEPTION_HPP
