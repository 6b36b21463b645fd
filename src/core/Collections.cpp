#include "Collections.hpp"

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <ranges>
#include <type_traits>

namespace
{
    using klondike::core::error::RuleViolation;
    using klondike::core::error::RuleViolationCode;

    inline auto Viol(RuleViolationCode code) -> RuleViolation
    {
        return RuleViolation{ .code = code };
    }

    auto CheckTakeCount(size_t const n, size_t const available) -> klondike::core::error::ValidateResult
    {
        if (n == 0)
            return std::unexpected(Viol(RuleViolationCode::Take_ZeroCards));
        if (n > available)
            return std::unexpected(Viol(RuleViolationCode::Take_TooMany)
                                   .with_attempted(static_cast<std::uint8_t>(n))
                                   .with_available(static_cast<std::uint8_t>(available)));
        return {};
    }

    auto CheckSingleReceive(size_t const n) -> klondike::core::error::ValidateResult
    {
        if (n == 0)
            return std::unexpected(Viol(RuleViolationCode::Receive_Empty));
        if (n > 1)
            return std::unexpected(Viol(RuleViolationCode::Receive_MultipleCards)
                                   .with_attempted(static_cast<std::uint8_t>(n)));
        return {};
    }

    template <typename Vec>
    auto TopRun(Vec const& v, size_t const n) -> std::optional<klondike::core::CardRun>
    {
        if (n > v.size()) return std::nullopt;
        klondike::core::CardRun run;
        run.reserve(n);
        for (auto it = v.end() - static_cast<std::ptrdiff_t>(n); it != v.end(); ++it)
        {
            if constexpr (std::is_same_v<typename Vec::value_type, klondike::core::ColumnEntry>)
                run.push_back(it->card);
            else
                run.push_back(*it);
        }
        return run;
    }
}

namespace klondike::core
{
    // ---------- CardStack ----------

    auto CardStack::CanTake(size_t const n) const -> error::ValidateResult
    {
        return CheckTakeCount(n, cards_.size());
    }

    auto CardStack::CanReceive(size_t const n) const -> error::ValidateResult
    {
        return CheckSingleReceive(n);
    }

    auto CardStack::Take(size_t const n) -> TakeResult
    {
        if (auto const ok = CanTake(n); !ok.has_value())
            return std::unexpected(ok.error());

        auto const start = cards_.end() - static_cast<std::ptrdiff_t>(n);
        CardRun run(start, cards_.end());
        cards_.erase(start, cards_.end());
        return run;
    }

    auto CardStack::Receive(CardRun cards) -> error::ValidateResult
    {
        if (auto const ok = CanReceive(cards.size()); !ok.has_value())
            return ok;
        cards_.push_back(cards.front());
        return {};
    }

    auto CardStack::Peek() const -> std::optional<Card>
    {
        if (cards_.empty()) return std::nullopt;
        return cards_.back();
    }

    auto CardStack::PeekN(size_t const n) const -> std::optional<CardRun>
    {
        return TopRun(cards_, n);
    }

    auto CardStack::Pop() -> Card
    {
        KLD_ASSERT(!cards_.empty(), "Pop from empty card stack");
        Card const c = cards_.back();
        cards_.pop_back();
        return c;
    }

    // ---------- CardColumn ----------

    auto CardColumn::CanTake(size_t const n) const -> error::ValidateResult
    {
        return CheckTakeCount(n, entries_.size());
    }

    auto CardColumn::CanReceive(size_t const n) const -> error::ValidateResult
    {
        if (n == 0)
            return std::unexpected(Viol(error::RuleViolationCode::Receive_Empty));
        return {};
    }

    auto CardColumn::Take(size_t const n) -> TakeResult
    {
        if (auto const ok = CanTake(n); !ok.has_value())
            return std::unexpected(ok.error());

        auto const start = entries_.end() - static_cast<std::ptrdiff_t>(n);
        CardRun run;
        run.reserve(n);
        std::ranges::transform(start, entries_.end(), std::back_inserter(run),
                               [](ColumnEntry const& e) { return e.card; });
        entries_.erase(start, entries_.end());
        return run;
    }

    auto CardColumn::Receive(CardRun cards) -> error::ValidateResult
    {
        if (auto const ok = CanReceive(cards.size()); !ok.has_value())
            return ok;
        for (Card const& c : cards)
        {
            entries_.push_back(ColumnEntry{c, CardState::FaceUp});
        }
        return {};
    }

    auto CardColumn::Peek() const -> std::optional<Card>
    {
        if (entries_.empty()) return std::nullopt;
        return entries_.back().card;
    }

    auto CardColumn::PeekN(size_t const n) const -> std::optional<CardRun>
    {
        return TopRun(entries_, n);
    }

    auto CardColumn::FaceUpCount() const noexcept -> size_t
    {
        auto const face_up = entries_ | std::views::reverse
                           | std::views::take_while([](ColumnEntry const& e)
                             {
                                 return e.state == CardState::FaceUp;
                             });
        return static_cast<size_t>(std::ranges::distance(face_up));
    }

    auto CardColumn::RevealTop() -> bool
    {
        if (entries_.empty() || entries_.back().state == CardState::FaceUp) return false;
        entries_.back().state = CardState::FaceUp;
        return true;
    }

    // ---------- FoundationPile ----------

    auto FoundationPile::CanTake(size_t const n) const -> error::ValidateResult
    {
        if (n > 1)
            return std::unexpected(Viol(error::RuleViolationCode::Take_MultipleFromFoundation)
                                   .with_attempted(static_cast<std::uint8_t>(n)));
        return CheckTakeCount(n, cards_.size());
    }

    auto FoundationPile::CanReceive(size_t const n) const -> error::ValidateResult
    {
        return CheckSingleReceive(n);
    }

    auto FoundationPile::Take(size_t const n) -> TakeResult
    {
        if (auto const ok = CanTake(n); !ok.has_value())
            return std::unexpected(ok.error());
        CardRun run{cards_.back()};
        cards_.pop_back();
        return run;
    }

    auto FoundationPile::Receive(CardRun cards) -> error::ValidateResult
    {
        if (auto const ok = CanReceive(cards.size()); !ok.has_value())
            return ok;
        cards_.push_back(cards.front());
        return {};
    }

    auto FoundationPile::Peek() const -> std::optional<Card>
    {
        if (cards_.empty()) return std::nullopt;
        return cards_.back();
    }

    auto FoundationPile::PeekN(size_t const n) const -> std::optional<CardRun>
    {
        return TopRun(cards_, n);
    }
}
