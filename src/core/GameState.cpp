#include "GameState.hpp"

#include <algorithm>
#include <ranges>
#include <type_traits>
#include <utility>

#include <fmt/format.h>

namespace klondike::core
{
    auto GameState::Init(std::vector<Card> deck, GameMode const mode) -> GameState
    {
        KLD_ASSERT(deck.size() >= constants::TableauDealSize, "Not enough cards in deck to deal the tableau");

        GameState gs{};
        gs.mode_ = mode;
        for (size_t i{}; i < constants::ColumnCount; ++i)
        {
            for (size_t j{}; j <= i; ++j)
            {
                gs.columns_[i].Deal(deck.back(), CardState::FaceDown);
                deck.pop_back();
            }
        }
        gs.stock_ = CardStack(std::move(deck));
        return gs;
    }

    auto GameState::Victory() -> GameState
    {
        GameState gs{};
        for (size_t i{}; i < constants::FoundationCount; ++i)
        {
            for (size_t r{1}; r <= constants::RanksPerSuit; ++r)
            {
                auto const ok = gs.foundations_[i].Receive({Card{FoundationSuit(i), static_cast<Rank>(r)}});
                KLD_ASSERT(ok.has_value(), "Foundation refused a single card while building victory state");
            }
        }
        return gs;
    }

    auto GameState::AlmostVictory() -> GameState
    {
        GameState gs = Victory();
        auto const ok = gs.Transfer(PileSelection{0}, ColumnSelection{0, 1});
        KLD_ASSERT(ok.has_value(), "Could not move a king off a complete foundation");
        return gs;
    }

    auto GameState::Draw() -> DrawOutcome
    {
        if (stock_.Empty())
        {
            if (waste_.Empty()) return DrawOutcome::Nothing;

            // waste top goes in first, so the oldest waste card ends on top of the stock
            while (!waste_.Empty())
            {
                stock_.Push(waste_.Pop());
            }
            return DrawOutcome::Recycled;
        }

        size_t const n = std::min(DrawCount(mode_), stock_.Size());
        for (size_t i{}; i < n; ++i)
        {
            waste_.Push(stock_.Pop());
        }
        return DrawOutcome::Drew;
    }

    auto GameState::RevealColumnTops() -> size_t
    {
        size_t flipped{};
        for (CardColumn& c : columns_)
        {
            flipped += c.RevealTop() ? 1 : 0;
        }
        return flipped;
    }

    auto GameState::IsVictory() const -> bool
    {
        return std::ranges::all_of(foundations_, [](FoundationPile const& p)
        {
            auto const top = p.Peek();
            return top && top->rank == Rank::King;
        });
    }

    auto GameState::Transfer(Selection const& from, Selection const& to) -> error::ValidateResult
    {
        using RVC = error::RuleViolationCode;
        if (SameCollection(from, to))
            return std::unexpected(error::RuleViolation{ .code = RVC::SameCollection });

        size_t const n = CardCount(from);

        return std::visit([n](auto* src, auto* dst) -> error::ValidateResult
        {
            if (auto const ok = src->CanTake(n); !ok.has_value()) return ok;
            if (auto const ok = dst->CanReceive(n); !ok.has_value()) return ok;

            TakeResult run = src->Take(n);
            if (!run.has_value())
                KLD_THROW(error::Code::TransferFailed, error::describe(run.error()));

            auto const received = dst->Receive(std::move(*run));
            if (!received.has_value())
                KLD_THROW(error::Code::TransferFailed, error::describe(received.error()));
            return {};
        }, CollectionAt(from), CollectionAt(to));
    }

    template <typename Self>
    auto GameState::CollectionAtImpl(Self& self, Selection const& s)
        -> std::conditional_t<std::is_const_v<Self>, ConstCollectionPtr, CollectionPtr>
    {
        using Ptr = std::conditional_t<std::is_const_v<Self>, ConstCollectionPtr, CollectionPtr>;
        return std::visit([&self]<typename T0>(T0 const& sel) -> Ptr
        {
            using T = std::decay_t<T0>;
            if constexpr (std::is_same_v<T, DeckSelection>)
            {
                return &self.waste_;
            }
            else if constexpr (std::is_same_v<T, ColumnSelection>)
            {
                KLD_ASSERT(sel.index < constants::ColumnCount,
                           fmt::format("Column index {} out of range", sel.index));
                return &self.columns_[sel.index];
            }
            else
            {
                KLD_ASSERT(sel.index < constants::FoundationCount,
                           fmt::format("Foundation index {} out of range", sel.index));
                return &self.foundations_[sel.index];
            }
        }, s);
    }

    auto GameState::CollectionAt(Selection const& s) -> CollectionPtr
    {
        return CollectionAtImpl(*this, s);
    }

    auto GameState::CollectionAt(Selection const& s) const -> ConstCollectionPtr
    {
        return CollectionAtImpl(*this, s);
    }

    auto GameState::PeekRun(Selection const& s) const -> std::optional<CardRun>
    {
        size_t const n = CardCount(s);
        return std::visit([n](auto const* c) { return c->PeekN(n); }, CollectionAt(s));
    }

    auto GameState::Column(size_t const idx) const -> CardColumn const&
    {
        KLD_ASSERT(idx < constants::ColumnCount, fmt::format("Column index {} out of range", idx));
        return columns_[idx];
    }

    auto GameState::Foundation(size_t const idx) const -> FoundationPile const&
    {
        KLD_ASSERT(idx < constants::FoundationCount, fmt::format("Foundation index {} out of range", idx));
        return foundations_[idx];
    }

    auto GameState::VisibleWaste() const -> std::span<Card const>
    {
        std::span<Card const> const all = waste_.Cards();
        size_t const shown = std::min(DrawCount(mode_), all.size());
        return all.last(shown);
    }

    auto GameState::TotalCards() const -> size_t
    {
        size_t total = stock_.Size() + waste_.Size();
        for (CardColumn const& c : columns_) total += c.Size();
        for (FoundationPile const& p : foundations_) total += p.Size();
        return total;
    }

    auto GameState::FoundationSuit(size_t const idx) -> Suit
    {
        KLD_ASSERT(idx < constants::FoundationCount, fmt::format("Foundation index {} out of range", idx));
        return AllSuits[idx];
    }
}
