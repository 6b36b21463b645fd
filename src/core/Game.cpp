#include "Game.hpp"

#include <type_traits>
#include <utility>

#include "Cards.hpp"
#include "Engine.hpp"
#include "KlondikeRules.hpp"
#include "UncheckedRules.hpp"

namespace klondike::core
{
    Game::Game(Config const& config, std::unique_ptr<Rules> rules) :
        cfg_(config),
        rules_(rules ? std::move(rules) : std::make_unique<KlondikeRules>()),
        rng_{cfg_.seed},
        debug_mode_{cfg_.debug_mode}
    {
        Deal(ShuffledDeck(rng_), cfg_.mode);
    }

    Game::Game(Config const& config, std::vector<Card> deck, std::unique_ptr<Rules> rules) :
        cfg_(config),
        rules_(rules ? std::move(rules) : std::make_unique<KlondikeRules>()),
        rng_{cfg_.seed},
        debug_mode_{cfg_.debug_mode}
    {
        Deal(std::move(deck), cfg_.mode);
    }

    auto Game::NewGame(GameMode const mode) -> void
    {
        Deal(ShuffledDeck(rng_), mode);
    }

    auto Game::Restart() -> void
    {
        Deal(dealt_deck_, state_.Mode());
    }

    auto Game::Deal(std::vector<Card> deck, GameMode const mode) -> void
    {
        dealt_deck_ = deck;
        state_ = GameState::Init(std::move(deck), mode);

        cursor_ = DeckSelection{};
        selected_.reset();
        status_.clear();
        context_help_.clear();
        phase_ = Phase::Game;

        RunTurn();
    }

    auto Game::Step(Input const& input) -> TurnOutcome
    {
        if (phase_ == Phase::Victory) return TurnOutcome::Victory;

        std::visit([&]<typename T0>(T0 const& in)
        {
            using T = std::decay_t<T0>;
            if constexpr (std::is_same_v<T, CursorInput>)
            {
                cursor_ = ApplyCursorAction(in.action, state_, cursor_, debug_mode_);
            }
            else if constexpr (std::is_same_v<T, SelectInput>)
            {
                CardsAction();
            }
            else if constexpr (std::is_same_v<T, HitInput>)
            {
                HitAction();
            }
            else if constexpr (std::is_same_v<T, ClearSelectionInput>)
            {
                selected_.reset();
            }
            else if constexpr (std::is_same_v<T, ToggleDebugInput>)
            {
                debug_mode_ = !debug_mode_;
            }
            else if constexpr (std::is_same_v<T, UncheckedMoveInput>)
            {
                if (debug_mode_) UncheckedCardsAction();
            }
            else if constexpr (std::is_same_v<T, CheckValidInput>)
            {
                if (debug_mode_) CheckValidAction();
            }
        }, input);

        return RunTurn();
    }

    auto Game::Step(Player& player) -> TurnOutcome
    {
        return Step(player.NextInput(Snapshot()));
    }

    auto Game::RunTurn() -> TurnOutcome
    {
        // Ensure a face-up card at the end of each column, then hit if the waste ran dry
        RestoreInvariants(state_, cfg_.auto_draw);
        ApplySelectionRules();
        SetContextHelp();

        if (state_.IsVictory())
        {
            status_ = "Victory";
            phase_ = Phase::Victory;
            return TurnOutcome::Victory;
        }
        return TurnOutcome::Continue;
    }

    auto Game::CardsAction() -> void
    {
        if (selected_)
        {
            Selection const from = *selected_;
            selected_.reset();
            ReportMove(AttemptMove(*rules_, from, cursor_, state_));
        }
        else if (CardCount(cursor_) > 0)
        {
            selected_ = cursor_;
        }
    }

    auto Game::HitAction() -> void
    {
        if (std::holds_alternative<DeckSelection>(cursor_))
        {
            DrawFromDeck(state_);
        }
        else if (auto const* col = std::get_if<ColumnSelection>(&cursor_))
        {
            ReportMove(AutoPlaceToFoundation(*rules_, col->index, state_));
        }
    }

    auto Game::UncheckedCardsAction() -> void
    {
        if (selected_)
        {
            Selection const from = *selected_;
            selected_.reset();
            ReportMove(AttemptMove(UncheckedRules{}, from, cursor_, state_));
        }
        else if (CardCount(cursor_) > 0)
        {
            selected_ = cursor_;
        }
    }

    auto Game::CheckValidAction() -> void
    {
        if (!selected_)
        {
            status_.clear();
            return;
        }
        auto const ok = rules_->Validate(state_, *selected_, cursor_);
        status_ = ok.has_value() ? std::string("valid move") : error::describe(ok.error());
    }

    auto Game::ApplySelectionRules() -> void
    {
        cursor_ = ApplyColumnSelectionRules(cursor_, state_, debug_mode_);
        if (selected_)
        {
            selected_ = ApplyColumnSelectionRules(*selected_, state_, debug_mode_);
        }
    }

    auto Game::SetContextHelp() -> void
    {
        if (std::holds_alternative<DeckSelection>(cursor_))
            context_help_ = "Enter: Hit";
        else if (std::holds_alternative<ColumnSelection>(cursor_))
            context_help_ = "Enter: Try to Move to Stack";
        else
            context_help_.clear();
    }

    auto Game::ReportMove(error::ValidateResult const& result) -> void
    {
        if (result.has_value())
        {
            status_ = "move OK";
            return;
        }
        status_ = result.error().kind() == error::MoveErrorKind::InvalidMove ? "invalid move" : "move attempt failed";
        if (debug_mode_)
        {
            status_ += ": " + error::describe(result.error());
        }
    }

    auto Game::Snapshot() const -> std::shared_ptr<GameSnapshot const>
    {
        std::shared_ptr<GameSnapshot> snap = std::make_shared<GameSnapshot>();
        snap->mode = state_.Mode();
        snap->phase = phase_;
        snap->cursor = cursor_;
        snap->selected = selected_;
        snap->debug_mode = debug_mode_;
        snap->context_help = context_help_;
        snap->status = status_;

        snap->stock_size = state_.Stock().Size();
        auto const waste = state_.VisibleWaste();
        snap->waste_visible.assign(waste.begin(), waste.end());

        for (size_t i{}; i < constants::ColumnCount; ++i)
        {
            auto const entries = state_.Column(i).Entries();
            snap->columns[i].assign(entries.begin(), entries.end());
        }
        for (size_t i{}; i < constants::FoundationCount; ++i)
        {
            snap->foundation_sizes[i] = state_.Foundation(i).Size();
            snap->foundation_tops[i] = state_.Foundation(i).Peek();
        }
        return snap;
    }
}
