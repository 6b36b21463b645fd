#ifndef KLONDIKE_GAME_HPP
#define KLONDIKE_GAME_HPP

#include <memory>
#include <optional>
#include <random>
#include <string>
#include <vector>
#include "Types.hpp"
#include "Actions.hpp"
#include "State.hpp"
#include "GameState.hpp"
#include "Rules.hpp"
#include "Player.hpp"

namespace klondike::core::debug {struct Inspector;}
namespace klondike::core
{
    // One game session: the authoritative GameState plus cursor, held selection and messages.
    class Game
    {
    public:
        Game() = delete;
        explicit Game(Config const& config,
                      std::unique_ptr<Rules> rules = nullptr);
        // Deals `deck` instead of a shuffle; Restart() replays it.
        Game(Config const& config,
             std::vector<Card> deck,
             std::unique_ptr<Rules> rules = nullptr);

        // One turn: apply the input, then restore invariants and check for victory.
        // Inputs are ignored once the game is won.
        auto Step(Input const& input) -> TurnOutcome;
        auto Step(Player& player) -> TurnOutcome;

        auto NewGame(GameMode mode) -> void;
        // Redeals the deck the current game started from.
        auto Restart() -> void;

        auto Snapshot() const -> std::shared_ptr<GameSnapshot const>;

        auto State()       const noexcept -> GameState const&               { return state_; }
        auto Cursor()      const noexcept -> Selection const&               { return cursor_; }
        auto Selected()    const noexcept -> std::optional<Selection> const& { return selected_; }
        auto PhaseNow()    const noexcept -> Phase                          { return phase_; }
        auto DebugMode()   const noexcept -> bool                           { return debug_mode_; }
        auto ContextHelp() const noexcept -> std::string const&             { return context_help_; }
        auto Status()      const noexcept -> std::string const&             { return status_; }
        auto DealtDeck()   const noexcept -> std::vector<Card> const&       { return dealt_deck_; }
        auto Settings()    const noexcept -> Config const&                  { return cfg_; }

        //allows class to directly access private data on an instance
        friend struct debug::Inspector;

    private:
        auto Deal(std::vector<Card> deck, GameMode mode) -> void;
        auto RunTurn() -> TurnOutcome;

        auto CardsAction() -> void;
        auto HitAction() -> void;
        auto UncheckedCardsAction() -> void;
        auto CheckValidAction() -> void;
        auto ApplySelectionRules() -> void;
        auto SetContextHelp() -> void;
        auto ReportMove(error::ValidateResult const& result) -> void;

    private:
        Config cfg_;
        std::unique_ptr<Rules> rules_;
        std::mt19937_64 rng_;

        // Authoritative state
        GameState state_;
        std::vector<Card> dealt_deck_;

        // Turn state
        Selection cursor_{DeckSelection{}};
        std::optional<Selection> selected_{};
        bool debug_mode_{false};
        Phase phase_{Phase::Game};
        std::string context_help_;
        std::string status_;
    };
}
#endif //KLONDIKE_GAME_HPP
