#include <gtest/gtest.h>
#include <cstdint>
#include <filesystem>
#include <memory>

#include <fmt/format.h>

#include "../core/Game.hpp"
#include "../core/RandomAi.hpp"
#include "../debug/AuditLogger.hpp"
#include "../debug/Invariants.hpp"
#include "../debug/RecordingPlayer.hpp"

using namespace klondike::core;

namespace
{
constexpr size_t MaxTurns = 4000;

auto make_player(std::uint64_t seed) -> std::unique_ptr<Player>
{
    return klondike::core::debug::WrapRecording(std::make_unique<RandomAI>(seed + 1));
}

auto make_game(std::uint64_t seed, GameMode mode) -> Game
{
    Config cfg{
        .mode       = mode,
        .seed       = seed,
        .auto_draw  = true,
        .debug_mode = false
    };
    return Game(cfg);
}

} // anonymous namespace

TEST(SelfPlay, Transcripts_And_Invariants)
{
    namespace fs = std::filesystem;
    fs::create_directories("_artifacts");

    for (std::uint64_t seed : {111ull, 222ull, 333ull})
    {
        for (GameMode mode : {GameMode::DrawOne, GameMode::DrawThree})
        {
            Game game = make_game(seed, mode);
            auto player = make_player(seed);
            auto* rec = klondike::core::debug::AsRecording(player.get());
            ASSERT_NE(rec, nullptr) << "Player not wrapped with RecordingPlayer";

            auto const path = fs::path(fmt::format("_artifacts/klondike_{}_{}.log", seed, DrawCount(mode)));
            klondike::core::debug::AuditLogger log(path.string());
            ASSERT_TRUE(log.good());
            log.start(game, seed);

            for (size_t turn{}; turn < MaxTurns; ++turn)
            {
                auto const snap = game.Snapshot();

                TurnOutcome const out = game.Step(*player);
                ASSERT_NO_THROW(klondike::core::debug::CheckInvariants(game))
                    << "seed " << seed << " turn " << turn;

                ASSERT_TRUE(rec->HasLast()) << "No input recorded";
                log.turn(*snap, rec->Last());
                log.outcome(out, game.Status());

                if (out == TurnOutcome::Victory) break;
            }
            log.end(game);

            if (game.PhaseNow() != Phase::Victory)
            {
                EXPECT_EQ(rec->Count(), MaxTurns);
            }
            EXPECT_EQ(game.State().TotalCards(), constants::DeckSize);

            ASSERT_TRUE(fs::exists(path));
            ASSERT_GT(fs::file_size(path), 0u);
        }
    }
}

TEST(SelfPlay, WrapRecording_Records_Each_Input)
{
    RandomAI plain(5);
    EXPECT_EQ(klondike::core::debug::AsRecording(&plain), nullptr);

    Game game = make_game(5, GameMode::DrawOne);
    auto player = make_player(5);
    auto* rec = klondike::core::debug::AsRecording(player.get());
    ASSERT_NE(rec, nullptr);
    EXPECT_FALSE(rec->HasLast());

    Input const first = player->NextInput(game.Snapshot());
    EXPECT_TRUE(rec->HasLast());
    EXPECT_EQ(rec->Count(), 1u);
    EXPECT_EQ(rec->Last().index(), first.index());

    game.Step(*player);
    EXPECT_EQ(rec->Count(), 2u);
}

TEST(SelfPlay, Same_Seed_Same_Game)
{
    auto play = [](std::uint64_t seed)
    {
        Game game = make_game(seed, GameMode::DrawThree);
        RandomAI ai(seed);
        for (size_t turn{}; turn < 500; ++turn) game.Step(ai);
        return game.Snapshot();
    };

    auto const a = play(77);
    auto const b = play(77);
    EXPECT_EQ(a->cursor, b->cursor);
    EXPECT_EQ(a->stock_size, b->stock_size);
    EXPECT_EQ(a->waste_visible, b->waste_visible);
    EXPECT_EQ(a->columns, b->columns);
    EXPECT_EQ(a->foundation_sizes, b->foundation_sizes);
}
