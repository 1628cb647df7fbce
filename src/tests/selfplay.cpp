#include <gtest/gtest.h>
#include <filesystem>
#include <format>
#include <print>

#include "../core/Game.hpp"
#include "../core/ClassicRules.hpp"
#include "../debug/AuditLogger.hpp"
#include "../debug/Invariants.hpp"
#include "../debug/RecordingPlayer.hpp"
#include "GreedyAi.hpp"

using namespace rummikub::core;

namespace
{
constexpr int MaxSteps = 200;
constexpr uint64_t SolverNodes = 500;

auto make_players(size_t n) -> std::vector<std::unique_ptr<Player>>
{
    std::vector<std::unique_ptr<Player>> ps;
    for (size_t i = 0; i < n; ++i) ps.emplace_back(std::make_unique<rummikub::test::GreedyAi>(SolverNodes));
    return ps;
}

auto tiles_in_play(GameImpl const& game) -> size_t
{
    size_t n = game.CanonicalBoard().TileCount() + game.DrawPileSize();
    for (PlyrIdxT i = 0; i < game.PlayerCount(); ++i) n += game.HandOf(i).size();
    return n;
}

auto make_game(std::uint64_t seed, uint32_t n_players) -> GameImpl
{
    Config cfg{
        .n_players    = n_players,
        .seed         = seed,
        .turn_timeout = std::chrono::milliseconds(0)
    };

    auto ps = make_players(n_players);
    ps = rummikub::core::debug::WrapRecording(ps);

    return GameImpl(cfg, std::make_unique<ClassicRules>(), std::move(ps));
}

auto play_logged(std::uint64_t seed, uint32_t n_players) -> void
{
    namespace fs = std::filesystem;
    auto const path = fs::path(std::format("_artifacts/game_{}p_{}.log", n_players, seed));

    auto game = make_game(seed, n_players);
    rummikub::core::debug::AuditLogger log(path.string());
    log.start(game, seed);

    size_t const tiles_at_start = tiles_in_play(game);

    int steps = 0;
    size_t asked = 0;
    for (; steps < MaxSteps; ++steps)
    {
        PlyrIdxT const actor = game.Current();

        TurnOutcome const out = game.Step();
        ++asked;
        rummikub::core::debug::CheckInvariants(game);

        // Fetch what the actor saw and chose
        auto* rec = rummikub::core::debug::AsRecording(game.PlayerAt(actor));
        ASSERT_NE(rec, nullptr) << "Player not wrapped with RecordingPlayer";
        ASSERT_TRUE(rec->HasLast()) << "No proposal recorded for actor seat";
        rummikub::core::debug::RecordedTurn const& turn = rec->Last();
        ASSERT_EQ(turn.seen->seat, actor);

        log.turn(*turn.seen, actor, turn.proposal);
        log.outcome(out, game.LastViolation());
        rummikub::core::debug::CheckResolved(game, turn, out);

        // the greedy players only ever propose legal moves
        ASSERT_NE(out, TurnOutcome::Rejected) << describe(*game.LastViolation());
        ASSERT_NE(out, TurnOutcome::Pending);

        if (out == TurnOutcome::GameEnded) break;
    }
    log.end(game);

    // synchronous seats: one proposal per step, none asked twice
    size_t recorded = 0;
    for (PlyrIdxT i = 0; i < game.PlayerCount(); ++i)
    {
        recorded += rummikub::core::debug::AsRecording(game.PlayerAt(i))->Turns().size();
    }
    EXPECT_EQ(recorded, asked);

    if (game.IsOver())
    {
        ASSERT_TRUE(game.Winner().has_value());
        EXPECT_TRUE(game.HandOf(*game.Winner()).empty());
    }
    else
    {
        std::print("seed {}: no winner after {} steps\n", seed, steps);
    }

    EXPECT_EQ(tiles_in_play(game), tiles_at_start);
    EXPECT_TRUE(game.CanonicalBoard().IsValid());

    ASSERT_TRUE(fs::exists(path));
    ASSERT_GT(fs::file_size(path), 0u);
}

} // anonymous namespace

TEST(SelfPlay, Transcripts_And_End)
{
    std::filesystem::create_directories("_artifacts");
    try
    {
        for (std::uint64_t seed : {111ull, 222ull, 333ull})
        {
            play_logged(seed, 2);
        }
    }
    catch (rummikub::core::OmegaException<rummikub::core::error::Code> const& e)
    {
        std::print("{}", e);
        FAIL() << e.what();
    }
}

TEST(SelfPlay, FourSeats)
{
    std::filesystem::create_directories("_artifacts");
    try
    {
        play_logged(444ull, 4);
    }
    catch (rummikub::core::OmegaException<rummikub::core::error::Code> const& e)
    {
        std::print("{}", e);
        FAIL() << e.what();
    }
}
