#include <gtest/gtest.h>
#include <chrono>
#include <future>
#include <vector>

#include "../core/Exception.hpp"
#include "../core/Solver.hpp"
#include "Fixtures.hpp"

using namespace rummikub::core;
using namespace rummikub::test;

namespace
{
    auto Flatten(std::vector<Meld> const& melds) -> std::vector<TileSP>
    {
        return Board{melds}.AllTiles();
    }

    // Every tile used once, every meld valid, and the output solves again.
    auto ExpectExactCover(std::vector<TileSP> const& input, std::vector<Meld> const& melds) -> void
    {
        for (Meld const& m : melds) EXPECT_TRUE(m.Validate());

        std::vector<TileSP> const flat = Flatten(melds);
        EXPECT_EQ(Ids(flat), Ids(input));
        EXPECT_TRUE(Board{melds}.IsValid());
        EXPECT_TRUE(Solver::SolveOnce(flat).has_value());
    }
}

TEST(Solver, EmptyInputIsEmptyPartition)
{
    SolveResult const r = Solver::SolveOnce({});
    ASSERT_TRUE(r.has_value());
    EXPECT_TRUE(r->empty());
}

TEST(Solver, FewerThanThreeTilesNeverSolve)
{
    std::vector<TileSP> const one{Red(5)};
    std::vector<TileSP> const two{Red(5), Red(6)};
    std::vector<TileSP> const two_wild{Wild(), Wild()};

    EXPECT_EQ(Solver::SolveOnce(one).error(), SolveError::NoPartitionFound);
    EXPECT_EQ(Solver::SolveOnce(two).error(), SolveError::NoPartitionFound);
    EXPECT_EQ(Solver::SolveOnce(two_wild).error(), SolveError::NoPartitionFound);
}

TEST(Solver, SingleRun)
{
    std::vector<TileSP> const tiles{Red(5), Red(6), Red(7)};
    SolveResult const r = Solver::SolveOnce(tiles);
    ASSERT_TRUE(r.has_value());
    ASSERT_EQ(r->size(), 1u);
    EXPECT_EQ(r->front().Classify(), MeldKind::Run);
    ExpectExactCover(tiles, *r);
}

TEST(Solver, SingleGroup)
{
    std::vector<TileSP> const tiles{Red(5), Blue(5), Black(5)};
    SolveResult const r = Solver::SolveOnce(tiles);
    ASSERT_TRUE(r.has_value());
    ASSERT_EQ(r->size(), 1u);
    EXPECT_EQ(r->front().Classify(), MeldKind::Group);
    ExpectExactCover(tiles, *r);
}

TEST(Solver, WildcardFillsGap)
{
    std::vector<TileSP> const tiles{Red(5), Red(7), Wild()};
    SolveResult const r = Solver::SolveOnce(tiles);
    ASSERT_TRUE(r.has_value());
    ASSERT_EQ(r->size(), 1u);
    EXPECT_EQ(r->front().Classify(), MeldKind::Run);
    ExpectExactCover(tiles, *r);
}

TEST(Solver, WildcardBelowTopOfRun)
{
    std::vector<TileSP> const tiles{Red(12), Red(13), Wild()};
    SolveResult const r = Solver::SolveOnce(tiles);
    ASSERT_TRUE(r.has_value());
    ExpectExactCover(tiles, *r);
}

TEST(Solver, OnlyWildcards)
{
    std::vector<TileSP> const tiles{Wild(), Wild(), Wild()};
    SolveResult const r = Solver::SolveOnce(tiles);
    ASSERT_TRUE(r.has_value());
    ExpectExactCover(tiles, *r);
}

TEST(Solver, Unsolvable)
{
    std::vector<TileSP> const gap{Red(1), Red(2), Red(3), Red(5)};
    EXPECT_EQ(Solver::SolveOnce(gap).error(), SolveError::NoPartitionFound);

    std::vector<TileSP> const mixed{Red(5), Blue(6), Black(7)};
    EXPECT_EQ(Solver::SolveOnce(mixed).error(), SolveError::NoPartitionFound);
}

TEST(Solver, BacktracksOutOfFirstGroup)
{
    // The 4s may only form {K4,B4,O4}; R4 belongs to the red run.
    std::vector<TileSP> const tiles{Red(4), Blue(4), Black(4), Orange(4), Red(5), Red(6)};
    SolveResult const r = Solver::SolveOnce(tiles);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->size(), 2u);
    ExpectExactCover(tiles, *r);
}

TEST(Solver, DuplicateCopies)
{
    std::vector<TileSP> const tiles{Red(5), Red(5), Red(6), Red(6), Red(7), Red(7)};
    SolveResult const r = Solver::SolveOnce(tiles);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->size(), 2u);
    ExpectExactCover(tiles, *r);
}

TEST(Solver, MixedTable)
{
    std::vector<TileSP> const tiles{
        Orange(7), Red(3), Blue(7), Red(5), Black(7), Red(4),
        Blue(10), Blue(11), Wild(), Blue(13), Black(1), Red(1), Orange(1)
    };
    SolveResult const r = Solver::SolveOnce(tiles);
    ASSERT_TRUE(r.has_value());
    ExpectExactCover(tiles, *r);
}

TEST(Solver, NodeBudgetIsReportedDistinctly)
{
    std::vector<TileSP> const tiles{Red(5), Red(6), Red(7), Blue(5), Blue(6), Blue(7)};

    Solver tight{SearchBudget{.max_nodes = 1}};
    SolveResult const r = tight.Solve(tiles);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error(), SolveError::SearchBudgetExceeded);

    Solver roomy{};
    SolveResult const ok = roomy.Solve(tiles);
    ASSERT_TRUE(ok.has_value());
    EXPECT_GT(roomy.NodesVisited(), 0u);
    ExpectExactCover(tiles, *ok);
}

namespace
{
    // Values 1..9 in every color plus a lone R13: no partition exists, and
    // the grid alone splits into runs in well over a thousand ways.
    auto UnsolvableGrid() -> std::vector<TileSP>
    {
        std::vector<TileSP> tiles;
        for (int v = 1; v <= 9; ++v)
        {
            tiles.push_back(Red(v));
            tiles.push_back(Blue(v));
            tiles.push_back(Black(v));
            tiles.push_back(Orange(v));
        }
        tiles.push_back(Red(13));
        return tiles;
    }
}

TEST(Solver, NodeBudgetBelowPollInterval)
{
    // more than 256 nodes are needed before the search can give up
    Solver s{SearchBudget{.max_nodes = 256}};
    SolveResult const r = s.Solve(UnsolvableGrid());
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error(), SolveError::SearchBudgetExceeded);
}

TEST(Solver, PastDeadlineStopsAtFirstPoll)
{
    Solver s{SearchBudget{.deadline = std::chrono::steady_clock::now() - std::chrono::seconds(1)}};
    SolveResult const r = s.Solve(UnsolvableGrid());
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error(), SolveError::SearchBudgetExceeded);
    EXPECT_EQ(s.NodesVisited(), 256u);
}

TEST(Solver, NullTileIsMisuse)
{
    std::vector<TileSP> const tiles{Red(5), nullptr, Red(7)};
    EXPECT_THROW(Solver::SolveOnce(tiles), error::AssertionError);
}

TEST(Solver, IndependentCallsRunConcurrently)
{
    auto job = [](int base)
    {
        std::vector<TileSP> const tiles{Red(base), Red(base + 1), Red(base + 2),
                                        Black(base + 3), Blue(base + 3), Orange(base + 3)};
        return Solver::SolveOnce(tiles).has_value();
    };

    std::vector<std::future<bool>> runs;
    for (int base = 1; base <= 8; ++base) runs.push_back(std::async(std::launch::async, job, base));
    for (auto& f : runs) EXPECT_TRUE(f.get());
}
