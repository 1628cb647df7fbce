//
// Solver.hpp
//

#ifndef RUMMIKUB_SOLVER_HPP
#define RUMMIKUB_SOLVER_HPP

#include <chrono>
#include <expected>
#include <optional>
#include <span>
#include <vector>
#include "Meld.hpp"
#include "Types.hpp"

namespace rummikub::core
{
    enum class SolveError : uint8_t
    {
        NoPartitionFound,     // proven: no partition exists
        SearchBudgetExceeded  // unknown: gave up before finishing
    };

    struct SearchBudget
    {
        uint64_t max_nodes{constants::DefaultSolverNodes};
        std::optional<std::chrono::steady_clock::time_point> deadline{};
    };

    using SolveResult = std::expected<std::vector<Meld>, SolveError>;

    // Exact-cover partition of a tile multiset into valid melds.
    //
    // Deterministic backtracking over a canonically sorted pool: the smallest
    // remaining tile is the anchor and every meld that could contain it is
    // tried (groups first, then runs), one representative per interchangeable
    // tile type. Every call is bounded by its SearchBudget.
    //
    // An instance holds per-call counters only; use one instance per thread.
    class Solver
    {
    public:
        explicit Solver(SearchBudget budget = {}) : budget_(budget) {}

        auto Solve(std::span<TileSP const> tiles) -> SolveResult;
        auto NodesVisited() const noexcept -> uint64_t { return nodes_; }

        static auto SolveOnce(std::span<TileSP const> tiles, SearchBudget budget = {}) -> SolveResult
        {
            return Solver{budget}.Solve(tiles);
        }

    private:
        using Pool = std::vector<TileSP>;

        auto Backtrack(Pool const& pool) -> std::optional<std::vector<Meld>>;
        auto TryCandidate(Pool const& pool, std::vector<TileSP> const& cand) -> std::optional<std::vector<Meld>>;
        // false once the budget is spent
        auto Tick() -> bool;

        static auto GroupCandidates(Pool const& pool) -> std::vector<std::vector<TileSP>>;
        static auto RunCandidates(Pool const& pool) -> std::vector<std::vector<TileSP>>;
        static auto ExtendRun(std::vector<TileSP>& seq, Pool const& lane, int next_value,
                              std::vector<std::vector<TileSP>>& out) -> void;
        static auto Without(Pool const& pool, std::span<TileSP const> used) -> Pool;

    private:
        SearchBudget budget_;
        uint64_t nodes_{};
        bool exhausted_{false};
    };
}

#endif //RUMMIKUB_SOLVER_HPP
