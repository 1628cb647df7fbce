//
// Solver.cpp
//
#include "Solver.hpp"

#include <algorithm>
#include <array>
#include <iterator>
#include <ranges>
#include <unordered_set>
#include "Exception.hpp"
#include "Tile.hpp"
#include "Util.hpp"

namespace rummikub::core
{
    // Colors of a group candidate, order-free. Two candidates with the same
    // signature differ only by tile identity.
    static auto GroupSignature(std::span<TileSP const> tiles) -> uint32_t
    {
        std::array<uint8_t, constants::ColorCount + 1> counts{};
        for (TileSP const& t : tiles) ++counts[std::to_underlying(t->color)];

        uint32_t sig{};
        for (uint8_t const c : counts) sig = sig * 8 + c;
        return sig;
    }

    auto Solver::Solve(std::span<TileSP const> tiles) -> SolveResult
    {
        nodes_ = 0;
        exhausted_ = false;

        RMK_ASSERT(!util::any_null(tiles), "Null tile handed to the solver");

        if (tiles.empty()) return std::vector<Meld>{};
        if (tiles.size() < constants::MinMeldSize) return std::unexpected(SolveError::NoPartitionFound);

        Pool pool(tiles.begin(), tiles.end());
        std::ranges::sort(pool, [](TileSP const& a, TileSP const& b) { return CanonicalLess(*a, *b); });

        std::optional<std::vector<Meld>> found = Backtrack(pool);
        if (found) return std::move(*found);
        if (exhausted_) return std::unexpected(SolveError::SearchBudgetExceeded);
        return std::unexpected(SolveError::NoPartitionFound);
    }

    auto Solver::Tick() -> bool
    {
        if (exhausted_) return false;
        ++nodes_;
        if (nodes_ > budget_.max_nodes)
        {
            exhausted_ = true;
        }
        else if (budget_.deadline && (nodes_ & 0xFFu) == 0 &&
                 std::chrono::steady_clock::now() >= *budget_.deadline)
        {
            exhausted_ = true;
        }
        return !exhausted_;
    }

    auto Solver::Backtrack(Pool const& pool) -> std::optional<std::vector<Meld>>
    {
        if (pool.empty()) return std::vector<Meld>{};
        if (pool.size() < constants::MinMeldSize) return std::nullopt;
        if (!Tick()) return std::nullopt;

        // Wildcards sort last, so a wildcard anchor means nothing else is left.
        if (pool.front()->wildcard)
        {
            Meld rest{pool};
            if (!rest.Validate()) return std::nullopt;
            std::vector<Meld> out;
            out.push_back(std::move(rest));
            return out;
        }

        for (std::vector<TileSP> const& cand : GroupCandidates(pool))
        {
            if (auto sol = TryCandidate(pool, cand)) return sol;
            if (exhausted_) return std::nullopt;
        }

        for (std::vector<TileSP> const& cand : RunCandidates(pool))
        {
            if (auto sol = TryCandidate(pool, cand)) return sol;
            if (exhausted_) return std::nullopt;
        }

        return std::nullopt;
    }

    auto Solver::TryCandidate(Pool const& pool, std::vector<TileSP> const& cand)
        -> std::optional<std::vector<Meld>>
    {
        std::optional<std::vector<Meld>> rest = Backtrack(Without(pool, cand));
        if (!rest) return std::nullopt;

        std::vector<Meld> out;
        out.reserve(rest->size() + 1);
        out.emplace_back(cand);
        std::ranges::move(*rest, std::back_inserter(out));
        return out;
    }

    auto Solver::GroupCandidates(Pool const& pool) -> std::vector<std::vector<TileSP>>
    {
        TileSP const& anchor = pool.front();

        std::vector<TileSP> others;
        for (TileSP const& t : pool | std::views::drop(1))
        {
            if (t->wildcard || t->value == anchor->value) others.push_back(t);
        }

        std::vector<std::vector<TileSP>> out;
        std::unordered_set<uint32_t> seen;

        auto consider = [&](std::vector<TileSP> cand)
        {
            if (!Meld::IsValidGroup(cand)) return;
            if (!seen.insert(GroupSignature(cand)).second) return;
            out.push_back(std::move(cand));
        };

        size_t const n = others.size();
        for (size_t i{}; i < n; ++i)
        {
            for (size_t j{i + 1}; j < n; ++j)
            {
                consider({anchor, others[i], others[j]});
            }
        }
        for (size_t i{}; i < n; ++i)
        {
            for (size_t j{i + 1}; j < n; ++j)
            {
                for (size_t k{j + 1}; k < n; ++k)
                {
                    consider({anchor, others[i], others[j], others[k]});
                }
            }
        }
        return out;
    }

    auto Solver::RunCandidates(Pool const& pool) -> std::vector<std::vector<TileSP>>
    {
        TileSP const& anchor = pool.front();

        Pool lane;
        for (TileSP const& t : pool | std::views::drop(1))
        {
            if (t->wildcard || t->color == anchor->color) lane.push_back(t);
        }

        std::vector<std::vector<TileSP>> out;
        std::vector<TileSP> seq{anchor};
        ExtendRun(seq, lane, anchor->value + 1, out);
        return out;
    }

    auto Solver::ExtendRun(std::vector<TileSP>& seq, Pool const& lane, int const next_value,
                           std::vector<std::vector<TileSP>>& out) -> void
    {
        if (seq.size() >= constants::MinMeldSize && Meld::IsValidRun(seq)) out.push_back(seq);
        if (seq.size() >= constants::MaxRunSize) return;

        // Past 13 only wildcards extend; they end up in front of the anchor.
        bool took_plain = false;
        bool took_wild = false;
        for (size_t i{}; i < lane.size(); ++i)
        {
            TileSP const& t = lane[i];
            if (t->wildcard)
            {
                if (took_wild) continue;
                took_wild = true;
            }
            else
            {
                if (next_value > constants::MaxValue || t->value != next_value || took_plain) continue;
                took_plain = true;
            }

            Pool rest;
            rest.reserve(lane.size() - 1);
            for (size_t j{}; j < lane.size(); ++j)
            {
                if (j != i) rest.push_back(lane[j]);
            }

            seq.push_back(t);
            ExtendRun(seq, rest, next_value + 1, out);
            seq.pop_back();
        }
    }

    auto Solver::Without(Pool const& pool, std::span<TileSP const> used) -> Pool
    {
        Pool out;
        out.reserve(pool.size());
        for (TileSP const& t : pool)
        {
            if (!util::ContainsId(used, t->id)) out.push_back(t);
        }
        return out;
    }
}
