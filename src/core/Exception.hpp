//
// Exception.hpp
//

#ifndef RUMMIKUB_EXCEPTION_HPP
#define RUMMIKUB_EXCEPTION_HPP

#include "OmegaException.hpp"

#include <expected>
#include <stdexcept>
#include <format>
#include <utility>
#include "Types.hpp"

namespace rummikub::core::error
{
    enum class Code : unsigned
    {
        Unknown, // unknown error
        Rules, // rules engine misuse (not an illegal proposal)
        State, // state engine misuse (not an illegal proposal)
        MalformedTile, // non-wildcard value outside [1,13]
        Timeout, // deadline exceeded waiting on a player
        Serialization, // FlatBuffers verification/build errors
        Assertion // internal assertion failed
    };

    struct UnknownError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct RulesError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct StateError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct MalformedTileError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct TimeoutError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct SerializationError : public OmegaException<Code>
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
        case Code::Unknown: throw UnknownError(std::move(msg), c, loc);
        case Code::Rules: throw RulesError(std::move(msg), c, loc);
        case Code::State: throw StateError(std::move(msg), c, loc);
        case Code::MalformedTile: throw MalformedTileError(std::move(msg), c, loc);
        case Code::Timeout: throw TimeoutError(std::move(msg), c, loc);
        case Code::Serialization: throw SerializationError(std::move(msg), c, loc);
        case Code::Assertion: throw AssertionError(std::move(msg), c, loc);
        }
        throw std::runtime_error(msg);
    }

#define RMK_THROW(code_enum, msg) ::rummikub::core::error::fail((code_enum), (msg))
#define RMK_ASSERT(cond, msg) do { if(!(cond)) ::rummikub::core::error::fail(::rummikub::core::error::Code::Assertion, (msg)); } while(0)

    // Fine-grained reasons for an illegal proposal, in validation order.
    enum class RuleViolationCode : std::uint16_t
    {
        // Board
        Play_InvalidBoard,

        // Ownership
        Play_NullTile,
        Play_TileNotInHand,
        Play_DuplicateClaim,

        // Net play
        Play_Empty,

        // Opening meld
        Play_OpeningBelowThreshold,

        // Conservation
        Play_DuplicateBoardTile,
        Play_BoardTileMissing,
        Play_ForeignTile,

        // Safety net
        Internal_Unreachable
    };

    // Compact, optional context carried with the violation.
    struct RuleViolation
    {
        RuleViolationCode code{};
        std::optional<PlyrIdxT> actor{};
        std::optional<std::size_t> meld_index{};
        std::optional<TileId> tile{};
        std::optional<std::uint32_t> points{};
        std::optional<std::uint32_t> threshold{};
        std::optional<std::size_t> attempted_count{};

        auto with_actor(PlyrIdxT s) -> RuleViolation&
        {
            actor = s;
            return *this;
        }

        auto with_meld(std::size_t i) -> RuleViolation&
        {
            meld_index = i;
            return *this;
        }

        auto with_tile(TileId id) -> RuleViolation&
        {
            tile = id;
            return *this;
        }

        auto with_points(std::uint32_t p) -> RuleViolation&
        {
            points = p;
            return *this;
        }

        auto with_threshold(std::uint32_t t) -> RuleViolation&
        {
            threshold = t;
            return *this;
        }

        auto with_attempted(std::size_t n) -> RuleViolation&
        {
            attempted_count = n;
            return *this;
        }
    };

    inline auto to_string(RuleViolationCode c) -> std::string_view
    {
        using E = RuleViolationCode;
        switch (c)
        {
        case E::Play_InvalidBoard: return "Play: proposed board contains an invalid meld";
        case E::Play_NullTile: return "Play: null tile reference";
        case E::Play_TileNotInHand: return "Play: claimed tile not in hand";
        case E::Play_DuplicateClaim: return "Play: tile claimed twice";
        case E::Play_Empty: return "Play: no tile leaves the hand";
        case E::Play_OpeningBelowThreshold: return "Play: opening meld below threshold";
        case E::Play_DuplicateBoardTile: return "Play: tile appears twice on the board";
        case E::Play_BoardTileMissing: return "Play: board tile dropped from the table";
        case E::Play_ForeignTile: return "Play: board tile neither on the table nor claimed";
        case E::Internal_Unreachable: return "Internal: unreachable";
        }
        return "Unknown";
    }

    inline auto describe(RuleViolation const& v) -> std::string
    {
        auto s = std::format("{}", to_string(v.code));
        if (v.actor) s += std::format(" | actor=P{}", static_cast<int>(*v.actor));
        if (v.meld_index) s += std::format(" | meld={}", *v.meld_index);
        if (v.tile) s += std::format(" | tile=#{}", *v.tile);
        if (v.points) s += std::format(" | points={}", *v.points);
        if (v.threshold) s += std::format(" | threshold={}", *v.threshold);
        if (v.attempted_count) s += std::format(" | attempted={}", *v.attempted_count);
        return s;
    }

    using ValidateResult = std::expected<void, RuleViolation>;
}

#endif //RUMMIKUB_EXCEPTION_HPP
