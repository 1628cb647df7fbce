//
// Rules.hpp
//

#ifndef RUMMIKUB_RULES_HPP
#define RUMMIKUB_RULES_HPP

#include "Actions.hpp"
#include "Types.hpp"
#include "Exception.hpp"

namespace rummikub::core
{
    //forward declaration
    class GameImpl;

    class Rules
    {
    public:
        using CheckResult = error::ValidateResult;

        virtual ~Rules() = default;

        // Returns unexpected(reason) for illegal proposals (NOT exceptions).
        // Throw only for engine misuse / broken invariants.
        virtual auto Validate(GameImpl const& game, Proposal const& p) const -> CheckResult = 0;

        // Commit a validated proposal to the authoritative state.
        virtual auto Apply(GameImpl& game, Proposal const& p) -> void = 0;

        // Recover from an illegal proposal. Canonical board stays untouched.
        virtual auto Penalize(GameImpl& game, error::RuleViolation const& v) -> void = 0;

        // Resolve the turn: returns GameEnded once terminal, otherwise moves
        // the turn pointer on and returns `resolved`.
        virtual auto Advance(GameImpl& game, TurnOutcome resolved) -> TurnOutcome = 0;
    };
}

#endif //RUMMIKUB_RULES_HPP
