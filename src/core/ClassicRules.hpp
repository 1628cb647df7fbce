//
// ClassicRules.hpp
//

#ifndef RUMMIKUB_CLASSICRULES_HPP
#define RUMMIKUB_CLASSICRULES_HPP
#include "Rules.hpp"

namespace rummikub::core
{
    class ClassicRules final : public Rules
    {
    public:
        auto Validate(GameImpl const& game, Proposal const& p) const -> CheckResult override;
        auto Apply(GameImpl& game, Proposal const& p) -> void override;
        auto Penalize(GameImpl& game, error::RuleViolation const& v) -> void override;
        auto Advance(GameImpl& game, TurnOutcome resolved) -> TurnOutcome override;

        // Opening-meld points: face values of the claimed tiles, wildcards count 0.
        static auto OpeningPoints(std::span<TileSP const> claimed) -> uint32_t;

    private:
        static auto CheckConservation(GameImpl const& game, PlayAction const& play) -> CheckResult;
    };
}

#endif //RUMMIKUB_CLASSICRULES_HPP
