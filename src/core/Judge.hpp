//
// Judge.hpp
//

#ifndef RUMMIKUB_JUDGE_HPP
#define RUMMIKUB_JUDGE_HPP

#include <future>
#include <optional>
#include "Actions.hpp"
#include "State.hpp"
#include "Types.hpp"

namespace rummikub::core
{
    class GameImpl;

    enum class DecisionResult : uint8_t
    {
        OK,
        Timeout
    };

    struct TimedProposal
    {
        Proposal proposal{};
        DecisionResult result{};
    };

    // The single suspension point of a turn. At most one proposal is
    // outstanding at any time; a timed-out wait is kept and resumed by the
    // next call instead of asking the player again. The worker shares
    // ownership of the player, so the game may be dropped mid-wait.
    class Judge
    {
    public:
        Judge() = default;

        auto GetProposal(GameImpl& game, PlyrIdxT actor) -> TimedProposal;
        auto HasPending() const noexcept -> bool { return pending_.has_value(); }

    private:
        std::optional<std::future<Proposal>> pending_;
        PlyrIdxT pending_actor_{};
    };
}
#endif //RUMMIKUB_JUDGE_HPP
