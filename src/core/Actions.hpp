//
// Actions.hpp
//

#ifndef RUMMIKUB_ACTIONS_HPP
#define RUMMIKUB_ACTIONS_HPP

#include "Types.hpp"
#include "Board.hpp"

namespace rummikub::core
{
    struct DrawAction {};

    // Replacement board plus the hand tiles that ended up on it.
    struct PlayAction
    {
        Board board;
        std::vector<TileSP> from_hand;
    };

    using Proposal = std::variant<DrawAction, PlayAction>;

    enum class TurnOutcome : uint8_t
    {
        Drew,
        Committed,
        Rejected,   // illegal Play, penalty applied
        Pending,    // proposal wait timed out, turn not resolved
        GameEnded
    };

    enum class Phase : uint8_t
    {
        AwaitingProposal,
        Evaluating,
        GameOver
    };
} // namespace rummikub::core

#endif //RUMMIKUB_ACTIONS_HPP
