//
// Player.hpp
//

#ifndef RUMMIKUB_PLAYER_HPP
#define RUMMIKUB_PLAYER_HPP

#include "Actions.hpp"
#include "State.hpp"

namespace rummikub::core
{
    class Player
    {
    public:
        virtual ~Player() = default;

        // Called once per turn by the authoritative game loop. A Play must only
        // claim tiles taken from snapshot->my_hand.
        // When the engine runs with a turn timeout this is invoked on a worker
        // thread; the deadline is advisory for the player.
        virtual Proposal Propose(std::shared_ptr<const GameSnapshot> snapshot,
                                 std::chrono::steady_clock::time_point deadline) = 0;
    };
}
#endif //RUMMIKUB_PLAYER_HPP
