//
// State.hpp
//

#ifndef RUMMIKUB_STATE_HPP
#define RUMMIKUB_STATE_HPP

#include "Types.hpp"
#include "Actions.hpp"
#include "Board.hpp"

namespace rummikub::core
{
    // Immutable snapshot handed to a player. Owns its board copy; editing it
    // never reaches the canonical board.
    struct GameSnapshot
    {
        uint8_t  n_players{};
        PlyrIdxT seat{};
        PlyrIdxT current{};
        Phase    phase{Phase::AwaitingProposal};

        Board board;

        // reveal my hand, sizes for everyone
        std::vector<TileSP> my_hand;
        std::vector<uint8_t> hand_counts;

        size_t draw_pile{};
        bool opened{false};
        uint32_t opening_threshold{};
    };

    // Complete authoritative state, in the shape a host would persist.
    struct GameRecord
    {
        Board board;
        std::vector<std::vector<TileSP>> hands;
        // drawn from the back
        std::vector<TileSP> draw_pile;
        std::vector<bool> opened;
        PlyrIdxT current{};
        bool terminal{false};
        std::optional<PlyrIdxT> winner{};
    };

} // namespace rummikub::core

#endif //RUMMIKUB_STATE_HPP
