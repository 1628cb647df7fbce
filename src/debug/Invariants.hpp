//
// Invariants.hpp
//

#ifndef RUMMIKUB_INVARIANTS_HPP
#define RUMMIKUB_INVARIANTS_HPP

#include "../core/Game.hpp"
#include "../core/Exception.hpp"
#include "Inspector.hpp"
#include <unordered_set>
#include <vector>

namespace rummikub::core::debug
{
    // A second layer of checks over the authoritative state. Throws
    // AssertionError on the first broken invariant.
    inline auto CheckInvariants(GameImpl const& g) -> void
    {
#if RMK_ENABLE_TEST_HOOKS == false
        (void)g;
#else
    Inspector::SnapshotAll const s = Inspector::Gather(g);

    // 1) Only valid boards are ever committed
    RMK_ASSERT(s.board_valid, "Canonical board holds an invalid meld");

    // 2) Every seat has a hand and an opening flag
    RMK_ASSERT(s.hands.size() == s.n_players, "Hand count != player count");
    RMK_ASSERT(s.opened.size() == s.n_players, "Opening flag count != player count");
    RMK_ASSERT(s.current < s.n_players, "Turn pointer out of range");

    // 3) Terminal iff a winner exists, and the winner holds nothing
    RMK_ASSERT((s.phase == Phase::GameOver) == s.winner.has_value(), "Terminal flag and winner disagree");
    if (s.winner)
    {
        RMK_ASSERT(s.hands.at(*s.winner).empty(), "Winner still holds tiles");
        RMK_ASSERT(s.opened.at(*s.winner), "Winner never completed an opening meld");
    }

    // 4) No tile in two places, and nothing created or destroyed
    {
        std::unordered_set<Tile const*> seen;
        std::unordered_set<TileId> ids;
        seen.reserve(s.tile_count);

        auto push_unique = [&](Tile const* p)
        {
            RMK_ASSERT(p != nullptr, "Null tile in a zone");
            bool const inserted = seen.insert(p).second && ids.insert(p->id).second;
            RMK_ASSERT(inserted, "Duplicate tile across zones");
        };

        for (auto p : s.deck) push_unique(p);
        for (auto const& h : s.hands) for (auto const p : h) push_unique(p);
        for (auto const& m : s.board) for (auto const p : m) push_unique(p);

        RMK_ASSERT(seen.size() == s.tile_count, "Materialized tile count != tiles in play");
    }

#endif // RMK_ENABLE_TEST_HOOKS == true
    }
}
#endif //RUMMIKUB_INVARIANTS_HPP
