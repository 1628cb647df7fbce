//
// Inspector.hpp
//

#ifndef RUMMIKUB_INSPECTOR_HPP
#define RUMMIKUB_INSPECTOR_HPP

#include <algorithm>
#include <iterator>
#include <vector>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <ranges>
#include <utility>

#include "../core/Types.hpp"
#include "../core/Game.hpp"

namespace rummikub::core::debug
{
    struct Inspector
    {
        struct SnapshotAll
        {
            std::vector<Tile const*> deck;
            std::vector<std::vector<Tile const*>> hands;
            std::vector<std::vector<Tile const*>> board;
            std::vector<bool> opened;
            uint8_t n_players{};
            Phase phase{};

            PlyrIdxT current{};
            std::optional<PlyrIdxT> winner{};
            bool board_valid{};
            size_t tile_count{};
        };

        static inline auto Gather(GameImpl const& g) -> SnapshotAll
        {
            auto raw = [](TileSP const& t) -> Tile const* { return t.get(); };

            SnapshotAll ret{};
            ret.n_players = static_cast<uint8_t>(g.players_.size());
            ret.phase = g.phase_;
            ret.current = g.current_;
            ret.winner = g.winner_;
            ret.opened = g.opened_;
            ret.board_valid = g.board_.IsValid();
            ret.tile_count = g.tile_count_;
            ret.hands.resize(g.hands_.size());

            for (size_t i{}; i < g.hands_.size(); ++i)
            {
                ret.hands[i].reserve(g.hands_[i].size());
                std::ranges::transform(g.hands_[i], std::back_inserter(ret.hands[i]), raw);
            }

            ret.deck.reserve(g.deck_.size());
            std::ranges::transform(std::as_const(g.deck_), std::back_inserter(ret.deck), raw);

            for (Meld const& m : g.board_.Melds())
            {
                std::vector<Tile const*>& dst = ret.board.emplace_back();
                std::ranges::transform(m.Tiles(), std::back_inserter(dst), raw);
            }

            return ret;
        }
    };
}

#endif //RUMMIKUB_INSPECTOR_HPP
