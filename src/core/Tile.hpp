//
// Tile.hpp
//

#ifndef RUMMIKUB_TILE_HPP
#define RUMMIKUB_TILE_HPP

#include <span>
#include <string>
#include "Types.hpp"

namespace rummikub::core
{
    // Throws MalformedTileError if value is outside [1,13] or color is Wildcard.
    auto MakeTile(Color color, int value) -> TileSP;
    auto MakeWildcard() -> TileSP;

    // Rebuilds a tile with a known id (decoding, restores). Same checks as MakeTile,
    // and the largest TileId is refused.
    auto RestoreTile(TileId id, Color color, int value, bool wildcard) -> TileSP;

    // Fresh identity, same face. Simulation only, never for gameplay transfer.
    auto Clone(Tile const& t) -> TileSP;

    inline auto Interchangeable(Tile const& a, Tile const& b) -> bool { return a == b; }

    // Wildcards contribute 0.
    inline auto FaceValue(Tile const& t) -> uint32_t { return t.wildcard ? 0u : t.value; }
    auto FaceValue(std::span<TileSP const> tiles) -> uint32_t;

    // value ascending, then color, wildcards last; id breaks ties.
    auto CanonicalLess(Tile const& a, Tile const& b) -> bool;

    auto ColorLetter(Color c) -> char;
    // R5, B12, K1, O7, J
    auto ToString(Tile const& t) -> std::string;
}

#endif //RUMMIKUB_TILE_HPP
