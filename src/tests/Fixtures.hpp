//
// Fixtures.hpp
//

#ifndef RUMMIKUB_FIXTURES_HPP
#define RUMMIKUB_FIXTURES_HPP

#include <algorithm>
#include <chrono>
#include <initializer_list>
#include <memory>
#include <span>
#include <utility>
#include <vector>

#include "../core/Types.hpp"
#include "../core/Tile.hpp"
#include "../core/Meld.hpp"
#include "../core/Board.hpp"
#include "../core/State.hpp"
#include "../core/Game.hpp"
#include "../core/ClassicRules.hpp"

namespace rummikub::test
{
    using namespace rummikub::core;

    inline auto Red(int v) -> TileSP    { return MakeTile(Color::Red, v); }
    inline auto Blue(int v) -> TileSP   { return MakeTile(Color::Blue, v); }
    inline auto Black(int v) -> TileSP  { return MakeTile(Color::Black, v); }
    inline auto Orange(int v) -> TileSP { return MakeTile(Color::Orange, v); }
    inline auto Wild() -> TileSP        { return MakeWildcard(); }

    inline auto MeldOf(std::initializer_list<TileSP> tiles) -> Meld
    {
        return Meld{std::vector<TileSP>(tiles)};
    }

    inline auto BoardOf(std::initializer_list<Meld> melds) -> Board
    {
        return Board{std::vector<Meld>(melds)};
    }

    // Engine-thread proposals, fixed seed.
    inline auto SyncConfig() -> Config
    {
        return Config{
            .n_players    = 2,
            .seed         = 7,
            .turn_timeout = std::chrono::milliseconds(0)
        };
    }

    inline auto Ids(std::span<TileSP const> tiles) -> std::vector<TileId>
    {
        std::vector<TileId> out;
        out.reserve(tiles.size());
        for (TileSP const& t : tiles) out.push_back(t->id);
        std::ranges::sort(out);
        return out;
    }

    // Two-seat record; seat 0 moves first.
    inline auto TwoSeatRecord(std::vector<TileSP> hand0,
                              std::vector<TileSP> hand1,
                              std::vector<TileSP> pile,
                              Board board = {},
                              std::vector<bool> opened = {false, false}) -> GameRecord
    {
        GameRecord rec{};
        rec.board = std::move(board);
        rec.hands.push_back(std::move(hand0));
        rec.hands.push_back(std::move(hand1));
        rec.draw_pile = std::move(pile);
        rec.opened = std::move(opened);
        rec.current = 0;
        return rec;
    }

    inline auto Pile(size_t n) -> std::vector<TileSP>
    {
        std::vector<TileSP> out;
        out.reserve(n);
        for (size_t i{}; i < n; ++i) out.push_back(Orange(static_cast<int>(1 + i % constants::MaxValue)));
        return out;
    }

    inline auto MakeGame(Config const& cfg,
                         std::vector<std::unique_ptr<Player>> players,
                         GameRecord record) -> std::unique_ptr<GameImpl>
    {
        return std::make_unique<GameImpl>(cfg, std::make_unique<ClassicRules>(),
                                          std::move(players), std::move(record));
    }
}

#endif //RUMMIKUB_FIXTURES_HPP
