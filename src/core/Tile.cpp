//
// Tile.cpp
//
#include "Tile.hpp"

#include <atomic>
#include <format>
#include <limits>
#include <utility>
#include "Exception.hpp"

namespace rummikub::core
{
    static std::atomic<TileId> next_id{1};

    static auto ReserveId() -> TileId
    {
        TileId cur = next_id.load(std::memory_order_relaxed);
        do
        {
            if (cur == std::numeric_limits<TileId>::max())
                RMK_THROW(error::Code::State, "Tile id space exhausted");
        } while (!next_id.compare_exchange_weak(cur, cur + 1, std::memory_order_relaxed));
        return cur;
    }

    // Keeps freshly minted ids clear of restored ones.
    static auto BumpPast(TileId const id) -> void
    {
        TileId cur = next_id.load(std::memory_order_relaxed);
        while (cur <= id && !next_id.compare_exchange_weak(cur, id + 1, std::memory_order_relaxed))
        {
        }
    }

    static auto CheckFace(Color const color, int const value, bool const wildcard) -> void
    {
        if (wildcard) return;
        if (color == Color::Wildcard)
            RMK_THROW(error::Code::MalformedTile, "Non-wildcard tile with wildcard color");
        if (value < constants::MinValue || value > constants::MaxValue)
            RMK_THROW(error::Code::MalformedTile, std::format("Tile value {} outside [1,13]", value));
    }

    auto MakeTile(Color const color, int const value) -> TileSP
    {
        CheckFace(color, value, false);
        return std::make_shared<Tile const>(ReserveId(), color, static_cast<uint8_t>(value), false);
    }

    auto MakeWildcard() -> TileSP
    {
        return std::make_shared<Tile const>(ReserveId(), Color::Wildcard, uint8_t{0}, true);
    }

    auto RestoreTile(TileId const id, Color const color, int const value, bool const wildcard) -> TileSP
    {
        // the id counter could not move past it
        if (id == std::numeric_limits<TileId>::max())
            RMK_THROW(error::Code::MalformedTile, std::format("Tile id {} is reserved", id));
        CheckFace(color, value, wildcard);
        BumpPast(id);
        if (wildcard) return std::make_shared<Tile const>(id, Color::Wildcard, uint8_t{0}, true);
        return std::make_shared<Tile const>(id, color, static_cast<uint8_t>(value), false);
    }

    auto Clone(Tile const& t) -> TileSP
    {
        return t.wildcard ? MakeWildcard() : MakeTile(t.color, t.value);
    }

    auto FaceValue(std::span<TileSP const> tiles) -> uint32_t
    {
        uint32_t sum{};
        for (TileSP const& t : tiles) sum += FaceValue(*t);
        return sum;
    }

    auto CanonicalLess(Tile const& a, Tile const& b) -> bool
    {
        if (a.wildcard != b.wildcard) return b.wildcard;
        if (a.value != b.value) return a.value < b.value;
        if (a.color != b.color) return std::to_underlying(a.color) < std::to_underlying(b.color);
        return a.id < b.id;
    }

    auto ColorLetter(Color const c) -> char
    {
        switch (c)
        {
        case Color::Black:    return 'K';
        case Color::Red:      return 'R';
        case Color::Blue:     return 'B';
        case Color::Orange:   return 'O';
        case Color::Wildcard: return 'J';
        }
        return '?';
    }

    auto ToString(Tile const& t) -> std::string
    {
        if (t.wildcard) return "J";
        return std::format("{}{}", ColorLetter(t.color), static_cast<int>(t.value));
    }
}
