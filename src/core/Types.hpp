//
// Types.hpp
//

#ifndef RUMMIKUB_TYPES_HPP
#define RUMMIKUB_TYPES_HPP

#ifndef RMK_ENABLE_TEST_HOOKS
#define RMK_ENABLE_TEST_HOOKS true
#endif

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>
#include <array>
#include <chrono>
#include <random>
#include <variant>

namespace rummikub::core::constants
{
    inline constexpr uint8_t MinValue = 1;
    inline constexpr uint8_t MaxValue = 13;
    inline constexpr size_t  ColorCount = 4;
    inline constexpr size_t  MinMeldSize = 3;
    inline constexpr size_t  MaxGroupSize = 4;
    inline constexpr size_t  MaxRunSize = MaxValue;
    inline constexpr uint64_t DefaultSolverNodes = 2'000'000;
    inline constexpr size_t  MinPlayers = 2;
    inline constexpr size_t  MaxPlayers = 4;
}

namespace rummikub::core
{
    enum class Color : uint8_t
    {
        Black = 0,
        Red,
        Blue,
        Orange,
        Wildcard
    };

    using TileId = uint32_t;

    struct Tile
    {
        Tile() = delete;
        Tile(TileId id, Color color, uint8_t value, bool wildcard) :
            id(id), color(color), value(value), wildcard(wildcard) {}

        TileId  id;
        Color   color;
        // 0 for wildcards
        uint8_t value;
        bool    wildcard;
        ///////////////////////////////////
        Tile(Tile const&) = delete;
        auto operator=(Tile const&) -> Tile& = delete;
    };

    // Interchangeable, not identical: identity is the id.
    inline auto operator==(Tile const& a, Tile const& b) -> bool
    {
        if (a.wildcard || b.wildcard) return a.wildcard && b.wildcard;
        return a.color == b.color && a.value == b.value;
    }

    using TileSP = std::shared_ptr<Tile const>;

    struct Config
    {
        uint32_t n_players{2}; // must equal the number of seats handed to GameImpl, 2..4
        uint8_t  deal_size{14};
        uint8_t  copies{2};
        uint8_t  wildcards{2};
        uint64_t seed{std::random_device{}()};
        // zero = ask the player synchronously on the engine thread
        std::chrono::milliseconds turn_timeout{std::chrono::seconds(30ULL)};
        uint32_t opening_threshold{30};
        uint8_t  penalty_draw{3};
        bool     enforce_conservation{true};
    };
    using PlyrIdxT = uint8_t;
}

#endif //RUMMIKUB_TYPES_HPP
