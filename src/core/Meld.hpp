//
// Meld.hpp
//

#ifndef RUMMIKUB_MELD_HPP
#define RUMMIKUB_MELD_HPP

#include <span>
#include <string_view>
#include <utility>
#include <vector>
#include "Types.hpp"

namespace rummikub::core
{
    enum class MeldKind : uint8_t
    {
        Invalid,
        Group,
        Run
    };

    // Ordered tiles; the kind is derived on demand and never stored.
    class Meld
    {
    public:
        Meld() = default;
        explicit Meld(std::vector<TileSP> tiles) : tiles_(std::move(tiles)) {}

        auto Validate() const -> bool;
        // An all-wildcard meld of 3-4 tiles reports Group.
        auto Classify() const -> MeldKind;

        auto Tiles() const noexcept -> std::vector<TileSP> const& { return tiles_; }
        auto Size()  const noexcept -> size_t { return tiles_.size(); }

        auto AddTile(TileSP tile) -> void;
        // Returns the removed tile, or nullptr if the id is not in this meld.
        auto RemoveTile(TileId id) -> TileSP;
        auto Contains(TileId id) const -> bool;
        auto FaceValue() const -> uint32_t;

        static auto IsValidGroup(std::span<TileSP const> tiles) -> bool;
        static auto IsValidRun(std::span<TileSP const> tiles) -> bool;

    private:
        std::vector<TileSP> tiles_;
    };

    auto to_string(MeldKind k) -> std::string_view;
}

#endif //RUMMIKUB_MELD_HPP
