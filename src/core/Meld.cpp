//
// Meld.cpp
//
#include "Meld.hpp"

#include <algorithm>
#include <ranges>
#include "Tile.hpp"
#include "Util.hpp"

namespace rummikub::core
{
    static auto SplitWildcards(std::span<TileSP const> tiles, std::vector<Tile const*>& plain) -> size_t
    {
        size_t wild{};
        for (TileSP const& t : tiles)
        {
            if (t->wildcard) ++wild;
            else plain.push_back(t.get());
        }
        return wild;
    }

    auto Meld::IsValidGroup(std::span<TileSP const> tiles) -> bool
    {
        if (tiles.size() > constants::MaxGroupSize) return false;

        std::vector<Tile const*> plain;
        plain.reserve(tiles.size());
        SplitWildcards(tiles, plain);
        if (plain.empty()) return true;

        uint8_t const value = plain.front()->value;
        util::ColorSet colors{};
        for (Tile const* t : plain)
        {
            if (t->value != value) return false;
            if (!colors.Insert(t->color)) return false;
        }
        return true;
    }

    auto Meld::IsValidRun(std::span<TileSP const> tiles) -> bool
    {
        std::vector<Tile const*> plain;
        plain.reserve(tiles.size());
        size_t wild = SplitWildcards(tiles, plain);
        if (plain.empty()) return tiles.size() <= constants::MaxRunSize;

        Color const color = plain.front()->color;
        if (std::ranges::any_of(plain, [color](Tile const* t) { return t->color != color; }))
            return false;

        std::ranges::sort(plain, {}, &Tile::value);

        for (size_t i{}; i + 1 < plain.size(); ++i)
        {
            int const gap = int{plain[i + 1]->value} - int{plain[i]->value} - 1;
            if (gap < 0) return false;
            if (static_cast<size_t>(gap) > wild) return false;
            wild -= static_cast<size_t>(gap);
        }

        size_t const lo = plain.front()->value;
        size_t const hi = plain.back()->value;
        return wild <= (lo - constants::MinValue) + (constants::MaxValue - hi);
    }

    auto Meld::Validate() const -> bool
    {
        if (tiles_.size() < constants::MinMeldSize) return false;
        if (std::ranges::any_of(tiles_, [](TileSP const& t) { return !t; })) return false;
        return IsValidGroup(tiles_) || IsValidRun(tiles_);
    }

    auto Meld::Classify() const -> MeldKind
    {
        if (tiles_.size() < constants::MinMeldSize) return MeldKind::Invalid;
        if (std::ranges::any_of(tiles_, [](TileSP const& t) { return !t; })) return MeldKind::Invalid;
        if (IsValidGroup(tiles_)) return MeldKind::Group;
        if (IsValidRun(tiles_)) return MeldKind::Run;
        return MeldKind::Invalid;
    }

    auto Meld::AddTile(TileSP tile) -> void
    {
        tiles_.push_back(std::move(tile));
    }

    auto Meld::RemoveTile(TileId const id) -> TileSP
    {
        auto const it = std::ranges::find_if(tiles_, [id](TileSP const& t) { return t && t->id == id; });
        if (it == std::end(tiles_)) return nullptr;
        TileSP out = std::move(*it);
        tiles_.erase(it);
        return out;
    }

    auto Meld::Contains(TileId const id) const -> bool
    {
        return std::ranges::any_of(tiles_, [id](TileSP const& t) { return t && t->id == id; });
    }

    auto Meld::FaceValue() const -> uint32_t
    {
        return core::FaceValue(std::span<TileSP const>{tiles_});
    }

    auto to_string(MeldKind const k) -> std::string_view
    {
        switch (k)
        {
        case MeldKind::Group:   return "Group";
        case MeldKind::Run:     return "Run";
        case MeldKind::Invalid: return "Invalid";
        }
        return "?";
    }
}
