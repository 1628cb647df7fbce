//
// Util.hpp
//

#ifndef RUMMIKUB_UTIL_HPP
#define RUMMIKUB_UTIL_HPP

#include <algorithm>
#include <span>
#include <memory>
#include <unordered_set>
#include <utility>
#include "Types.hpp"

namespace rummikub::core::util
{
    template <typename T>
    inline auto any_null(std::span<T const> ptrs) -> bool
    {
        if constexpr (std::is_same_v<T, std::weak_ptr<typename T::element_type>>)
        {
            return std::ranges::any_of(ptrs, [](auto const& p) { return p.expired(); });
        }
        else if constexpr (std::is_same_v<T, std::shared_ptr<typename T::element_type>>)
        {
            return std::ranges::any_of(ptrs, [](auto const& p) { return !p; });
        }
        else
        {
            static_assert([]{return false;}(), "Ptr must be std::shared_ptr<T> or std::weak_ptr<T>");
        }
    }

    class ColorSet
    {
    public:
        // false if the color was already present
        auto Insert(Color const c) -> bool
        {
            uint8_t const bit = uint8_t{1} << std::to_underlying(c);
            bool const fresh = !(bits_ & bit);
            bits_ |= bit;
            return fresh;
        }
    private:
        uint8_t bits_{};
    };

    // Identity (id) duplicates across any number of Add calls.
    class TileUniqueChecker
    {
    public:
        auto Add(Tile const& t) -> void
        {
            contains_dup_ |= !seen_.insert(t.id).second;
        }
        [[nodiscard]]
        auto ContainsDup() const -> bool
        {
            return contains_dup_;
        }
        [[nodiscard]]
        auto Seen(TileId const id) const -> bool
        {
            return seen_.contains(id);
        }
    private:
        std::unordered_set<TileId> seen_;
        bool contains_dup_{false};
    };

    inline auto ContainsId(std::span<TileSP const> tiles, TileId const id) -> bool
    {
        return std::ranges::any_of(tiles, [id](TileSP const& t) { return t && t->id == id; });
    }
}

#endif //RUMMIKUB_UTIL_HPP
