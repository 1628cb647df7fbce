//
// Board.cpp
//
#include "Board.hpp"

#include <algorithm>
#include <iterator>
#include <ranges>
#include "Util.hpp"

namespace rummikub::core
{
    auto Board::AddMeld(Meld meld) -> void
    {
        melds_.push_back(std::move(meld));
    }

    auto Board::IsValid() const -> bool
    {
        return std::ranges::all_of(melds_, [](Meld const& m) { return m.Validate(); });
    }

    auto Board::FirstInvalid() const -> size_t
    {
        auto const it = std::ranges::find_if(melds_, [](Meld const& m) { return !m.Validate(); });
        return static_cast<size_t>(std::distance(std::cbegin(melds_), it));
    }

    auto Board::AllTiles() const -> std::vector<TileSP>
    {
        std::vector<TileSP> out;
        out.reserve(TileCount());
        for (Meld const& m : melds_)
        {
            std::ranges::copy(m.Tiles(), std::back_inserter(out));
        }
        return out;
    }

    auto Board::TileCount() const -> size_t
    {
        size_t n{};
        for (Meld const& m : melds_) n += m.Size();
        return n;
    }

    auto Board::FaceValue() const -> uint32_t
    {
        uint32_t sum{};
        for (Meld const& m : melds_) sum += m.FaceValue();
        return sum;
    }

    auto Board::HasDuplicateTiles() const -> bool
    {
        util::TileUniqueChecker checker{};
        for (Meld const& m : melds_)
        {
            for (TileSP const& t : m.Tiles())
            {
                if (t) checker.Add(*t);
            }
        }
        return checker.ContainsDup();
    }
}
