//
// Board.hpp
//

#ifndef RUMMIKUB_BOARD_HPP
#define RUMMIKUB_BOARD_HPP

#include <vector>
#include "Meld.hpp"

namespace rummikub::core
{
    // Value type. Copies share tiles by identity but own their melds,
    // so editing a copy never touches the original.
    class Board
    {
    public:
        Board() = default;
        explicit Board(std::vector<Meld> melds) : melds_(std::move(melds)) {}

        auto Clone() const -> Board { return *this; }

        auto AddMeld(Meld meld) -> void;
        auto IsValid() const -> bool;
        // First invalid meld, or MeldCount() if all are valid.
        auto FirstInvalid() const -> size_t;
        auto AllTiles() const -> std::vector<TileSP>;

        auto Melds() const noexcept -> std::vector<Meld> const& { return melds_; }
        auto Melds() noexcept       -> std::vector<Meld>&       { return melds_; }
        auto MeldCount() const noexcept -> size_t { return melds_.size(); }
        auto Empty() const noexcept -> bool { return melds_.empty(); }
        auto TileCount() const -> size_t;
        auto FaceValue() const -> uint32_t;
        auto HasDuplicateTiles() const -> bool;

    private:
        std::vector<Meld> melds_;
    };
}

#endif //RUMMIKUB_BOARD_HPP
