//
// StateCodec.cpp
//
#include "StateCodec.hpp"

#include <format>
#include <optional>
#include <utility>
#include <vector>

#include "../core/Exception.hpp"
#include "../core/Tile.hpp"
#include "../core/Util.hpp"

namespace fbs = rummikub::gen::state;

namespace
{
    // Verify enum layouts (one value per enum is sufficient to catch drift)
    static_assert((int)rummikub::core::Color::Black == (int)fbs::Color::Black);
    static_assert((int)rummikub::core::Color::Wildcard == (int)fbs::Color::Wildcard);

    using TileVec = flatbuffers::Vector<flatbuffers::Offset<fbs::Tile>>;
}

namespace rummikub::core::codec
{
    auto ToFbColor(Color const c) noexcept -> fbs::Color
    {
        switch (c)
        {
        case Color::Black: return fbs::Color::Black;
        case Color::Red: return fbs::Color::Red;
        case Color::Blue: return fbs::Color::Blue;
        case Color::Orange: return fbs::Color::Orange;
        case Color::Wildcard: return fbs::Color::Wildcard;
        }
        return fbs::Color::Black;
    }

    // The verifier does not range-check enums.
    auto FromFbColor(fbs::Color const c) noexcept -> std::optional<Color>
    {
        switch (c)
        {
        case fbs::Color::Black: return Color::Black;
        case fbs::Color::Red: return Color::Red;
        case fbs::Color::Blue: return Color::Blue;
        case fbs::Color::Orange: return Color::Orange;
        case fbs::Color::Wildcard: return Color::Wildcard;
        }
        return std::nullopt;
    }

    static auto ToFbTiles(flatbuffers::FlatBufferBuilder& fbb, std::span<TileSP const> tiles)
        -> flatbuffers::Offset<TileVec>
    {
        std::vector<flatbuffers::Offset<fbs::Tile>> vec;
        vec.reserve(tiles.size());
        for (TileSP const& t : tiles)
        {
            vec.push_back(fbs::CreateTile(fbb, t->id, ToFbColor(t->color), t->value, t->wildcard));
        }
        return fbb.CreateVector(vec);
    }

    auto EncodeGameRecord(GameRecord const& rec) -> flatbuffers::DetachedBuffer
    {
        RMK_ASSERT(rec.opened.empty() || rec.opened.size() == rec.hands.size(),
                   "Opening flags do not match hands");

        flatbuffers::FlatBufferBuilder fbb;

        std::vector<flatbuffers::Offset<fbs::Meld>> melds;
        melds.reserve(rec.board.MeldCount());
        for (Meld const& m : rec.board.Melds())
        {
            melds.push_back(fbs::CreateMeld(fbb, ToFbTiles(fbb, m.Tiles())));
        }
        auto const board_vec = fbb.CreateVector(melds);

        std::vector<flatbuffers::Offset<fbs::Hand>> hands;
        hands.reserve(rec.hands.size());
        for (size_t i{}; i < rec.hands.size(); ++i)
        {
            bool const opened = !rec.opened.empty() && rec.opened[i];
            hands.push_back(fbs::CreateHand(fbb, ToFbTiles(fbb, rec.hands[i]), opened));
        }
        auto const hands_vec = fbb.CreateVector(hands);

        auto const pile_vec = ToFbTiles(fbb, rec.draw_pile);

        auto const root = fbs::CreateGameState(
            fbb,
            /*schema_version*/ 1,
            /*board*/ board_vec,
            /*hands*/ hands_vec,
            /*draw_pile*/ pile_vec,
            /*current*/ rec.current,
            /*terminal*/ rec.terminal,
            /*winner*/ rec.winner ? static_cast<int16_t>(*rec.winner) : int16_t{-1}
        );
        fbs::FinishGameStateBuffer(fbb, root);
        return fbb.Release();
    }

    // ---------- Decode ----------

    static auto FromFbTiles(TileVec const* vec, util::TileUniqueChecker& seen)
        -> std::expected<std::vector<TileSP>, ParseError>
    {
        std::vector<TileSP> out;
        if (!vec) return out;
        out.reserve(vec->size());
        for (fbs::Tile const* t : *vec)
        {
            std::optional<Color> const color = FromFbColor(t->color());
            if (!color)
                return std::unexpected(ParseError{std::format("tile #{}: unknown color {}", t->id(),
                                                              static_cast<int>(t->color()))});
            try
            {
                out.push_back(RestoreTile(t->id(), *color, t->value(), t->wildcard()));
            }
            catch (error::MalformedTileError const& e)
            {
                return std::unexpected(ParseError{std::format("tile #{}: {}", t->id(), e.what())});
            }
            seen.Add(*out.back());
            if (seen.ContainsDup())
                return std::unexpected(ParseError{std::format("tile #{} appears twice", t->id())});
        }
        return out;
    }

    auto DecodeGameRecord(std::span<std::byte const> bytes)
        -> std::expected<GameRecord, ParseError>
    {
        if (bytes.size() < sizeof(flatbuffers::uoffset_t))
            return std::unexpected(ParseError{"buffer too small"});

        auto const* raw = reinterpret_cast<uint8_t const*>(bytes.data());
        if (!fbs::GameStateBufferHasIdentifier(raw))
            return std::unexpected(ParseError{"not a game state buffer"});

        flatbuffers::Verifier verifier(raw, bytes.size());
        if (!fbs::VerifyGameStateBuffer(verifier))
            return std::unexpected(ParseError{"buffer failed verification"});

        fbs::GameState const* gs = fbs::GetGameState(raw);

        GameRecord rec{};
        util::TileUniqueChecker seen{};

        if (auto const* melds = gs->board())
        {
            for (fbs::Meld const* m : *melds)
            {
                auto tiles = FromFbTiles(m->tiles(), seen);
                if (!tiles) return std::unexpected(tiles.error());
                rec.board.AddMeld(Meld{std::move(*tiles)});
            }
        }

        if (auto const* hands = gs->hands())
        {
            for (fbs::Hand const* h : *hands)
            {
                auto tiles = FromFbTiles(h->tiles(), seen);
                if (!tiles) return std::unexpected(tiles.error());
                rec.hands.push_back(std::move(*tiles));
                rec.opened.push_back(h->opened());
            }
        }

        auto pile = FromFbTiles(gs->draw_pile(), seen);
        if (!pile) return std::unexpected(pile.error());
        rec.draw_pile = std::move(*pile);

        rec.current = gs->current();
        rec.terminal = gs->terminal();

        if (!rec.hands.empty() && rec.current >= rec.hands.size())
            return std::unexpected(ParseError{"turn pointer out of range"});
        if (int16_t const winner = gs->winner(); winner >= 0)
        {
            if (static_cast<size_t>(winner) >= rec.hands.size())
                return std::unexpected(ParseError{std::format("winner seat {} out of range", winner)});
            rec.winner = static_cast<PlyrIdxT>(winner);
        }
        if (rec.terminal != rec.winner.has_value())
            return std::unexpected(ParseError{"terminal flag and winner disagree"});

        return rec;
    }
}
