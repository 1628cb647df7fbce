#include "AuditLogger.hpp"

#include <format>
#include <ranges>
#include <string_view>
#include <vector>

#include "../core/Tile.hpp"

using namespace rummikub::core;

namespace
{

auto s_hand_sizes(GameImpl const& game) -> std::string
{
    std::string body;
    for (PlyrIdxT i = 0; i < game.PlayerCount(); ++i)
    {
        body += std::format("{}{}:{}", (i ? "," : ""), static_cast<int>(i), game.HandOf(i).size());
    }
    return body;
}

} // anonymous namespace

namespace rummikub::core::debug
{

auto FormatTiles(std::span<TileSP const> tiles) -> std::string
{
    std::string body;
    for (size_t i{}; i < tiles.size(); ++i)
    {
        body += (i ? " " : "");
        body += tiles[i] ? ToString(*tiles[i]) : std::string("--");
    }
    return std::format("[{}]", body);
}

auto FormatBoard(Board const& b) -> std::string
{
    std::string body;
    bool first = true;
    for (Meld const& m : b.Melds())
    {
        body += (first ? "" : ",");
        first = false;
        body += FormatTiles(m.Tiles());
    }
    return body;
}

auto FormatProposal(Proposal const& p) -> std::string
{
    return std::visit(
        [&]<typename T0>(T0 const& act) -> std::string
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, PlayAction>)
            {
                return std::format("Play{} -> {{{}}}", FormatTiles(act.from_hand), FormatBoard(act.board));
            }
            else
            {
                return "Draw";
            }
        },
        p
    );
}

auto to_string(TurnOutcome const o) -> std::string_view
{
    switch (o)
    {
    case TurnOutcome::Drew:      return "Drew";
    case TurnOutcome::Committed: return "Committed";
    case TurnOutcome::Rejected:  return "Rejected";
    case TurnOutcome::Pending:   return "Pending";
    case TurnOutcome::GameEnded: return "GameEnded";
    }
    return "?";
}

AuditLogger::AuditLogger(std::string path)
    : out_(std::move(path), std::ios::out | std::ios::trunc)
{
}

AuditLogger::~AuditLogger() = default;

auto AuditLogger::start(GameImpl const& game, uint64_t seed) -> void
{
    out_ << std::format("Seed={}\n", seed);
    out_ << std::format("Players={}\n", static_cast<int>(game.PlayerCount()));
    out_ << std::format("DealSize={}\n", static_cast<int>(game.Settings().deal_size));
    out_ << std::format("Hands=[{}]\n", s_hand_sizes(game));
    out_ << std::format("DrawPile={}\n", game.DrawPileSize());
    out_.flush();
}

auto AuditLogger::turn(GameSnapshot const& s,
                       PlyrIdxT actor,
                       Proposal const& p) -> void
{
    out_ << std::format(
        "Turn actor=P{} opened={} hand={} pile={} board={{{}}}\n",
        static_cast<int>(actor),
        (s.opened ? "Y" : "N"),
        s.my_hand.size(),
        s.draw_pile,
        FormatBoard(s.board)
    );

    out_ << std::format("Proposal: {}\n", FormatProposal(p));
}

auto AuditLogger::outcome(TurnOutcome o, std::optional<error::RuleViolation> const& why) -> void
{
    if (o == TurnOutcome::Rejected && why)
    {
        out_ << std::format("Outcome: {} ({})\n", to_string(o), error::describe(*why));
        return;
    }
    out_ << std::format("Outcome: {}\n", to_string(o));
}

auto AuditLogger::end(GameImpl const& game) -> void
{
    int const winner = game.Winner() ? static_cast<int>(*game.Winner()) : -1;

    out_ << std::format("Winner={}\n", winner);
    out_ << std::format("Hands=[{}]\n", s_hand_sizes(game));
    out_.flush();
}

auto AuditLogger::flush() -> void
{
    out_.flush();
}

}
