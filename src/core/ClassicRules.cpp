//
// ClassicRules.cpp
//

#include "ClassicRules.hpp"

#include "Game.hpp"
#include "Tile.hpp"
#include "Util.hpp"
#include <ranges>
#include <algorithm>
#include <unordered_map>
namespace
{
    inline auto Viol(rummikub::core::error::RuleViolationCode code) -> rummikub::core::error::RuleViolation
    {
        return rummikub::core::error::RuleViolation{ .code = code };
    }
}

namespace rummikub::core
{
    auto ClassicRules::OpeningPoints(std::span<TileSP const> claimed) -> uint32_t
    {
        return FaceValue(claimed);
    }

    // Proposed board == canonical board + claimed tiles, each exactly once.
    auto ClassicRules::CheckConservation(GameImpl const& game, PlayAction const& play) -> CheckResult
    {
        using RVC = ::rummikub::core::error::RuleViolationCode;
        PlyrIdxT const actor = game.current_;

        std::unordered_map<TileId, Tile const*> expected;
        for (TileSP const& t : game.board_.AllTiles()) expected.emplace(t->id, t.get());
        for (TileSP const& t : play.from_hand) expected.emplace(t->id, t.get());

        util::TileUniqueChecker placed{};
        std::vector<Meld> const& melds = play.board.Melds();
        for (size_t i{}; i < melds.size(); ++i)
        {
            for (TileSP const& t : melds[i].Tiles())
            {
                placed.Add(*t);
                if (placed.ContainsDup())
                    return std::unexpected(Viol(RVC::Play_DuplicateBoardTile)
                                           .with_actor(actor).with_meld(i).with_tile(t->id));

                auto const it = expected.find(t->id);
                if (it == std::end(expected) || !(*it->second == *t))
                    return std::unexpected(Viol(RVC::Play_ForeignTile)
                                           .with_actor(actor).with_meld(i).with_tile(t->id));
            }
        }

        for (auto const& [id, tile] : expected)
        {
            if (!placed.Seen(id))
                return std::unexpected(Viol(RVC::Play_BoardTileMissing).with_actor(actor).with_tile(id));
        }
        return {};
    }

auto ClassicRules::Validate(GameImpl const& game, Proposal const& p) const -> CheckResult
{
    using RVC = ::rummikub::core::error::RuleViolationCode;

    PlyrIdxT const actor = game.current_;

    return std::visit([&]<typename T0>(T0 const& act) -> CheckResult
    {
        using T = std::decay_t<T0>;

        if constexpr (std::is_same_v<T, DrawAction>)
        {
            return {};
        }
        else if constexpr (std::is_same_v<T, PlayAction>)
        {
            // a) every meld on the proposed board is valid
            if (size_t const bad = act.board.FirstInvalid(); bad != act.board.MeldCount())
                return std::unexpected(Viol(RVC::Play_InvalidBoard)
                                       .with_actor(actor).with_meld(bad));

            // b) every claimed tile is in the hand, by identity, once
            if (util::any_null(std::span{act.from_hand}))
                return std::unexpected(Viol(RVC::Play_NullTile).with_actor(actor));

            util::TileUniqueChecker checker{};
            for (TileSP const& t : act.from_hand)
            {
                TileSP const owned = game.FindInHand(actor, t->id);
                if (!owned || !(*owned == *t))
                    return std::unexpected(Viol(RVC::Play_TileNotInHand)
                                           .with_actor(actor).with_tile(t->id));

                checker.Add(*t);
                if (checker.ContainsDup())
                    return std::unexpected(Viol(RVC::Play_DuplicateClaim)
                                           .with_actor(actor).with_tile(t->id));
            }

            // c) at least one tile leaves the hand
            if (act.from_hand.empty())
                return std::unexpected(Viol(RVC::Play_Empty).with_actor(actor));

            // d) opening meld threshold
            if (!game.opened_[actor])
            {
                uint32_t const points = OpeningPoints(act.from_hand);
                if (points < game.cfg_.opening_threshold)
                    return std::unexpected(Viol(RVC::Play_OpeningBelowThreshold)
                                           .with_actor(actor)
                                           .with_points(points)
                                           .with_threshold(game.cfg_.opening_threshold)
                                           .with_attempted(act.from_hand.size()));
            }

            // e) nothing dropped, nothing invented
            if (game.cfg_.enforce_conservation)
                return CheckConservation(game, act);

            return {};
        }

        RMK_THROW(rummikub::core::error::Code::Unknown, "Unreachable variant in Validate");
    }, p);
}


    auto ClassicRules::Apply(GameImpl& game, Proposal const& p) -> void
    {
        PlyrIdxT const actor = game.current_;
        std::visit([&]<typename T0>(T0 const& act)
            {
                using T = std::decay_t<T0>;
                if constexpr(std::is_same_v<T, DrawAction>)
                {
                    game.DrawInto(actor, 1);
                }
                else if constexpr(std::is_same_v<T, PlayAction>)
                {
                    game.board_ = act.board.Clone();
                    for (TileSP const& t : act.from_hand)
                    {
                        game.RemoveFromHand(actor, t->id);
                    }
                    game.opened_[actor] = true;

                    if (game.hands_[actor].empty())
                    {
                        game.winner_ = actor;
                        game.phase_ = Phase::GameOver;
                    }
                }
            }, p);
    }

    auto ClassicRules::Penalize(GameImpl& game, error::RuleViolation const& v) -> void
    {
        (void)v;
        game.DrawInto(game.current_, game.cfg_.penalty_draw);
    }

    auto ClassicRules::Advance(GameImpl& game, TurnOutcome const resolved) -> TurnOutcome
    {
        if (game.phase_ == Phase::GameOver) return TurnOutcome::GameEnded;

        game.current_ = game.NextSeat(game.current_);
        game.phase_ = Phase::AwaitingProposal;
        return resolved;
    }
}
