//
// RecordingPlayer.hpp
//

#ifndef RUMMIKUB_RECORDINGPLAYER_HPP
#define RUMMIKUB_RECORDINGPLAYER_HPP

#include <algorithm>
#include <memory>
#include <utility>
#include <variant>
#include <vector>

#include "../core/Exception.hpp"
#include "../core/Game.hpp"
#include "../core/Player.hpp"

namespace rummikub::core::debug
{
    // What a seat was shown and what it answered.
    struct RecordedTurn
    {
        std::shared_ptr<const GameSnapshot> seen;
        Proposal proposal{DrawAction{}};
    };

    // Forwards to the wrapped player and keeps every exchange, oldest first.
    // Not synchronised: read it only once the outstanding proposal resolved.
    class RecordingPlayer final : public Player
    {
    public:
        explicit RecordingPlayer(std::unique_ptr<Player> inner)
            : inner_{std::move(inner)}
        {
        }

        auto Propose(std::shared_ptr<const GameSnapshot> s,
                     std::chrono::steady_clock::time_point deadline) -> Proposal override
        {
            Proposal p = inner_->Propose(s, deadline);
            turns_.push_back(RecordedTurn{std::move(s), p});
            return p;
        }

        auto HasLast() const -> bool { return !turns_.empty(); }

        auto Last() const -> RecordedTurn const&
        {
            RMK_ASSERT(!turns_.empty(), "No proposal recorded yet");
            return turns_.back();
        }

        auto Turns() const -> std::vector<RecordedTurn> const& { return turns_; }

    private:
        std::unique_ptr<Player> inner_;
        std::vector<RecordedTurn> turns_;
    };

    inline auto WrapRecording(std::vector<std::unique_ptr<Player>>& players)
        -> std::vector<std::unique_ptr<Player>>
    {
        std::vector<std::unique_ptr<Player>> out;
        out.reserve(players.size());

        for (auto& p : players)
        {
            out.emplace_back(std::make_unique<RecordingPlayer>(std::move(p)));
        }

        return out;
    }

    // nullptr unless the seat was wrapped with WrapRecording
    inline auto AsRecording(Player* p) -> RecordingPlayer*
    {
        return dynamic_cast<RecordingPlayer*>(p);
    }

    // Replays the recorded turn against the state after Step() and checks the
    // engine did what the outcome claims: a draw took at most one tile, a
    // rejection drew the penalty, a commit installed exactly the proposed board
    // and took exactly the claimed tiles out of the hand.
    inline auto CheckResolved(GameImpl const& g, RecordedTurn const& turn, TurnOutcome const out) -> void
    {
        RMK_ASSERT(turn.seen != nullptr, "Recorded turn without a snapshot");
        GameSnapshot const& before = *turn.seen;
        std::vector<TileSP> const& hand = g.HandOf(before.seat);

        auto pile_gave = [&](size_t want) { return std::min(want, before.draw_pile); };

        switch (out)
        {
        case TurnOutcome::Pending:
            return;
        case TurnOutcome::Drew:
            RMK_ASSERT(std::holds_alternative<DrawAction>(turn.proposal), "Drew without a draw proposal");
            RMK_ASSERT(hand.size() == before.my_hand.size() + pile_gave(1), "Draw moved the wrong number of tiles");
            return;
        case TurnOutcome::Rejected:
            RMK_ASSERT(hand.size() == before.my_hand.size() + pile_gave(g.Settings().penalty_draw),
                       "Penalty drew the wrong number of tiles");
            RMK_ASSERT(g.LastViolation().has_value(), "Rejected without a recorded violation");
            return;
        case TurnOutcome::Committed:
        case TurnOutcome::GameEnded:
            break;
        }

        PlayAction const* play = std::get_if<PlayAction>(&turn.proposal);
        RMK_ASSERT(play != nullptr, "Commit without a play proposal");
        RMK_ASSERT(hand.size() + play->from_hand.size() == before.my_hand.size(),
                   "Commit took the wrong number of tiles from the hand");
        for (TileSP const& t : play->from_hand)
        {
            RMK_ASSERT(g.FindInHand(before.seat, t->id) == nullptr, "Claimed tile still in hand after commit");
        }

        auto ids = [](std::vector<TileSP> const& tiles)
        {
            std::vector<TileId> v;
            v.reserve(tiles.size());
            for (TileSP const& t : tiles) v.push_back(t->id);
            std::ranges::sort(v);
            return v;
        };
        RMK_ASSERT(g.CanonicalBoard().MeldCount() == play->board.MeldCount(), "Committed board lost or gained melds");
        RMK_ASSERT(ids(g.CanonicalBoard().AllTiles()) == ids(play->board.AllTiles()),
                   "Committed board differs from the proposed one");
        RMK_ASSERT(g.HasOpened(before.seat), "Commit left the opening flag unset");
    }
} // namespace rummikub::core::debug

#endif //RUMMIKUB_RECORDINGPLAYER_HPP
