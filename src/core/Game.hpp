//
// Game.hpp
//

#ifndef RUMMIKUB_GAME_HPP
#define RUMMIKUB_GAME_HPP

#include <algorithm>
#include <random>
#include <span>
#include <string>
#include "Types.hpp"
#include "Actions.hpp"
#include "Board.hpp"
#include "State.hpp"
#include "Rules.hpp"
#include "Player.hpp"
#include "Judge.hpp"

namespace rummikub::core::debug {struct Inspector;}
namespace rummikub::core
{
    class GameImpl
    {
    public:
        GameImpl() = delete;
        // Builds and shuffles the deck from cfg, then deals.
        GameImpl(Config const& config,
                 std::unique_ptr<Rules> rules,
                 std::vector<std::unique_ptr<Player>> players);
        // Starts from an explicit state. Throws StateError if the record is inconsistent.
        GameImpl(Config const& config,
                 std::unique_ptr<Rules> rules,
                 std::vector<std::unique_ptr<Player>> players,
                 GameRecord record);

        // One state-machine step: ask the current player for a proposal, validate, commit or penalize, advance.
        auto Step() -> TurnOutcome;
        auto SnapshotFor(PlyrIdxT seat) const -> std::shared_ptr<GameSnapshot const>;
        auto Export() const -> GameRecord;

        auto Current()     const noexcept -> PlyrIdxT { return current_; }
        auto PhaseNow()    const noexcept -> Phase    { return phase_; }
        auto IsOver()      const noexcept -> bool     { return phase_ == Phase::GameOver; }
        auto Winner()      const noexcept -> std::optional<PlyrIdxT> { return winner_; }
        auto PlayerCount() const noexcept -> size_t   { return players_.size(); }
        auto DrawPileSize() const noexcept -> size_t  { return deck_.size(); }
        auto CanonicalBoard() const noexcept -> Board const& { return board_; }
        auto Settings()    const noexcept -> Config const& { return cfg_; }
        auto HandOf(PlyrIdxT seat) const -> std::vector<TileSP> const& { return hands_.at(seat); }
        auto HasOpened(PlyrIdxT seat) const -> bool { return opened_.at(seat); }
        auto LastViolation() const noexcept -> std::optional<error::RuleViolation> const& { return last_violation_; }
        auto ProposalPending() const noexcept -> bool { return judge_->HasPending(); }

        //allows class to directly access private data on an instance
        friend class ClassicRules;
        friend struct debug::Inspector;

        //returns nullptr if not in the hand
        auto FindInHand(PlyrIdxT seat, TileId id) const -> TileSP;
        //pops from the back of the pile; returns how many were drawn
        auto DrawInto(PlyrIdxT seat, size_t count) -> size_t;
        //throws if the tile is not in the hand
        auto RemoveFromHand(PlyrIdxT seat, TileId id) -> TileSP;

        inline auto NextSeat(PlyrIdxT const idx) const -> PlyrIdxT { return static_cast<PlyrIdxT>((idx + 1) % players_.size()); }
        auto PlayerAt(PlyrIdxT seat) -> Player* { return players_.at(seat).get(); }
        // Shared with an outstanding proposal task, so the player outlives the game if needed.
        auto SharedPlayerAt(PlyrIdxT seat) const -> std::shared_ptr<Player> { return players_.at(seat); }
    private:
        //Produces a shuffled deck
        auto BuildDeck() -> void;
        auto DealInitialHands() -> void;
        auto Restore(GameRecord record) -> void;
    private:
        Config cfg_;
        std::unique_ptr<Rules> rules_;
        std::vector<std::shared_ptr<Player>> players_;
        std::mt19937_64 rng_;
        std::unique_ptr<Judge> judge_;

        // Authoritative state
        Board board_;                                        // canonical table
        std::vector<std::vector<TileSP>> hands_;             // [seat] owns tiles in hand
        std::vector<TileSP> deck_;                           // draw pile, popped from the back
        std::vector<bool> opened_;                           // [seat] opening meld done

        // Turn state
        PlyrIdxT current_{0};
        Phase    phase_{Phase::AwaitingProposal};
        std::optional<PlyrIdxT> winner_{};
        std::optional<error::RuleViolation> last_violation_{};
        size_t   tile_count_{};                              // every tile in play, fixed at start
    };
}
#endif //RUMMIKUB_GAME_HPP
