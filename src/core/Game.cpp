//
// Game.cpp
//
#include "Game.hpp"
#include <format>
#include <print>
#include <ranges>
#include <utility>

#include "Tile.hpp"
#include "Util.hpp"

namespace rummikub::core
{
    static auto CheckSeats(Config const& cfg, std::vector<std::shared_ptr<Player>> const& players) -> void
    {
        RMK_ASSERT(players.size() >= constants::MinPlayers, "Less than 2 players while initialising core");
        RMK_ASSERT(players.size() <= constants::MaxPlayers, "More than 4 players while initialising core");
        RMK_ASSERT(cfg.n_players == players.size(),
                   std::format("Config expects {} players, got {}", cfg.n_players, players.size()));
        RMK_ASSERT(!std::ranges::any_of(players,
                                        [](std::shared_ptr<Player> const& p) { return !p; }), "Invalid player in core");
    }

    static auto Share(std::vector<std::unique_ptr<Player>> players) -> std::vector<std::shared_ptr<Player>>
    {
        std::vector<std::shared_ptr<Player>> out;
        out.reserve(players.size());
        for (auto& p : players) out.emplace_back(std::move(p));
        return out;
    }

    GameImpl::GameImpl(Config const& config,
                       std::unique_ptr<Rules> rules,
                       std::vector<std::unique_ptr<Player>> players) :
        cfg_(config),
        rules_(std::move(rules)),
        players_(Share(std::move(players))),
        rng_{cfg_.seed},
        judge_(std::make_unique<Judge>()),
        hands_(players_.size()),
        opened_(players_.size(), false)
    {
        CheckSeats(cfg_, players_);
        RMK_ASSERT(rules_ != nullptr, "Null rules in core");
        BuildDeck();
        RMK_ASSERT(!deck_.empty(), "Empty deck after attempting init of deck in core");
        tile_count_ = deck_.size();
        DealInitialHands();
    }

    GameImpl::GameImpl(Config const& config,
                       std::unique_ptr<Rules> rules,
                       std::vector<std::unique_ptr<Player>> players,
                       GameRecord record) :
        cfg_(config),
        rules_(std::move(rules)),
        players_(Share(std::move(players))),
        rng_{cfg_.seed},
        judge_(std::make_unique<Judge>())
    {
        CheckSeats(cfg_, players_);
        RMK_ASSERT(rules_ != nullptr, "Null rules in core");
        Restore(std::move(record));
    }

    auto GameImpl::BuildDeck() -> void
    {
        deck_.clear();
        deck_.reserve(constants::ColorCount * constants::MaxValue * cfg_.copies + cfg_.wildcards);
        for (size_t c{}; c < constants::ColorCount; ++c)
        {
            for (int v{constants::MinValue}; v <= constants::MaxValue; ++v)
            {
                for (uint8_t k{}; k < cfg_.copies; ++k)
                {
                    deck_.push_back(MakeTile(static_cast<Color>(c), v));
                }
            }
        }
        for (uint8_t k{}; k < cfg_.wildcards; ++k)
        {
            deck_.push_back(MakeWildcard());
        }
        std::ranges::shuffle(deck_, rng_);
    }

    auto GameImpl::DealInitialHands() -> void
    {
        size_t const target = cfg_.deal_size;
        RMK_ASSERT(target * hands_.size() <= deck_.size(), "Less tiles in deck than required to init player hands");
        for (auto& hand : hands_)
        {
            while (hand.size() < target)
            {
                hand.push_back(std::move(deck_.back()));
                deck_.pop_back();
            }
        }
        current_ = 0;
        phase_ = Phase::AwaitingProposal;
    }

    auto GameImpl::Restore(GameRecord record) -> void
    {
        using error::Code;
        size_t const n = players_.size();
        if (record.hands.size() != n)
            RMK_THROW(Code::State, std::format("Record has {} hands for {} players", record.hands.size(), n));
        if (record.opened.empty()) record.opened.assign(n, false);
        if (record.opened.size() != n)
            RMK_THROW(Code::State, "Record opening flags do not match player count");
        if (record.current >= n)
            RMK_THROW(Code::State, "Record turn pointer out of range");
        if (record.terminal != record.winner.has_value())
            RMK_THROW(Code::State, "Record terminal flag and winner disagree");
        if (record.winner && (*record.winner >= n || !record.hands[*record.winner].empty()))
            RMK_THROW(Code::State, "Record winner must be a seat with an empty hand");

        util::TileUniqueChecker checker{};
        auto admit = [&](std::vector<TileSP> const& zone)
        {
            if (util::any_null(std::span{zone}))
                RMK_THROW(Code::State, "Record holds a null tile");
            for (TileSP const& t : zone) checker.Add(*t);
        };
        admit(record.board.AllTiles());
        for (auto const& hand : record.hands) admit(hand);
        admit(record.draw_pile);
        if (checker.ContainsDup())
            RMK_THROW(Code::State, "Record holds the same tile in two places");

        board_ = std::move(record.board);
        hands_ = std::move(record.hands);
        deck_ = std::move(record.draw_pile);
        opened_ = std::move(record.opened);
        current_ = record.current;
        winner_ = record.winner;
        phase_ = record.terminal ? Phase::GameOver : Phase::AwaitingProposal;

        tile_count_ = board_.TileCount() + deck_.size();
        for (auto const& hand : hands_) tile_count_ += hand.size();
    }

    auto GameImpl::SnapshotFor(PlyrIdxT const seat) const -> std::shared_ptr<GameSnapshot const>
    {
        RMK_ASSERT(seat < players_.size(), "Snapshot requested for a seat that does not exist");

        std::shared_ptr<GameSnapshot> snap = std::make_shared<GameSnapshot>();
        snap->n_players = static_cast<uint8_t>(players_.size());
        snap->seat = seat;
        snap->current = current_;
        snap->phase = phase_;
        snap->board = board_.Clone();
        snap->my_hand = hands_[seat];

        for (auto const& hand : hands_)
        {
            snap->hand_counts.push_back(static_cast<uint8_t>(std::min<size_t>(hand.size(), 255)));
        }
        snap->draw_pile = deck_.size();
        snap->opened = opened_[seat];
        snap->opening_threshold = cfg_.opening_threshold;

        return snap;
    }

    auto GameImpl::Export() const -> GameRecord
    {
        GameRecord rec{};
        rec.board = board_.Clone();
        rec.hands = hands_;
        rec.draw_pile = deck_;
        rec.opened = opened_;
        rec.current = current_;
        rec.terminal = phase_ == Phase::GameOver;
        rec.winner = winner_;
        return rec;
    }

    auto GameImpl::FindInHand(PlyrIdxT const seat, TileId const id) const -> TileSP
    {
        auto const& hand = hands_.at(seat);
        auto const it = std::ranges::find_if(hand, [id](TileSP const& t) { return t->id == id; });
        return (it != std::cend(hand)) ? *it : TileSP{};
    }

    auto GameImpl::DrawInto(PlyrIdxT const seat, size_t const count) -> size_t
    {
        auto& hand = hands_.at(seat);
        size_t drawn{};
        while (drawn < count && !deck_.empty())
        {
            hand.push_back(std::move(deck_.back()));
            deck_.pop_back();
            ++drawn;
        }
        return drawn;
    }

    auto GameImpl::RemoveFromHand(PlyrIdxT const seat, TileId const id) -> TileSP
    {
        auto& hand = hands_.at(seat);
        auto const it = std::ranges::find_if(hand, [id](TileSP const& t) { return t->id == id; });
        if (it == std::end(hand))
            RMK_THROW(error::Code::State, std::format("Tile #{} not in hand of P{}", id, static_cast<int>(seat)));
        TileSP out = std::move(*it);
        hand.erase(it);
        return out;
    }

    auto GameImpl::Step() -> TurnOutcome
    {
        if (phase_ == Phase::GameOver) return TurnOutcome::GameEnded;

        PlyrIdxT const actor = current_;
        TimedProposal const dec = judge_->GetProposal(*this, actor);
        if (dec.result == DecisionResult::Timeout) return TurnOutcome::Pending;

        phase_ = Phase::Evaluating;
        if (auto const ok = rules_->Validate(*this, dec.proposal); !ok.has_value())
        {
            std::print("{}\n", error::describe(ok.error()));
            last_violation_ = ok.error();
            rules_->Penalize(*this, ok.error());
            return rules_->Advance(*this, TurnOutcome::Rejected);
        }

        last_violation_.reset();
        bool const drew = std::holds_alternative<DrawAction>(dec.proposal);
        rules_->Apply(*this, dec.proposal);
        return rules_->Advance(*this, drew ? TurnOutcome::Drew : TurnOutcome::Committed);
    }
}
