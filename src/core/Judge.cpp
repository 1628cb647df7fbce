//
// Judge.cpp
//
#include "Judge.hpp"
#include <future>
#include <thread>
#include <utility>
#include "Exception.hpp"
#include "Game.hpp"
#include "Player.hpp"

namespace rummikub::core
{
    auto Judge::GetProposal(GameImpl& game, PlyrIdxT actor) -> TimedProposal
    {
        std::chrono::milliseconds const timeout = game.Settings().turn_timeout;

        if (timeout.count() <= 0)
        {
            RMK_ASSERT(!pending_, "Synchronous proposal requested while one is outstanding");
            return {game.PlayerAt(actor)->Propose(game.SnapshotFor(actor),
                                                  std::chrono::steady_clock::time_point::max()),
                    DecisionResult::OK};
        }

        auto const deadline = std::chrono::steady_clock::now() + timeout;

        if (!pending_)
        {
            std::shared_ptr<const GameSnapshot> snap = game.SnapshotFor(actor);

            std::packaged_task<Proposal()> task(
                [p = game.SharedPlayerAt(actor),
                 snp = std::move(snap),
                 deadline]() mutable
                {
                    return p->Propose(std::move(snp), deadline);
                }
            );

            pending_ = task.get_future();
            pending_actor_ = actor;

            std::thread worker(std::move(task));
            worker.detach();
        }

        RMK_ASSERT(pending_actor_ == actor, "Outstanding proposal belongs to another seat");

        if (pending_->wait_until(deadline) == std::future_status::ready)
        {
            std::future<Proposal> fut = std::move(*pending_);
            pending_.reset();
            return {fut.get(), DecisionResult::OK};
        }

        //Timeout: keep waiting on the same future next time
        return {DrawAction{}, DecisionResult::Timeout};
    }

}
