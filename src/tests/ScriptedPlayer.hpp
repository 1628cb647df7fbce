//
// ScriptedPlayer.hpp
//

#ifndef RUMMIKUB_SCRIPTEDPLAYER_HPP
#define RUMMIKUB_SCRIPTEDPLAYER_HPP

#include <atomic>
#include <deque>
#include <future>
#include <memory>
#include <thread>
#include <utility>

#include "../core/Player.hpp"

namespace rummikub::test
{
    // Hands out queued proposals in order, then draws.
    class ScriptedPlayer final : public core::Player
    {
    public:
        ScriptedPlayer() = default;
        explicit ScriptedPlayer(std::deque<core::Proposal> script) : script_(std::move(script)) {}

        auto Queue(core::Proposal p) -> void { script_.push_back(std::move(p)); }

        auto Propose(std::shared_ptr<const core::GameSnapshot> snapshot,
                     std::chrono::steady_clock::time_point deadline) -> core::Proposal override
        {
            (void)deadline;
            ++requests_;
            last_seen_ = std::move(snapshot);
            caller_ = std::this_thread::get_id();

            if (script_.empty()) return core::DrawAction{};
            core::Proposal p = std::move(script_.front());
            script_.pop_front();
            return p;
        }

        auto Requests() const -> size_t { return requests_; }
        auto LastSnapshot() const -> std::shared_ptr<const core::GameSnapshot> const& { return last_seen_; }
        auto CallerThread() const -> std::thread::id { return caller_; }

    private:
        std::deque<core::Proposal> script_;
        size_t requests_{};
        std::shared_ptr<const core::GameSnapshot> last_seen_;
        std::thread::id caller_{};
    };

    // Holds its answer until Release(); drives the async proposal boundary.
    class BlockingPlayer final : public core::Player
    {
    public:
        // destroyed, when given, flips once the player is gone
        explicit BlockingPlayer(std::shared_ptr<std::atomic<bool>> destroyed = {})
            : gate_(release_.get_future().share()), destroyed_(std::move(destroyed))
        {
        }

        ~BlockingPlayer() override
        {
            if (destroyed_) destroyed_->store(true);
        }

        auto Propose(std::shared_ptr<const core::GameSnapshot> snapshot,
                     std::chrono::steady_clock::time_point deadline) -> core::Proposal override
        {
            (void)snapshot;
            (void)deadline;
            calls_.fetch_add(1, std::memory_order_relaxed);
            gate_.wait();
            answered_.fetch_add(1, std::memory_order_relaxed);
            return core::DrawAction{};
        }

        auto Release() -> void
        {
            if (!released_.exchange(true)) release_.set_value();
        }

        auto Calls() const -> int { return calls_.load(std::memory_order_relaxed); }
        auto Answered() const -> int { return answered_.load(std::memory_order_relaxed); }

    private:
        std::promise<void> release_;
        std::shared_future<void> gate_;
        std::atomic<int> calls_{0};
        std::atomic<int> answered_{0};
        std::atomic<bool> released_{false};
        std::shared_ptr<std::atomic<bool>> destroyed_;
    };
}

#endif //RUMMIKUB_SCRIPTEDPLAYER_HPP
