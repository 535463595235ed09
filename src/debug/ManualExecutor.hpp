//
// ManualExecutor.hpp: deterministic executor with a virtual clock
//

#ifndef CARDARENA_MANUALEXECUTOR_HPP
#define CARDARENA_MANUALEXECUTOR_HPP

#include <chrono>
#include <cstddef>
#include <deque>
#include <map>
#include <utility>

#include "../core/Executor.hpp"

namespace arena::core::debug
{
    // Nothing runs until the test asks. Timers fire in due order as the virtual
    // clock is advanced; ties fire in scheduling order.
    class ManualExecutor final : public Executor
    {
    public:
        auto Post(Task task) -> void override
        {
            if (!stopped_)
            {
                ready_.push_back(std::move(task));
            }
        }

        auto PostAfter(std::chrono::milliseconds delay, Task task) -> TimerId override
        {
            TimerId const id = next_timer_++;
            if (!stopped_)
            {
                timers_.emplace(now_ + delay, Timed{id, std::move(task)});
            }
            return id;
        }

        auto Cancel(TimerId id) -> bool override
        {
            for (auto it = timers_.begin(); it != timers_.end(); ++it)
            {
                if (it->second.id == id)
                {
                    timers_.erase(it);
                    return true;
                }
            }
            return false;
        }

        auto Shutdown() -> void override
        {
            stopped_ = true;
            ready_.clear();
            timers_.clear();
        }

        // Runs posted tasks, including ones they post, until none remain.
        auto RunPending() -> std::size_t
        {
            std::size_t ran{};
            while (!ready_.empty())
            {
                Task t = std::move(ready_.front());
                ready_.pop_front();
                t();
                ++ran;
            }
            return ran;
        }

        // Moves the clock forward, firing every timer that falls due on the way.
        auto AdvanceBy(std::chrono::milliseconds delta) -> void
        {
            std::chrono::milliseconds const target = now_ + delta;
            RunPending();
            while (!timers_.empty() && timers_.begin()->first <= target)
            {
                auto it = timers_.begin();
                now_ = it->first;
                Task t = std::move(it->second.task);
                timers_.erase(it);
                t();
                RunPending();
            }
            now_ = target;
        }

        // Fires timers until none are left. Returns the virtual time that passed.
        auto RunUntilIdle() -> std::chrono::milliseconds
        {
            std::chrono::milliseconds const start = now_;
            RunPending();
            while (!timers_.empty())
            {
                AdvanceBy(timers_.begin()->first - now_);
            }
            return now_ - start;
        }

        [[nodiscard]] auto Now() const noexcept -> std::chrono::milliseconds { return now_; }
        [[nodiscard]] auto PendingTasks() const noexcept -> std::size_t { return ready_.size(); }
        [[nodiscard]] auto PendingTimers() const noexcept -> std::size_t { return timers_.size(); }

    private:
        struct Timed
        {
            TimerId id{};
            Task task;
        };

        std::deque<Task> ready_;
        std::multimap<std::chrono::milliseconds, Timed> timers_;
        std::chrono::milliseconds now_{0};
        TimerId next_timer_{1};
        bool stopped_{false};
    };
}

#endif //CARDARENA_MANUALEXECUTOR_HPP
