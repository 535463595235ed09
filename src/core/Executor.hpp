//
// Executor.hpp
//

#ifndef CARDARENA_EXECUTOR_HPP
#define CARDARENA_EXECUTOR_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <thread>

namespace arena::core
{
    using Task = std::function<void()>;
    using TimerId = std::uint64_t;

    // The single sequential context every session mutation runs on.
    // Tasks never run concurrently with each other.
    class Executor
    {
    public:
        virtual ~Executor() = default;

        virtual auto Post(Task task) -> void = 0;

        // Returns a handle usable with Cancel(). Handles are never reused.
        virtual auto PostAfter(std::chrono::milliseconds delay, Task task) -> TimerId = 0;

        // false if the timer already fired or never existed
        virtual auto Cancel(TimerId id) -> bool = 0;

        // Drops everything queued; later posts are ignored. Idempotent.
        virtual auto Shutdown() -> void = 0;
    };

    class ThreadExecutor final : public Executor
    {
    public:
        ThreadExecutor();
        ~ThreadExecutor() override;

        ThreadExecutor(ThreadExecutor const&) = delete;
        auto operator=(ThreadExecutor const&) -> ThreadExecutor& = delete;

        auto Post(Task task) -> void override;
        auto PostAfter(std::chrono::milliseconds delay, Task task) -> TimerId override;
        auto Cancel(TimerId id) -> bool override;
        auto Shutdown() -> void override;

        [[nodiscard]]
        auto OnWorker() const noexcept -> bool { return std::this_thread::get_id() == worker_.get_id(); }

    private:
        using Clock = std::chrono::steady_clock;

        struct Timed
        {
            TimerId id{};
            Task task;
        };

        auto Run() -> void;

        std::mutex m_;
        std::condition_variable cv_;
        std::deque<Task> ready_;
        std::multimap<Clock::time_point, Timed> timers_;
        TimerId next_timer_{1};
        bool stopping_{false};
        // lives on the worker's stack; set when Shutdown runs on the worker
        bool* released_{nullptr};
        std::thread worker_;
    };
}

#endif //CARDARENA_EXECUTOR_HPP
