//
// Executor.cpp
//

#include "Executor.hpp"

#include <exception>
#include <utility>

#include "Exception.hpp"

namespace arena::core
{
    ThreadExecutor::ThreadExecutor()
        : worker_([this] { Run(); })
    {
    }

    ThreadExecutor::~ThreadExecutor()
    {
        Shutdown();
    }

    auto ThreadExecutor::Post(Task task) -> void
    {
        {
            std::lock_guard<std::mutex> lock(m_);
            if (stopping_)
            {
                return;
            }
            ready_.push_back(std::move(task));
        }
        cv_.notify_one();
    }

    auto ThreadExecutor::PostAfter(std::chrono::milliseconds delay, Task task) -> TimerId
    {
        TimerId id{};
        {
            std::lock_guard<std::mutex> lock(m_);
            id = next_timer_++;
            if (stopping_)
            {
                return id;
            }
            timers_.emplace(Clock::now() + delay, Timed{id, std::move(task)});
        }
        cv_.notify_one();
        return id;
    }

    auto ThreadExecutor::Cancel(TimerId id) -> bool
    {
        std::lock_guard<std::mutex> lock(m_);
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

    auto ThreadExecutor::Shutdown() -> void
    {
        {
            std::lock_guard<std::mutex> lock(m_);
            stopping_ = true;
            ready_.clear();
            timers_.clear();
        }
        cv_.notify_all();

        if (worker_.joinable())
        {
            if (OnWorker())
            {
                // shutting down from inside a task: the loop exits after it returns
                // without touching members, since the task may be destroying us
                *released_ = true;
                worker_.detach();
            }
            else
            {
                worker_.join();
            }
        }
    }

    auto ThreadExecutor::Run() -> void
    {
        bool released = false;
        std::unique_lock<std::mutex> lock(m_);
        released_ = &released;
        while (!stopping_)
        {
            // promote due timers in deadline order
            auto const now = Clock::now();
            while (!timers_.empty() && timers_.begin()->first <= now)
            {
                ready_.push_back(std::move(timers_.begin()->second.task));
                timers_.erase(timers_.begin());
            }

            if (ready_.empty())
            {
                if (timers_.empty())
                {
                    cv_.wait(lock);
                }
                else
                {
                    cv_.wait_until(lock, timers_.begin()->first);
                }
                continue;
            }

            Task task = std::move(ready_.front());
            ready_.pop_front();

            lock.unlock();
            try
            {
                task();
            }
            catch (OmegaException<error::Code> const& e)
            {
                ARN_LOG_ERROR("Executor", "{}", e);
            }
            catch (std::exception const& e)
            {
                ARN_LOG_ERROR("Executor", "task failed: {}", e.what());
            }
            if (released)
            {
                return;
            }
            lock.lock();
        }
    }
}
