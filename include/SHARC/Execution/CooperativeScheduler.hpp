/// @file CooperativeScheduler.hpp
/// @brief Single-thread, cooperative executor pumped by the caller.
#pragma once

#include <coroutine>
#include <cstddef>
#include <deque>

namespace SHARC::Execution
{
    /// @brief A single-threaded cooperative scheduler.
    ///
    /// This scheduler never spawns background threads. Work is executed only when the caller pumps the scheduler
    /// via `RunOne`/`RunUntilIdle`, in the order it was scheduled.
    class CooperativeScheduler final
    {
    public:
        CooperativeScheduler() = default;

        CooperativeScheduler(const CooperativeScheduler&)            = delete;
        CooperativeScheduler& operator=(const CooperativeScheduler&) = delete;

        void Execute(std::coroutine_handle<> coro) noexcept
        {
            if (coro)
            {
                m_ready.push_back(coro);
            }
        }

        [[nodiscard]] bool RunOne()
        {
            if (m_ready.empty())
            {
                return false;
            }

            auto coro = m_ready.front();
            m_ready.pop_front();
            if (!coro.done())
            {
                coro.resume();
            }
            return true;
        }

        void RunUntilIdle()
        {
            while (RunOne()) {}
        }

        [[nodiscard]] std::size_t PendingReady() const noexcept
        {
            return m_ready.size();
        }

    private:
        std::deque<std::coroutine_handle<>> m_ready {};
    };
}// namespace SHARC::Execution
