/// @file InlineScheduler.hpp
/// @brief Scheduler that runs coroutines inline.
#pragma once

#include <coroutine>

namespace SHARC::Execution
{
    /// @brief Scheduler that resumes scheduled coroutines immediately on the calling thread.
    class InlineScheduler final
    {
    public:
        InlineScheduler() = default;

        void Execute(std::coroutine_handle<> coro) noexcept
        {
            if (coro && !coro.done())
            {
                coro.resume();
            }
        }
    };
}// namespace SHARC::Execution
