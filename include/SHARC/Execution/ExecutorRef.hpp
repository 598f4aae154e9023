/// @file ExecutorRef.hpp
/// @brief Lightweight type-erased reference to an executor/scheduler.
#pragma once

#include <coroutine>

namespace SHARC::Execution
{
    /// @brief Type-erased, non-owning executor reference.
    ///
    /// A scheduler qualifies if it exposes `Execute(std::coroutine_handle<>)`. The referenced scheduler must
    /// outlive every `ExecutorRef` created from it.
    class ExecutorRef final
    {
    public:
        using ExecuteFn = void (*)(void*, std::coroutine_handle<>) noexcept;

        constexpr ExecutorRef() noexcept = default;

        constexpr ExecutorRef(void* self, ExecuteFn execute) noexcept
            : m_self(self)
            , m_execute(execute)
        {
        }

        template<typename TScheduler>
            requires requires(TScheduler& s, std::coroutine_handle<> h) { s.Execute(h); }
        static constexpr ExecutorRef From(TScheduler& scheduler) noexcept
        {
            return ExecutorRef(
                    &scheduler,
                    +[](void* s, std::coroutine_handle<> coro) noexcept {
                        static_cast<TScheduler*>(s)->Execute(coro);
                    });
        }

        [[nodiscard]] constexpr bool IsValid() const noexcept
        {
            return m_self != nullptr && m_execute != nullptr;
        }

        void Execute(std::coroutine_handle<> coro) const noexcept
        {
            m_execute(m_self, coro);
        }

        /// @brief Hands `coro` to the executor, or resumes it on the calling thread if there is none.
        void ExecuteOrResume(std::coroutine_handle<> coro) const noexcept
        {
            if (IsValid())
                Execute(coro);
            else
                coro.resume();
        }

    private:
        void*     m_self {nullptr};
        ExecuteFn m_execute {nullptr};
    };
}// namespace SHARC::Execution
