/// <summary>
/// Lazily-started coroutine type used to drive suspending container access.
/// </summary>
#pragma once

#include <atomic>
#include <coroutine>
#include <exception>
#include <optional>
#include <thread>
#include <type_traits>
#include <utility>

#include <SHARC/Execution/ExecutorRef.hpp>

namespace SHARC::Async
{
    template<typename T>
    class Task;

    namespace detail
    {
        /// Completion of a task frame. `Finishing` covers the window in which the final awaiter still touches the
        /// promise after publishing completion; the frame may only be destroyed once `Finished` is reached.
        enum class CompletionState : unsigned char
        {
            Running,
            Finishing,
            Finished,
        };

        struct TaskPromiseBase
        {
            std::exception_ptr           m_error {};
            std::atomic<CompletionState> m_state {CompletionState::Running};
            std::coroutine_handle<>      m_continuation {};
            SHARC::Execution::ExecutorRef m_executor {};

            std::suspend_always initial_suspend() noexcept
            {
                return {};
            }

            struct FinalAwaiter
            {
                bool await_ready() noexcept
                {
                    return false;
                }

                template<typename TPromise>
                std::coroutine_handle<> await_suspend(std::coroutine_handle<TPromise> h) noexcept
                {
                    auto& p            = h.promise();
                    auto  continuation = p.m_continuation;
                    auto  executor     = p.m_executor;
                    p.m_state.store(CompletionState::Finishing, std::memory_order_release);
                    p.m_state.notify_all();
                    // The frame may be destroyed from here on; only locals are used below.
                    p.m_state.store(CompletionState::Finished, std::memory_order_release);
                    if (!continuation)
                        return std::noop_coroutine();
                    if (executor.IsValid())
                    {
                        executor.Execute(continuation);
                        return std::noop_coroutine();
                    }
                    return continuation;
                }

                void await_resume() noexcept {}
            };

            FinalAwaiter final_suspend() noexcept
            {
                return {};
            }

            void unhandled_exception() noexcept
            {
                m_error = std::current_exception();
            }

            /// Blocks until the final awaiter no longer touches the frame. Only valid once the task has finished
            /// or is driven by another thread.
            void WaitFinished() const noexcept
            {
                auto state = m_state.load(std::memory_order_acquire);
                while (state == CompletionState::Running)
                {
                    m_state.wait(state, std::memory_order_acquire);
                    state = m_state.load(std::memory_order_acquire);
                }
                while (state != CompletionState::Finished)
                {
                    std::this_thread::yield();
                    state = m_state.load(std::memory_order_acquire);
                }
            }

            /// Destroying the frame is safe unless another thread is inside the final awaiter.
            void WaitUntilDestructible() const noexcept
            {
                while (m_state.load(std::memory_order_acquire) == CompletionState::Finishing)
                {
                    std::this_thread::yield();
                }
            }

            /// Executor the task runs on; awaiters use it to resume the coroutine after suspending.
            [[nodiscard]] SHARC::Execution::ExecutorRef GetExecutor() const noexcept
            {
                return m_executor;
            }
        };

        template<typename T>
        struct TaskPromise : TaskPromiseBase
        {
            std::optional<T> m_value {};

            Task<T> get_return_object() noexcept;

            void return_value(T value) noexcept(std::is_nothrow_move_constructible_v<T>)
            {
                m_value.emplace(std::move(value));
            }
        };

        template<>
        struct TaskPromise<void> : TaskPromiseBase
        {
            Task<void> get_return_object() noexcept;

            void return_void() noexcept {}
        };
    }// namespace detail

    //------------------------------------------------------------------------
    // Task<T>
    //------------------------------------------------------------------------

    /// @brief A lazily-started coroutine producing a `T`.
    ///
    /// A task runs when it is started on a scheduler (`Start`) or, if never started, inline when first
    /// awaited by another coroutine. Awaiting tasks inherit the executor of the awaiting task.
    template<typename T = void>
    class Task
    {
    public:
        using promise_type = detail::TaskPromise<T>;
        using handle_type  = std::coroutine_handle<promise_type>;

        explicit Task(handle_type h) noexcept
            : m_handle(h)
        {
        }

        Task(Task&& o) noexcept
            : m_handle(std::exchange(o.m_handle, nullptr))
            , m_started(o.m_started)
        {
            o.m_started = false;
        }
        Task& operator=(Task&& o) noexcept
        {
            if (this != &o)
            {
                Destroy();
                m_handle    = std::exchange(o.m_handle, nullptr);
                m_started   = o.m_started;
                o.m_started = false;
            }
            return *this;
        }
        Task(const Task&)            = delete;
        Task& operator=(const Task&) = delete;

        /// Destroys the coroutine frame. Destroying a suspended task unwinds its locals, which cancels any
        /// acquisition it was suspended in.
        ~Task()
        {
            Destroy();
        }

        bool await_ready() const noexcept
        {
            return !m_handle || m_handle.done();
        }

        template<typename TPromise>
        std::coroutine_handle<> await_suspend(std::coroutine_handle<TPromise> awaiting) noexcept
        {
            auto& prom          = m_handle.promise();
            prom.m_continuation = awaiting;
            if constexpr (std::is_base_of_v<detail::TaskPromiseBase, TPromise>)
            {
                if (!prom.m_executor.IsValid())
                    prom.m_executor = awaiting.promise().GetExecutor();
            }
            if (!m_started)
            {
                m_started = true;
                return m_handle;
            }
            return std::noop_coroutine();
        }

        T await_resume()
        {
            return TakeResult();
        }

        /// Schedule this task on `scheduler`. No effect if the task was already started.
        template<typename TScheduler>
        void Start(TScheduler& scheduler) noexcept
        {
            Start(SHARC::Execution::ExecutorRef::From(scheduler));
        }

        void Start(SHARC::Execution::ExecutorRef executor) noexcept
        {
            if (!m_started)
            {
                m_started                     = true;
                m_handle.promise().m_executor = executor;
                executor.ExecuteOrResume(m_handle);
            }
        }

        /// Block the calling thread until the task has finished. The task must be driven by another thread or
        /// have completed already.
        void Wait() const noexcept
        {
            m_handle.promise().WaitFinished();
        }

        T Get()
        {
            Wait();
            return TakeResult();
        }

        [[nodiscard]] bool IsCompleted() const noexcept
        {
            return m_handle && m_handle.promise().m_state.load(std::memory_order_acquire) != detail::CompletionState::Running;
        }

        [[nodiscard]] bool IsStarted() const noexcept
        {
            return m_started;
        }

        [[nodiscard]] bool IsFaulted() const noexcept
        {
            return IsCompleted() && m_handle.promise().m_error != nullptr;
        }

        handle_type Handle() const noexcept
        {
            return m_handle;
        }

    private:
        void Destroy() noexcept
        {
            if (!m_handle)
                return;
            m_handle.promise().WaitUntilDestructible();
            m_handle.destroy();
        }

        T TakeResult()
        {
            auto& p = m_handle.promise();
            if (p.m_error)
                std::rethrow_exception(p.m_error);
            if constexpr (!std::is_void_v<T>)
                return std::move(*p.m_value);
        }

        handle_type m_handle;
        bool        m_started {false};
    };

    namespace detail
    {
        template<typename T>
        Task<T> TaskPromise<T>::get_return_object() noexcept
        {
            return Task<T> {std::coroutine_handle<TaskPromise<T>>::from_promise(*this)};
        }

        inline Task<void> TaskPromise<void>::get_return_object() noexcept
        {
            return Task<void> {std::coroutine_handle<TaskPromise<void>>::from_promise(*this)};
        }
    }// namespace detail
}// namespace SHARC::Async
