#pragma once

#include <concepts>
#include <coroutine>
#include <cstddef>
#include <mutex>

#include <SHARC/Execution/ExecutorRef.hpp>
#include <SHARC/Primitives.hpp>

namespace SHARC::Async
{
    enum class LockMode : UInt8
    {
        Shared,
        Exclusive,
    };

    /// @brief A read-write lock whose acquisition suspends the awaiting coroutine instead of blocking the thread.
    ///
    /// Waiters are queued in FIFO order. On release the lock hands access to the head of the queue: either a run
    /// of consecutive readers or a single writer. A new acquisition only takes the fast path while nobody is
    /// queued, so a waiting writer is not starved by a stream of readers.
    ///
    /// A granted waiter is resumed through the executor of the task it belongs to (see `Task::GetExecutor`), or
    /// inline on the releasing thread when it has none.
    ///
    /// Granted waiters stay on a ready list owned by the lock until they are handed to their executor.
    ///
    /// Destroying a coroutine suspended in `co_await LockSharedAsync()` / `co_await LockExclusiveAsync()` unlinks
    /// its waiter from whichever list holds it. If access had already been handed to it, the access is released
    /// again.
    class ReadWriteLock
    {
    public:
        class LockAwaiter;

        ReadWriteLock() = default;
        ReadWriteLock(const ReadWriteLock&)            = delete;
        ReadWriteLock& operator=(const ReadWriteLock&) = delete;

        /// @brief Awaitable shared acquisition. `co_await` completes once a read lock is held by the caller.
        [[nodiscard]] LockAwaiter LockSharedAsync() noexcept;

        /// @brief Awaitable exclusive acquisition. `co_await` completes once the write lock is held by the caller.
        [[nodiscard]] LockAwaiter LockExclusiveAsync() noexcept;

        [[nodiscard]] bool TryLockShared() noexcept
        {
            std::lock_guard lock(m_mutex);
            return TryAcquireLocked(LockMode::Shared);
        }

        [[nodiscard]] bool TryLockExclusive() noexcept
        {
            std::lock_guard lock(m_mutex);
            return TryAcquireLocked(LockMode::Exclusive);
        }

        void UnlockShared() noexcept
        {
            Release(LockMode::Shared);
        }

        void UnlockExclusive() noexcept
        {
            Release(LockMode::Exclusive);
        }

        /// @brief Number of coroutines currently suspended waiting for access.
        [[nodiscard]] std::size_t PendingWaiters() const noexcept
        {
            std::lock_guard lock(m_mutex);
            return m_queue.size;
        }

        [[nodiscard]] std::size_t ActiveReaders() const noexcept
        {
            std::lock_guard lock(m_mutex);
            return m_readers;
        }

        [[nodiscard]] bool IsLockedExclusive() const noexcept
        {
            std::lock_guard lock(m_mutex);
            return m_writer;
        }

        class LockAwaiter
        {
        public:
            LockAwaiter(ReadWriteLock& lock, LockMode mode) noexcept
                : m_lock(lock)
                , m_mode(mode)
            {
            }

            /// Only an awaiter that has not been awaited yet may be moved.
            LockAwaiter(LockAwaiter&& other) noexcept
                : m_lock(other.m_lock)
                , m_mode(other.m_mode)
            {
            }

            LockAwaiter(const LockAwaiter&)            = delete;
            LockAwaiter& operator=(const LockAwaiter&) = delete;
            LockAwaiter& operator=(LockAwaiter&&)      = delete;

            ~LockAwaiter()
            {
                m_lock.Abandon(*this);
            }

            bool await_ready() noexcept
            {
                std::lock_guard lock(m_lock.m_mutex);
                if (m_lock.TryAcquireLocked(m_mode))
                {
                    m_state = State::Granted;
                    return true;
                }
                return false;
            }

            template<typename TPromise>
            bool await_suspend(std::coroutine_handle<TPromise> handle) noexcept
            {
                m_handle = handle;
                if constexpr (requires(TPromise& p) { { p.GetExecutor() } -> std::convertible_to<Execution::ExecutorRef>; })
                {
                    m_executor = handle.promise().GetExecutor();
                }
                return m_lock.Enqueue(*this);
            }

            /// Access now belongs to the caller, who must release it with `UnlockShared`/`UnlockExclusive`.
            void await_resume() noexcept
            {
                m_state = State::Claimed;
            }

            [[nodiscard]] LockMode Mode() const noexcept { return m_mode; }

        private:
            friend class ReadWriteLock;

            enum class State : UInt8
            {
                Idle,
                Queued,
                Ready,
                Granted,
                Claimed,
            };

            ReadWriteLock&          m_lock;
            LockMode                m_mode;
            State                   m_state {State::Idle};
            std::coroutine_handle<> m_handle {};
            Execution::ExecutorRef  m_executor {};
            LockAwaiter*            m_prev {nullptr};
            LockAwaiter*            m_next {nullptr};
        };

    private:
        /// Intrusive FIFO of awaiters linked through `m_prev`/`m_next`. Guarded by `m_mutex`.
        struct WaiterList
        {
            LockAwaiter* head {nullptr};
            LockAwaiter* tail {nullptr};
            std::size_t  size {0};

            void PushBack(LockAwaiter& waiter) noexcept
            {
                waiter.m_prev = tail;
                waiter.m_next = nullptr;
                if (tail)
                    tail->m_next = &waiter;
                else
                    head = &waiter;
                tail = &waiter;
                ++size;
            }

            void Remove(LockAwaiter& waiter) noexcept
            {
                if (waiter.m_prev)
                    waiter.m_prev->m_next = waiter.m_next;
                else
                    head = waiter.m_next;
                if (waiter.m_next)
                    waiter.m_next->m_prev = waiter.m_prev;
                else
                    tail = waiter.m_prev;
                waiter.m_prev = nullptr;
                waiter.m_next = nullptr;
                --size;
            }
        };

        [[nodiscard]] bool TryAcquireLocked(LockMode mode) noexcept
        {
            if (m_writer)
                return false;
            if (mode == LockMode::Shared)
            {
                if (m_queue.head != nullptr)
                    return false;
                ++m_readers;
                return true;
            }
            if (m_readers != 0 || m_queue.head != nullptr)
                return false;
            m_writer = true;
            return true;
        }

        /// Returns true if the awaiter was queued and the coroutine must suspend.
        bool Enqueue(LockAwaiter& waiter) noexcept
        {
            std::lock_guard lock(m_mutex);
            // The lock may have been released between await_ready and await_suspend.
            if (TryAcquireLocked(waiter.m_mode))
            {
                waiter.m_state = LockAwaiter::State::Granted;
                return false;
            }
            waiter.m_state = LockAwaiter::State::Queued;
            m_queue.PushBack(waiter);
            return true;
        }

        void ReleaseLocked(LockMode mode) noexcept
        {
            if (mode == LockMode::Shared)
                --m_readers;
            else
                m_writer = false;
        }

        /// Moves every waiter that can run now from the wait queue to the ready list.
        /// Returns true if anything was moved.
        bool GrantLocked() noexcept
        {
            bool granted = false;
            while (m_queue.head != nullptr && !m_writer)
            {
                LockAwaiter* waiter = m_queue.head;
                if (waiter->m_mode == LockMode::Exclusive)
                {
                    if (m_readers != 0)
                        break;
                    m_writer = true;
                }
                else
                {
                    ++m_readers;
                }

                m_queue.Remove(*waiter);
                waiter->m_state = LockAwaiter::State::Ready;
                m_ready.PushBack(*waiter);
                granted = true;
            }
            return granted;
        }

        /// Resumes ready waiters one at a time. Each waiter is popped under the mutex, so a resumed coroutine may
        /// destroy a waiter still on the list, which then unlinks itself in `Abandon`.
        void ResumeReady() noexcept
        {
            for (;;)
            {
                std::coroutine_handle<> handle;
                Execution::ExecutorRef  executor;
                {
                    std::lock_guard lock(m_mutex);
                    LockAwaiter*    waiter = m_ready.head;
                    if (waiter == nullptr)
                        return;
                    m_ready.Remove(*waiter);
                    waiter->m_state = LockAwaiter::State::Granted;
                    handle          = waiter->m_handle;
                    executor        = waiter->m_executor;
                }
                executor.ExecuteOrResume(handle);
            }
        }

        void Release(LockMode mode) noexcept
        {
            bool granted = false;
            {
                std::lock_guard lock(m_mutex);
                ReleaseLocked(mode);
                granted = GrantLocked();
            }
            if (granted)
                ResumeReady();
        }

        void Abandon(LockAwaiter& waiter) noexcept
        {
            bool granted = false;
            {
                std::lock_guard lock(m_mutex);
                switch (waiter.m_state)
                {
                    case LockAwaiter::State::Queued:
                        // A cancelled writer at the head may have been holding back readers queued behind it.
                        m_queue.Remove(waiter);
                        granted = GrantLocked();
                        break;
                    case LockAwaiter::State::Ready:
                        m_ready.Remove(waiter);
                        ReleaseLocked(waiter.m_mode);
                        granted = GrantLocked();
                        break;
                    case LockAwaiter::State::Granted:
                        ReleaseLocked(waiter.m_mode);
                        granted = GrantLocked();
                        break;
                    case LockAwaiter::State::Idle:
                    case LockAwaiter::State::Claimed:
                        break;
                }
                waiter.m_state = LockAwaiter::State::Idle;
            }
            if (granted)
                ResumeReady();
        }

        mutable std::mutex m_mutex;
        std::size_t        m_readers {0};
        bool               m_writer {false};
        WaiterList         m_queue;
        WaiterList         m_ready;
    };

    inline ReadWriteLock::LockAwaiter ReadWriteLock::LockSharedAsync() noexcept
    {
        return LockAwaiter(*this, LockMode::Shared);
    }

    inline ReadWriteLock::LockAwaiter ReadWriteLock::LockExclusiveAsync() noexcept
    {
        return LockAwaiter(*this, LockMode::Exclusive);
    }
}// namespace SHARC::Async
