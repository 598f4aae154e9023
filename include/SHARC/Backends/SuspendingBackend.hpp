/// @file SuspendingBackend.hpp
/// @brief Coroutine-suspending backend for cooperative async code.
#pragma once

#include <SHARC/Config.hpp>

#if SHARC_ENABLE_ASYNC

#include <utility>

#include <SHARC/Async/ReadWriteLock.hpp>
#include <SHARC/Backends/BackendConcept.hpp>

namespace SHARC
{
    /// @brief Backend built on `Async::ReadWriteLock`.
    ///
    /// Acquisition never fails; it suspends the awaiting coroutine until access is free. The synchronous
    /// accessors always report `AccessError::UnsupportedMode` instead of blocking the caller's thread.
    struct SuspendingBackend final
    {
        static constexpr BackendKind Kind         = BackendKind::Suspending;
        static constexpr bool        IsSuspending = true;

        using RefCount = Memory::AtomicRefCount;

        template<typename T>
        class Cell
        {
        public:
            using ValueType = T;

            template<typename... Args>
            explicit Cell(std::in_place_t, Args&&... args)
                : m_value(std::forward<Args>(args)...)
            {
            }

            Cell(const Cell&)            = delete;
            Cell& operator=(const Cell&) = delete;

            AccessExpected<void> AcquireShared() noexcept
            {
                return MakeAccessError(AccessError::UnsupportedMode);
            }

            AccessExpected<void> AcquireExclusive() noexcept
            {
                return MakeAccessError(AccessError::UnsupportedMode);
            }

            [[nodiscard]] Async::ReadWriteLock::LockAwaiter LockSharedAsync() noexcept
            {
                return m_lock.LockSharedAsync();
            }

            [[nodiscard]] Async::ReadWriteLock::LockAwaiter LockExclusiveAsync() noexcept
            {
                return m_lock.LockExclusiveAsync();
            }

            void ReleaseShared() noexcept
            {
                m_lock.UnlockShared();
            }

            void ReleaseExclusive(bool) noexcept
            {
                m_lock.UnlockExclusive();
            }

            [[nodiscard]] T& Value() noexcept { return m_value; }

            [[nodiscard]] const Async::ReadWriteLock& Lock() const noexcept { return m_lock; }

        private:
            Async::ReadWriteLock m_lock;
            T                    m_value;
        };
    };

    static_assert(BackendConcept<SuspendingBackend>);
    static_assert(SuspendingCellConcept<SuspendingBackend::Cell<int>>);
}// namespace SHARC

#endif
