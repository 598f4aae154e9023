/// @file ThreadSafeBackend.hpp
/// @brief Blocking, poison-tracking backend for data shared between OS threads.
#pragma once

#include <utility>

#include <SHARC/Backends/BackendConcept.hpp>
#include <SHARC/Sync/ReadWriteLock.hpp>

namespace SHARC
{
    /// @brief Backend built on `Sync::ReadWriteLock`.
    ///
    /// Acquisition blocks the calling thread until the lock is available. It fails only with
    /// `AccessError::Poisoned`, after an exclusive guard was released during exception unwinding; the lock is
    /// released again before the error is returned.
    struct ThreadSafeBackend final
    {
        static constexpr BackendKind Kind         = BackendKind::ThreadSafe;
        static constexpr bool        IsSuspending = false;

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
                m_lock.StartRead();
                if (m_lock.IsPoisoned())
                {
                    m_lock.EndRead();
                    return MakeAccessError(AccessError::Poisoned);
                }
                return {};
            }

            AccessExpected<void> AcquireExclusive() noexcept
            {
                m_lock.StartWrite();
                if (m_lock.IsPoisoned())
                {
                    m_lock.EndWrite();
                    return MakeAccessError(AccessError::Poisoned);
                }
                return {};
            }

            void ReleaseShared() noexcept
            {
                m_lock.EndRead();
            }

            void ReleaseExclusive(bool abandoned) noexcept
            {
                m_lock.EndWrite(abandoned);
            }

            [[nodiscard]] T& Value() noexcept { return m_value; }

            [[nodiscard]] bool IsPoisoned() const noexcept { return m_lock.IsPoisoned(); }
            void               ClearPoison() noexcept { m_lock.ClearPoison(); }

        private:
            Sync::ReadWriteLock m_lock;
            T                   m_value;
        };
    };

    static_assert(BackendConcept<ThreadSafeBackend>);
}// namespace SHARC
