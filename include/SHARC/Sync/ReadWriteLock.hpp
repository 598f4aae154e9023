#pragma once

#include <atomic>
#include <shared_mutex>

namespace SHARC::Sync
{
    /// @brief A read-write lock that allows multiple readers or a single writer at a time, and that
    /// remembers when a writer abandoned the lock during exception unwinding.
    ///
    /// Poisoning is sticky: once a writer has been released with `abandoned == true`, `IsPoisoned()`
    /// stays true until `ClearPoison()` is called. The lock never clears poison by itself.
    /// @note This is a wrapper around `std::shared_mutex`.
    class ReadWriteLock
    {
    public:
        /// @brief Default constructor
        ReadWriteLock() = default;
        /// @brief Copy constructor (deleted)
        ReadWriteLock(const ReadWriteLock&) = delete;
        /// @brief Copy assignment operator (deleted)
        ReadWriteLock& operator=(const ReadWriteLock&) = delete;

        /// @brief Acquires a shared read lock, blocking if necessary
        /// @note Multiple threads can hold read locks simultaneously
        void StartRead() noexcept
        {
            m_mutex.lock_shared();
        }

        /// @brief Releases a previously acquired read lock
        void EndRead() noexcept
        {
            m_mutex.unlock_shared();
        }

        /// @brief Attempts to acquire a shared read lock without blocking
        [[nodiscard]] bool TryStartRead() noexcept
        {
            return m_mutex.try_lock_shared();
        }

        /// @brief Acquires an exclusive write lock, blocking if necessary
        /// @note Only one thread can hold a write lock at a time
        void StartWrite() noexcept
        {
            m_mutex.lock();
        }

        /// @brief Releases a previously acquired write lock
        /// @param abandoned True if the writer is being released while an exception unwinds its scope.
        void EndWrite(bool abandoned = false) noexcept
        {
            if (abandoned)
                m_poisoned.store(true, std::memory_order_relaxed);
            m_mutex.unlock();
        }

        /// @brief Attempts to acquire an exclusive write lock without blocking
        [[nodiscard]] bool TryStartWrite() noexcept
        {
            return m_mutex.try_lock();
        }

        /// @brief True once a writer has abandoned the lock and until `ClearPoison()` is called.
        /// @note Read while holding the lock for a result ordered with the abandoning writer.
        [[nodiscard]] bool IsPoisoned() const noexcept
        {
            return m_poisoned.load(std::memory_order_relaxed);
        }

        void ClearPoison() noexcept
        {
            m_poisoned.store(false, std::memory_order_relaxed);
        }

    private:
        std::shared_mutex m_mutex;
        std::atomic<bool> m_poisoned {false};
    };
}// namespace SHARC::Sync
