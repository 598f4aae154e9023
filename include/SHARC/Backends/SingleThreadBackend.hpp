/// @file SingleThreadBackend.hpp
/// @brief Borrow-checked backend for data confined to one thread.
#pragma once

#include <utility>

#include <SHARC/Backends/BackendConcept.hpp>
#include <SHARC/Sync/BorrowFlag.hpp>

namespace SHARC
{
    /// @brief Backend built on `Sync::BorrowFlag` and non-atomic reference counts.
    ///
    /// Never blocks. An acquisition that overlaps an incompatible outstanding guard fails immediately with
    /// `AccessError::BorrowConflict`. Containers using this backend, their clones and their guards must all stay
    /// on the thread that created them.
    struct SingleThreadBackend final
    {
        static constexpr BackendKind Kind         = BackendKind::SingleThread;
        static constexpr bool        IsSuspending = false;

        using RefCount = Memory::LocalRefCount;

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
                if (!m_borrow.TryBorrowShared())
                    return MakeAccessError(AccessError::BorrowConflict);
                return {};
            }

            AccessExpected<void> AcquireExclusive() noexcept
            {
                if (!m_borrow.TryBorrowExclusive())
                    return MakeAccessError(AccessError::BorrowConflict);
                return {};
            }

            void ReleaseShared() noexcept
            {
                m_borrow.ReleaseShared();
            }

            // No poisoning: an abandoned borrow leaves the value usable.
            void ReleaseExclusive(bool) noexcept
            {
                m_borrow.ReleaseExclusive();
            }

            [[nodiscard]] T& Value() noexcept { return m_value; }

            [[nodiscard]] const Sync::BorrowFlag& Borrow() const noexcept { return m_borrow; }

        private:
            Sync::BorrowFlag m_borrow;
            T                m_value;
        };
    };

    static_assert(BackendConcept<SingleThreadBackend>);
}// namespace SHARC
