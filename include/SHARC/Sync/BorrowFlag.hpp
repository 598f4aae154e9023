/// @file BorrowFlag.hpp
/// @brief Runtime borrow tracking for single-threaded interior mutability.
#pragma once

#include <SHARC/Primitives.hpp>

namespace SHARC::Sync
{
    /// @brief Tracks outstanding borrows of a single-threaded cell.
    ///
    /// The state is `0` when unborrowed, `n > 0` while `n` shared borrows are held and `-1` while an
    /// exclusive borrow is held. Acquisition never blocks: an incompatible request simply fails.
    /// Not thread-safe.
    class BorrowFlag
    {
    public:
        BorrowFlag()                             = default;
        BorrowFlag(const BorrowFlag&)            = delete;
        BorrowFlag& operator=(const BorrowFlag&) = delete;

        [[nodiscard]] bool TryBorrowShared() noexcept
        {
            if (m_state < 0)
                return false;
            ++m_state;
            return true;
        }

        void ReleaseShared() noexcept
        {
            --m_state;
        }

        [[nodiscard]] bool TryBorrowExclusive() noexcept
        {
            if (m_state != 0)
                return false;
            m_state = Exclusive;
            return true;
        }

        void ReleaseExclusive() noexcept
        {
            m_state = Unborrowed;
        }

        [[nodiscard]] bool IsBorrowed() const noexcept { return m_state != Unborrowed; }
        [[nodiscard]] bool IsExclusivelyBorrowed() const noexcept { return m_state == Exclusive; }
        [[nodiscard]] IntSize SharedBorrows() const noexcept { return m_state > 0 ? m_state : 0; }

    private:
        static constexpr IntSize Unborrowed = 0;
        static constexpr IntSize Exclusive  = -1;

        IntSize m_state {Unborrowed};
    };
}// namespace SHARC::Sync
