/// @file Container.hpp
/// @brief Reference-counted, interior-mutable containers parameterised by a sharing backend.
#pragma once

#include <concepts>
#include <cstddef>
#include <optional>
#include <utility>

#include <SHARC/Access/AccessError.hpp>
#include <SHARC/Access/Guards.hpp>
#include <SHARC/Backends/BackendConcept.hpp>
#include <SHARC/Backends/DefaultBackend.hpp>
#include <SHARC/Backends/SingleThreadBackend.hpp>
#include <SHARC/Backends/ThreadSafeBackend.hpp>
#include <SHARC/Config.hpp>
#include <SHARC/Memory/SmartPointers.hpp>

#if SHARC_ENABLE_ASYNC
#include <coroutine>

#include <SHARC/Async/ReadWriteLock.hpp>
#include <SHARC/Backends/SuspendingBackend.hpp>
#endif

namespace SHARC
{
    template<typename T, BackendConcept TBackend>
    class Container;

    template<typename T, BackendConcept TBackend>
    class WeakContainer;

#if SHARC_ENABLE_ASYNC
    namespace detail
    {
        /// Awaitable whose result is already known; `co_await` never suspends.
        template<typename TResult>
        class ReadyAwaiter
        {
        public:
            explicit ReadyAwaiter(TResult result) noexcept(std::is_nothrow_move_constructible_v<TResult>)
                : m_result(std::move(result))
            {
            }

            bool await_ready() const noexcept { return true; }
            void await_suspend(std::coroutine_handle<>) const noexcept {}
            TResult await_resume() { return std::move(m_result); }

        private:
            TResult m_result;
        };

        /// Suspends on the cell's async lock and hands the acquired access to a guard.
        template<typename TGuard, Async::LockMode Mode>
        class GuardAwaiter
        {
        public:
            using CellType = typename TGuard::CellType;

            explicit GuardAwaiter(CellType& cell) noexcept
                : m_cell(&cell)
                , m_lock(Lock(cell))
            {
            }

            bool await_ready() noexcept { return m_lock.await_ready(); }

            template<typename TPromise>
            bool await_suspend(std::coroutine_handle<TPromise> handle) noexcept
            {
                return m_lock.await_suspend(handle);
            }

            TGuard await_resume() noexcept
            {
                m_lock.await_resume();
                return TGuard(AdoptAccess, *m_cell);
            }

        private:
            static Async::ReadWriteLock::LockAwaiter Lock(CellType& cell) noexcept
            {
                if constexpr (Mode == Async::LockMode::Shared)
                    return cell.LockSharedAsync();
                else
                    return cell.LockExclusiveAsync();
            }

            CellType*                         m_cell;
            Async::ReadWriteLock::LockAwaiter m_lock;
        };

        /// Suspends for shared access and yields a copy of the value; the read lock is released before resuming
        /// returns.
        template<typename T, typename TGuard>
        class CloneAwaiter
        {
        public:
            explicit CloneAwaiter(typename TGuard::CellType& cell) noexcept
                : m_read(cell)
            {
            }

            bool await_ready() noexcept { return m_read.await_ready(); }

            template<typename TPromise>
            bool await_suspend(std::coroutine_handle<TPromise> handle) noexcept
            {
                return m_read.await_suspend(handle);
            }

            T await_resume()
            {
                auto guard = m_read.await_resume();
                return T(guard.Get());
            }

        private:
            GuardAwaiter<TGuard, Async::LockMode::Shared> m_read;
        };
    }// namespace detail
#endif

    /// @brief Non-owning handle to a container allocation.
    ///
    /// A weak handle never keeps the value alive. `Upgrade` succeeds only while at least one strong handle exists
    /// at the moment of the check.
    template<typename T, BackendConcept TBackend>
    class WeakContainer
    {
    public:
        using StrongType = Container<T, TBackend>;

        /// A default-constructed weak handle refers to nothing and never upgrades.
        WeakContainer() noexcept = default;

        [[nodiscard]] std::optional<StrongType> Upgrade() const noexcept
        {
            auto strong = m_ref.Lock();
            if (!strong)
                return std::nullopt;
            return StrongType(std::move(strong));
        }

        [[nodiscard]] bool Expired() const noexcept { return m_ref.Expired(); }

    private:
        friend class Container<T, TBackend>;

        using CellType = typename TBackend::template Cell<T>;
        using WeakRefType = Memory::WeakRef<CellType, typename TBackend::RefCount>;

        explicit WeakContainer(WeakRefType ref) noexcept
            : m_ref(std::move(ref))
        {
        }

        WeakRefType m_ref;
    };

    /// @brief Shared ownership of a single value with access mediated by `TBackend`.
    ///
    /// Copies are O(1) and refer to the same allocation; a write through any copy is visible through every
    /// other. The value lives until the last strong handle is gone. A moved-from container is empty and may
    /// only be assigned to or destroyed.
    ///
    /// Guards borrow the allocation and must not outlive every container referring to it. The accessors that
    /// hand out guards are therefore unavailable on a temporary container.
    template<typename T, BackendConcept TBackend>
    class Container
    {
    public:
        using ValueType      = T;
        using Backend        = TBackend;
        using CellType       = typename TBackend::template Cell<T>;
        using ReadGuardType  = ReadGuard<T, TBackend>;
        using WriteGuardType = WriteGuard<T, TBackend>;
        using WeakType       = WeakContainer<T, TBackend>;

        explicit Container(T value)
            : m_ref(Memory::MakeStrong<CellType, RefCount>(std::in_place, std::move(value)))
        {
        }

        template<typename... Args>
        explicit Container(std::in_place_t, Args&&... args)
            : m_ref(Memory::MakeStrong<CellType, RefCount>(std::in_place, std::forward<Args>(args)...))
        {
        }

        Container(const Container&)                = default;
        Container& operator=(const Container&)     = default;
        Container(Container&&) noexcept            = default;
        Container& operator=(Container&&) noexcept = default;

        /// @brief Another strong handle to the same allocation.
        [[nodiscard]] Container Clone() const noexcept { return *this; }

        /// @brief Shared access. Fails with `Poisoned`, `BorrowConflict` or `UnsupportedMode` depending on the backend.
        [[nodiscard]] AccessExpected<ReadGuardType> Read() const& noexcept
        {
            return ReadGuardType::Acquire(Cell());
        }
        AccessExpected<ReadGuardType> Read() const&& = delete;

        /// @brief Exclusive access. Fails with `Poisoned`, `BorrowConflict` or `UnsupportedMode` depending on the backend.
        [[nodiscard]] AccessExpected<WriteGuardType> Write() const& noexcept
        {
            return WriteGuardType::Acquire(Cell());
        }
        AccessExpected<WriteGuardType> Write() const&& = delete;

        /// @brief Copy of the current value, or the error a shared `Read()` reports.
        [[nodiscard]] AccessExpected<T> GetCloned() const
            requires std::copy_constructible<T>
        {
            auto guard = Read();
            if (!guard)
                return MakeAccessError(guard.error());
            return AccessExpected<T>(std::in_place, guard->Get());
        }

#if SHARC_ENABLE_ASYNC
        /// @brief Awaitable shared access.
        ///
        /// On the suspending backend `co_await` suspends until no writer holds or awaits the lock and yields a
        /// `ReadGuard`. On a synchronous backend it completes without suspending and yields the same
        /// `AccessExpected<ReadGuard>` that `Read()` returns.
        [[nodiscard]] auto ReadAsync() const& noexcept
        {
            if constexpr (TBackend::IsSuspending)
                return detail::GuardAwaiter<ReadGuardType, Async::LockMode::Shared>(Cell());
            else
                return detail::ReadyAwaiter<AccessExpected<ReadGuardType>>(Read());
        }
        void ReadAsync() const&& = delete;

        /// @brief Awaitable exclusive access. See `ReadAsync`.
        [[nodiscard]] auto WriteAsync() const& noexcept
        {
            if constexpr (TBackend::IsSuspending)
                return detail::GuardAwaiter<WriteGuardType, Async::LockMode::Exclusive>(Cell());
            else
                return detail::ReadyAwaiter<AccessExpected<WriteGuardType>>(Write());
        }
        void WriteAsync() const&& = delete;

        /// @brief Awaitable copy of the value: yields `T` on the suspending backend, otherwise completes without
        /// suspending and yields `GetCloned()`.
        [[nodiscard]] auto GetClonedAsync() const&
            requires std::copy_constructible<T>
        {
            if constexpr (TBackend::IsSuspending)
                return detail::CloneAwaiter<T, ReadGuardType>(Cell());
            else
                return detail::ReadyAwaiter<AccessExpected<T>>(GetCloned());
        }
        void GetClonedAsync() const&& = delete;
#endif

        [[nodiscard]] WeakType Downgrade() const noexcept
        {
            return WeakType(typename WeakType::WeakRefType(m_ref));
        }

        /// Number of strong handles. Only a snapshot when other threads hold handles.
        [[nodiscard]] std::size_t StrongCount() const noexcept { return m_ref.UseCount(); }

        /// Number of weak handles. Only a snapshot when other threads hold handles.
        [[nodiscard]] std::size_t WeakCount() const noexcept { return m_ref.WeakCount(); }

        [[nodiscard]] bool SharesAllocationWith(const Container& other) const noexcept
        {
            return m_ref.SharesOwnershipWith(other.m_ref);
        }

        /// @brief True once an exclusive guard was dropped by exception unwinding, until `ClearPoison()`.
        [[nodiscard]] bool IsPoisoned() const noexcept
            requires(TBackend::Kind == BackendKind::ThreadSafe)
        {
            return Cell().IsPoisoned();
        }

        /// @brief Accept the current value as consistent again after a poisoning.
        void ClearPoison() const noexcept
            requires(TBackend::Kind == BackendKind::ThreadSafe)
        {
            Cell().ClearPoison();
        }

        /// Compares the contained values through two shared reads. False if either read fails, which makes it
        /// always false on the suspending backend.
        friend bool operator==(const Container& lhs, const Container& rhs)
            requires std::equality_comparable<T>
        {
            if constexpr (TBackend::IsSuspending)
            {
                return false;
            }
            else
            {
                auto left = lhs.Read();
                if (!left)
                    return false;
                // A second shared lock on the same allocation could deadlock behind a waiting writer.
                if (lhs.SharesAllocationWith(rhs))
                    return left->Get() == left->Get();
                auto right = rhs.Read();
                if (!right)
                    return false;
                return left->Get() == right->Get();
            }
        }

    private:
        friend class WeakContainer<T, TBackend>;

        using RefCount = typename TBackend::RefCount;
        using StrongRefType = Memory::StrongRef<CellType, RefCount>;

        explicit Container(StrongRefType ref) noexcept
            : m_ref(std::move(ref))
        {
        }

        [[nodiscard]] CellType& Cell() const noexcept { return *m_ref; }

        StrongRefType m_ref;
    };

    /// @brief Build a container of `T` in place on the given backend.
    template<typename T, BackendConcept TBackend = DefaultSyncBackend, typename... Args>
    [[nodiscard]] Container<T, TBackend> MakeContainer(Args&&... args)
    {
        return Container<T, TBackend>(std::in_place, std::forward<Args>(args)...);
    }

    /// Shared value on the build's default synchronous backend.
    template<typename T>
    using Shared = Container<T, DefaultSyncBackend>;
    template<typename T>
    using WeakShared = WeakContainer<T, DefaultSyncBackend>;

    /// Shared value confined to one thread, with runtime borrow checking.
    template<typename T>
    using LocalShared = Container<T, SingleThreadBackend>;
    template<typename T>
    using WeakLocalShared = WeakContainer<T, SingleThreadBackend>;

    /// Shared value protected by a blocking, poison-tracking lock.
    template<typename T>
    using ThreadShared = Container<T, ThreadSafeBackend>;
    template<typename T>
    using WeakThreadShared = WeakContainer<T, ThreadSafeBackend>;

#if SHARC_ENABLE_ASYNC
    /// Shared value whose accessors suspend the awaiting coroutine.
    template<typename T>
    using AsyncShared = Container<T, SuspendingBackend>;
    template<typename T>
    using WeakAsyncShared = WeakContainer<T, SuspendingBackend>;
#endif
}// namespace SHARC
