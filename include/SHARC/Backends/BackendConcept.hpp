/// @file BackendConcept.hpp
/// @brief The capability every sharing backend must provide to back a `Container`.
#pragma once

#include <concepts>
#include <string_view>

#include <SHARC/Access/AccessError.hpp>
#include <SHARC/Config.hpp>
#include <SHARC/Memory/SmartPointers.hpp>
#include <SHARC/Primitives.hpp>

#if SHARC_ENABLE_ASYNC
#include <SHARC/Async/ReadWriteLock.hpp>
#endif

namespace SHARC
{
    enum class BackendKind : UInt8
    {
        ThreadSafe,
        SingleThread,
        Suspending,
    };

    [[nodiscard]] constexpr std::string_view ToString(BackendKind kind) noexcept
    {
        switch (kind)
        {
            case BackendKind::ThreadSafe:
                return "ThreadSafe";
            case BackendKind::SingleThread:
                return "SingleThread";
            case BackendKind::Suspending:
                return "Suspending";
        }
        return "Unknown";
    }

    /// @brief Interior-mutable slot owned by a container allocation.
    ///
    /// Synchronous acquisition either succeeds or reports why it cannot, and every successful acquisition is
    /// paired with exactly one release. `abandoned` tells the cell that an exclusive holder is being released
    /// while an exception unwinds its scope.
    template<typename C>
    concept CellConcept = requires(C& cell, bool abandoned) {
        typename C::ValueType;
        { cell.AcquireShared() } -> std::same_as<AccessExpected<void>>;
        { cell.AcquireExclusive() } -> std::same_as<AccessExpected<void>>;
        { cell.ReleaseShared() } noexcept;
        { cell.ReleaseExclusive(abandoned) } noexcept;
        { cell.Value() } -> std::same_as<typename C::ValueType&>;
    };

#if SHARC_ENABLE_ASYNC
    /// @brief A cell whose acquisition can suspend the awaiting coroutine.
    template<typename C>
    concept SuspendingCellConcept = CellConcept<C> && requires(C& cell) {
        { cell.LockSharedAsync() } -> std::same_as<Async::ReadWriteLock::LockAwaiter>;
        { cell.LockExclusiveAsync() } -> std::same_as<Async::ReadWriteLock::LockAwaiter>;
    };
#endif

    namespace detail
    {
        struct BackendSample
        {
        };
    }// namespace detail

    /// @brief Tag type selecting one sharing primitive for a `Container`.
    template<typename B>
    concept BackendConcept = requires {
        { B::Kind } -> std::convertible_to<BackendKind>;
        { B::IsSuspending } -> std::convertible_to<bool>;
        typename B::RefCount;
        typename B::template Cell<detail::BackendSample>;
    } && Memory::RefCountPolicy<typename B::RefCount>
      && CellConcept<typename B::template Cell<detail::BackendSample>>;
}// namespace SHARC
