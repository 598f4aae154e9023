/// @file SharedAny.hpp
/// @brief Backend-erased container holding either a synchronous or a suspending `Container`.
#pragma once

#include <concepts>
#include <cstddef>
#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

#include <SHARC/Access/AccessError.hpp>
#include <SHARC/Access/Guards.hpp>
#include <SHARC/Backends/BackendConcept.hpp>
#include <SHARC/Backends/DefaultBackend.hpp>
#include <SHARC/Config.hpp>
#include <SHARC/Containers/Container.hpp>

#if SHARC_ENABLE_ASYNC
#include <coroutine>

#include <SHARC/Backends/SuspendingBackend.hpp>
#endif

namespace SHARC
{
    template<typename T, BackendConcept TSyncBackend>
        requires(!TSyncBackend::IsSuspending)
    class SharedAny;

    template<typename T, BackendConcept TSyncBackend>
        requires(!TSyncBackend::IsSuspending)
    class WeakSharedAny;

    namespace detail
    {
        /// Holds the guard of whichever alternative produced it.
        template<typename T, typename TSyncBackend>
        using AnyReadGuardVariant =
#if SHARC_ENABLE_ASYNC
                std::variant<ReadGuard<T, TSyncBackend>, ReadGuard<T, SuspendingBackend>>;
#else
                std::variant<ReadGuard<T, TSyncBackend>>;
#endif

        template<typename T, typename TSyncBackend>
        using AnyWriteGuardVariant =
#if SHARC_ENABLE_ASYNC
                std::variant<WriteGuard<T, TSyncBackend>, WriteGuard<T, SuspendingBackend>>;
#else
                std::variant<WriteGuard<T, TSyncBackend>>;
#endif

#if SHARC_ENABLE_ASYNC
        /// Either a result that is already known or the awaiter of a suspending container, whose result is
        /// converted to `TResult` on resumption.
        template<typename TResult, typename TSuspending>
        class AnyAccessAwaiter
        {
        public:
            explicit AnyAccessAwaiter(TResult result) noexcept(std::is_nothrow_move_constructible_v<TResult>)
                : m_state(std::in_place_index<0>, std::move(result))
            {
            }

            explicit AnyAccessAwaiter(TSuspending&& awaiter) noexcept
                : m_state(std::in_place_index<1>, std::move(awaiter))
            {
            }

            bool await_ready() noexcept
            {
                if (TSuspending* awaiter = std::get_if<1>(&m_state))
                    return awaiter->await_ready();
                return true;
            }

            template<typename TPromise>
            bool await_suspend(std::coroutine_handle<TPromise> handle) noexcept
            {
                return std::get<1>(m_state).await_suspend(handle);
            }

            TResult await_resume()
            {
                if (TSuspending* awaiter = std::get_if<1>(&m_state))
                    return TResult(std::in_place, awaiter->await_resume());
                return std::move(std::get<0>(m_state));
            }

        private:
            std::variant<TResult, TSuspending> m_state;
        };
#endif
    }// namespace detail

    /// @brief Shared access obtained through a `SharedAny`.
    template<typename T, BackendConcept TSyncBackend>
    class AnyReadGuard
    {
    public:
        template<BackendConcept TBackend>
        explicit AnyReadGuard(ReadGuard<T, TBackend>&& guard) noexcept
            : m_guard(std::move(guard))
        {
        }

        [[nodiscard]] const T& Get() const
        {
            return std::visit([](const auto& guard) -> const T& { return guard.Get(); }, m_guard);
        }

        [[nodiscard]] const T& operator*() const { return Get(); }
        [[nodiscard]] const T* operator->() const { return &Get(); }

    private:
        detail::AnyReadGuardVariant<T, TSyncBackend> m_guard;
    };

    /// @brief Exclusive access obtained through a `SharedAny`.
    template<typename T, BackendConcept TSyncBackend>
    class AnyWriteGuard
    {
    public:
        template<BackendConcept TBackend>
        explicit AnyWriteGuard(WriteGuard<T, TBackend>&& guard) noexcept
            : m_guard(std::move(guard))
        {
        }

        [[nodiscard]] T& Get() const
        {
            return std::visit([](const auto& guard) -> T& { return guard.Get(); }, m_guard);
        }

        [[nodiscard]] T& operator*() const { return Get(); }
        [[nodiscard]] T* operator->() const { return &Get(); }

    private:
        detail::AnyWriteGuardVariant<T, TSyncBackend> m_guard;
    };

    /// @brief A container whose backend is chosen at runtime between `TSyncBackend` and the suspending backend.
    ///
    /// Converts implicitly from either concrete container without changing the allocation it refers to.
    /// Synchronous accessors forward to a synchronous container and report `AccessError::UnsupportedMode` for a
    /// suspending one. Asynchronous accessors work on both: they suspend on a suspending container and complete
    /// immediately, with the synchronous result, on a synchronous one. Neither kind allocates.
    ///
    /// Like `Container`, accessors that hand out guards or awaiters are unavailable on a temporary.
    template<typename T, BackendConcept TSyncBackend = DefaultSyncBackend>
        requires(!TSyncBackend::IsSuspending)
    class SharedAny
    {
    public:
        using ValueType      = T;
        using SyncType       = Container<T, TSyncBackend>;
        using ReadGuardType  = AnyReadGuard<T, TSyncBackend>;
        using WriteGuardType = AnyWriteGuard<T, TSyncBackend>;
        using WeakType       = WeakSharedAny<T, TSyncBackend>;
#if SHARC_ENABLE_ASYNC
        using AsyncType = AsyncShared<T>;
#endif

        SharedAny(SyncType container) noexcept
            : m_inner(std::move(container))
        {
        }

#if SHARC_ENABLE_ASYNC
        SharedAny(AsyncType container) noexcept
            : m_inner(std::move(container))
        {
        }
#endif

        [[nodiscard]] SharedAny Clone() const noexcept { return *this; }

        [[nodiscard]] BackendKind Kind() const noexcept
        {
            return IsAsync() ? BackendKind::Suspending : TSyncBackend::Kind;
        }

        [[nodiscard]] bool IsAsync() const noexcept { return AsSync() == nullptr; }

        /// @brief The synchronous alternative, or null.
        [[nodiscard]] const SyncType* AsSync() const noexcept { return std::get_if<SyncType>(&m_inner); }

#if SHARC_ENABLE_ASYNC
        /// @brief The suspending alternative, or null.
        [[nodiscard]] const AsyncType* AsAsync() const noexcept { return std::get_if<AsyncType>(&m_inner); }
#endif

        [[nodiscard]] AccessExpected<ReadGuardType> Read() const& noexcept
        {
            const SyncType* sync = AsSync();
            if (sync == nullptr)
                return MakeAccessError(AccessError::UnsupportedMode);
            return Wrap<ReadGuardType>(sync->Read());
        }
        AccessExpected<ReadGuardType> Read() const&& = delete;

        [[nodiscard]] AccessExpected<WriteGuardType> Write() const& noexcept
        {
            const SyncType* sync = AsSync();
            if (sync == nullptr)
                return MakeAccessError(AccessError::UnsupportedMode);
            return Wrap<WriteGuardType>(sync->Write());
        }
        AccessExpected<WriteGuardType> Write() const&& = delete;

        [[nodiscard]] AccessExpected<T> GetCloned() const
            requires std::copy_constructible<T>
        {
            const SyncType* sync = AsSync();
            if (sync == nullptr)
                return MakeAccessError(AccessError::UnsupportedMode);
            return sync->GetCloned();
        }

#if SHARC_ENABLE_ASYNC
        /// @brief Awaitable shared access yielding `AccessExpected<ReadGuardType>`.
        [[nodiscard]] auto ReadAsync() const& noexcept
        {
            using Awaiter = detail::AnyAccessAwaiter<AccessExpected<ReadGuardType>,
                                                     decltype(std::declval<const AsyncType&>().ReadAsync())>;
            if (const AsyncType* async = AsAsync())
                return Awaiter(async->ReadAsync());
            return Awaiter(Read());
        }
        void ReadAsync() const&& = delete;

        /// @brief Awaitable exclusive access yielding `AccessExpected<WriteGuardType>`.
        [[nodiscard]] auto WriteAsync() const& noexcept
        {
            using Awaiter = detail::AnyAccessAwaiter<AccessExpected<WriteGuardType>,
                                                     decltype(std::declval<const AsyncType&>().WriteAsync())>;
            if (const AsyncType* async = AsAsync())
                return Awaiter(async->WriteAsync());
            return Awaiter(Write());
        }
        void WriteAsync() const&& = delete;

        /// @brief Awaitable copy of the value yielding `AccessExpected<T>`.
        [[nodiscard]] auto GetClonedAsync() const&
            requires std::copy_constructible<T>
        {
            using Awaiter = detail::AnyAccessAwaiter<AccessExpected<T>,
                                                     decltype(std::declval<const AsyncType&>().GetClonedAsync())>;
            if (const AsyncType* async = AsAsync())
                return Awaiter(async->GetClonedAsync());
            return Awaiter(GetCloned());
        }
        void GetClonedAsync() const&& = delete;
#endif

        [[nodiscard]] WeakType Downgrade() const noexcept
        {
            return std::visit([](const auto& container) { return WeakType(container.Downgrade()); }, m_inner);
        }

        [[nodiscard]] std::size_t StrongCount() const noexcept
        {
            return std::visit([](const auto& container) { return container.StrongCount(); }, m_inner);
        }

    private:
        template<typename TAnyGuard, typename TGuard>
        static AccessExpected<TAnyGuard> Wrap(AccessExpected<TGuard>&& result) noexcept
        {
            if (!result)
                return MakeAccessError(result.error());
            return AccessExpected<TAnyGuard>(std::in_place, std::move(*result));
        }

#if SHARC_ENABLE_ASYNC
        using Storage = std::variant<SyncType, AsyncType>;
#else
        using Storage = std::variant<SyncType>;
#endif

        Storage m_inner;
    };

    /// @brief Non-owning counterpart of `SharedAny`.
    template<typename T, BackendConcept TSyncBackend = DefaultSyncBackend>
        requires(!TSyncBackend::IsSuspending)
    class WeakSharedAny
    {
    public:
        using StrongType = SharedAny<T, TSyncBackend>;

        WeakSharedAny(WeakContainer<T, TSyncBackend> weak) noexcept
            : m_inner(std::move(weak))
        {
        }

#if SHARC_ENABLE_ASYNC
        WeakSharedAny(WeakContainer<T, SuspendingBackend> weak) noexcept
            : m_inner(std::move(weak))
        {
        }
#endif

        [[nodiscard]] std::optional<StrongType> Upgrade() const noexcept
        {
            return std::visit(
                    [](const auto& weak) -> std::optional<StrongType> {
                        auto strong = weak.Upgrade();
                        if (!strong)
                            return std::nullopt;
                        return StrongType(std::move(*strong));
                    },
                    m_inner);
        }

        [[nodiscard]] bool Expired() const noexcept
        {
            return std::visit([](const auto& weak) { return weak.Expired(); }, m_inner);
        }

    private:
#if SHARC_ENABLE_ASYNC
        std::variant<WeakContainer<T, TSyncBackend>, WeakContainer<T, SuspendingBackend>> m_inner;
#else
        std::variant<WeakContainer<T, TSyncBackend>> m_inner;
#endif
    };
}// namespace SHARC
