/// @file SmartPointers.hpp
/// @brief Header-only reference-counted handles (`StrongRef`, `WeakRef`) with pluggable count policies.
///
/// Design goals
/// - One allocation holding the control block and the object.
/// - Count policy chosen at compile time: atomic for handles shared across threads, plain integers for
///   handles confined to one thread.
/// - `WeakRef::Lock` never allocates and never resurrects an object whose strong count reached zero.
#pragma once

#include <atomic>
#include <concepts>
#include <cstddef>
#include <memory>
#include <new>
#include <type_traits>
#include <utility>

namespace SHARC::Memory
{
    /// \brief Reference-count policy using atomic counters. Safe to share between threads.
    struct AtomicRefCount final
    {
        using Counter = std::atomic<std::size_t>;

        static std::size_t Load(const Counter& counter) noexcept
        {
            return counter.load(std::memory_order_relaxed);
        }

        /// \brief Increment for a holder that already owns a reference (relaxed is sufficient).
        static void Increment(Counter& counter) noexcept
        {
            counter.fetch_add(1, std::memory_order_relaxed);
        }

        /// \brief Decrement and return the previous value.
        static std::size_t Decrement(Counter& counter) noexcept
        {
            return counter.fetch_sub(1, std::memory_order_acq_rel);
        }

        /// \brief Increment only if the count is non-zero; false once the count has reached zero.
        static bool IncrementIfNonZero(Counter& counter) noexcept
        {
            std::size_t s = counter.load(std::memory_order_relaxed);
            while (s != 0)
            {
                if (counter.compare_exchange_weak(s, s + 1, std::memory_order_acquire, std::memory_order_relaxed))
                    return true;
                // s is updated with the observed value; loop
            }
            return false;
        }
    };

    /// \brief Reference-count policy using plain counters. Handles must stay on one thread.
    struct LocalRefCount final
    {
        using Counter = std::size_t;

        static std::size_t Load(const Counter& counter) noexcept { return counter; }
        static void        Increment(Counter& counter) noexcept { ++counter; }
        static std::size_t Decrement(Counter& counter) noexcept { return counter--; }

        static bool IncrementIfNonZero(Counter& counter) noexcept
        {
            if (counter == 0)
                return false;
            ++counter;
            return true;
        }
    };

    template<class P>
    concept RefCountPolicy = requires(typename P::Counter& counter, const typename P::Counter& view) {
        { P::Load(view) } noexcept -> std::same_as<std::size_t>;
        { P::Increment(counter) } noexcept;
        { P::Decrement(counter) } noexcept -> std::same_as<std::size_t>;
        { P::IncrementIfNonZero(counter) } noexcept -> std::same_as<bool>;
    };

    namespace detail
    {
        template<class T, RefCountPolicy Policy>
        struct RefControl final
        {
            typename Policy::Counter strong {1};// number of StrongRef owners
            typename Policy::Counter weak {1};  // number of WeakRef owners + the strong group's self-weak

            alignas(T) std::byte storage[sizeof(T)];

            [[nodiscard]] T* Object() noexcept
            {
                return std::launder(reinterpret_cast<T*>(storage));
            }

            void DestroyObject() noexcept(std::is_nothrow_destructible_v<T>)
            {
                std::destroy_at(Object());
            }
        };
    }// namespace detail

    template<class T, RefCountPolicy Policy>
    class StrongRef;

    template<class T, RefCountPolicy Policy>
    class WeakRef;

    /// \brief Create a control block and T in one allocation.
    template<class T, RefCountPolicy Policy = AtomicRefCount, class... Args>
    [[nodiscard]] StrongRef<T, Policy> MakeStrong(Args&&... args);

    /// \brief Reference-counted owning handle.
    ///
    /// Self-weak strategy: the strong owners collectively hold one weak count so the control block
    /// survives until both the last strong and the last weak owner are gone.
    template<class T, RefCountPolicy Policy = AtomicRefCount>
    class StrongRef
    {
    public:
        using Element = T;

        constexpr StrongRef() noexcept = default;

        StrongRef(const StrongRef& other) noexcept
            : m_ctrl(other.m_ctrl)
        {
            if (m_ctrl)
                Policy::Increment(m_ctrl->strong);
        }
        StrongRef& operator=(const StrongRef& other) noexcept
        {
            if (this != &other)
            {
                Release();
                m_ctrl = other.m_ctrl;
                if (m_ctrl)
                    Policy::Increment(m_ctrl->strong);
            }
            return *this;
        }

        StrongRef(StrongRef&& other) noexcept
            : m_ctrl(std::exchange(other.m_ctrl, nullptr))
        {
        }
        StrongRef& operator=(StrongRef&& other) noexcept
        {
            if (this != &other)
            {
                Release();
                m_ctrl = std::exchange(other.m_ctrl, nullptr);
            }
            return *this;
        }

        ~StrongRef() noexcept { Release(); }

        [[nodiscard]] T* Get() const noexcept { return m_ctrl ? m_ctrl->Object() : nullptr; }
        [[nodiscard]] T& operator*() const { return *Get(); }
        [[nodiscard]] T* operator->() const noexcept { return Get(); }
        explicit         operator bool() const noexcept { return m_ctrl != nullptr; }

        /// \brief Current strong owners (best-effort under concurrency).
        [[nodiscard]] std::size_t UseCount() const noexcept
        {
            return m_ctrl ? Policy::Load(m_ctrl->strong) : 0;
        }

        /// \brief Current weak owners, excluding the strong group's self-weak.
        [[nodiscard]] std::size_t WeakCount() const noexcept
        {
            return m_ctrl ? Policy::Load(m_ctrl->weak) - 1 : 0;
        }

        /// \brief True if both handles refer to the same control block.
        [[nodiscard]] bool SharesOwnershipWith(const StrongRef& other) const noexcept
        {
            return m_ctrl == other.m_ctrl;
        }

        void Reset() noexcept { Release(); }

        friend class WeakRef<T, Policy>;

        template<class U, RefCountPolicy P, class... Args>
        friend StrongRef<U, P> MakeStrong(Args&&... args);

    private:
        using Control = detail::RefControl<T, Policy>;

        explicit StrongRef(Control* ctrl) noexcept
            : m_ctrl(ctrl)
        {
        }

        /// \brief Release one strong reference; destroy object on last strong, free on last weak.
        void Release() noexcept
        {
            if (!m_ctrl)
                return;
            if (Policy::Decrement(m_ctrl->strong) == 1)
            {
                // Last strong owner: destroy the object, then drop the strong group's self-weak.
                m_ctrl->DestroyObject();
                if (Policy::Decrement(m_ctrl->weak) == 1)
                    delete m_ctrl;
            }
            m_ctrl = nullptr;
        }

        Control* m_ctrl {nullptr};
    };

    /// \brief Weak non-owning handle that can lock to a `StrongRef` while the object is still alive.
    template<class T, RefCountPolicy Policy>
    class WeakRef
    {
    public:
        constexpr WeakRef() noexcept = default;

        explicit WeakRef(const StrongRef<T, Policy>& strong) noexcept
            : m_ctrl(strong.m_ctrl)
        {
            if (m_ctrl)
                Policy::Increment(m_ctrl->weak);
        }

        WeakRef(const WeakRef& other) noexcept
            : m_ctrl(other.m_ctrl)
        {
            if (m_ctrl)
                Policy::Increment(m_ctrl->weak);
        }
        WeakRef& operator=(const WeakRef& other) noexcept
        {
            if (this != &other)
            {
                Release();
                m_ctrl = other.m_ctrl;
                if (m_ctrl)
                    Policy::Increment(m_ctrl->weak);
            }
            return *this;
        }

        WeakRef(WeakRef&& other) noexcept
            : m_ctrl(std::exchange(other.m_ctrl, nullptr))
        {
        }
        WeakRef& operator=(WeakRef&& other) noexcept
        {
            if (this != &other)
            {
                Release();
                m_ctrl = std::exchange(other.m_ctrl, nullptr);
            }
            return *this;
        }

        ~WeakRef() noexcept { Release(); }

        [[nodiscard]] bool Expired() const noexcept
        {
            return !m_ctrl || Policy::Load(m_ctrl->strong) == 0;
        }

        /// \brief Attempt to acquire a strong owner; returns an empty handle once the object is gone.
        ///
        /// The answer is only true at the instant the strong count is inspected.
        [[nodiscard]] StrongRef<T, Policy> Lock() const noexcept
        {
            if (m_ctrl && Policy::IncrementIfNonZero(m_ctrl->strong))
                return StrongRef<T, Policy>(m_ctrl);
            return {};
        }

    private:
        using Control = detail::RefControl<T, Policy>;

        /// \brief Drop one weak reference; free the control block if it was the last one.
        void Release() noexcept
        {
            if (!m_ctrl)
                return;
            // The strong group holds a weak count until the object is destroyed, so reaching zero here
            // implies no strong owners remain.
            if (Policy::Decrement(m_ctrl->weak) == 1)
                delete m_ctrl;
            m_ctrl = nullptr;
        }

        Control* m_ctrl {nullptr};
    };

    template<class T, RefCountPolicy Policy, class... Args>
    StrongRef<T, Policy> MakeStrong(Args&&... args)
    {
        using Control = detail::RefControl<T, Policy>;

        auto ctrl = std::make_unique<Control>();
        std::construct_at(reinterpret_cast<T*>(ctrl->storage), std::forward<Args>(args)...);
        return StrongRef<T, Policy>(ctrl.release());
    }
}// namespace SHARC::Memory
