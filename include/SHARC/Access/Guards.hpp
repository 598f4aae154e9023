/// @file Guards.hpp
/// @brief Scoped RAII handles proving shared or exclusive access to a container's value.
#pragma once

#include <exception>
#include <utility>

#include <SHARC/Access/AccessError.hpp>
#include <SHARC/Backends/BackendConcept.hpp>

namespace SHARC
{
    /// @brief Marks a guard constructor that takes over an access the caller already acquired.
    struct AdoptAccessTag final
    {
        explicit AdoptAccessTag() = default;
    };

    inline constexpr AdoptAccessTag AdoptAccess {};

    /// @brief Shared (read-only) access to the value of a container.
    ///
    /// Releases the access when destroyed, on every exit path. Move-only. A guard borrows the cell of the
    /// container it came from and must not outlive every container referencing that allocation.
    template<typename T, BackendConcept TBackend>
    class ReadGuard final
    {
    public:
        using CellType = typename TBackend::template Cell<T>;

        ReadGuard(AdoptAccessTag, CellType& cell) noexcept
            : m_cell(&cell)
        {
        }

        [[nodiscard]] static AccessExpected<ReadGuard> Acquire(CellType& cell) noexcept
        {
            if (auto acquired = cell.AcquireShared(); !acquired)
                return MakeAccessError(acquired.error());
            return AccessExpected<ReadGuard>(std::in_place, AdoptAccess, cell);
        }

        ReadGuard(const ReadGuard&)            = delete;
        ReadGuard& operator=(const ReadGuard&) = delete;

        ReadGuard(ReadGuard&& other) noexcept
            : m_cell(std::exchange(other.m_cell, nullptr))
        {
        }

        ReadGuard& operator=(ReadGuard&& other) noexcept
        {
            if (this != &other)
            {
                Release();
                m_cell = std::exchange(other.m_cell, nullptr);
            }
            return *this;
        }

        ~ReadGuard() { Release(); }

        [[nodiscard]] const T& Get() const noexcept { return m_cell->Value(); }
        [[nodiscard]] const T& operator*() const noexcept { return Get(); }
        [[nodiscard]] const T* operator->() const noexcept { return &Get(); }

    private:
        void Release() noexcept
        {
            if (m_cell)
            {
                m_cell->ReleaseShared();
                m_cell = nullptr;
            }
        }

        CellType* m_cell {nullptr};
    };

    /// @brief Exclusive (read-write) access to the value of a container.
    ///
    /// If the guard is destroyed while an exception thrown inside its scope is unwinding, the access is reported
    /// to the backend as abandoned; the thread-safe backend poisons the allocation in response.
    template<typename T, BackendConcept TBackend>
    class WriteGuard final
    {
    public:
        using CellType = typename TBackend::template Cell<T>;

        WriteGuard(AdoptAccessTag, CellType& cell) noexcept
            : m_cell(&cell)
            , m_uncaughtOnEntry(std::uncaught_exceptions())
        {
        }

        [[nodiscard]] static AccessExpected<WriteGuard> Acquire(CellType& cell) noexcept
        {
            if (auto acquired = cell.AcquireExclusive(); !acquired)
                return MakeAccessError(acquired.error());
            return AccessExpected<WriteGuard>(std::in_place, AdoptAccess, cell);
        }

        WriteGuard(const WriteGuard&)            = delete;
        WriteGuard& operator=(const WriteGuard&) = delete;

        WriteGuard(WriteGuard&& other) noexcept
            : m_cell(std::exchange(other.m_cell, nullptr))
            , m_uncaughtOnEntry(other.m_uncaughtOnEntry)
        {
        }

        WriteGuard& operator=(WriteGuard&& other) noexcept
        {
            if (this != &other)
            {
                Release();
                m_cell            = std::exchange(other.m_cell, nullptr);
                m_uncaughtOnEntry = other.m_uncaughtOnEntry;
            }
            return *this;
        }

        ~WriteGuard() { Release(); }

        [[nodiscard]] T& Get() const noexcept { return m_cell->Value(); }
        [[nodiscard]] T& operator*() const noexcept { return Get(); }
        [[nodiscard]] T* operator->() const noexcept { return &Get(); }

    private:
        void Release() noexcept
        {
            if (m_cell)
            {
                m_cell->ReleaseExclusive(std::uncaught_exceptions() > m_uncaughtOnEntry);
                m_cell = nullptr;
            }
        }

        CellType* m_cell {nullptr};
        int       m_uncaughtOnEntry {0};
    };
}// namespace SHARC
