/// @file AccessError.hpp
/// @brief Error codes and expected type for shared container access.
#pragma once

#include <expected>
#include <iosfwd>
#include <string_view>
#include <system_error>
#include <type_traits>

#include <SHARC/Defines.hpp>
#include <SHARC/Primitives.hpp>

namespace SHARC
{
    /// @brief Reasons a container access can fail.
    ///
    /// The set is closed. Each value is produced by exactly one kind of backend:
    /// - `Poisoned`: thread-safe backend, after an exclusive guard was released during exception unwinding.
    /// - `BorrowConflict`: single-threaded backend, when an incompatible borrow is outstanding.
    /// - `UnsupportedMode`: suspending backend, when a synchronous accessor is called.
    enum class AccessError : UInt8
    {
        Poisoned = 1,
        BorrowConflict,
        UnsupportedMode,
    };

    template<typename T>
    using AccessExpected = std::expected<T, AccessError>;

    [[nodiscard]] constexpr std::unexpected<AccessError> MakeAccessError(AccessError error) noexcept
    {
        return std::unexpected<AccessError>(error);
    }

    /// @brief Human-readable description of an access error.
    [[nodiscard]] constexpr std::string_view ToString(AccessError error) noexcept
    {
        switch (error)
        {
            case AccessError::Poisoned:
                return "lock poisoned by an abandoned exclusive access";
            case AccessError::BorrowConflict:
                return "borrow conflict: an incompatible borrow is already held";
            case AccessError::UnsupportedMode:
                return "operation not supported for this container mode";
        }
        return "unknown access error";
    }

    /// @brief Error category bridging `AccessError` into `std::error_code`.
    SHARC_API const std::error_category& AccessErrorCategory() noexcept;

    [[nodiscard]] inline std::error_code make_error_code(AccessError error) noexcept
    {
        return {static_cast<int>(error), AccessErrorCategory()};
    }

    SHARC_API std::ostream& operator<<(std::ostream& stream, AccessError error);
}// namespace SHARC

template<>
struct std::is_error_code_enum<SHARC::AccessError> : std::true_type
{
};
