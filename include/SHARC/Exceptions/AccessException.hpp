#pragma once

/// @file AccessException.hpp
/// @brief Declares the AccessException class and the `Unwrap` bridge.

#include <string>
#include <type_traits>
#include <utility>

#include <SHARC/Access/AccessError.hpp>
#include <SHARC/Exceptions/Exception.hpp>

namespace SHARC::Exceptions
{
    /// @class AccessException
    /// @brief Exception carrying the `AccessError` that caused a failed container access.
    class AccessException : public Exception
    {
    public:
        /// @brief Constructs from the failed access reason.
        /// @param error The access error being reported.
        explicit AccessException(AccessError error)
            : Exception(std::string(ToString(error)))
            , m_error(error)
        {
        }

        /// @brief The access error being reported.
        [[nodiscard]] AccessError GetError() const noexcept { return m_error; }

        /// @brief The access error as a `std::error_code`.
        [[nodiscard]] std::error_code GetErrorCode() const noexcept { return make_error_code(m_error); }

    private:
        AccessError m_error;
    };
}// namespace SHARC::Exceptions

namespace SHARC
{
    /// @brief Returns the contained value or throws `Exceptions::AccessException`.
    template<typename T>
    [[nodiscard]] T Unwrap(AccessExpected<T>&& result)
    {
        if (!result)
        {
            throw Exceptions::AccessException(result.error());
        }
        return std::move(*result);
    }

    /// @brief Throws `Exceptions::AccessException` if the result holds an error.
    inline void Unwrap(AccessExpected<void>&& result)
    {
        if (!result)
        {
            throw Exceptions::AccessException(result.error());
        }
    }
}// namespace SHARC
