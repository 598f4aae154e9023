#pragma once

#include <stdexcept>
#include <string>

namespace SHARC::Exceptions
{
    /// @class Exception
    /// @brief Base class for all exceptions thrown by SHARC.
    ///
    /// @details
    /// SHARC reports access failures as `AccessExpected` values. Exceptions are only thrown by the
    /// explicit bridges (`Unwrap`) for callers that prefer exception-based error handling.
    class Exception : public std::runtime_error
    {
    public:
        /// @brief Constructor.
        explicit Exception(const char* message)
            : std::runtime_error(message)
        {
        }

        /// @brief Constructor with a string message.
        explicit Exception(const std::string& message)
            : std::runtime_error(message)
        {
        }

        /// @brief Destructor.
        ~Exception() noexcept override = default;

        /// @brief Returns the exception message.
        const char* GetMessage() const noexcept { return this->what(); }
    };
}// namespace SHARC::Exceptions
