// Fundamental type definitions shared by every SHARC module.
#pragma once
#include <cstddef>
#include <cstdint>

namespace SHARC
{
    /// @brief Represents an 8-bit unsigned integer.
    using UInt8 = std::uint8_t;

    /// @brief Signed size type used for differences and borrow counters.
    using IntSize = std::ptrdiff_t;
}// namespace SHARC
