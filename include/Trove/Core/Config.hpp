#pragma once

#include <cstddef>
#include <limits>
#include <type_traits>

#include "Base.hpp"

namespace Trove
{
    namespace config
    {
        // Control bytes compared per SIMD load
        inline constexpr std::size_t GROUP_WIDTH = 16;

        // Maximum load factor (87.5%)
        inline constexpr std::size_t MAX_LOAD_NUMERATOR = 7;
        inline constexpr std::size_t MAX_LOAD_DENOMINATOR = 8;

        // Smallest non-zero capacity; one group always covers the whole table
        inline constexpr std::size_t MIN_CAPACITY = GROUP_WIDTH - 1;
    }

    template<typename T>
    inline constexpr bool IsPowerOfTwo(T value) noexcept
    {
        return value && !(value & (value - 1));
    }

    template<typename T>
    inline constexpr T AlignUp(T value, T alignment) noexcept
    {
        return (value + alignment - 1) & ~(alignment - 1);
    }

    // Returns false instead of wrapping when a + b overflows
    template<typename T>
    inline constexpr bool CheckedAdd(T a, T b, T& out) noexcept
    {
        static_assert(std::is_unsigned_v<T>, "CheckedAdd requires an unsigned type");
        if (a > std::numeric_limits<T>::max() - b) TROVE_UNLIKELY
        {
            return false;
        }
        out = a + b;
        return true;
    }

    template<typename T>
    inline constexpr bool CheckedMul(T a, T b, T& out) noexcept
    {
        static_assert(std::is_unsigned_v<T>, "CheckedMul requires an unsigned type");
        if (b != 0 && a > std::numeric_limits<T>::max() / b) TROVE_UNLIKELY
        {
            return false;
        }
        out = a * b;
        return true;
    }
}
