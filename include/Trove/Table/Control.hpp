#pragma once

#include <cstddef>
#include <cstdint>

#include "../Core/Base.hpp"

namespace Trove
{
    using CtrlByte = std::uint8_t;

    // Control byte encoding shared by RawTable and Group
    //
    //   FULL      0b0hhhhhhh  (h = 7-bit hash fragment)
    //   EMPTY     0b10000000
    //   DELETED   0b11111110
    //   SENTINEL  0b11111111
    //
    // Every special value has the high bit set, and read as signed bytes
    // EMPTY < DELETED < SENTINEL, which lets a single signed compare against
    // SENTINEL select the vacant slots.
    namespace Ctrl
    {
        inline constexpr CtrlByte EMPTY = 0x80;
        inline constexpr CtrlByte DELETED = 0xFE;
        inline constexpr CtrlByte SENTINEL = 0xFF;

        inline constexpr CtrlByte H2_MASK = 0x7F;

        // Probe start position; the low 7 bits are left to H2
        TROVE_FORCEINLINE constexpr std::size_t H1(std::uint64_t hash) noexcept
        {
            return static_cast<std::size_t>(hash >> 7);
        }

        TROVE_FORCEINLINE constexpr CtrlByte H2(std::uint64_t hash) noexcept
        {
            return static_cast<CtrlByte>(hash & H2_MASK);
        }

        TROVE_FORCEINLINE constexpr bool IsFull(CtrlByte ctrl) noexcept
        {
            return ctrl < EMPTY;
        }

        TROVE_FORCEINLINE constexpr bool IsEmpty(CtrlByte ctrl) noexcept
        {
            return ctrl == EMPTY;
        }

        TROVE_FORCEINLINE constexpr bool IsDeleted(CtrlByte ctrl) noexcept
        {
            return ctrl == DELETED;
        }

        TROVE_FORCEINLINE constexpr bool IsEmptyOrDeleted(CtrlByte ctrl) noexcept
        {
            return ctrl >= EMPTY && ctrl < SENTINEL;
        }
    }
}
