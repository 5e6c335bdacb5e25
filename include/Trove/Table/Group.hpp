#pragma once

#include <cstddef>
#include <cstdint>
#include <iterator>

#include "../Core/Config.hpp"
#include "../Platform/Simd.hpp"
#include "Control.hpp"

namespace Trove
{
    // Set of slot offsets within one group, one bit per control byte.
    // Iterating yields the offsets of the set bits in ascending order.
    class BitMask
    {
    public:
        using MaskType = std::uint16_t;

        static constexpr int WIDTH = static_cast<int>(config::GROUP_WIDTH);

        class iterator
        {
        public:
            using iterator_category = std::forward_iterator_tag;
            using value_type = int;
            using difference_type = std::ptrdiff_t;
            using pointer = const int*;
            using reference = int;

            iterator() = default;
            explicit iterator(MaskType mask) noexcept : m_mask(mask) {}

            int operator*() const noexcept
            {
                return Simd::Ops::CountTrailingZeros(m_mask);
            }

            iterator& operator++() noexcept
            {
                m_mask = static_cast<MaskType>(m_mask & (m_mask - 1));
                return *this;
            }

            iterator operator++(int) noexcept
            {
                iterator tmp = *this;
                ++(*this);
                return tmp;
            }

            TROVE_NODISCARD bool operator==(const iterator& other) const noexcept = default;

        private:
            MaskType m_mask = 0;
        };

        constexpr BitMask() noexcept = default;
        constexpr explicit BitMask(MaskType mask) noexcept : m_mask(mask) {}

        TROVE_NODISCARD constexpr bool AnyBitSet() const noexcept { return m_mask != 0; }
        TROVE_NODISCARD constexpr explicit operator bool() const noexcept { return m_mask != 0; }
        TROVE_NODISCARD constexpr MaskType Raw() const noexcept { return m_mask; }

        // Offset of the lowest set bit; undefined for an empty mask
        TROVE_NODISCARD int LowestBitSet() const noexcept
        {
            TROVE_ASSERT(m_mask != 0, "LowestBitSet on empty mask");
            return Simd::Ops::CountTrailingZeros(m_mask);
        }

        // Offset of the highest set bit; undefined for an empty mask
        TROVE_NODISCARD int HighestBitSet() const noexcept
        {
            TROVE_ASSERT(m_mask != 0, "HighestBitSet on empty mask");
            return WIDTH - 1 - Simd::Ops::CountLeadingZeros(m_mask);
        }

        TROVE_NODISCARD int TrailingZeros() const noexcept
        {
            return Simd::Ops::CountTrailingZeros(m_mask);
        }

        TROVE_NODISCARD int LeadingZeros() const noexcept
        {
            return Simd::Ops::CountLeadingZeros(m_mask);
        }

        TROVE_NODISCARD int Count() const noexcept
        {
            return Simd::Ops::PopCount(m_mask);
        }

        TROVE_NODISCARD iterator begin() const noexcept { return iterator(m_mask); }
        TROVE_NODISCARD iterator end() const noexcept { return iterator(); }

        TROVE_NODISCARD constexpr bool operator==(const BitMask& other) const noexcept = default;

    private:
        MaskType m_mask = 0;
    };

    // A window of GROUP_WIDTH control bytes starting at any position.
    // Matching only reports what the bytes contain; callers bound the
    // offsets against the table's capacity.
    class Group
    {
    public:
        static constexpr std::size_t WIDTH = config::GROUP_WIDTH;

        explicit Group(const CtrlByte* pos) noexcept : m_ctrl(pos) {}

        // Bytes equal to the hash fragment h2
        TROVE_NODISCARD BitMask Match(CtrlByte h2) const noexcept
        {
            return BitMask(Simd::Ops::MatchByteMask(m_ctrl, h2));
        }

        TROVE_NODISCARD BitMask MatchEmpty() const noexcept
        {
            return BitMask(Simd::Ops::MatchByteMask(m_ctrl, Ctrl::EMPTY));
        }

        TROVE_NODISCARD BitMask MatchEmptyOrDeleted() const noexcept
        {
            return BitMask(Simd::Ops::MatchSignedLessMask(m_ctrl, static_cast<std::int8_t>(-1)));
        }

        TROVE_NODISCARD BitMask MatchFull() const noexcept
        {
            return BitMask(static_cast<BitMask::MaskType>(~Simd::Ops::MatchHighBitMask(m_ctrl)));
        }

    private:
        const CtrlByte* m_ctrl;
    };
}
