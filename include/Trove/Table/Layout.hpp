#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <type_traits>

#include "../Core/Config.hpp"
#include "../Core/Result.hpp"

namespace Trove
{
    // Concrete byte layout of one table allocation:
    //
    //   [ ctrl: capacity + GROUP_WIDTH bytes | pad ][ buckets: capacity * entrySize ]
    //   ^ aligned to ctrlAlignment                  ^ bucketOffset
    struct AllocationLayout
    {
        std::size_t size = 0;
        std::size_t alignment = 0;
        std::size_t bucketOffset = 0;
    };

    // Memory shape of a bucket as the engine sees it
    struct TableLayout
    {
        std::size_t entrySize = 0;
        std::size_t ctrlAlignment = config::GROUP_WIDTH;

        TROVE_NODISCARD static constexpr TableLayout FromEntry(std::size_t size, std::size_t alignment) noexcept
        {
            return TableLayout{size, std::max(alignment, config::GROUP_WIDTH)};
        }

        template<typename T>
        TROVE_NODISCARD static constexpr TableLayout Of() noexcept
        {
            return FromEntry(sizeof(T), alignof(T));
        }

        TROVE_NODISCARD constexpr bool IsValid() const noexcept
        {
            return entrySize > 0 && IsPowerOfTwo(ctrlAlignment) && ctrlAlignment >= config::GROUP_WIDTH;
        }

        // Control bytes: one per slot, the sentinel, and GROUP_WIDTH - 1 clones
        // of the leading bytes so a group load starting at any slot stays in bounds.
        TROVE_NODISCARD static constexpr std::size_t CtrlBytes(std::size_t capacity) noexcept
        {
            return capacity + config::GROUP_WIDTH;
        }

        TROVE_NODISCARD Result<AllocationLayout, Error> CalculateFor(std::size_t capacity) const noexcept
        {
            std::size_t ctrlBytes = 0;
            if (!CheckedAdd(capacity, config::GROUP_WIDTH, ctrlBytes)) TROVE_UNLIKELY
            {
                return Err(ErrorCode::CapacityOverflow);
            }

            std::size_t padded = 0;
            // Guards the rounding in AlignUp
            if (!CheckedAdd(ctrlBytes, ctrlAlignment - 1, padded)) TROVE_UNLIKELY
            {
                return Err(ErrorCode::CapacityOverflow);
            }
            const std::size_t bucketOffset = AlignUp(ctrlBytes, ctrlAlignment);

            std::size_t bucketBytes = 0;
            if (!CheckedMul(capacity, entrySize, bucketBytes)) TROVE_UNLIKELY
            {
                return Err(ErrorCode::CapacityOverflow);
            }

            std::size_t total = 0;
            if (!CheckedAdd(bucketOffset, bucketBytes, total)) TROVE_UNLIKELY
            {
                return Err(ErrorCode::CapacityOverflow);
            }

            return AllocationLayout{total, ctrlAlignment, bucketOffset};
        }

        TROVE_NODISCARD constexpr bool operator==(const TableLayout& other) const noexcept = default;
    };

    // A (K, V) pair packed as one region: key bytes [0, valueOffset),
    // value bytes [valueOffset, entrySize).
    struct EntryLayout
    {
        std::size_t entrySize = 0;
        std::size_t valueOffset = 0;
        std::size_t alignment = 1;

        template<typename K, typename V>
        struct Pair
        {
            K key;
            V value;
        };

        template<typename K, typename V>
        TROVE_NODISCARD static constexpr EntryLayout Of() noexcept
        {
            using PairType = Pair<K, V>;
            static_assert(std::is_standard_layout_v<PairType>, "Key and value types must give a standard-layout pair");
            return EntryLayout{sizeof(PairType), offsetof(PairType, value), alignof(PairType)};
        }

        TROVE_NODISCARD constexpr std::size_t KeySize() const noexcept { return valueOffset; }
        TROVE_NODISCARD constexpr std::size_t ValueSize() const noexcept { return entrySize - valueOffset; }

        TROVE_NODISCARD constexpr bool IsValid() const noexcept
        {
            return entrySize > 0 && valueOffset <= entrySize && IsPowerOfTwo(alignment) && entrySize % alignment == 0;
        }

        TROVE_NODISCARD constexpr TableLayout ToTableLayout() const noexcept
        {
            return TableLayout::FromEntry(entrySize, alignment);
        }

        TROVE_NODISCARD constexpr bool operator==(const EntryLayout& other) const noexcept = default;
    };
}
